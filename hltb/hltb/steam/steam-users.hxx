#pragma once

#include <optional>
#include <string>
#include <vector>

#include <hltb/steam/steam-types.hxx>

namespace hltb
{
  // Locate the local Steam client's data directory. Checks the usual
  // per-user locations, the Flatpak sandbox, and system-wide installs.
  //
  std::optional<steam_paths>
  find_steam ();

  // The account the client would sign in with: the one flagged most
  // recent, otherwise the latest login.
  //
  std::optional<steam_account>
  acting_account (const std::vector<steam_account>&);

  // SteamID64 of the acting account of the local client, if there is a
  // client and it has seen a login.
  //
  std::optional<std::string>
  detect_steam_user ();
}
