#pragma once

#include <string>
#include <vector>
#include <cstdint>
#include <optional>
#include <filesystem>

namespace hltb
{
  namespace fs = std::filesystem;

  // Storefront app id.
  //
  using steam_app_id = std::uint32_t;

  // An account that has signed in to the local Steam client, from
  // config/loginusers.vdf.
  //
  struct steam_account
  {
    std::string steam_id;      // SteamID64, decimal.
    std::string account_name;
    std::string persona_name;
    bool most_recent;
    std::int64_t timestamp;    // Last login, seconds since epoch.

    steam_account () : most_recent (false), timestamp (0) {}
  };

  // Where the local Steam client keeps its state.
  //
  struct steam_paths
  {
    fs::path root;
    fs::path login_users;     // config/loginusers.vdf
  };

  // SteamID64 of an individual account: 17 digits in the 7656119... range.
  //
  inline bool
  valid_steam_id (const std::string& s)
  {
    if (s.size () != 17 || s.compare (0, 7, "7656119") != 0)
      return false;

    for (char c: s)
      if (c < '0' || c > '9')
        return false;

    return true;
  }
}
