#pragma once

#include <chrono>
#include <filesystem>
#include <string>

#include <hltb/cache/cache-types.hxx>
#include <hltb/catalog/catalog-endpoint.hxx>

namespace hltb
{
  namespace fs = std::filesystem;

  // Everything the command line decides, in one place.
  //
  struct runtime_config
  {
    fs::path cache_root;

    // SteamID64 of the acting user. Empty if unknown, in which case there is
    // no bulk import and any id cache owner is accepted.
    //
    std::string user;

    id_cache_policy ids;
    result_cache_policy results;

    bool verify = false;

    std::string catalog_base = catalog_endpoint::default_base;

    // Per-request timeout, connect and I/O alike.
    //
    std::chrono::milliseconds timeout {10000};
  };

  // $XDG_CACHE_HOME/hltb, else $HOME/.cache/hltb, else ./.hltb.
  //
  fs::path
  default_cache_root ();
}
