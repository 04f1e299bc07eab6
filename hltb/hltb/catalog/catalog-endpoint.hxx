#pragma once

#include <string>
#include <cstdint>
#include <utility>

namespace hltb
{
  // Catalog URL builder.
  //
  // None of these endpoints are documented. The search path and the page
  // data build id rotate with every site deployment and are discovered at
  // runtime (see catalog_session), the rest has been stable so far.
  //
  class catalog_endpoint
  {
  public:
    static constexpr const char* default_base = "https://howlongtobeat.com/";

    // Used when the search path can't be discovered from the site scripts.
    //
    static constexpr const char* fallback_search_path = "/api/search";

    explicit
    catalog_endpoint (std::string base = default_base)
      : base_ (std::move (base))
    {
      if (base_.empty () || base_.back () != '/')
        base_ += '/';
    }

    const std::string&
    base () const noexcept
    {
      return base_;
    }

    // The value of Referer/Origin the catalog expects.
    //
    std::string
    origin () const
    {
      return base_.substr (0, base_.size () - 1);
    }

    std::string
    home () const
    {
      return base_;
    }

    // Resolve a site-absolute path ("/_next/...") or a full URL.
    //
    std::string
    resolve (const std::string& p) const
    {
      if (p.find ("://") != std::string::npos)
        return p;

      return origin () + (p.empty () || p[0] != '/' ? "/" : "") + p;
    }

    std::string
    search (const std::string& path) const
    {
      return resolve (path);
    }

    // Token handshake lives under the search path.
    //
    std::string
    search_init (const std::string& path, std::int64_t now_ms) const
    {
      return resolve (path) + "/init?t=" + std::to_string (now_ms);
    }

    std::string
    game_page (const std::string& build_id, std::uint64_t id) const
    {
      return base_ + "_next/data/" + build_id + "/game/" +
             std::to_string (id) + ".json";
    }

    std::string
    steam_import () const
    {
      return base_ + "api/steam/getSteamImportData";
    }

  private:
    std::string base_;
  };
}
