#pragma once

#include <optional>
#include <ostream>
#include <string>
#include <utility>

#include <hltb/catalog/catalog-types.hxx>
#include <hltb/match/match-selector.hxx>

namespace hltb
{
  // How a by-name resolution ended.
  //
  // Unmatched is a confirmed miss and is worth remembering. Failed means we
  // never got a usable answer (network, upstream) and nothing should be
  // cached.
  //
  enum class resolution_status
  {
    matched,
    unmatched,
    failed
  };

  inline std::ostream&
  operator<< (std::ostream& os, resolution_status s)
  {
    switch (s)
    {
    case resolution_status::matched:   return os << "matched";
    case resolution_status::unmatched: return os << "unmatched";
    case resolution_status::failed:    return os << "failed";
    }
    return os;
  }

  struct name_resolution
  {
    resolution_status status;

    // The last query issued, or the storefront title if we never got as far
    // as searching.
    //
    std::string searched_name;

    // Present if matched.
    //
    std::optional<match_candidate> match;

    // Present if failed.
    //
    catalog_status failure;
    std::string error;

    name_resolution ()
      : status (resolution_status::unmatched),
        failure (catalog_status::ok) {}

    static name_resolution
    matched (match_candidate m, std::string searched)
    {
      name_resolution r;
      r.status = resolution_status::matched;
      r.searched_name = std::move (searched);
      r.match = std::move (m);
      return r;
    }

    static name_resolution
    unmatched (std::string searched)
    {
      name_resolution r;
      r.searched_name = std::move (searched);
      return r;
    }

    template <typename V>
    static name_resolution
    failed (const catalog_result<V>& f, std::string searched = std::string ())
    {
      name_resolution r;
      r.status = resolution_status::failed;
      r.searched_name = std::move (searched);
      r.failure = f.status;
      r.error = f.error;
      return r;
    }

    const catalog_record*
    record () const noexcept
    {
      return match ? &match->record : nullptr;
    }
  };
}
