#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

#include <hltb/cache/cache-types.hxx>
#include <hltb/cache/cache-database.hxx>

namespace hltb
{
  // Storefront id to catalog id, as of the last bulk import.
  //
  // Reads are served from memory; the database copy only matters at
  // startup. The content changes only through replace(), which swaps the
  // whole map after the database transaction has committed.
  //
  class id_cache
  {
  public:
    id_cache (cache_database&, id_cache_policy);

    // Catalog id for the storefront id. Doesn't check validity.
    //
    std::optional<std::uint64_t>
    find (std::uint32_t storefront_id) const;

    // Whether the content may be used for this user at this time. An empty
    // user means "unknown" and accepts any owner.
    //
    bool
    valid (const std::string& user, std::int64_t now) const;

    // Whether a session start should re-import.
    //
    bool
    needs_refresh (const std::string& user, std::int64_t now) const;

    void
    replace (const std::vector<id_mapping>&,
             const std::string& owner,
             std::int64_t now);

    void
    clear ();

    std::size_t
    size () const noexcept
    {
      return map_.size ();
    }

    const std::optional<id_cache_meta>&
    meta () const noexcept
    {
      return meta_;
    }

    const id_cache_policy&
    policy () const noexcept
    {
      return policy_;
    }

  private:
    cache_database& db_;
    id_cache_policy policy_;

    std::unordered_map<std::uint32_t, std::uint64_t> map_;
    std::optional<id_cache_meta> meta_;
  };
}
