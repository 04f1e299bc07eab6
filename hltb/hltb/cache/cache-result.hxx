#pragma once

#include <cstdint>
#include <optional>
#include <string>

#include <boost/json.hpp>

#include <hltb/catalog/catalog-types.hxx>
#include <hltb/cache/cache-types.hxx>
#include <hltb/cache/cache-database.hxx>

namespace hltb
{
  namespace json = boost::json;

  // A remembered lookup outcome: the record, or a confirmed miss.
  //
  struct result_entry
  {
    std::optional<catalog_record> data;
    std::string searched_name;
    std::int64_t written_at;

    result_entry () : written_at (0) {}

    result_entry (std::optional<catalog_record> d,
                  std::string n,
                  std::int64_t ts)
      : data (std::move (d)), searched_name (std::move (n)), written_at (ts) {}

    bool
    miss () const noexcept
    {
      return !data.has_value ();
    }
  };

  struct result_read
  {
    std::optional<result_entry> entry;

    // Absent, older than the TTL, or a miss.
    //
    bool stale;
  };

  // Last result per storefront id.
  //
  // A miss is always stale: the catalog may have learned the title since.
  // Stale entries are still returned so the caller can show something while
  // refreshing.
  //
  class result_cache
  {
  public:
    result_cache (cache_database& db, result_cache_policy p)
      : db_ (db), policy_ (p) {}

    result_read
    read (std::uint32_t storefront_id, std::int64_t now) const;

    // Replace the entry for the storefront id.
    //
    void
    write (std::uint32_t storefront_id, const result_entry&);

    void
    clear ();

    const result_cache_policy&
    policy () const noexcept
    {
      return policy_;
    }

  private:
    cache_database& db_;
    result_cache_policy policy_;
  };

  // Record (de)serialization for the cache. record_from_json() returns
  // nullopt for anything that is not an object with a catalog id.
  //
  json::value
  to_json (const catalog_record&);

  std::optional<catalog_record>
  record_from_json (const json::value&);
}
