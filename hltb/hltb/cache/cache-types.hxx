#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <ostream>
#include <string>
#include <utility>

#include <odb/core.hxx>

namespace hltb
{
  // When the storefront-to-catalog id cache is re-imported.
  //
  enum class id_refresh_mode
  {
    max_age,       // Import when missing, foreign, or older than max_age.
    every_session  // Import at every session start; reads never expire.
  };

  inline std::ostream&
  operator<< (std::ostream& os, id_refresh_mode m)
  {
    switch (m)
    {
    case id_refresh_mode::max_age:       return os << "max-age";
    case id_refresh_mode::every_session: return os << "every-session";
    }
    return os;
  }

  // Throws std::invalid_argument on an unknown name.
  //
  id_refresh_mode
  to_id_refresh_mode (const std::string&);

  struct id_cache_policy
  {
    id_refresh_mode mode = id_refresh_mode::max_age;
    std::chrono::seconds max_age = std::chrono::hours (24 * 7);
  };

  struct result_cache_policy
  {
    std::chrono::seconds ttl = std::chrono::hours (24);
  };

  // One row of the id cache. Replaced wholesale on every import.
  //
  #pragma db object table("id_mappings")
  class id_mapping
  {
  public:
    id_mapping () = default;

    id_mapping (std::uint32_t s, std::uint64_t c)
      : storefront_id_ (s), catalog_id_ (c) {}

    std::uint32_t
    storefront_id () const noexcept { return storefront_id_; }

    std::uint64_t
    catalog_id () const noexcept { return catalog_id_; }

  private:
    friend class odb::access;

    #pragma db id
    std::uint32_t storefront_id_ = 0;

    #pragma db not_null
    std::uint64_t catalog_id_ = 0;
  };

  // Who the id cache was imported for and when. There is only ever one row.
  //
  #pragma db object table("id_cache_meta")
  class id_cache_meta
  {
  public:
    static constexpr std::uint16_t singleton = 1;

    id_cache_meta () = default;

    id_cache_meta (std::string o, std::int64_t ts)
      : owner_ (std::move (o)), written_at_ (ts) {}

    const std::string&
    owner () const noexcept { return owner_; }

    std::int64_t
    written_at () const noexcept { return written_at_; }

  private:
    friend class odb::access;

    #pragma db id
    std::uint16_t slot_ = singleton;

    #pragma db not_null
    std::string owner_;

    std::int64_t written_at_ = 0;
  };

  // Last lookup outcome for a storefront id.
  //
  // The record is kept as JSON so that adding a field doesn't need a schema
  // change. A confirmed miss is stored as `null`.
  //
  #pragma db object table("cached_results")
  class cached_result
  {
  public:
    cached_result () = default;

    cached_result (std::uint32_t s,
                   std::string d,
                   std::string n,
                   std::int64_t ts)
      : storefront_id_ (s),
        data_ (std::move (d)),
        searched_name_ (std::move (n)),
        written_at_ (ts)
    {
    }

    std::uint32_t
    storefront_id () const noexcept { return storefront_id_; }

    const std::string&
    data () const noexcept { return data_; }

    const std::string&
    searched_name () const noexcept { return searched_name_; }

    std::int64_t
    written_at () const noexcept { return written_at_; }

    bool
    miss () const noexcept { return data_ == "null"; }

    void
    set_data (std::string d) { data_ = std::move (d); }

    void
    set_searched_name (std::string n) { searched_name_ = std::move (n); }

    void
    set_written_at (std::int64_t ts) { written_at_ = ts; }

  private:
    friend class odb::access;

    #pragma db id
    std::uint32_t storefront_id_ = 0;

    #pragma db not_null
    std::string data_;

    std::string searched_name_;

    #pragma db not_null index
    std::int64_t written_at_ = 0;
  };

  // What --stats shows.
  //
  struct cache_stats
  {
    std::size_t mappings = 0;
    std::optional<std::string> owner;
    std::int64_t ids_written_at = 0;

    std::size_t results = 0;
    std::size_t misses = 0;
    std::int64_t oldest_result = 0;
  };

  inline std::ostream&
  operator<< (std::ostream& os, const cache_stats& s)
  {
    os << "id mappings:   " << s.mappings << '\n'
       << "id owner:      " << (s.owner ? *s.owner : std::string ("-")) << '\n'
       << "ids imported:  " << s.ids_written_at << '\n'
       << "results:       " << s.results << " (" << s.misses << " miss)\n"
       << "oldest result: " << s.oldest_result << '\n';
    return os;
  }
}
