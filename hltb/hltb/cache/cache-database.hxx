#pragma once

#include <hltb/cache/cache-types.hxx>

#include <filesystem>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include <odb/query.hxx>
#include <odb/database.hxx>
#include <odb/transaction.hxx>
#include <odb/schema-catalog.hxx>
#include <odb/sqlite/database.hxx>

namespace hltb
{
  namespace fs = std::filesystem;

  template <typename S = std::string>
  struct cache_database_traits
  {
    using string_type = S;
    using database_type = odb::sqlite::database;

    static constexpr const char* db_name = "hltb.db";

    // Table whose presence tells us the schema has been created.
    //
    static constexpr const char* check_table = "cached_results";

    // Several lookups of one session may hit the database while an import
    // replaces the id tables.
    //
    static constexpr bool wal = true;
  };

  // The persistent cache: id mappings with their import metadata, and the
  // last result per storefront id.
  //
  // Every operation is a single transaction. Failures to open or query are
  // thrown as odb::exception (or std::runtime_error for the directory).
  //
  template <typename T = cache_database_traits<>>
  class basic_cache_database
  {
  public:
    using traits_type = T;
    using string_type = typename traits_type::string_type;
    using database_type = typename traits_type::database_type;

    // Open (creating if necessary) the database in the cache root directory.
    //
    explicit
    basic_cache_database (const fs::path& root);

    basic_cache_database (const basic_cache_database&) = delete;
    basic_cache_database& operator= (const basic_cache_database&) = delete;

    const fs::path&
    path () const noexcept;

    // Id cache.
    //

    std::vector<id_mapping>
    mappings () const;

    std::optional<id_cache_meta>
    meta () const;

    // Drop all mappings and write the new set and metadata, in one
    // transaction.
    //
    void
    replace_mappings (const std::vector<id_mapping>&, const id_cache_meta&);

    void
    clear_mappings ();

    std::size_t
    count_mappings () const;

    // Result cache.
    //

    std::optional<cached_result>
    find_result (std::uint32_t storefront_id) const;

    // Insert or replace the entry as a whole.
    //
    void
    store_result (const cached_result&);

    void
    clear_results ();

    std::size_t
    count_results () const;

    std::size_t
    count_misses () const;

    // Timestamp of the oldest entry, if any.
    //
    std::optional<std::int64_t>
    oldest_result () const;

    // Runs 'PRAGMA integrity_check'.
    //
    bool
    check () const;

    // Give space back after a clear. Can't run inside a transaction.
    //
    void
    vacuum ();

  private:
    void
    init (const fs::path& root);

    void
    schema ();

    void
    pragmas ();

    // Rows of O matching the query, in one read transaction.
    //
    template <typename O>
    std::size_t
    count (const odb::query<O>&) const;

    fs::path path_;
    std::unique_ptr<database_type> db_;
  };

  using cache_database = basic_cache_database<>;
}

#include <hltb/cache/cache-database.ixx>
#include <hltb/cache/cache-database.txx>
