#include <stdexcept>
#include <system_error>

#include <odb/query.hxx>
#include <odb/result.hxx>

#include <odb/sqlite/connection.hxx>

#include <sqlite3.h>

#include <hltb/cache/cache-types-odb.hxx>

namespace hltb
{
  template <typename T>
  basic_cache_database<T>::
  basic_cache_database (const fs::path& d)
  {
    init (d);
  }

  template <typename T>
  void basic_cache_database<T>::
  init (const fs::path& d)
  {
    if (!fs::exists (d))
    {
      std::error_code ec;
      fs::create_directories (d, ec);

      if (ec)
        throw std::runtime_error (
          "unable to create cache directory " + d.string () + ": " +
          ec.message ());
    }

    path_ = d / traits_type::db_name;

    db_ = std::make_unique<database_type> (
      path_.string (),
      SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE);

    pragmas ();
    schema ();
  }

  template <typename T>
  void basic_cache_database<T>::
  schema ()
  {
    // create_schema() has no "if not exists" mode, so look for one of our
    // tables first.
    //
    bool exists (false);
    {
      odb::transaction t (db_->begin ());

      odb::sqlite::connection& c (
        static_cast<odb::sqlite::connection&> (t.connection ()));

      sqlite3_stmt* s (nullptr);
      const char* q (
        "SELECT name FROM sqlite_master WHERE type='table' AND name=?");

      if (sqlite3_prepare_v2 (c.handle (), q, -1, &s, nullptr) == SQLITE_OK)
      {
        sqlite3_bind_text (s, 1, traits_type::check_table, -1, SQLITE_STATIC);

        if (sqlite3_step (s) == SQLITE_ROW)
          exists = true;

        sqlite3_finalize (s);
      }

      t.commit ();
    }

    if (!exists)
    {
      odb::transaction t (db_->begin ());
      odb::schema_catalog::create_schema (*db_);
      t.commit ();
    }
  }

  template <typename T>
  void basic_cache_database<T>::
  pragmas ()
  {
    // Journal mode and synchronous can't be changed inside a transaction,
    // which ODB's execute() would open.
    //
    odb::connection_ptr c (db_->connection ());
    sqlite3* h (static_cast<odb::sqlite::connection&> (*c).handle ());

    if (traits_type::wal)
      sqlite3_exec (h, "PRAGMA journal_mode=WAL", nullptr, nullptr, nullptr);

    // It's a cache: losing the last write on a crash is acceptable.
    //
    sqlite3_exec (h, "PRAGMA synchronous=NORMAL", nullptr, nullptr, nullptr);
    sqlite3_exec (h, "PRAGMA temp_store=MEMORY", nullptr, nullptr, nullptr);
  }

  template <typename T>
  template <typename O>
  std::size_t basic_cache_database<T>::
  count (const odb::query<O>& q) const
  {
    odb::transaction t (db_->begin ());
    odb::result<O> r (db_->template query<O> (q));

    std::size_t n (0);
    for (auto i (r.begin ()); i != r.end (); ++i)
      ++n;

    t.commit ();
    return n;
  }

  template <typename T>
  std::vector<id_mapping> basic_cache_database<T>::
  mappings () const
  {
    std::vector<id_mapping> r;

    odb::transaction t (db_->begin ());
    odb::result<id_mapping> res (db_->template query<id_mapping> ());

    for (auto& m: res)
      r.push_back (m);

    t.commit ();
    return r;
  }

  template <typename T>
  std::optional<id_cache_meta> basic_cache_database<T>::
  meta () const
  {
    odb::transaction t (db_->begin ());
    std::shared_ptr<id_cache_meta> m (
      db_->template find<id_cache_meta> (id_cache_meta::singleton));
    t.commit ();

    return m ? std::optional<id_cache_meta> (*m) : std::nullopt;
  }

  template <typename T>
  void basic_cache_database<T>::
  replace_mappings (const std::vector<id_mapping>& ms, const id_cache_meta& m)
  {
    odb::transaction t (db_->begin ());

    db_->template erase_query<id_mapping> ();
    db_->template erase_query<id_cache_meta> ();

    for (const id_mapping& x: ms)
      db_->persist (x);

    db_->persist (m);

    t.commit ();
  }

  template <typename T>
  void basic_cache_database<T>::
  clear_mappings ()
  {
    odb::transaction t (db_->begin ());

    db_->template erase_query<id_mapping> ();
    db_->template erase_query<id_cache_meta> ();

    t.commit ();
  }

  template <typename T>
  std::size_t basic_cache_database<T>::
  count_mappings () const
  {
    return count (odb::query<id_mapping> ());
  }

  template <typename T>
  std::optional<cached_result> basic_cache_database<T>::
  find_result (std::uint32_t id) const
  {
    odb::transaction t (db_->begin ());
    std::shared_ptr<cached_result> r (db_->template find<cached_result> (id));
    t.commit ();

    return r ? std::optional<cached_result> (*r) : std::nullopt;
  }

  template <typename T>
  void basic_cache_database<T>::
  store_result (const cached_result& r)
  {
    odb::transaction t (db_->begin ());

    std::shared_ptr<cached_result> e (
      db_->template find<cached_result> (r.storefront_id ()));

    if (e)
    {
      e->set_data (r.data ());
      e->set_searched_name (r.searched_name ());
      e->set_written_at (r.written_at ());
      db_->update (*e);
    }
    else
      db_->persist (r);

    t.commit ();
  }

  template <typename T>
  void basic_cache_database<T>::
  clear_results ()
  {
    odb::transaction t (db_->begin ());
    db_->template erase_query<cached_result> ();
    t.commit ();
  }

  template <typename T>
  std::size_t basic_cache_database<T>::
  count_results () const
  {
    return count (odb::query<cached_result> ());
  }

  template <typename T>
  std::size_t basic_cache_database<T>::
  count_misses () const
  {
    using query = odb::query<cached_result>;

    return count<cached_result> (query::data == "null");
  }

  template <typename T>
  std::optional<std::int64_t> basic_cache_database<T>::
  oldest_result () const
  {
    using query = odb::query<cached_result>;

    std::optional<std::int64_t> r;

    odb::transaction t (db_->begin ());
    odb::result<cached_result> res (
      db_->template query<cached_result> (
        "ORDER BY" + query::written_at + "LIMIT 1"));

    for (auto& e: res)
      r = e.written_at ();

    t.commit ();
    return r;
  }

  template <typename T>
  bool basic_cache_database<T>::
  check () const
  {
    odb::transaction t (db_->begin ());
    bool ok (true);

    odb::sqlite::connection& c (
      static_cast<odb::sqlite::connection&> (t.connection ()));

    sqlite3_stmt* s (nullptr);

    if (sqlite3_prepare_v2 (c.handle (),
                            "PRAGMA integrity_check",
                            -1,
                            &s,
                            nullptr) == SQLITE_OK)
    {
      if (sqlite3_step (s) == SQLITE_ROW)
      {
        const char* r (
          reinterpret_cast<const char*> (sqlite3_column_text (s, 0)));

        if (r == nullptr || std::string (r) != "ok")
          ok = false;
      }

      sqlite3_finalize (s);
    }
    else
      ok = false;

    t.commit ();
    return ok;
  }

  template <typename T>
  void basic_cache_database<T>::
  vacuum ()
  {
    odb::connection_ptr c (db_->connection ());
    sqlite3* h (static_cast<odb::sqlite::connection&> (*c).handle ());

    char* e (nullptr);
    if (sqlite3_exec (h, "VACUUM", nullptr, nullptr, &e) != SQLITE_OK)
    {
      std::string m (e != nullptr ? e : "unknown error");
      sqlite3_free (e);
      throw std::runtime_error ("unable to vacuum cache database: " + m);
    }
  }
}
