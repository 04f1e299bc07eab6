#include <hltb/cache/cache-id.hxx>
#include <hltb/cache/cache-result.hxx>
#include <hltb/cache/cache-database.hxx>
#include <hltb/cache/cache-reconciler.hxx>

#include <cassert>
#include <chrono>
#include <filesystem>
#include <string>
#include <system_error>

#include <unistd.h>

using namespace std;
using namespace hltb;

namespace fs = std::filesystem;

// Scratch cache root, removed on destruction.
//
struct temp_root
{
  fs::path path;

  explicit
  temp_root (const string& n)
    : path (fs::temp_directory_path () /
            ("hltb-" + n + '-' + to_string (getpid ())))
  {
    error_code ec;
    fs::remove_all (path, ec);
  }

  ~temp_root ()
  {
    error_code ec;
    fs::remove_all (path, ec);
  }
};

static const int64_t day (24 * 60 * 60);
static const int64_t t0 (1700000000);

static const string alice ("76561198000000001");
static const string bob ("76561198000000002");

static void
test_id_cache ()
{
  temp_root r ("id");

  {
    cache_database db (r.path);
    id_cache c (db, id_cache_policy ());

    assert (c.size () == 0);
    assert (!c.valid ("", t0));
    assert (c.needs_refresh (alice, t0));

    c.replace ({{220, 4000}, {400, 7231}}, alice, t0);

    assert (c.find (220) == 4000u);
    assert (!c.find (570));

    assert (c.valid (alice, t0 + day));
    assert (c.valid ("", t0 + day));
    assert (!c.valid (bob, t0 + day));
    assert (!c.needs_refresh (alice, t0 + day));

    // Past the age ceiling.
    //
    assert (!c.valid (alice, t0 + 8 * day));
    assert (c.needs_refresh (alice, t0 + 8 * day));
  }

  // Survives a restart.
  //
  {
    cache_database db (r.path);

    id_cache_policy p;
    p.mode = id_refresh_mode::every_session;

    id_cache c (db, p);

    assert (c.size () == 2);
    assert (c.meta () && c.meta ()->owner () == alice);
    assert (c.find (400) == 7231u);

    // No age ceiling on reads, but always re-imported.
    //
    assert (c.valid (alice, t0 + 365 * day));
    assert (c.needs_refresh (alice, t0));

    c.clear ();
    assert (c.size () == 0 && !c.valid ("", t0));
    assert (db.count_mappings () == 0);
  }
}

static void
test_reconcile ()
{
  temp_root r ("reconcile");
  cache_database db (r.path);
  id_cache c (db, id_cache_policy ());
  id_reconciler rc (c);

  vector<import_mapping> ms {
    import_mapping (220, 4000),
    import_mapping (570, 0),
    import_mapping (400, 7231),
    import_mapping (400, 7232)};

  reconcile_summary s (rc.reconcile (ms, alice, t0));

  assert (s.applied ());
  assert (s.received == 4 && s.stored == 2 && s.dropped == 2);
  assert (c.find (400) == 7232u);
  assert (!c.find (570));

  // Nothing usable: the cache stays as it was, owner and age included.
  //
  s = rc.reconcile ({}, bob, t0 + day);
  assert (!s.applied ());

  s = rc.reconcile ({import_mapping (570, 0)}, bob, t0 + day);
  assert (!s.applied () && s.dropped == 1);

  assert (c.size () == 2);
  assert (c.meta ()->owner () == alice);
  assert (c.meta ()->written_at () == t0);
  assert (c.valid (alice, t0 + day));
  assert (db.count_mappings () == 2);

  // A new import replaces everything.
  //
  s = rc.reconcile ({import_mapping (10, 11)}, bob, t0 + day);
  assert (s.applied ());
  assert (c.size () == 1 && !c.find (220));
  assert (c.valid (bob, t0 + day) && !c.valid (alice, t0 + day));
  assert (db.count_mappings () == 1);
}

static void
test_results ()
{
  temp_root r ("result");
  cache_database db (r.path);
  result_cache c (db, result_cache_policy ());

  {
    result_read x (c.read (220, t0));
    assert (!x.entry && x.stale);
  }

  catalog_record hl2;
  hl2.catalog_id = 4000;
  hl2.title = "Half-Life 2";
  hl2.main_hours = 13;
  hl2.main_extra_hours = 16.5;
  hl2.completionist_hours = 20.5;
  hl2.storefront_id = 220;

  c.write (220, result_entry (hl2, "Half-Life 2", t0));

  {
    result_read x (c.read (220, t0 + 3600));
    assert (x.entry && !x.stale);
    assert (x.entry->data && *x.entry->data == hl2);
    assert (x.entry->searched_name == "Half-Life 2");
  }

  // Past the TTL the value is still there, just stale.
  //
  {
    result_read x (c.read (220, t0 + day + 1));
    assert (x.entry && x.stale);
    assert (x.entry->data->catalog_id == 4000);
  }

  // A fresh miss is stale all the same.
  //
  c.write (500, result_entry (nullopt, "Zzzqx Unknown Game", t0));
  {
    result_read x (c.read (500, t0));
    assert (x.entry && x.entry->miss () && x.stale);
    assert (x.entry->searched_name == "Zzzqx Unknown Game");
  }

  // Writes replace the whole entry.
  //
  c.write (220, result_entry (nullopt, "Half Life 2", t0 + 10));
  {
    result_read x (c.read (220, t0 + 10));
    assert (x.entry->miss ());
    assert (x.entry->searched_name == "Half Life 2");
  }

  assert (db.count_results () == 2);
  assert (db.count_misses () == 2);
  assert (db.oldest_result () == t0);
  assert (db.check ());

  c.clear ();
  assert (db.count_results () == 0);
  assert (!db.oldest_result ());
}

int
main ()
{
  test_id_cache ();
  test_reconcile ();
  test_results ();
}
