#include <hltb/resolve/resolve-strategy.hxx>

#include <hltb/testing/fake-http-client.hxx>
#include <hltb/testing/fake-catalog.hxx>

#include <cassert>
#include <stdexcept>
#include <string>
#include <vector>

using namespace std;
using namespace hltb;

using client_type   = fake_http_client;
using test_resolver = basic_resolver<resolver_traits<client_type>>;

// Everything a resolver needs, wired to the fake client.
//
struct fixture
{
  asio::io_context ioc;
  client_type client;
  fake_catalog site {client};
  basic_catalog_transport<client_type> transport {client, catalog_endpoint ()};
  basic_catalog_session<client_type> session {transport};
  basic_catalog_api<client_type> api {transport, session};
  basic_steam_store<client_type> store {transport};

  name_resolution
  by_name (steam_app_id app, bool verify = false)
  {
    resolver_traits<client_type> t;
    t.verify = verify;

    test_resolver r (api, store, override_table::builtin (), t);
    return run_awaitable (ioc, r.resolve_by_name (app));
  }

  catalog_result<catalog_record>
  by_id (uint64_t id, steam_app_id app)
  {
    test_resolver r (api, store);
    return run_awaitable (ioc, r.resolve_by_id (id, app));
  }
};

static void
test_exact_sanitized ()
{
  fixture f;

  f.site.store_name (211420, "DARK SOULS™: Prepare To Die™ Edition");
  f.site.results (json::array {
    game (2, "Dark Souls III", 113400),
    game (3, "Dark Souls: Prepare to Die Edition", 151200)});

  name_resolution r (f.by_name (211420));

  assert (r.status == resolution_status::matched);
  assert (r.match->catalog_id () == 3);
  assert (r.match->exact);
  assert (r.record ()->main_hours == 42.0);

  // The simplified form ("DARK SOULS") is never tried.
  //
  vector<string> qs (f.site.queries ());
  assert (qs.size () == 1);
  assert (qs[0] == "DARK SOULS: Prepare To Die Edition");
  assert (r.searched_name == qs[0]);
}

static void
test_override_table ()
{
  const override_table& b (override_table::builtin ());

  for (size_t i (1); i < b.size (); ++i)
    assert (b.entries ()[i - 1].app < b.entries ()[i].app);

  assert (b.find (1004640) == "Final Fantasy Tactics: The Ivalice Chronicles");
  assert (!b.find (1004641));
  assert (!override_table ().find (1));

  auto rejected = [] (vector<name_override> es)
  {
    try
    {
      override_table t (move (es));
      return false;
    }
    catch (const invalid_argument&)
    {
      return true;
    }
  };

  assert (rejected ({{20, "B"}, {10, "A"}}));
  assert (rejected ({{10, "A"}, {10, "A again"}}));
  assert (rejected ({{10, ""}}));
  assert (!rejected ({{10, "A"}, {20, "B"}}));
}

static void
test_override ()
{
  fixture f;

  f.site.results (json::array {
    game (7, "Final Fantasy Tactics: The Ivalice Chronicles", 144000)});

  name_resolution r (f.by_name (1004640));

  assert (r.status == resolution_status::matched);
  assert (r.match->catalog_id () == 7);

  // No storefront title lookup at all.
  //
  assert (f.client.calls ("https://store.steampowered.com/") == 0);
  assert (f.client.calls ("https://steamhunters.com/") == 0);

  vector<string> qs (f.site.queries ());
  assert (qs.size () == 1);
  assert (qs[0] == "Final Fantasy Tactics: The Ivalice Chronicles");
}

static void
test_name_source_fallback ()
{
  fixture f;

  f.client.on (fake_catalog::appdetails_url (400), 200,
               R"({"400":{"success":false}})");
  f.client.on (fake_catalog::steamhunters_url (400), 200,
               R"({"appId":400,"name":"Portal"})");
  f.site.results (json::array {game (10, "Portal", 10800)});

  name_resolution r (f.by_name (400));

  assert (r.status == resolution_status::matched);
  assert (r.match->catalog_id () == 10);
  assert (f.client.calls (fake_catalog::appdetails_url (400)) == 1);
  assert (f.client.calls (fake_catalog::steamhunters_url (400)) == 1);
}

static void
test_simplified_query ()
{
  fixture f;

  f.site.store_name (220, "Half-Life 2 (2004)");
  f.site.results (json::array {game (20, "Half-Life 2", 46800)});

  name_resolution r (f.by_name (220));

  assert (r.status == resolution_status::matched);
  assert (r.match->catalog_id () == 20);

  vector<string> qs (f.site.queries ());
  assert (qs.size () == 2);
  assert (qs[0] == "Half-Life 2 (2004)");
  assert (qs[1] == "Half-Life 2");
  assert (r.searched_name == "Half-Life 2");
}

static void
test_hyphenated_title ()
{
  fixture f;

  // A shorter title that the word before the hyphen would match exactly.
  //
  f.site.store_name (1817070, "Spider-Man Uncaged Edition");
  f.site.results (json::array {
    game (1, "Spider-Man: Uncaged Edition", 36000),
    game (2, "Spider", 7200)});

  name_resolution r (f.by_name (1817070));

  assert (r.status == resolution_status::matched);
  assert (r.match->catalog_id () == 1);
  assert (!r.match->exact);

  vector<string> qs (f.site.queries ());
  assert (qs.size () == 1);
  assert (qs[0] == "Spider-Man Uncaged Edition");
}

static void
test_miss ()
{
  fixture f;

  f.site.store_name (500, "Zzzqx Unknown Game");
  f.site.results (json::array {game (1, "Tetris", 3600)});

  name_resolution r (f.by_name (500));

  assert (r.status == resolution_status::unmatched);
  assert (!r.match);
  assert (r.searched_name == "Zzzqx Unknown Game");
}

static void
test_failures ()
{
  // Search unreachable.
  //
  {
    fixture f;

    f.site.store_name (500, "Celeste");
    f.client.fail (fake_catalog::search);

    name_resolution r (f.by_name (500));

    assert (r.status == resolution_status::failed);
    assert (r.failure == catalog_status::transport_failure);
    assert (r.searched_name == "Celeste");
  }

  // No source knows the title.
  //
  {
    fixture f;

    f.client.on (fake_catalog::appdetails_url (600), 200, "null");
    f.client.on (fake_catalog::steamhunters_url (600), 404, "");

    name_resolution r (f.by_name (600));

    assert (r.status == resolution_status::failed);
    assert (r.failure == catalog_status::upstream_rejection);
    assert (f.site.queries ().empty ());
  }
}

static void
test_verification ()
{
  auto setup = [] (fixture& f)
  {
    f.site.store_name (480490, "Prey 2017");
    f.site.results (json::array {
      game (50, "Prey 2006", 28800),
      game (51, "Prey (2017)", 61200)});

    f.site.page (game (50, "Prey 2006", 28800, 3970));
    f.site.page (game (51, "Prey (2017)", 61200, 480490));
  };

  // Both are two edits away: the selector keeps catalog order.
  //
  {
    fixture f;
    setup (f);

    name_resolution r (f.by_name (480490));

    assert (r.status == resolution_status::matched);
    assert (r.match->catalog_id () == 50);
    assert (!r.match->verified);
    assert (f.client.calls (fake_catalog::page_url (50)) == 0);
  }

  {
    fixture f;
    setup (f);

    name_resolution r (f.by_name (480490, true));

    assert (r.status == resolution_status::matched);
    assert (r.match->catalog_id () == 51);
    assert (r.match->verified);
    assert (f.client.calls (fake_catalog::page_url (50)) == 1);
    assert (f.client.calls (fake_catalog::page_url (51)) == 1);
  }
}

static void
test_by_id ()
{
  fixture f;

  f.site.page (game (99, "Celeste", 28800, 504230));

  catalog_result<catalog_record> r (f.by_id (99, 504230));

  assert (r);
  assert (r.value->title == "Celeste");
  assert (r.value->main_hours == 8.0);
  assert (r.value->storefront_id == 504230);
  assert (f.site.queries ().empty ());

  // Unknown page: one rediscovery, then the rejection stands.
  //
  f.client.on (fake_catalog::page_url (98), 404, "");

  r = f.by_id (98, 1);

  assert (r.status == catalog_status::upstream_rejection);
  assert (r.http_status == 404);
  assert (f.client.calls (fake_catalog::page_url (98)) == 2);
}

int
main ()
{
  test_override_table ();
  test_exact_sanitized ();
  test_override ();
  test_name_source_fallback ();
  test_simplified_query ();
  test_hyphenated_title ();
  test_miss ();
  test_failures ();
  test_verification ();
  test_by_id ();
}
