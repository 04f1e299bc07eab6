#include <hltb/catalog/catalog-api.hxx>

#include <hltb/testing/fake-http-client.hxx>
#include <hltb/testing/fake-catalog.hxx>

#include <cassert>
#include <string>
#include <vector>

using namespace std;
using namespace hltb;

using client_type = fake_http_client;

struct fixture
{
  asio::io_context ioc;
  client_type client;
  fake_catalog site {client};
  basic_catalog_transport<client_type> transport {client, catalog_endpoint ()};
  basic_catalog_session<client_type> session {transport};
  basic_catalog_api<client_type> api {transport, session};
};

static void
test_transport ()
{
  fixture f;
  const string u ("https://example.org/x");

  // Unreachable.
  //
  {
    auto r (run_awaitable (f.ioc, f.transport.get_json (u)));
    assert (r.status == catalog_status::transport_failure);
    assert (r.http_status == 0);
  }

  // Non-2xx carries the status.
  //
  f.client.on (u, 503, "<html>busy</html>");
  {
    auto r (run_awaitable (f.ioc, f.transport.get_json (u)));
    assert (r.status == catalog_status::upstream_rejection);
    assert (r.http_status == 503);
  }

  // The literal null body.
  //
  f.client.on (u, 200, "null");
  {
    auto r (run_awaitable (f.ioc, f.transport.get_json (u)));
    assert (r.status == catalog_status::malformed_response);
    assert (r.null_payload);
  }

  f.client.on (u, 200, "{\"a\":");
  {
    auto r (run_awaitable (f.ioc, f.transport.get_json (u)));
    assert (r.status == catalog_status::malformed_response);
    assert (!r.null_payload);
  }

  f.client.on (u, 200, "{\"a\":1}");
  {
    auto r (run_awaitable (f.ioc, f.transport.get_json (u)));
    assert (r && r.value->at ("a").as_int64 () == 1);
  }

  // Origin claims only go to the catalog.
  //
  const auto& rq (f.client.requests ().back ());
  assert (!rq.get_header ("Origin"));
}

static void
test_extract ()
{
  assert (extract_build_id (R"({"page":"/","buildId":"x_Y-1","isFallback":false})") ==
          "x_Y-1");
  assert (!extract_build_id ("<html></html>"));

  assert (extract_app_script (
            R"(<script src="/_next/static/chunks/pages/_app-9f8e7d.js" defer>)") ==
          "/_next/static/chunks/pages/_app-9f8e7d.js");

  assert (extract_search_path (R"(fetch("/api/search",{method:"POST"}))") ==
          "/api/search");
  assert (extract_search_path (
            R"(fetch("/api/user/1");fetch("/api/find/".concat("ab12"),{}))") ==
          "/api/find/ab12");
  assert (extract_search_path (R"(fetch("/api/lookup/"))") == "/api/lookup");
  assert (!extract_search_path (R"(fetch("/api/steam/x");fetch("/api/game/1"))"));
}

static void
test_discovery_fallback ()
{
  fixture f;

  // The bundle is gone: the well-known path is used.
  //
  f.client.forget (fake_catalog::script);

  string e (run_awaitable (f.ioc, f.session.endpoint ()));
  assert (e == "https://howlongtobeat.com/api/search");

  // Still a build id from the home page.
  //
  auto b (run_awaitable (f.ioc, f.session.build_id ()));
  assert (b && *b.value == fake_catalog::build);

  // Nothing at all.
  //
  f.client.forget (fake_catalog::home);
  f.session.invalidate ();

  e = run_awaitable (f.ioc, f.session.endpoint ());
  assert (e == "https://howlongtobeat.com/api/search");

  b = run_awaitable (f.ioc, f.session.build_id ());
  assert (b.status == catalog_status::malformed_response);

  // The site comes back: picked up without an explicit invalidate.
  //
  f.site.serve ();

  b = run_awaitable (f.ioc, f.session.build_id ());
  assert (b && *b.value == fake_catalog::build);

  e = run_awaitable (f.ioc, f.session.endpoint ());
  assert (e == fake_catalog::search);

  // Once learned, the home page is not fetched again.
  //
  size_t n (f.client.count (fake_catalog::home));
  run_awaitable (f.ioc, f.session.build_id ());
  assert (f.client.count (fake_catalog::home) == n);
}

static void
test_token ()
{
  fixture f;

  auto t (run_awaitable (f.ioc, f.session.token ()));
  assert (t && *t.value == "t0k");

  // Reused within the validity window.
  //
  t = run_awaitable (f.ioc, f.session.token ());
  assert (t);
  assert (f.client.calls (fake_catalog::init) == 1);
  assert (f.client.count (fake_catalog::home) == 1);

  auto s (run_awaitable (f.ioc, f.session.ensure_fresh ()));
  assert (s && s.value->endpoint_url == fake_catalog::search);

  f.session.invalidate ();
  assert (!f.session.current ());

  t = run_awaitable (f.ioc, f.session.token ());
  assert (f.client.calls (fake_catalog::init) == 2);
}

static void
test_search ()
{
  fixture f;

  f.site.results (json::array {
    game (1, "Hades", 79200, 1145360),
    game (2, "Hades II", 0)});

  auto r (run_awaitable (f.ioc, f.api.search ("Hades")));

  assert (r);
  assert (r.value->size () == 2);
  assert ((*r.value)[0].title == "Hades");
  assert ((*r.value)[0].main_hours == 22.0);
  assert ((*r.value)[0].storefront_id == 1145360);
  assert (!(*r.value)[1].has_times ());

  const auto& rq (f.client.requests ().back ());
  assert (rq.get_header ("x-auth-token") == "t0k");
  assert (rq.get_header ("Origin") == "https://howlongtobeat.com");

  json::value b (json::parse (*rq.body));
  assert (b.at ("searchType").as_string () == "games");
  assert (b.at ("searchTerms").as_array ().size () == 1);
  assert (b.at ("searchOptions").at ("games").at ("sortCategory").as_string () ==
          "popular");
}

static void
test_search_rediscovery ()
{
  fixture f;

  // The first discovery sees an old bundle whose path no longer exists.
  //
  f.client.on (fake_catalog::script, 200, R"(fetch("/api/old/".concat("1")))");
  f.client.on ("https://howlongtobeat.com/api/old/1", 404, "");
  f.client.on_prefix ("https://howlongtobeat.com/api/old/1/init?t=", 200,
                      R"({"token":"old"})");

  auto r (run_awaitable (f.ioc, [&f] () -> asio::awaitable<
                                   catalog_result<vector<catalog_record>>>
  {
    // Deploy happens between discovery and search.
    //
    co_await f.session.endpoint ();

    f.client.on (fake_catalog::script, 200,
                 R"(fetch("/api/seek/".concat("f00d")))");
    f.site.results (json::array {game (5, "Inside", 12600)});

    co_return co_await f.api.search ("Inside");
  } ()));

  assert (r && r.value->size () == 1);
  assert (f.client.count ("https://howlongtobeat.com/api/old/1",
                          http_method::post) == 1);
  assert (f.client.count (fake_catalog::search, http_method::post) == 1);
  assert (f.client.count (fake_catalog::home) == 2);
}

static void
test_tokenless ()
{
  fixture f;

  f.client.on_prefix (fake_catalog::init, 500, "");
  f.site.results (json::array {game (5, "Inside", 12600)});

  auto r (run_awaitable (f.ioc, f.api.search ("Inside")));

  assert (r && r.value->size () == 1);
  assert (!f.client.requests ().back ().get_header ("x-auth-token"));
}

static void
test_import ()
{
  fixture f;

  // Empty user never reaches the network.
  //
  {
    auto r (run_awaitable (f.ioc, f.api.fetch_import ("")));
    assert (r.status == catalog_status::inaccessible_source);
    assert (f.client.requests ().empty ());
  }

  f.client.on (fake_catalog::import, 200, "null");
  {
    auto r (run_awaitable (f.ioc, f.api.fetch_import ("76561198000000001")));
    assert (r.status == catalog_status::inaccessible_source);
  }

  f.client.on (fake_catalog::import, 200, R"({"error":"profile private"})");
  {
    auto r (run_awaitable (f.ioc, f.api.fetch_import ("76561198000000001")));
    assert (r.status == catalog_status::inaccessible_source);
    assert (r.error == "profile private");
  }

  f.client.on (fake_catalog::import, 200, R"({"games":[
    {"steam_id":220,"hltb_id":4000,"steam_name":"Half-Life 2","hltb_name":"Half-Life 2"},
    {"steam_id":570,"hltb_id":0,"steam_name":"Dota 2"},
    {"steam_id":"400","hltb_id":"7231","steam_name":"Portal"}]})");
  {
    auto r (run_awaitable (f.ioc, f.api.fetch_import ("76561198000000001")));
    assert (r);
    assert (r.value->size () == 2);
    assert ((*r.value)[0].storefront_id == 220 && (*r.value)[0].catalog_id == 4000);
    assert ((*r.value)[1].storefront_id == 400 && (*r.value)[1].catalog_id == 7231);

    json::value b (json::parse (*f.client.requests ().back ().body));
    assert (b.at ("steamUserId").as_string () == "76561198000000001");
    assert (b.at ("steamOmitData").as_int64 () == 0);
  }

  // Every row unusable.
  //
  f.client.on (fake_catalog::import, 200,
               R"({"games":[{"steam_id":570,"hltb_id":0}]})");
  {
    auto r (run_awaitable (f.ioc, f.api.fetch_import ("76561198000000001")));
    assert (r.status == catalog_status::inaccessible_source);
  }
}

static void
test_terms ()
{
  vector<string> t (search_terms ("  The  Witcher 3: Wild Hunt "));

  assert (t.size () == 5);
  assert (t[0] == "The" && t[2] == "3:" && t[4] == "Hunt");
  assert (search_terms ("").empty ());
}

int
main ()
{
  test_transport ();
  test_extract ();
  test_discovery_fallback ();
  test_token ();
  test_search ();
  test_search_rediscovery ();
  test_tokenless ();
  test_import ();
  test_terms ();
}
