#include <hltb/hltb-log.hxx>

namespace hltb
{
  template <typename C>
  json::value basic_catalog_api<C>::
  search_body (const std::string& q)
  {
    json::array terms;
    for (const std::string& t: search_terms (q))
      terms.emplace_back (t);

    // Mirrors what the site's own search page sends. The server rejects
    // bodies that leave out any of the option groups.
    //
    return json::value {
      {"searchType", "games"},
      {"searchTerms", std::move (terms)},
      {"searchPage", 1},
      {"size", search_size},
      {"searchOptions", {
        {"games", {
          {"userId", 0},
          {"platform", ""},
          {"sortCategory", "popular"},
          {"rangeCategory", "main"},
          {"rangeTime", {{"min", nullptr}, {"max", nullptr}}},
          {"gameplay", {
            {"perspective", ""},
            {"flow", ""},
            {"genre", ""},
            {"difficulty", ""}}},
          {"rangeYear", {{"min", ""}, {"max", ""}}},
          {"modifier", ""}}},
        {"users", {{"sortCategory", "postcount"}}},
        {"lists", {{"sortCategory", "follows"}}},
        {"filter", ""},
        {"sort", 0},
        {"randomizer", 0}}},
      {"useCache", true}};
  }

  template <typename C>
  json::value basic_catalog_api<C>::
  import_body (const std::string& u)
  {
    return json::value {{"steamUserId", u}, {"steamOmitData", 0}};
  }

  template <typename C>
  asio::awaitable<catalog_result<json::value>> basic_catalog_api<C>::
  post_search (const json::value& body)
  {
    // Without a token the catalog may still answer, so a failure here only
    // costs us the header.
    //
    typename transport_type::headers_type hs;
    std::string url;

    catalog_result<auth_session> s (co_await session_.ensure_fresh ());

    if (s)
    {
      hs.set ("x-auth-token", s.value->token);
      url = std::move (s.value->endpoint_url);
    }
    else
    {
      warn << "proceeding without catalog token: " << s.error;
      url = co_await session_.endpoint ();
    }

    co_return co_await transport_.post_json (url, body, std::move (hs));
  }

  template <typename C>
  asio::awaitable<catalog_result<std::vector<catalog_record>>>
  basic_catalog_api<C>::
  search (const std::string& q)
  {
    using result = catalog_result<std::vector<catalog_record>>;

    json::value body (search_body (q));
    catalog_result<json::value> r (co_await post_search (body));

    if (r.status == catalog_status::upstream_rejection &&
        endpoint_moved (r.http_status))
    {
      info << "search endpoint rejected with " << r.http_status
           << ", rediscovering";

      session_.invalidate ();
      r = co_await post_search (body);
    }

    if (!r)
      co_return result::failure (r);

    result s (parse_search_response (*r.value));

    if (s)
      trace << "search '" << q << "': " << s.value->size () << " hit(s)";

    co_return s;
  }

  template <typename C>
  asio::awaitable<catalog_result<catalog_record>> basic_catalog_api<C>::
  fetch_by_id (std::uint64_t id)
  {
    using result = catalog_result<catalog_record>;

    for (int attempt (0);; ++attempt)
    {
      catalog_result<std::string> b (co_await session_.build_id ());

      if (!b)
        co_return result::failure (b);

      catalog_result<json::value> r (
        co_await transport_.get_json (
          transport_.endpoint ().game_page (*b.value, id)));

      // A rotated build id gives 404 for every page.
      //
      if (attempt == 0 &&
          r.status == catalog_status::upstream_rejection &&
          r.http_status == 404)
      {
        info << "game page not found under build " << *b.value
             << ", rediscovering";

        session_.invalidate ();
        continue;
      }

      if (!r)
      {
        result x (result::failure (r));

        if (r.null_payload)
          x.error = "invalid JSON response";

        co_return x;
      }

      co_return parse_game_page (*r.value);
    }
  }

  template <typename C>
  asio::awaitable<catalog_result<std::vector<import_mapping>>>
  basic_catalog_api<C>::
  fetch_import (const std::string& u)
  {
    using result = catalog_result<std::vector<import_mapping>>;

    if (u.empty ())
      co_return result (catalog_status::inaccessible_source,
                        "no storefront user");

    catalog_result<json::value> r (
      co_await transport_.post_json (transport_.endpoint ().steam_import (),
                                     import_body (u)));

    // A `null` body is the catalog's way of saying the profile is private.
    //
    if (r.null_payload)
      co_return result (catalog_status::inaccessible_source,
                        "profile is private or unknown",
                        r.http_status);

    if (!r)
      co_return result::failure (r);

    co_return parse_import_response (*r.value);
  }
}
