#pragma once

#include <cstdint>
#include <string>
#include <vector>

#include <boost/asio.hpp>
#include <boost/json.hpp>

#include <hltb/catalog/catalog-types.hxx>
#include <hltb/catalog/catalog-session.hxx>
#include <hltb/catalog/catalog-transport.hxx>

namespace hltb
{
  namespace asio = boost::asio;
  namespace json = boost::json;

  // The three catalog operations we use: name search, fetch by id, and the
  // storefront library import.
  //
  // Endpoint and token come from the session. When the catalog answers in a
  // way that says our discovered state went stale (the search path or build
  // id rotated), the session is invalidated and the call is repeated once.
  //
  template <typename C = http_client>
  class basic_catalog_api
  {
  public:
    using transport_type = basic_catalog_transport<C>;
    using session_type   = basic_catalog_session<C>;

    // Page size of a search. The catalog caps it anyway.
    //
    static constexpr std::size_t search_size = 20;

    basic_catalog_api (transport_type& t, session_type& s)
      : transport_ (t), session_ (s) {}

    basic_catalog_api (const basic_catalog_api&) = delete;
    basic_catalog_api& operator= (const basic_catalog_api&) = delete;

    // Hits in the catalog's relevance order. An empty list is a valid
    // answer.
    //
    asio::awaitable<catalog_result<std::vector<catalog_record>>>
    search (const std::string& query);

    asio::awaitable<catalog_result<catalog_record>>
    fetch_by_id (std::uint64_t catalog_id);

    // Storefront-to-catalog mappings for a public profile. Private or
    // unknown profiles end in inaccessible_source.
    //
    asio::awaitable<catalog_result<std::vector<import_mapping>>>
    fetch_import (const std::string& steam_user_id);

    // Request body of a search for the query.
    //
    static json::value
    search_body (const std::string& query);

    static json::value
    import_body (const std::string& steam_user_id);

  private:
    asio::awaitable<catalog_result<json::value>>
    post_search (const json::value& body);

    transport_type& transport_;
    session_type& session_;
  };

  using catalog_api = basic_catalog_api<>;

  // Whether an upstream status means our discovered endpoint state is
  // outdated.
  //
  inline bool
  endpoint_moved (std::uint16_t s) noexcept
  {
    return s == 404 || s == 403;
  }

  // Split a query into the catalog's search terms.
  //
  std::vector<std::string>
  search_terms (const std::string&);
}

#include <hltb/catalog/catalog-api.txx>
