#pragma once

#include <string>

#include <boost/asio.hpp>
#include <boost/json.hpp>

#include <hltb/http/http-client.hxx>

#include <hltb/catalog/catalog-types.hxx>
#include <hltb/catalog/catalog-endpoint.hxx>

namespace hltb
{
  namespace asio = boost::asio;
  namespace json = boost::json;

  // HTTP calls with the catalog's standard headers and outcome
  // classification.
  //
  // Every call ends in one of: a value, a transport failure (no status), an
  // upstream rejection (non-2xx, status carried), or a malformed payload
  // (including the literal `null` body). JSON is decoded here so that
  // nothing past this point handles raw payloads. No retries: whether a
  // failure is worth retrying is the caller's call.
  //
  // The client type is a template parameter so tests can substitute a canned
  // one. It must provide request(request_type) -> awaitable<response_type>.
  //
  template <typename C = http_client>
  class basic_catalog_transport
  {
  public:
    using client_type   = C;
    using request_type  = typename client_type::request_type;
    using response_type = typename client_type::response_type;
    using headers_type  = typename request_type::headers_type;

    basic_catalog_transport (client_type& c, catalog_endpoint e)
      : client_ (c), endpoint_ (std::move (e)) {}

    basic_catalog_transport (const basic_catalog_transport&) = delete;
    basic_catalog_transport& operator= (const basic_catalog_transport&) = delete;

    asio::awaitable<catalog_result<std::string>>
    get_text (const std::string& url, headers_type extra = headers_type ());

    asio::awaitable<catalog_result<json::value>>
    get_json (const std::string& url, headers_type extra = headers_type ());

    asio::awaitable<catalog_result<json::value>>
    post_json (const std::string& url,
               const json::value& body,
               headers_type extra = headers_type ());

    const catalog_endpoint&
    endpoint () const noexcept
    {
      return endpoint_;
    }

    // Number of exchanges performed, for diagnostics.
    //
    std::size_t
    requests () const noexcept
    {
      return requests_;
    }

  private:
    asio::awaitable<catalog_result<std::string>>
    exchange (request_type req);

    static catalog_result<json::value>
    decode (catalog_result<std::string>&& r);

    void
    standard_headers (request_type& req) const;

  private:
    client_type& client_;
    catalog_endpoint endpoint_;
    std::size_t requests_ = 0;
  };

  using catalog_transport = basic_catalog_transport<>;
}

#include <hltb/catalog/catalog-transport.txx>
