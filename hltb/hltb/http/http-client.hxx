#pragma once

#include <string>
#include <cstdint>

#include <boost/asio.hpp>
#include <boost/asio/ssl.hpp>
#include <boost/beast.hpp>

#include <hltb/http/http-types.hxx>
#include <hltb/http/http-request.hxx>
#include <hltb/http/http-response.hxx>

namespace hltb
{
  namespace asio  = boost::asio;
  namespace beast = boost::beast;
  namespace ssl   = boost::asio::ssl;

  template <typename S = std::string>
  struct http_client_traits
  {
    using string_type   = S;
    using request_type  = basic_http_request<string_type>;
    using response_type = basic_http_response<string_type>;

    // Both in milliseconds. The request timeout covers writing the request
    // and reading the whole response.
    //
    std::uint32_t connect_timeout = 10000;
    std::uint32_t request_timeout = 10000;

    std::uint8_t max_redirects = 5;

    bool verify_peer = true;
    string_type ca_file;           // Empty means the system store.

    // The catalog turns away clients that don't look like a browser.
    //
    string_type user_agent = string_type (
      "Mozilla/5.0 (X11; Linux x86_64) AppleWebKit/537.36 "
      "(KHTML, like Gecko) Chrome/124.0.0.0 Safari/537.36");
  };

  // One-shot HTTP/1.1 exchanges over plain TCP or TLS, as coroutines.
  //
  // Each request gets its own connection and the response is read whole.
  // Redirects are followed up to the traits limit. Anything that goes wrong
  // below HTTP (resolve, connect, handshake, timeout) comes out as
  // boost::system::system_error; an HTTP error status is a normal response.
  //
  template <typename T = http_client_traits<>>
  class basic_http_client
  {
  public:
    using traits_type   = T;
    using string_type   = typename traits_type::string_type;
    using request_type  = typename traits_type::request_type;
    using response_type = typename traits_type::response_type;
    using headers_type  = typename request_type::headers_type;

    explicit
    basic_http_client (asio::io_context&, traits_type = traits_type ());

    basic_http_client (const basic_http_client&) = delete;
    basic_http_client& operator= (const basic_http_client&) = delete;

    asio::awaitable<response_type>
    request (request_type);

    const traits_type&
    traits () const noexcept
    {
      return traits_;
    }

  private:
    asio::awaitable<response_type>
    fetch (const request_type&, const url_parts&);

    asio::awaitable<response_type>
    fetch_tls (const request_type&, const url_parts&);

  private:
    asio::io_context& ioc_;
    traits_type traits_;
    ssl::context tls_;
  };

  using http_client = basic_http_client<>;
}

#include <hltb/http/http-client.ixx>
#include <hltb/http/http-client.txx>
