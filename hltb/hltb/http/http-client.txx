#include <chrono>
#include <stdexcept>

#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>
#include <boost/beast/ssl.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/ssl/stream.hpp>
#include <boost/asio/use_awaitable.hpp>

#include <openssl/err.h>
#include <openssl/ssl.h>

namespace hltb
{
  namespace http = beast::http;

  // Send the request over a connected stream and read the response. The
  // stream's lowest layer must be a beast::tcp_stream (for the deadline).
  //
  template <typename R, typename Stream, typename Q>
  asio::awaitable<R>
  http_roundtrip (Stream& s,
                  const Q& q,
                  const std::string& target,
                  std::chrono::milliseconds timeout)
  {
    http::request<http::string_body> m (
      q.method == http_method::post ? http::verb::post : http::verb::get,
      target,
      11);

    for (const auto& h: q.headers)
      m.set (h.first, h.second);

    if (q.body)
    {
      m.body () = *q.body;
      m.prepare_payload ();
    }

    beast::get_lowest_layer (s).expires_after (timeout);

    co_await http::async_write (s, m, asio::use_awaitable);

    beast::flat_buffer buf;
    http::response<http::string_body> a;
    co_await http::async_read (s, buf, a, asio::use_awaitable);

    R r;
    r.status = static_cast<http_status> (a.result_int ());

    for (const auto& h: a)
      r.headers.add (std::string (h.name_string ()), std::string (h.value ()));

    if (!a.body ().empty ())
      r.body = std::move (a.body ());

    co_return r;
  }

  template <typename T>
  asio::awaitable<typename basic_http_client<T>::response_type>
  basic_http_client<T>::
  request (request_type q)
  {
    for (std::uint8_t hops (0);; ++hops)
    {
      url_parts u (parse_url (q.url));
      q.complete (u, traits_.user_agent);

      response_type r (co_await fetch (q, u));

      std::optional<string_type> loc;
      if (!r.is_redirect () || !(loc = r.location ()))
        co_return r;

      if (hops == traits_.max_redirects)
        throw std::runtime_error ("too many redirects from " + q.url);

      q.url = resolve_location (q.url, *loc);

      // Only a 303 changes the method; everything else replays the body.
      //
      if (r.status == http_status::see_other)
      {
        q.method = http_method::get;
        q.body = std::nullopt;
        q.headers.remove ("Content-Type");
      }
    }
  }

  template <typename T>
  asio::awaitable<typename basic_http_client<T>::response_type>
  basic_http_client<T>::
  fetch (const request_type& q, const url_parts& u)
  {
    if (u.secure ())
      co_return co_await fetch_tls (q, u);

    asio::ip::tcp::resolver rs (ioc_);
    auto eps (co_await rs.async_resolve (u.host, u.port, asio::use_awaitable));

    beast::tcp_stream s (ioc_);
    s.expires_after (std::chrono::milliseconds (traits_.connect_timeout));
    co_await s.async_connect (eps, asio::use_awaitable);

    response_type r (
      co_await http_roundtrip<response_type> (
        s, q, u.target, std::chrono::milliseconds (traits_.request_timeout)));

    beast::error_code ec;
    s.socket ().shutdown (asio::ip::tcp::socket::shutdown_both, ec);

    co_return r;
  }

  template <typename T>
  asio::awaitable<typename basic_http_client<T>::response_type>
  basic_http_client<T>::
  fetch_tls (const request_type& q, const url_parts& u)
  {
    asio::ip::tcp::resolver rs (ioc_);
    auto eps (co_await rs.async_resolve (u.host, u.port, asio::use_awaitable));

    beast::ssl_stream<beast::tcp_stream> s (ioc_, tls_);

    // SNI goes through the OpenSSL handle. The catalog's CDN drops the
    // handshake without it.
    //
    if (!SSL_set_tlsext_host_name (s.native_handle (), u.host.c_str ()))
      throw beast::system_error (
        beast::error_code (static_cast<int> (::ERR_get_error ()),
                           asio::error::get_ssl_category ()),
        "unable to set SNI for " + u.host);

    if (traits_.verify_peer)
      s.set_verify_callback (ssl::host_name_verification (u.host));

    beast::tcp_stream& l (beast::get_lowest_layer (s));
    l.expires_after (std::chrono::milliseconds (traits_.connect_timeout));

    co_await l.async_connect (eps, asio::use_awaitable);
    co_await s.async_handshake (ssl::stream_base::client, asio::use_awaitable);

    response_type r (
      co_await http_roundtrip<response_type> (
        s, q, u.target, std::chrono::milliseconds (traits_.request_timeout)));

    // No close_notify: many servers never answer it and we would sit out
    // the deadline.
    //
    beast::error_code ec;
    l.socket ().shutdown (asio::ip::tcp::socket::shutdown_both, ec);

    co_return r;
  }
}
