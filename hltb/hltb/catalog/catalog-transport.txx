#include <exception>

#include <boost/system/system_error.hpp>

#include <hltb/hltb-log.hxx>

namespace hltb
{
  // Keep error strings readable when the server answers with a whole HTML
  // page.
  //
  inline std::string
  truncate_body (const std::string& b, std::size_t n = 200)
  {
    return b.size () > n ? b.substr (0, n) + "..." : b;
  }

  template <typename C>
  void basic_catalog_transport<C>::
  standard_headers (request_type& req) const
  {
    req.set_header ("Accept", "application/json, text/plain, */*");

    // The catalog checks where requests claim to come from. Third-party
    // hosts (storefront APIs) get no such claims.
    //
    if (req.url.compare (0, endpoint_.base ().size (), endpoint_.base ()) == 0)
    {
      req.set_header ("Referer", endpoint_.base ());
      req.set_header ("Origin", endpoint_.origin ());
    }
  }

  template <typename C>
  asio::awaitable<catalog_result<std::string>> basic_catalog_transport<C>::
  exchange (request_type req)
  {
    using result = catalog_result<std::string>;

    ++requests_;

    if (verb >= 3)
      trace << req;

    response_type r;

    try
    {
      r = co_await client_.request (std::move (req));
    }
    catch (const boost::system::system_error& e)
    {
      co_return result (catalog_status::transport_failure,
                        std::string (e.what ()) + " [" +
                        e.code ().category ().name () + ':' +
                        std::to_string (e.code ().value ()) + ']');
    }
    catch (const std::exception& e)
    {
      co_return result (catalog_status::transport_failure, e.what ());
    }

    std::uint16_t s (r.status_code ());

    if (!r.is_success ())
      co_return result (catalog_status::upstream_rejection,
                        "HTTP " + std::to_string (s) +
                        (r.text ().empty ()
                         ? std::string ()
                         : ": " + truncate_body (r.text ())),
                        s);

    co_return result (r.text (), s);
  }

  template <typename C>
  catalog_result<json::value> basic_catalog_transport<C>::
  decode (catalog_result<std::string>&& r)
  {
    using result = catalog_result<json::value>;

    if (!r)
      return result::failure (r);

    const std::string& b (*r.value);

    json::error_code ec;
    json::value jv (json::parse (b, ec));

    if (ec)
      return result (catalog_status::malformed_response,
                     "invalid JSON response: " + ec.message (),
                     r.http_status);

    // The catalog answers `null` when it has nothing for us.
    //
    if (jv.is_null ())
    {
      result x (catalog_status::malformed_response,
                "null response",
                r.http_status);
      x.null_payload = true;
      return x;
    }

    return result (std::move (jv), r.http_status);
  }

  template <typename C>
  asio::awaitable<catalog_result<std::string>> basic_catalog_transport<C>::
  get_text (const std::string& url, headers_type extra)
  {
    request_type req (http_method::get, url, std::move (extra));
    standard_headers (req);
    co_return co_await exchange (std::move (req));
  }

  template <typename C>
  asio::awaitable<catalog_result<json::value>> basic_catalog_transport<C>::
  get_json (const std::string& url, headers_type extra)
  {
    request_type req (http_method::get, url, std::move (extra));
    standard_headers (req);
    co_return decode (co_await exchange (std::move (req)));
  }

  template <typename C>
  asio::awaitable<catalog_result<json::value>> basic_catalog_transport<C>::
  post_json (const std::string& url,
             const json::value& body,
             headers_type extra)
  {
    request_type req (http_method::post, url, std::move (extra));
    standard_headers (req);
    req.set_content_type ("application/json");
    req.set_body (json::serialize (body));
    co_return decode (co_await exchange (std::move (req)));
  }
}
