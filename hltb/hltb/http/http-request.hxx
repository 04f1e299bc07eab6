#pragma once

#include <string>
#include <utility>
#include <ostream>
#include <optional>

#include <hltb/http/http-types.hxx>

namespace hltb
{
  // Outgoing request. The URL is absolute; the client takes the connection
  // target from it.
  //
  template <typename S, typename B = S>
  class basic_http_request
  {
  public:
    using string_type  = S;
    using body_type    = B;
    using headers_type = basic_http_headers<string_type>;

    http_method              method = http_method::get;
    string_type              url;
    headers_type             headers;
    std::optional<body_type> body;

    basic_http_request () = default;

    basic_http_request (http_method m, string_type u, headers_type h = {})
      : method (m), url (std::move (u)), headers (std::move (h)) {}

    void
    set_header (string_type n, string_type v)
    {
      headers.set (std::move (n), std::move (v));
    }

    std::optional<string_type>
    get_header (const string_type& n) const
    {
      return headers.get (n);
    }

    void
    set_content_type (string_type t)
    {
      set_header ("Content-Type", std::move (t));
    }

    void
    set_body (body_type b)
    {
      body = std::move (b);
    }

    // Add Host and User-Agent where missing. Both are recomputed on every
    // redirect hop.
    //
    void
    complete (const url_parts&, const string_type& user_agent);
  };

  template <typename S, typename B>
  inline std::ostream&
  operator<< (std::ostream& o, const basic_http_request<S, B>& r)
  {
    o << r.method << ' ' << r.url;

    if (r.body)
      o << " (" << r.body->size () << " bytes)";

    return o;
  }

  using http_request = basic_http_request<std::string>;
}

#include <hltb/http/http-request.ixx>
