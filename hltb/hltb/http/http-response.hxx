#pragma once

#include <string>
#include <cstdint>
#include <utility>
#include <optional>

#include <hltb/http/http-types.hxx>

namespace hltb
{
  // Fully buffered response.
  //
  template <typename S, typename B = S>
  class basic_http_response
  {
  public:
    using string_type  = S;
    using body_type    = B;
    using headers_type = basic_http_headers<string_type>;

    http_status              status = http_status::none;
    headers_type             headers;
    std::optional<body_type> body;

    basic_http_response () = default;

    basic_http_response (http_status s, body_type b)
      : status (s), body (std::move (b)) {}

    std::uint16_t
    status_code () const noexcept
    {
      return static_cast<std::uint16_t> (status);
    }

    bool
    is_success () const noexcept
    {
      return status_code () / 100 == 2;
    }

    bool
    is_redirect () const noexcept
    {
      return status_code () / 100 == 3;
    }

    std::optional<string_type>
    location () const
    {
      return headers.get ("Location");
    }

    // Body, or an empty one if none came.
    //
    const body_type&
    text () const
    {
      static const body_type e;
      return body ? *body : e;
    }
  };

  using http_response = basic_http_response<std::string>;
}
