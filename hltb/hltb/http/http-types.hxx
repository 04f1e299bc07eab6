#pragma once

#include <string>
#include <vector>
#include <cstdint>
#include <utility>
#include <ostream>
#include <optional>
#include <initializer_list>

namespace hltb
{
  // Everything we send is either a page/JSON fetch or a JSON post.
  //
  enum class http_method
  {
    get,
    post
  };

  std::string
  to_string (http_method);

  inline std::ostream&
  operator<< (std::ostream& o, http_method m)
  {
    return o << to_string (m);
  }

  // Numeric HTTP status. Only the codes the client and the catalog layer
  // branch on are named; any other value is carried through as is.
  //
  enum class http_status : std::uint16_t
  {
    none        = 0,   // Nothing was received.
    ok          = 200,
    see_other   = 303,
    forbidden   = 403,
    not_found   = 404
  };

  inline std::ostream&
  operator<< (std::ostream& o, http_status s)
  {
    return o << static_cast<std::uint16_t> (s);
  }

  // Header list in arrival order. Names compare case-insensitively.
  //
  template <typename S>
  class basic_http_headers
  {
  public:
    using string_type = S;
    using field_type  = std::pair<string_type, string_type>;
    using fields_type = std::vector<field_type>;

    using const_iterator = typename fields_type::const_iterator;

    basic_http_headers () = default;

    basic_http_headers (std::initializer_list<field_type> fs)
      : fields_ (fs) {}

    // Drop any field of that name, then append.
    //
    void
    set (string_type name, string_type value);

    void
    add (string_type name, string_type value)
    {
      fields_.emplace_back (std::move (name), std::move (value));
    }

    void
    remove (const string_type& name);

    // Value of the first field with that name.
    //
    std::optional<string_type>
    get (const string_type& name) const;

    bool
    contains (const string_type& name) const
    {
      return get (name).has_value ();
    }

    const_iterator begin () const noexcept {return fields_.begin ();}
    const_iterator end () const noexcept {return fields_.end ();}

  private:
    fields_type fields_;
  };

  using http_headers = basic_http_headers<std::string>;

  // Pieces of an absolute http(s) URL. The port is always filled in.
  //
  struct url_parts
  {
    std::string scheme;
    std::string host;
    std::string port;
    std::string target;   // Path and query, at least "/".

    bool
    secure () const noexcept
    {
      return scheme == "https";
    }
  };

  url_parts
  parse_url (const std::string&);

  // Resolve a redirect Location against the URL that answered with it.
  //
  std::string
  resolve_location (const std::string& base, const std::string& location);
}

#include <hltb/http/http-types.ixx>
