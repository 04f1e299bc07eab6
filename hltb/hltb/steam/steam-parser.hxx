#pragma once

#include <hltb/steam/steam-types.hxx>

#include <string>
#include <map>
#include <vector>
#include <istream>
#include <variant>

namespace hltb
{
  struct vdf_node;

  using vdf_object = std::map<std::string, vdf_node>;

  // A VDF (Valve KeyValues text) value: either a string or a nested object.
  //
  struct vdf_node
  {
    std::variant<std::string, vdf_object> value;

    vdf_node () = default;

    explicit vdf_node (std::string s) : value (std::move (s)) {}
    explicit vdf_node (vdf_object o) : value (std::move (o)) {}

    bool
    is_string () const noexcept
    {
      return std::holds_alternative<std::string> (value);
    }

    bool
    is_object () const noexcept
    {
      return std::holds_alternative<vdf_object> (value);
    }

    const std::string&
    as_string () const
    {
      return std::get<std::string> (value);
    }

    const vdf_object&
    as_object () const
    {
      return std::get<vdf_object> (value);
    }

    // Child by key, nullptr if absent or this is not an object.
    //
    const vdf_node*
    find (const std::string& key) const;

    std::string
    get_string (const std::string& key, const std::string& def = "") const;

    const vdf_object*
    get_object (const std::string& key) const;
  };

  // VDF text parser.
  //
  // Throws std::runtime_error with the line number on structural errors.
  // Keys are kept as written; Steam is not consistent about their case.
  //
  class vdf_parser
  {
  public:
    static vdf_node
    parse (const std::string&);

    static vdf_node
    parse_file (const fs::path&);

    static vdf_node
    parse_stream (std::istream&);

  private:
    struct cursor
    {
      const char* p;
      const char* e;
      std::size_t line;

      explicit
      cursor (const std::string& s)
        : p (s.data ()), e (s.data () + s.size ()), line (1) {}
    };

    // Skip whitespace and // comments, return the next character without
    // consuming it ('\0' at end).
    //
    static char
    peek (cursor&);

    static std::string
    token (cursor&);

    static std::pair<std::string, vdf_node>
    entry (cursor&);

    static vdf_object
    object (cursor&);
  };

  // Accounts listed in loginusers.vdf:
  //
  // "users" { "7656119..." { "AccountName" "..." "MostRecent" "1" ... } }
  //
  std::vector<steam_account>
  parse_login_users (const vdf_node&);
}
