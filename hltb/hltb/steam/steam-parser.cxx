#include <hltb/steam/steam-parser.hxx>

#include <cctype>
#include <cstdlib>
#include <fstream>
#include <sstream>
#include <stdexcept>

using namespace std;

namespace hltb
{
  const vdf_node* vdf_node::
  find (const string& k) const
  {
    if (!is_object ())
      return nullptr;

    const vdf_object& o (as_object ());
    auto i (o.find (k));
    return i != o.end () ? &i->second : nullptr;
  }

  string vdf_node::
  get_string (const string& k, const string& def) const
  {
    const vdf_node* n (find (k));
    return n != nullptr && n->is_string () ? n->as_string () : def;
  }

  const vdf_object* vdf_node::
  get_object (const string& k) const
  {
    const vdf_node* n (find (k));
    return n != nullptr && n->is_object () ? &n->as_object () : nullptr;
  }

  // vdf_parser
  //
  char vdf_parser::
  peek (cursor& c)
  {
    while (c.p < c.e)
    {
      char x (*c.p);

      if (isspace (static_cast<unsigned char> (x)))
      {
        if (x == '\n')
          ++c.line;

        ++c.p;
      }
      else if (x == '/' && c.p + 1 < c.e && c.p[1] == '/')
      {
        while (c.p < c.e && *c.p != '\n')
          ++c.p;
      }
      else
        return x;
    }

    return '\0';
  }

  // Quoted with backslash escapes, or bare up to whitespace or a brace.
  //
  string vdf_parser::
  token (cursor& c)
  {
    if (peek (c) == '\0')
      throw runtime_error ("unexpected end of VDF input at line " +
                           std::to_string (c.line));

    string r;

    if (*c.p == '"')
    {
      for (++c.p;; ++c.p)
      {
        if (c.p == c.e)
          throw runtime_error ("unterminated VDF string at line " +
                               std::to_string (c.line));

        char x (*c.p);

        if (x == '"')
        {
          ++c.p;
          break;
        }

        if (x == '\\' && c.p + 1 < c.e)
        {
          switch (*++c.p)
          {
            case 'n':  r += '\n'; break;
            case 't':  r += '\t'; break;
            case 'r':  r += '\r'; break;
            default:   r += *c.p; break;
          }

          continue;
        }

        if (x == '\n')
          ++c.line;

        r += x;
      }
    }
    else
    {
      for (; c.p < c.e; ++c.p)
      {
        char x (*c.p);

        if (isspace (static_cast<unsigned char> (x)) ||
            x == '{' || x == '}' || x == '"')
          break;

        r += x;
      }
    }

    return r;
  }

  pair<string, vdf_node> vdf_parser::
  entry (cursor& c)
  {
    string k (token (c));

    if (peek (c) != '{')
      return {move (k), vdf_node (token (c))};

    ++c.p;
    vdf_object o (object (c));

    if (peek (c) != '}')
      throw runtime_error ("expected '}' at line " + std::to_string (c.line));

    ++c.p;
    return {move (k), vdf_node (move (o))};
  }

  vdf_object vdf_parser::
  object (cursor& c)
  {
    vdf_object r;

    for (char x (peek (c)); x != '\0' && x != '}'; x = peek (c))
    {
      auto [k, v] = entry (c);

      // Later duplicates win, as in the Steam client.
      //
      r[move (k)] = move (v);
    }

    return r;
  }

  vdf_node vdf_parser::
  parse (const string& s)
  {
    cursor c (s);

    if (peek (c) == '{')
    {
      ++c.p;
      return vdf_node (object (c));
    }

    // A sequence of top-level pairs, usually just one.
    //
    vdf_object r (object (c));

    if (peek (c) != '\0')
      throw runtime_error ("unexpected '}' at line " + std::to_string (c.line));

    return vdf_node (move (r));
  }

  vdf_node vdf_parser::
  parse_stream (istream& is)
  {
    ostringstream os;
    os << is.rdbuf ();
    return parse (os.str ());
  }

  vdf_node vdf_parser::
  parse_file (const fs::path& f)
  {
    ifstream is (f, ios::binary);

    if (!is)
      throw runtime_error ("unable to open " + f.string ());

    return parse_stream (is);
  }

  vector<steam_account>
  parse_login_users (const vdf_node& root)
  {
    vector<steam_account> r;

    const vdf_object* us (root.get_object ("users"));
    if (us == nullptr)
      return r;

    for (const auto& [id, n]: *us)
    {
      if (!n.is_object () || !valid_steam_id (id))
        continue;

      steam_account a;
      a.steam_id = id;
      a.account_name = n.get_string ("AccountName");
      a.persona_name = n.get_string ("PersonaName");

      // Older clients wrote "mostrecent".
      //
      string m (n.get_string ("MostRecent", n.get_string ("mostrecent", "0")));
      a.most_recent = m == "1";

      string t (n.get_string ("Timestamp", "0"));
      a.timestamp = strtoll (t.c_str (), nullptr, 10);

      r.push_back (move (a));
    }

    return r;
  }
}
