#include <hltb/http/http-types.hxx>

using namespace std;

namespace hltb
{
  string
  to_string (http_method m)
  {
    switch (m)
    {
    case http_method::get:  return "GET";
    case http_method::post: return "POST";
    }

    return "GET";
  }

  // scheme://host[:port][/target]. Userinfo and IPv6 literals don't occur
  // in anything we fetch.
  //
  url_parts
  parse_url (const string& u)
  {
    url_parts r;
    size_t b (0);

    if (size_t p = u.find ("://"); p != string::npos)
    {
      r.scheme = u.substr (0, p);
      b = p + 3;
    }
    else
      r.scheme = "http";

    size_t e (u.find_first_of ("/?", b));
    if (e == string::npos)
      e = u.size ();

    string a (u, b, e - b);

    if (size_t c = a.rfind (':'); c != string::npos)
    {
      r.host.assign (a, 0, c);
      r.port.assign (a, c + 1, string::npos);
    }
    else
    {
      r.host = move (a);
      r.port = r.secure () ? "443" : "80";
    }

    if (e == u.size ())
      r.target = "/";
    else if (u[e] == '?')
      r.target = '/' + u.substr (e);
    else
      r.target = u.substr (e);

    return r;
  }

  string
  resolve_location (const string& base, const string& loc)
  {
    if (loc.find ("://") != string::npos)
      return loc;

    url_parts p (parse_url (base));

    string r (p.scheme + "://" + p.host);

    if (p.port != (p.secure () ? "443" : "80"))
      r += ':' + p.port;

    // Protocol-relative, absolute path, or relative to the current
    // directory.
    //
    if (loc.compare (0, 2, "//") == 0)
      return p.scheme + ':' + loc;

    if (!loc.empty () && loc[0] == '/')
      return r + loc;

    return r + p.target.substr (0, p.target.rfind ('/') + 1) + loc;
  }
}
