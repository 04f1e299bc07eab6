#include <hltb/catalog/catalog-session.hxx>

#include <regex>

using namespace std;

namespace hltb
{
  // Pages and bundles run to hundreds of kilobytes, and std::regex over the
  // whole thing is both slow and deeply recursive. So we locate candidates
  // with find() and only run the expression over a short window.
  //
  static const size_t window (512);

  optional<string>
  extract_app_script (const string& html)
  {
    static const regex re (R"(^(/_next/static/chunks/pages/_app-[A-Za-z0-9_\-]+\.js))");
    static const string needle ("/_next/static/chunks/pages/_app-");

    for (size_t p (html.find (needle));
         p != string::npos;
         p = html.find (needle, p + 1))
    {
      string w (html.substr (p, window));
      smatch m;

      if (regex_search (w, m, re))
        return m[1].str ();
    }

    return nullopt;
  }

  optional<string>
  extract_build_id (const string& html)
  {
    static const regex re (R"re(^"buildId"\s*:\s*"([A-Za-z0-9_\-]+)")re");
    static const string needle ("\"buildId\"");

    for (size_t p (html.find (needle));
         p != string::npos;
         p = html.find (needle, p + 1))
    {
      string w (html.substr (p, window));
      smatch m;

      if (regex_search (w, m, re))
        return m[1].str ();
    }

    return nullopt;
  }

  optional<string>
  extract_search_path (const string& js)
  {
    // fetch("/api/seek/".concat("4a1f...")) or fetch("/api/search", ...).
    //
    static const regex re (
      R"re(^fetch\(\s*["'](/api/[A-Za-z0-9_\-/]+)["'])re"
      R"re((\s*\.concat\(\s*["']([A-Za-z0-9_\-/]*)["']\s*\))?)re");

    // Other API families the bundle talks to.
    //
    static const char* const skip[] = {
      "/api/user", "/api/steam", "/api/game", "/api/logout", "/api/error"};

    static const string needle ("fetch(");

    for (size_t p (js.find (needle));
         p != string::npos;
         p = js.find (needle, p + 1))
    {
      string w (js.substr (p, window));
      smatch m;

      if (!regex_search (w, m, re))
        continue;

      string path (m[1].str ());

      bool other (false);
      for (const char* s: skip)
      {
        if (path.compare (0, char_traits<char>::length (s), s) == 0)
        {
          other = true;
          break;
        }
      }

      if (other)
        continue;

      if (m[3].matched)
        path += m[3].str ();

      while (path.size () > 1 && path.back () == '/')
        path.pop_back ();

      return path;
    }

    return nullopt;
  }
}
