#include <hltb/match/match-name.hxx>

#include <regex>
#include <cctype>
#include <utility>
#include <algorithm>

using namespace std;

namespace hltb
{
  // UTF-8 sequences and what they become. An empty replacement drops the
  // glyph.
  //
  static const pair<const char*, const char*> glyphs[] = {
    {"\xE2\x84\xA2", ""},    // TRADE MARK SIGN
    {"\xC2\xAE",     ""},    // REGISTERED SIGN
    {"\xC2\xA9",     ""},    // COPYRIGHT SIGN
    {"\xE2\x84\xA0", ""},    // SERVICE MARK
    {"\xE2\x80\xA0", ""},    // DAGGER
    {"\xE2\x80\x98", "'"},   // LEFT SINGLE QUOTATION MARK
    {"\xE2\x80\x99", "'"},   // RIGHT SINGLE QUOTATION MARK
    {"\xE2\x80\x9C", "\""},  // LEFT DOUBLE QUOTATION MARK
    {"\xE2\x80\x9D", "\""},  // RIGHT DOUBLE QUOTATION MARK
    {"\xE2\x80\x93", "-"},   // EN DASH
    {"\xE2\x80\x94", "-"},   // EM DASH
    {"\xE2\x80\xA6", "..."}, // HORIZONTAL ELLIPSIS
    {"\xC2\xA0",     " "}    // NO-BREAK SPACE
  };

  string
  sanitize_name (const string& n)
  {
    string r;
    r.reserve (n.size ());

    for (size_t i (0); i < n.size ();)
    {
      bool m (false);

      if (static_cast<unsigned char> (n[i]) >= 0x80)
      {
        for (const auto& g: glyphs)
        {
          size_t l (char_traits<char>::length (g.first));

          if (n.compare (i, l, g.first) == 0)
          {
            r += g.second;
            i += l;
            m = true;
            break;
          }
        }
      }

      if (m)
        continue;

      char c (n[i++]);

      // Decoration.
      //
      if (c == '*' || c == '~')
        continue;

      // Collapse whitespace runs into a single space.
      //
      if (isspace (static_cast<unsigned char> (c)))
      {
        if (!r.empty () && r.back () != ' ')
          r += ' ';

        continue;
      }

      // "Dark Souls ™: ..." leaves a space before the colon.
      //
      if (c == ':' && !r.empty () && r.back () == ' ')
        r.pop_back ();

      r += c;
    }

    while (!r.empty () && r.back () == ' ')
      r.pop_back ();

    return r;
  }

  // Suffix rules, tried in order. Each strips one qualifier off the end.
  //
  static const vector<regex>&
  suffix_rules ()
  {
    using rc = regex_constants::syntax_option_type;
    const rc f (regex::ECMAScript | regex::icase);

    static const vector<regex> r {
      // Trailing "(2013)", "[Beta]", "(Classic)".
      //
      regex (R"(\s*[\(\[][^\(\)\[\]]*[\)\]]$)", f),

      // Well-known edition names without a separator: "Skyrim Special
      // Edition" keeps "Skyrim". The article goes with it.
      //
      regex (R"(\s+(the\s+)?(game of the year|goty|definitive|enhanced|complete|)"
             R"(deluxe|digital deluxe|special|collector's|anniversary|)"
             R"(ultimate|gold|premium|standard|legendary|remastered|)"
             R"(director's|extended|royal|maximum)\s+edition$)", f),

      // Any edition clause introduced by a separator: ": Prepare to Die
      // Edition", " - Uncut Edition". A dash only separates with spaces on
      // both sides; "Spider-Man" is one word. The clause is the last one,
      // so it never spans another separator.
      //
      regex (R"((\s*:\s*|\s+-\s+)((?!\s+-\s+)[^:])*\bedition$)", f),

      // Single-word suffixes, with or without a separator.
      //
      regex (R"((\s*:|\s+-)?\s+(remastered|remaster|definitive|goty|hd|)"
             R"(complete|anniversary|director's cut|redux)$)", f)
    };

    return r;
  }

  string
  simplify_name (const string& s)
  {
    string r (s);

    for (bool changed (true); changed && !r.empty ();)
    {
      changed = false;

      for (const regex& re: suffix_rules ())
      {
        string x (regex_replace (r, re, ""));

        if (x.size () < r.size ())
        {
          r = move (x);
          changed = true;
          break;
        }
      }
    }

    // Leftover separators from the stripped clause.
    //
    while (!r.empty () &&
           (r.back () == ' ' || r.back () == ':' || r.back () == '-'))
      r.pop_back ();

    return r.empty () ? s : r;
  }

  static inline char
  fold (char c) noexcept
  {
    return static_cast<char> (tolower (static_cast<unsigned char> (c)));
  }

  bool
  equal_icase (const string& x, const string& y) noexcept
  {
    if (x.size () != y.size ())
      return false;

    for (size_t i (0); i < x.size (); ++i)
      if (fold (x[i]) != fold (y[i]))
        return false;

    return true;
  }

  size_t
  edit_distance (const string& a, const string& b)
  {
    // Two rows of the usual DP table.
    //
    vector<size_t> p (b.size () + 1), c (b.size () + 1);

    for (size_t j (0); j <= b.size (); ++j)
      p[j] = j;

    for (size_t i (1); i <= a.size (); ++i)
    {
      c[0] = i;

      for (size_t j (1); j <= b.size (); ++j)
      {
        size_t sub (p[j - 1] + (fold (a[i - 1]) == fold (b[j - 1]) ? 0 : 1));
        c[j] = min ({p[j] + 1, c[j - 1] + 1, sub});
      }

      swap (p, c);
    }

    return p[b.size ()];
  }

  size_t
  match_threshold (const string& x, const string& y) noexcept
  {
    return max<size_t> (5, max (x.size (), y.size ()) / 5);
  }

  name_query::
  name_query (string r)
    : raw (move (r)),
      sanitized (sanitize_name (raw)),
      simplified (simplify_name (sanitized))
  {
  }

  vector<string> name_query::
  plan () const
  {
    vector<string> r {sanitized};

    if (!simplified.empty () && simplified != sanitized)
      r.push_back (simplified);

    return r;
  }
}
