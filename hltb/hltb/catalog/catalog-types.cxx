#include <hltb/catalog/catalog-types.hxx>

#include <cmath>
#include <cstdlib>

using namespace std;

namespace hltb
{
  ostream&
  operator<< (ostream& o, catalog_status s)
  {
    switch (s)
    {
      case catalog_status::ok:                  return o << "ok";
      case catalog_status::transport_failure:   return o << "transport failure";
      case catalog_status::upstream_rejection:  return o << "upstream rejection";
      case catalog_status::malformed_response:  return o << "malformed response";
      case catalog_status::no_identity_found:   return o << "no identity found";
      case catalog_status::inaccessible_source: return o << "inaccessible source";
    }
    return o;
  }

  bool
  operator== (const catalog_record& x, const catalog_record& y)
  {
    return x.catalog_id == y.catalog_id &&
           x.title == y.title &&
           x.main_hours == y.main_hours &&
           x.main_extra_hours == y.main_extra_hours &&
           x.completionist_hours == y.completionist_hours &&
           x.storefront_id == y.storefront_id;
  }

  double
  seconds_to_hours (int64_t s)
  {
    if (s <= 0)
      return 0;

    return std::round (static_cast<double> (s) / 3600.0 * 10.0) / 10.0;
  }

  // The catalog is not consistent about number representation: ids come as
  // integers in one payload and as strings in another, times sometimes as
  // doubles.
  //
  static optional<int64_t>
  json_integer (const json::value& v)
  {
    switch (v.kind ())
    {
      case json::kind::int64:  return v.get_int64 ();
      case json::kind::uint64: return static_cast<int64_t> (v.get_uint64 ());
      case json::kind::double_:
        return static_cast<int64_t> (std::llround (v.get_double ()));
      case json::kind::string:
      {
        const json::string& s (v.get_string ());
        if (s.empty ())
          return nullopt;

        string t (s.c_str ());
        char* e (nullptr);
        long long n (strtoll (t.c_str (), &e, 10));

        if (e != nullptr && *e == '\0')
          return static_cast<int64_t> (n);

        return nullopt;
      }
      default:
        return nullopt;
    }
  }

  static optional<int64_t>
  json_integer (const json::object& o, const char* k)
  {
    auto i (o.find (k));
    return i != o.end () ? json_integer (i->value ()) : nullopt;
  }

  static string
  json_text (const json::object& o, const char* k)
  {
    auto i (o.find (k));

    if (i != o.end () && i->value ().is_string ())
      return string (i->value ().get_string ().c_str ());

    return string ();
  }

  catalog_record
  parse_game (const json::object& o)
  {
    catalog_record r;

    if (auto v = json_integer (o, "game_id"); v && *v > 0)
      r.catalog_id = static_cast<uint64_t> (*v);

    r.title = json_text (o, "game_name");

    r.main_hours          = seconds_to_hours (json_integer (o, "comp_main").value_or (0));
    r.main_extra_hours    = seconds_to_hours (json_integer (o, "comp_plus").value_or (0));
    r.completionist_hours = seconds_to_hours (json_integer (o, "comp_100").value_or (0));

    if (auto v = json_integer (o, "profile_steam"); v && *v > 0 && *v <= UINT32_MAX)
      r.storefront_id = static_cast<uint32_t> (*v);

    return r;
  }

  catalog_result<vector<catalog_record>>
  parse_search_response (const json::value& jv)
  {
    using result = catalog_result<vector<catalog_record>>;

    if (!jv.is_object ())
      return result (catalog_status::malformed_response,
                     "search response is not an object");

    const json::object& o (jv.get_object ());
    auto i (o.find ("data"));

    if (i == o.end () || !i->value ().is_array ())
      return result (catalog_status::malformed_response,
                     "search response has no data array");

    vector<catalog_record> r;

    for (const json::value& g: i->value ().get_array ())
    {
      if (!g.is_object ())
        continue;

      catalog_record c (parse_game (g.get_object ()));

      // A hit without an id is of no use to anyone.
      //
      if (c.catalog_id != 0)
        r.push_back (move (c));
    }

    return result (move (r));
  }

  catalog_result<catalog_record>
  parse_game_page (const json::value& jv)
  {
    using result = catalog_result<catalog_record>;

    // pageProps.game.data.game
    //
    const json::value* v (&jv);

    for (const char* k: {"pageProps", "game", "data", "game"})
    {
      if (!v->is_object ())
        return result (catalog_status::malformed_response,
                       "unexpected response structure");

      auto i (v->get_object ().find (k));
      if (i == v->get_object ().end ())
        return result (catalog_status::malformed_response,
                       "unexpected response structure");

      v = &i->value ();
    }

    if (!v->is_array ())
      return result (catalog_status::malformed_response,
                     "unexpected response structure");

    const json::array& a (v->get_array ());

    if (a.empty () || !a.front ().is_object ())
      return result (catalog_status::no_identity_found, "no data found");

    catalog_record r (parse_game (a.front ().get_object ()));

    if (r.catalog_id == 0)
      return result (catalog_status::malformed_response,
                     "game entry without id");

    return result (move (r));
  }

  catalog_result<vector<import_mapping>>
  parse_import_response (const json::value& jv)
  {
    using result = catalog_result<vector<import_mapping>>;

    // A private profile comes back as null, as {"error": ...}, or without
    // the games member. We can't tell those apart from an empty library and
    // don't try to.
    //
    if (!jv.is_object ())
      return result (catalog_status::inaccessible_source,
                     "import data unavailable");

    const json::object& o (jv.get_object ());

    if (o.contains ("error"))
    {
      string e (json_text (o, "error"));
      return result (catalog_status::inaccessible_source,
                     e.empty () ? "import refused" : e);
    }

    auto i (o.find ("games"));
    if (i == o.end () || !i->value ().is_array ())
      return result (catalog_status::inaccessible_source,
                     "import data has no games");

    vector<import_mapping> r;

    for (const json::value& g: i->value ().get_array ())
    {
      if (!g.is_object ())
        continue;

      const json::object& go (g.get_object ());

      auto sid (json_integer (go, "steam_id"));
      auto cid (json_integer (go, "hltb_id"));

      if (!sid || *sid <= 0 || *sid > UINT32_MAX || !cid || *cid <= 0)
        continue;

      r.emplace_back (static_cast<uint32_t> (*sid),
                      static_cast<uint64_t> (*cid));
    }

    if (r.empty ())
      return result (catalog_status::inaccessible_source,
                     "import produced no mappings");

    return result (move (r));
  }
}
