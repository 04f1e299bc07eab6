#include <hltb/steam/steam-store.hxx>

using namespace std;

namespace hltb
{
  string
  steam_appdetails_url (steam_app_id id)
  {
    return "https://store.steampowered.com/api/appdetails?appids=" +
           to_string (id) + "&filters=basic";
  }

  optional<string>
  steam_appdetails_title (const json::value& jv, steam_app_id id)
  {
    if (!jv.is_object ())
      return nullopt;

    const json::value* a (jv.get_object ().if_contains (to_string (id)));
    if (a == nullptr || !a->is_object ())
      return nullopt;

    const json::object& ao (a->get_object ());

    const json::value* ok (ao.if_contains ("success"));
    if (ok == nullptr || !ok->is_bool () || !ok->get_bool ())
      return nullopt;

    const json::value* d (ao.if_contains ("data"));
    if (d == nullptr || !d->is_object ())
      return nullopt;

    const json::value* n (d->get_object ().if_contains ("name"));
    if (n == nullptr || !n->is_string () || n->get_string ().empty ())
      return nullopt;

    return string (n->get_string ().c_str ());
  }

  string
  steamhunters_url (steam_app_id id)
  {
    return "https://steamhunters.com/api/apps/" + to_string (id);
  }

  optional<string>
  steamhunters_title (const json::value& jv, steam_app_id)
  {
    if (!jv.is_object ())
      return nullopt;

    const json::value* n (jv.get_object ().if_contains ("name"));
    if (n == nullptr || !n->is_string () || n->get_string ().empty ())
      return nullopt;

    return string (n->get_string ().c_str ());
  }

  const vector<name_source>&
  default_name_sources ()
  {
    static const vector<name_source> r {
      {"steam store",  &steam_appdetails_url, &steam_appdetails_title},
      {"steamhunters", &steamhunters_url,     &steamhunters_title}};

    return r;
  }
}
