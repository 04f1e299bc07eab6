#include <hltb/cache/cache-result.hxx>

#include <hltb/hltb-log.hxx>

using namespace std;

namespace hltb
{
  json::value
  to_json (const catalog_record& r)
  {
    return json::value {
      {"id", r.catalog_id},
      {"title", r.title},
      {"main", r.main_hours},
      {"main_extra", r.main_extra_hours},
      {"completionist", r.completionist_hours},
      {"steam", r.storefront_id}};
  }

  optional<catalog_record>
  record_from_json (const json::value& jv)
  {
    const json::object* o (jv.if_object ());

    if (o == nullptr)
      return nullopt;

    const json::value* id (o->if_contains ("id"));

    if (id == nullptr || !id->is_number ())
      return nullopt;

    json::error_code ec;
    catalog_record r;

    r.catalog_id = id->to_number<uint64_t> (ec);

    if (ec || r.catalog_id == 0)
      return nullopt;

    auto hours = [o] (const char* k) -> double
    {
      const json::value* v (o->if_contains (k));
      json::error_code e;
      double d (v != nullptr ? v->to_number<double> (e) : 0);
      return v == nullptr || e ? 0 : d;
    };

    if (const json::value* t = o->if_contains ("title"); t && t->is_string ())
      r.title = t->get_string ().c_str ();

    r.main_hours = hours ("main");
    r.main_extra_hours = hours ("main_extra");
    r.completionist_hours = hours ("completionist");

    if (const json::value* s = o->if_contains ("steam"))
    {
      json::error_code e;
      uint32_t v (s->to_number<uint32_t> (e));
      r.storefront_id = e ? 0 : v;
    }

    return r;
  }

  result_read result_cache::
  read (uint32_t id, int64_t now) const
  {
    optional<cached_result> c (db_.find_result (id));

    if (!c)
      return result_read {nullopt, true};

    result_entry e (nullopt, c->searched_name (), c->written_at ());

    if (!c->miss ())
    {
      json::error_code ec;
      json::value jv (json::parse (c->data (), ec));

      e.data = ec ? nullopt : record_from_json (jv);

      // Treat an unreadable entry like no entry.
      //
      if (!e.data)
      {
        warn << "ignoring unreadable cache entry for app " << id;
        return result_read {nullopt, true};
      }
    }

    bool stale (e.miss () || now - e.written_at > policy_.ttl.count ());
    return result_read {move (e), stale};
  }

  void result_cache::
  write (uint32_t id, const result_entry& e)
  {
    db_.store_result (
      cached_result (id,
                     e.data ? json::serialize (to_json (*e.data)) : "null",
                     e.searched_name,
                     e.written_at));
  }

  void result_cache::
  clear ()
  {
    db_.clear_results ();
  }
}
