#include <hltb/cache/cache-id.hxx>

#include <hltb/hltb-log.hxx>

using namespace std;

namespace hltb
{
  id_cache::
  id_cache (cache_database& db, id_cache_policy p)
    : db_ (db), policy_ (p)
  {
    meta_ = db_.meta ();

    // Mappings without metadata are left over from an interrupted write
    // outside of our transactions. Don't trust them.
    //
    if (!meta_)
      return;

    for (const id_mapping& m: db_.mappings ())
      map_.emplace (m.storefront_id (), m.catalog_id ());

    trace << "loaded " << map_.size () << " id mapping(s) for "
          << meta_->owner ();
  }

  optional<uint64_t> id_cache::
  find (uint32_t id) const
  {
    auto i (map_.find (id));

    if (i == map_.end ())
      return nullopt;

    return i->second;
  }

  bool id_cache::
  valid (const string& user, int64_t now) const
  {
    if (!meta_)
      return false;

    if (!user.empty () && user != meta_->owner ())
      return false;

    if (policy_.mode == id_refresh_mode::every_session)
      return true;

    return now - meta_->written_at () <= policy_.max_age.count ();
  }

  bool id_cache::
  needs_refresh (const string& user, int64_t now) const
  {
    return policy_.mode == id_refresh_mode::every_session || !valid (user, now);
  }

  void id_cache::
  replace (const vector<id_mapping>& ms, const string& owner, int64_t now)
  {
    id_cache_meta m (owner, now);
    db_.replace_mappings (ms, m);

    unordered_map<uint32_t, uint64_t> n;
    n.reserve (ms.size ());

    for (const id_mapping& x: ms)
      n.emplace (x.storefront_id (), x.catalog_id ());

    map_.swap (n);
    meta_ = move (m);
  }

  void id_cache::
  clear ()
  {
    db_.clear_mappings ();
    map_.clear ();
    meta_ = nullopt;
  }
}
