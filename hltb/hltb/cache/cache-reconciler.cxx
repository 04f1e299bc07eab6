#include <hltb/cache/cache-reconciler.hxx>

#include <unordered_map>

#include <hltb/hltb-log.hxx>

using namespace std;

namespace hltb
{
  reconcile_summary id_reconciler::
  reconcile (const vector<import_mapping>& ms, const string& owner, int64_t now)
  {
    reconcile_summary s;
    s.received = ms.size ();

    vector<id_mapping> rs;
    rs.reserve (ms.size ());

    for (const import_mapping& m: ms)
    {
      if (m.catalog_id == 0 || m.storefront_id == 0)
      {
        ++s.dropped;
        continue;
      }

      rs.emplace_back (m.storefront_id, m.catalog_id);
    }

    if (rs.empty ())
    {
      warn << "import for " << owner << " has no usable mappings, "
           << "keeping " << cache_.size () << " cached";
      return s;
    }

    // Duplicate storefront ids would violate the primary key. Last one wins.
    //
    {
      unordered_map<uint32_t, size_t> seen;
      vector<id_mapping> u;
      u.reserve (rs.size ());

      for (const id_mapping& m: rs)
      {
        auto i (seen.find (m.storefront_id ()));

        if (i != seen.end ())
        {
          u[i->second] = m;
          ++s.dropped;
        }
        else
        {
          seen.emplace (m.storefront_id (), u.size ());
          u.push_back (m);
        }
      }

      rs.swap (u);
    }

    cache_.replace (rs, owner, now);
    s.stored = rs.size ();

    info << "imported " << s.stored << " id mapping(s) for " << owner;
    return s;
  }
}
