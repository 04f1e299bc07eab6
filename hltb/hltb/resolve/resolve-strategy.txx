#include <hltb/hltb-log.hxx>

namespace hltb
{
  template <typename T>
  asio::awaitable<catalog_result<catalog_record>> basic_resolver<T>::
  resolve_by_id (std::uint64_t id, steam_app_id app)
  {
    catalog_result<catalog_record> r (co_await api_.fetch_by_id (id));

    if (!r)
    {
      info << "app " << app << ": catalog id " << id << " not fetched: "
           << r.status << ": " << r.error;
      co_return r;
    }

    if (r.value->storefront_id != 0 && r.value->storefront_id != app)
      trace << "app " << app << ": catalog id " << id << " is recorded for app "
            << r.value->storefront_id;

    co_return r;
  }

  template <typename T>
  asio::awaitable<catalog_result<std::vector<std::string>>> basic_resolver<T>::
  plan (steam_app_id app)
  {
    using result = catalog_result<std::vector<std::string>>;

    // The override title is already the catalog's own spelling.
    //
    if (std::optional<std::string> o = overrides_.find (app))
    {
      trace << "app " << app << ": using override title '" << *o << "'";
      co_return result (std::vector<std::string> {std::move (*o)});
    }

    catalog_result<std::string> n (co_await store_.fetch_name (app));

    if (!n)
      co_return result::failure (n);

    name_query q (std::move (*n.value));

    if (q.sanitized.empty ())
      co_return result (catalog_status::no_identity_found,
                        "storefront title '" + q.raw + "' is empty when " +
                        "sanitized");

    co_return result (q.plan ());
  }

  template <typename T>
  asio::awaitable<name_resolution> basic_resolver<T>::
  resolve_by_name (steam_app_id app)
  {
    catalog_result<std::vector<std::string>> p (co_await plan (app));

    if (!p)
    {
      info << "app " << app << ": no storefront title: " << p.error;
      co_return name_resolution::failed (p);
    }

    // The first accepted inexact match is kept while the rest of the plan
    // gets a chance at an exact one.
    //
    std::optional<match_candidate> kept;
    std::string searched;

    for (const std::string& q: *p.value)
    {
      searched = q;

      catalog_result<std::vector<catalog_record>> hs (co_await api_.search (q));

      if (!hs)
      {
        warn << "app " << app << ": search for '" << q << "' failed: "
             << hs.status << ": " << hs.error;

        if (kept)
          break;

        co_return name_resolution::failed (hs, std::move (searched));
      }

      std::optional<match_candidate> m (select_best_match (q, *hs.value));

      if (!m)
      {
        trace << "app " << app << ": no match for '" << q << "' among "
              << hs.value->size () << " hit(s)";
        continue;
      }

      if (m->exact)
      {
        info << "app " << app << ": '" << q << "' matched exactly";
        co_return name_resolution::matched (std::move (*m), std::move (searched));
      }

      trace << "app " << app << ": '" << q << "' ~ '" << m->title ()
            << "' at distance " << m->score;

      if (traits_.verify)
        m = co_await verify (q, *hs.value, std::move (*m), app);

      if (!kept)
        kept = std::move (m);
    }

    if (kept)
    {
      info << "app " << app << ": matched '" << kept->title () << "'";
      co_return name_resolution::matched (std::move (*kept), std::move (searched));
    }

    info << "app " << app << ": no catalog entry for '" << searched << "'";
    co_return name_resolution::unmatched (std::move (searched));
  }

  template <typename T>
  asio::awaitable<match_candidate> basic_resolver<T>::
  verify (const std::string& q,
          const std::vector<catalog_record>& hits,
          match_candidate pick,
          steam_app_id app)
  {
    std::vector<match_candidate> cs (threshold_candidates (q, hits));

    if (cs.size () < 2)
      co_return pick;

    for (match_candidate& c: cs)
    {
      // Search hits sometimes carry the storefront id already.
      //
      if (c.record.storefront_id == 0)
      {
        catalog_result<catalog_record> r (
          co_await api_.fetch_by_id (c.catalog_id ()));

        if (!r)
        {
          trace << "unable to verify catalog id " << c.catalog_id () << ": "
                << r.error;
          continue;
        }

        c.record.storefront_id = r.value->storefront_id;
      }

      if (c.record.storefront_id == app)
      {
        trace << "app " << app << ": verified '" << c.title () << "'";
        c.verified = true;
        co_return c;
      }
    }

    co_return pick;
  }
}
