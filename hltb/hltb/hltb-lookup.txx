#include <exception>

#include <boost/asio/co_spawn.hpp>
#include <boost/asio/steady_timer.hpp>
#include <boost/asio/this_coro.hpp>
#include <boost/asio/use_awaitable.hpp>

#include <hltb/hltb-log.hxx>

namespace hltb
{
  inline asio::awaitable<void> refresh_task::
  wait () const
  {
    while (!completed_)
    {
      asio::steady_timer t (co_await asio::this_coro::executor,
                            std::chrono::milliseconds (50));
      co_await t.async_wait (asio::use_awaitable);
    }
  }

  template <typename C>
  basic_lookup_coordinator<C>::
  basic_lookup_coordinator (client_type& c,
                            cache_database& db,
                            const runtime_config& cfg)
    : db_ (db),
      user_ (cfg.user),
      transport_ (c, catalog_endpoint (cfg.catalog_base)),
      session_ (transport_),
      api_ (transport_, session_),
      store_ (transport_),
      resolver_ (api_, store_, override_table::builtin (), [&cfg]
                 {
                   resolver_traits<C> t;
                   t.verify = cfg.verify;
                   return t;
                 } ()),
      ids_ (db, cfg.ids),
      results_ (db, cfg.results),
      reconciler_ (ids_)
  {
  }

  template <typename C>
  lookup_result basic_lookup_coordinator<C>::
  present (const result_entry& e, bool from_cache)
  {
    lookup_result r;
    r.data = e.data;
    r.searched_name = e.searched_name;
    r.from_cache = from_cache;
    return r;
  }

  template <typename C>
  asio::awaitable<lookup_result> basic_lookup_coordinator<C>::
  resolve (steam_app_id app)
  {
    current_ = app;

    result_read rd (results_.read (app, current_timestamp ()));

    if (rd.entry && !rd.stale)
    {
      trace << "app " << app << ": fresh cache entry";
      co_return present (*rd.entry, true);
    }

    if (rd.entry)
    {
      trace << "app " << app << ": stale cache entry, refreshing";

      auto t (std::make_shared<refresh_task> (app));

      asio::co_spawn (co_await asio::this_coro::executor,
                      refresh (app, t),
                      [app] (std::exception_ptr e)
                      {
                        if (!e)
                          return;

                        try
                        {
                          std::rethrow_exception (e);
                        }
                        catch (const std::exception& x)
                        {
                          error << "app " << app << ": refresh failed: "
                                << x.what ();
                        }
                      });

      lookup_result r (present (*rd.entry, true));
      r.pending = std::move (t);
      co_return r;
    }

    outcome o (co_await fetch (app));

    lookup_result r;
    if (o.entry)
      r = present (*o.entry, false);

    co_return r;
  }

  template <typename C>
  asio::awaitable<typename basic_lookup_coordinator<C>::outcome>
  basic_lookup_coordinator<C>::
  fetch (steam_app_id app)
  {
    std::int64_t now (current_timestamp ());

    std::optional<std::uint64_t> id;
    if (ids_.valid (user_, now))
      id = ids_.find (app);

    if (id)
    {
      catalog_result<catalog_record> r (co_await resolver_.resolve_by_id (*id, app));

      if (r)
      {
        result_entry e (std::move (*r.value), std::string (), now);
        e.searched_name = e.data->title;
        results_.write (app, e);
        co_return outcome {std::move (e), std::string ()};
      }

      // A mapping that points nowhere, or a page route we can't use right
      // now (no build id, unexpected payload), is worth a name search.
      // Anything else is a failure of the moment.
      //
      bool gone (r.status == catalog_status::no_identity_found ||
                 r.status == catalog_status::malformed_response ||
                 (r.status == catalog_status::upstream_rejection &&
                  r.http_status == 404));

      if (!gone)
        co_return outcome {std::nullopt, r.error};

      info << "app " << app << ": catalog id " << *id
           << " unusable, searching by name";
    }

    name_resolution n (co_await resolver_.resolve_by_name (app));

    switch (n.status)
    {
    case resolution_status::matched:
      {
        result_entry e (n.match->record, std::move (n.searched_name), now);
        results_.write (app, e);
        co_return outcome {std::move (e), std::string ()};
      }
    case resolution_status::unmatched:
      {
        result_entry e (std::nullopt, std::move (n.searched_name), now);
        results_.write (app, e);
        co_return outcome {std::move (e), std::string ()};
      }
    case resolution_status::failed:
      break;
    }

    co_return outcome {std::nullopt, std::move (n.error)};
  }

  template <typename C>
  asio::awaitable<void> basic_lookup_coordinator<C>::
  refresh (steam_app_id app, std::shared_ptr<refresh_task> t)
  {
    outcome o;

    try
    {
      o = co_await fetch (app);
    }
    catch (const std::exception& e)
    {
      // Most likely the database. Complete the task so nobody waits
      // forever, then let the spawner report it.
      //
      t->completed_ = true;
      t->error_ = e.what ();
      throw;
    }

    t->result_ = std::move (o.entry);
    t->error_ = std::move (o.error);
    t->completed_ = true;

    if (!t->result_)
    {
      info << "app " << app << ": refresh failed, keeping cached entry: "
           << t->error_;
      co_return;
    }

    if (!display_)
      co_return;

    if (current_ && *current_ == app)
    {
      t->presented_ = true;
      display_ (app, present (*t->result_, false));
      co_return;
    }

    // Someone else is on display now. Redraw them from their own slot.
    //
    trace << "app " << app << ": refreshed while not current";

    if (current_)
    {
      result_read rd (results_.read (*current_, current_timestamp ()));

      lookup_result r;
      if (rd.entry)
        r = present (*rd.entry, true);

      display_ (*current_, r);
    }
  }

  template <typename C>
  asio::awaitable<bool> basic_lookup_coordinator<C>::
  import_library (const std::string& u, bool force)
  {
    if (!u.empty ())
      user_ = u;

    std::int64_t now (current_timestamp ());

    if (user_.empty ())
    {
      info << "no storefront user, skipping library import";
      co_return ids_.valid (user_, now);
    }

    if (!force && !ids_.needs_refresh (user_, now))
    {
      trace << "id cache for " << user_ << " is current";
      co_return true;
    }

    catalog_result<std::vector<import_mapping>> r (
      co_await api_.fetch_import (user_));

    if (!r)
    {
      warn << "library import for " << user_ << " failed: " << r.error;
      co_return ids_.valid (user_, now);
    }

    reconcile_summary s (reconciler_.reconcile (*r.value, user_, now));
    co_return s.applied () || ids_.valid (user_, now);
  }

  template <typename C>
  cache_stats basic_lookup_coordinator<C>::
  stats () const
  {
    cache_stats s;

    s.mappings = ids_.size ();

    if (const auto& m = ids_.meta ())
    {
      s.owner = m->owner ();
      s.ids_written_at = m->written_at ();
    }

    s.results = db_.count_results ();
    s.misses = db_.count_misses ();
    s.oldest_result = db_.oldest_result ().value_or (0);

    return s;
  }

  template <typename C>
  void basic_lookup_coordinator<C>::
  clear (bool ids, bool results)
  {
    if (ids)
      ids_.clear ();

    if (results)
      results_.clear ();

    if (ids || results)
      db_.vacuum ();
  }
}
