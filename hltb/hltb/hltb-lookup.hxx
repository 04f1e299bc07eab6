#pragma once

#include <cstdint>
#include <functional>
#include <memory>
#include <optional>
#include <string>

#include <boost/asio.hpp>

#include <hltb/hltb-config.hxx>

#include <hltb/catalog/catalog-api.hxx>
#include <hltb/catalog/catalog-session.hxx>
#include <hltb/catalog/catalog-transport.hxx>
#include <hltb/steam/steam-store.hxx>
#include <hltb/resolve/resolve-strategy.hxx>
#include <hltb/cache/cache-id.hxx>
#include <hltb/cache/cache-result.hxx>
#include <hltb/cache/cache-database.hxx>
#include <hltb/cache/cache-reconciler.hxx>

namespace hltb
{
  namespace asio = boost::asio;

  class refresh_task;

  template <typename C = http_client>
  class basic_lookup_coordinator;

  // What a lookup shows right away.
  //
  struct lookup_result
  {
    std::optional<catalog_record> data;
    std::string searched_name;
    bool from_cache = false;

    // Set when data is a stale cache entry being refreshed in the
    // background.
    //
    std::shared_ptr<refresh_task> pending;
  };

  // A background refresh of one storefront id.
  //
  // Always runs to completion. Its outcome is written to the cache under
  // its own id whether or not anyone is still interested in it.
  //
  class refresh_task
  {
  public:
    explicit
    refresh_task (steam_app_id a) : app_ (a) {}

    steam_app_id
    app () const noexcept
    {
      return app_;
    }

    bool
    completed () const noexcept
    {
      return completed_;
    }

    // The refreshed entry. Absent while pending or if the refresh failed.
    //
    const std::optional<result_entry>&
    result () const noexcept
    {
      return result_;
    }

    const std::string&
    error () const noexcept
    {
      return error_;
    }

    // Whether the outcome was handed to the display.
    //
    bool
    presented () const noexcept
    {
      return presented_;
    }

    // Suspend until completed.
    //
    asio::awaitable<void>
    wait () const;

  private:
    template <typename>
    friend class basic_lookup_coordinator;

    steam_app_id app_;
    bool completed_ = false;
    bool presented_ = false;
    std::optional<result_entry> result_;
    std::string error_;
  };

  // Lookup front: caches first, then the resolver.
  //
  // Keeps the identity currently on display as explicit state. A refresh
  // that completes for anything else is stored but not presented; the
  // display is redrawn from the current identity's own cache slot instead.
  //
  template <typename C>
  class basic_lookup_coordinator
  {
  public:
    using client_type    = C;
    using transport_type = basic_catalog_transport<C>;
    using session_type   = basic_catalog_session<C>;
    using api_type       = basic_catalog_api<C>;
    using store_type     = basic_steam_store<C>;
    using resolver_type  = basic_resolver<resolver_traits<C>>;

    // Called with whatever should now be on display for the identity.
    //
    using display_function =
      std::function<void (steam_app_id, const lookup_result&)>;

    basic_lookup_coordinator (client_type&,
                              cache_database&,
                              const runtime_config&);

    basic_lookup_coordinator (const basic_lookup_coordinator&) = delete;
    basic_lookup_coordinator& operator= (const basic_lookup_coordinator&) = delete;

    // Look the storefront id up and make it the current identity.
    //
    // A fresh cache entry is returned as is. A stale one is returned
    // together with a pending refresh. Without an entry the resolver runs
    // inline; a failure there yields no data and nothing is cached.
    //
    asio::awaitable<lookup_result>
    resolve (steam_app_id);

    // Bulk import for the user (the configured one if empty). Skipped while
    // the id cache is current under the policy, unless forced.
    //
    // Returns true if mappings were imported or the existing ones are
    // current.
    //
    asio::awaitable<bool>
    import_library (const std::string& user = std::string (),
                    bool force = false);

    void
    on_display (display_function f)
    {
      display_ = std::move (f);
    }

    std::optional<steam_app_id>
    current () const noexcept
    {
      return current_;
    }

    cache_stats
    stats () const;

    void
    clear (bool ids, bool results);

    id_cache&
    ids () noexcept
    {
      return ids_;
    }

    result_cache&
    results () noexcept
    {
      return results_;
    }

    session_type&
    session () noexcept
    {
      return session_;
    }

  private:
    struct outcome
    {
      std::optional<result_entry> entry;  // Absent on failure.
      std::string error;
    };

    // Resolve over the network and cache what is worth caching.
    //
    asio::awaitable<outcome>
    fetch (steam_app_id);

    asio::awaitable<void>
    refresh (steam_app_id, std::shared_ptr<refresh_task>);

    static lookup_result
    present (const result_entry&, bool from_cache);

  private:
    cache_database& db_;
    std::string user_;

    transport_type transport_;
    session_type session_;
    api_type api_;
    store_type store_;
    resolver_type resolver_;

    id_cache ids_;
    result_cache results_;
    id_reconciler reconciler_;

    std::optional<steam_app_id> current_;
    display_function display_;
  };

  using lookup_coordinator = basic_lookup_coordinator<>;
}

#include <hltb/hltb-lookup.txx>
