#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include <boost/asio.hpp>

#include <hltb/catalog/catalog-api.hxx>
#include <hltb/match/match-name.hxx>
#include <hltb/match/match-selector.hxx>
#include <hltb/steam/steam-store.hxx>
#include <hltb/resolve/resolve-types.hxx>
#include <hltb/resolve/resolve-overrides.hxx>

namespace hltb
{
  namespace asio = boost::asio;

  template <typename C = http_client>
  struct resolver_traits
  {
    using client_type = C;
    using api_type    = basic_catalog_api<C>;
    using store_type  = basic_steam_store<C>;

    // Confirm ambiguous distance matches by fetching each candidate. Costs a
    // round trip per candidate.
    //
    bool verify = false;
  };

  // Storefront id to catalog record.
  //
  // By id when we already know the catalog id, otherwise by name: override
  // table or storefront title, then the query plan through the match
  // selector. Every step is awaited in order; a call never backtracks.
  //
  template <typename T = resolver_traits<>>
  class basic_resolver
  {
  public:
    using traits_type = T;
    using api_type    = typename traits_type::api_type;
    using store_type  = typename traits_type::store_type;

    basic_resolver (api_type& a,
                    store_type& s,
                    const override_table& o = override_table::builtin (),
                    traits_type t = traits_type ())
      : api_ (a), store_ (s), overrides_ (o), traits_ (std::move (t)) {}

    basic_resolver (const basic_resolver&) = delete;
    basic_resolver& operator= (const basic_resolver&) = delete;

    // Direct fetch of a known catalog id. The storefront id is only used for
    // diagnostics.
    //
    asio::awaitable<catalog_result<catalog_record>>
    resolve_by_id (std::uint64_t catalog_id, steam_app_id app);

    asio::awaitable<name_resolution>
    resolve_by_name (steam_app_id app);

    const traits_type&
    traits () const noexcept
    {
      return traits_;
    }

  private:
    // Queries to issue for the app, or a failure if we couldn't get its
    // storefront title.
    //
    asio::awaitable<catalog_result<std::vector<std::string>>>
    plan (steam_app_id app);

    // Among the candidates within threshold, find the one the catalog itself
    // associates with the app. Returns the selector's pick if none does.
    //
    asio::awaitable<match_candidate>
    verify (const std::string& query,
            const std::vector<catalog_record>& hits,
            match_candidate pick,
            steam_app_id app);

  private:
    api_type& api_;
    store_type& store_;
    const override_table& overrides_;
    traits_type traits_;
  };

  using resolver = basic_resolver<>;
}

#include <hltb/resolve/resolve-strategy.txx>
