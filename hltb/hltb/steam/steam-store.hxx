#pragma once

#include <optional>
#include <string>
#include <vector>

#include <boost/asio.hpp>
#include <boost/json.hpp>

#include <hltb/steam/steam-types.hxx>
#include <hltb/catalog/catalog-types.hxx>
#include <hltb/catalog/catalog-transport.hxx>

namespace hltb
{
  namespace asio = boost::asio;
  namespace json = boost::json;

  // A public source of storefront titles.
  //
  struct name_source
  {
    const char* name;

    std::string (*url) (steam_app_id);

    // Title from the decoded payload, nullopt if this source doesn't have
    // one for the app.
    //
    std::optional<std::string> (*title) (const json::value&, steam_app_id);
  };

  // Steam store: {"<id>": {"success": true, "data": {"name": "..."}}}
  //
  std::string
  steam_appdetails_url (steam_app_id);

  std::optional<std::string>
  steam_appdetails_title (const json::value&, steam_app_id);

  // SteamHunters: {"name": "..."}. Knows delisted apps the store has
  // forgotten.
  //
  std::string
  steamhunters_url (steam_app_id);

  std::optional<std::string>
  steamhunters_title (const json::value&, steam_app_id);

  // Sources in the order they are tried.
  //
  const std::vector<name_source>&
  default_name_sources ();

  // Storefront title lookup.
  //
  // Sources are tried in order and the first one that knows the title wins.
  // If none does, the result carries the last source's failure, or
  // no_identity_found if they all answered without a title.
  //
  template <typename C = http_client>
  class basic_steam_store
  {
  public:
    using transport_type = basic_catalog_transport<C>;

    explicit
    basic_steam_store (transport_type& t,
                       std::vector<name_source> s = default_name_sources ())
      : transport_ (t), sources_ (std::move (s)) {}

    asio::awaitable<catalog_result<std::string>>
    fetch_name (steam_app_id);

  private:
    transport_type& transport_;
    std::vector<name_source> sources_;
  };

  using steam_store = basic_steam_store<>;
}

#include <hltb/steam/steam-store.txx>
