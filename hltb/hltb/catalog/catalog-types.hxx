#pragma once

#include <chrono>
#include <cstdint>
#include <optional>
#include <ostream>
#include <string>
#include <utility>
#include <vector>

#include <boost/json.hpp>

namespace hltb
{
  namespace json = boost::json;

  // How a catalog operation ended.
  //
  // Everything except ok is a recoverable outcome: the caller decides whether
  // to show "no data" or to try again later. Nothing here is fatal.
  //
  enum class catalog_status
  {
    ok,
    transport_failure,   // No response: resolve, connect, TLS, timeout.
    upstream_rejection,  // Response with a non-2xx status.
    malformed_response,  // 2xx but undecodable or semantically null.
    no_identity_found,   // Well-formed response without a usable candidate.
    inaccessible_source  // Bulk import produced nothing (private profile).
  };

  std::ostream&
  operator<< (std::ostream&, catalog_status);

  // Outcome of a catalog operation carrying a value on success.
  //
  // We carry failures as values rather than exceptions since most of them
  // are expected (a private profile, a title the catalog doesn't know) and
  // they cross coroutine boundaries.
  //
  template <typename V>
  struct catalog_result
  {
    using value_type = V;

    catalog_status status;
    std::optional<value_type> value;

    // Status of the last HTTP exchange, 0 if there was no response.
    //
    std::uint16_t http_status;
    std::string error;

    // The payload was the literal `null` the catalog uses for "nothing
    // here". Only meaningful with malformed_response.
    //
    bool null_payload;

    catalog_result ()
      : status (catalog_status::transport_failure),
        http_status (0),
        null_payload (false) {}

    catalog_result (value_type v, std::uint16_t hs = 200)
      : status (catalog_status::ok),
        value (std::move (v)),
        http_status (hs),
        null_payload (false) {}

    catalog_result (catalog_status s, std::string e, std::uint16_t hs = 0)
      : status (s),
        http_status (hs),
        error (std::move (e)),
        null_payload (false) {}

    // Carry a failure over to a result of another type.
    //
    template <typename U>
    static catalog_result
    failure (const catalog_result<U>& r)
    {
      catalog_result x (r.status, r.error, r.http_status);
      x.null_payload = r.null_payload;
      return x;
    }

    bool
    ok () const noexcept
    {
      return status == catalog_status::ok && value.has_value ();
    }

    explicit operator bool () const noexcept
    {
      return ok ();
    }
  };

  // A completion-time record as the catalog reports it.
  //
  // Hours of 0 mean "no data", not "zero time".
  //
  struct catalog_record
  {
    std::uint64_t catalog_id;
    std::string title;
    double main_hours;
    double main_extra_hours;
    double completionist_hours;

    // Storefront id the catalog associates with the game, 0 if unknown. Only
    // used to confirm ambiguous name matches.
    //
    std::uint32_t storefront_id;

    catalog_record ()
      : catalog_id (0),
        main_hours (0),
        main_extra_hours (0),
        completionist_hours (0),
        storefront_id (0) {}

    bool
    has_times () const noexcept
    {
      return main_hours > 0 || main_extra_hours > 0 || completionist_hours > 0;
    }
  };

  bool
  operator== (const catalog_record&, const catalog_record&);

  // One row of a bulk import: storefront id to catalog id.
  //
  struct import_mapping
  {
    std::uint32_t storefront_id;
    std::uint64_t catalog_id;

    import_mapping () : storefront_id (0), catalog_id (0) {}

    import_mapping (std::uint32_t s, std::uint64_t c)
      : storefront_id (s), catalog_id (c) {}
  };

  // Catalog reports seconds; we show hours rounded to one decimal.
  //
  double
  seconds_to_hours (std::int64_t s);

  // Payload decoding.
  //
  // These take already-parsed JSON and never throw on unexpected shapes:
  // whatever doesn't fit is reported through the result.
  //

  // Search response: {"data": [{game_id, game_name, comp_main, ...}]} in
  // relevance order.
  //
  catalog_result<std::vector<catalog_record>>
  parse_search_response (const json::value&);

  // Next.js page data: pageProps.game.data.game[0].
  //
  catalog_result<catalog_record>
  parse_game_page (const json::value&);

  // Bulk import response: {"games": [{steam_id, hltb_id, ...}]}. Rows
  // without a catalog id are dropped.
  //
  catalog_result<std::vector<import_mapping>>
  parse_import_response (const json::value&);

  // Single game object as it appears in both search and page payloads.
  //
  catalog_record
  parse_game (const json::object&);

  inline std::int64_t
  current_timestamp ()
  {
    auto e (std::chrono::system_clock::now ().time_since_epoch ());
    return std::chrono::duration_cast<std::chrono::seconds> (e).count ();
  }

  inline std::int64_t
  current_timestamp_ms ()
  {
    auto e (std::chrono::system_clock::now ().time_since_epoch ());
    return std::chrono::duration_cast<std::chrono::milliseconds> (e).count ();
  }
}
