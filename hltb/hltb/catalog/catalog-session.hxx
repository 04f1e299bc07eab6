#pragma once

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>

#include <boost/asio.hpp>

#include <hltb/catalog/catalog-types.hxx>
#include <hltb/catalog/catalog-transport.hxx>

namespace hltb
{
  namespace asio = boost::asio;

  // Current search endpoint and auth token.
  //
  struct auth_session
  {
    std::string token;
    std::string endpoint_url;   // Full search URL.
    std::int64_t obtained_at;   // Milliseconds since epoch.

    auth_session () : obtained_at (0) {}

    auth_session (std::string t, std::string u, std::int64_t at)
      : token (std::move (t)), endpoint_url (std::move (u)), obtained_at (at) {}
  };

  // Pure extraction over the catalog's published pages.
  //

  // Path of the Next.js application bundle referenced by the home page.
  //
  std::optional<std::string>
  extract_app_script (const std::string& html);

  // The Next.js build id, the dynamic segment of /_next/data/ URLs.
  //
  std::optional<std::string>
  extract_build_id (const std::string& html);

  // Search API path from the application bundle. The bundle makes several
  // fetch("/api/...") calls; the ones belonging to other API families are
  // skipped. The path may be assembled with a trailing .concat("...").
  //
  std::optional<std::string>
  extract_search_path (const std::string& script);

  // Endpoint & token manager.
  //
  // Owns the single auth_session and the discovered endpoint state. Callers
  // go through the accessors, never the fields: a refresh in flight is
  // waited for rather than duplicated or observed half-done. Failures are
  // reported as values; an unobtainable token is not fatal and the caller
  // may proceed unauthenticated.
  //
  template <typename C = http_client>
  class basic_catalog_session
  {
  public:
    using transport_type = basic_catalog_transport<C>;

    static constexpr std::chrono::milliseconds token_validity {
      std::chrono::minutes (5)};

    explicit
    basic_catalog_session (transport_type& t) : transport_ (t) {}

    basic_catalog_session (const basic_catalog_session&) = delete;
    basic_catalog_session& operator= (const basic_catalog_session&) = delete;

    // Full search URL. Falls back to the well-known path if discovery fails,
    // so this always yields something to try.
    //
    asio::awaitable<std::string>
    endpoint ();

    // Auth token, re-fetched when absent or older than token_validity.
    //
    asio::awaitable<catalog_result<std::string>>
    token ();

    asio::awaitable<catalog_result<std::string>>
    build_id ();

    // Make sure both endpoint and token are current and return a snapshot.
    //
    asio::awaitable<catalog_result<auth_session>>
    ensure_fresh ();

    // Forget everything so the next call re-discovers. Used when the API
    // tells us the endpoint moved.
    //
    void
    invalidate ();

    // Snapshot of the session, if a token was ever obtained.
    //
    std::optional<auth_session>
    current () const
    {
      return session_;
    }

  private:
    // Wait until no refresh is in flight.
    //
    asio::awaitable<void>
    idle ();

    // Fetch the home page and the application bundle. Must be called with
    // the refresh flag held.
    //
    asio::awaitable<void>
    discover ();

    bool
    token_fresh (std::int64_t now) const noexcept
    {
      return session_ &&
             !session_->token.empty () &&
             now - session_->obtained_at < token_validity.count ();
    }

  private:
    transport_type& transport_;

    bool discovered_ = false;
    std::optional<std::string> search_path_;
    std::optional<std::string> build_id_;
    std::optional<auth_session> session_;

    bool refreshing_ = false;
  };

  using catalog_session = basic_catalog_session<>;
}

#include <hltb/catalog/catalog-session.txx>
