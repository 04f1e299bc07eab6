#include <boost/asio/steady_timer.hpp>
#include <boost/asio/this_coro.hpp>
#include <boost/asio/use_awaitable.hpp>

#include <hltb/hltb-log.hxx>

namespace hltb
{
  // Hold the refresh flag for the duration of a scope.
  //
  struct refresh_guard
  {
    bool& flag;

    explicit
    refresh_guard (bool& f) : flag (f) {flag = true;}
    ~refresh_guard () {flag = false;}

    refresh_guard (const refresh_guard&) = delete;
    refresh_guard& operator= (const refresh_guard&) = delete;
  };

  template <typename C>
  asio::awaitable<void> basic_catalog_session<C>::
  idle ()
  {
    // Refreshes are a couple of requests long.
    //
    while (refreshing_)
    {
      asio::steady_timer t (co_await asio::this_coro::executor,
                            std::chrono::milliseconds (50));
      co_await t.async_wait (asio::use_awaitable);
    }
  }

  template <typename C>
  asio::awaitable<void> basic_catalog_session<C>::
  discover ()
  {
    const catalog_endpoint& ep (transport_.endpoint ());

    search_path_ = std::nullopt;
    build_id_ = std::nullopt;

    catalog_result<std::string> home (
      co_await transport_.get_text (ep.home ()));

    // Without the home page nothing was learned: leave discovery pending
    // for the next call.
    //
    if (!home)
    {
      warn << "unable to fetch catalog home page: " << home.error;
    }
    else
    {
      discovered_ = true;
      build_id_ = extract_build_id (*home.value);

      if (!build_id_)
        warn << "catalog build id not found on home page";

      if (auto s = extract_app_script (*home.value))
      {
        catalog_result<std::string> js (
          co_await transport_.get_text (ep.resolve (*s)));

        if (js)
          search_path_ = extract_search_path (*js.value);
        else
          warn << "unable to fetch catalog script " << *s << ": " << js.error;
      }
      else
        warn << "catalog application script not found on home page";
    }

    if (search_path_)
      trace << "discovered search path " << *search_path_;
    else
    {
      info << "using fallback search path " << catalog_endpoint::fallback_search_path;
      search_path_ = catalog_endpoint::fallback_search_path;
    }
  }

  template <typename C>
  asio::awaitable<std::string> basic_catalog_session<C>::
  endpoint ()
  {
    co_await idle ();

    if (!discovered_)
    {
      refresh_guard g (refreshing_);
      co_await discover ();
    }

    co_return transport_.endpoint ().search (*search_path_);
  }

  template <typename C>
  asio::awaitable<catalog_result<std::string>> basic_catalog_session<C>::
  build_id ()
  {
    using result = catalog_result<std::string>;

    co_await idle ();

    if (!discovered_)
    {
      refresh_guard g (refreshing_);
      co_await discover ();
    }

    if (!build_id_)
      co_return result (catalog_status::malformed_response,
                        "catalog build id unavailable");

    co_return result (*build_id_);
  }

  template <typename C>
  asio::awaitable<catalog_result<std::string>> basic_catalog_session<C>::
  token ()
  {
    using result = catalog_result<std::string>;

    co_await idle ();

    std::int64_t now (current_timestamp_ms ());

    if (token_fresh (now))
      co_return result (session_->token);

    refresh_guard g (refreshing_);

    if (!discovered_)
      co_await discover ();

    const catalog_endpoint& ep (transport_.endpoint ());
    std::string path (*search_path_);

    catalog_result<json::value> r (
      co_await transport_.get_json (ep.search_init (path, now)));

    if (!r)
      co_return result::failure (r);

    const json::value& jv (*r.value);
    const json::value* t (jv.is_object ()
                          ? jv.get_object ().if_contains ("token")
                          : nullptr);

    if (t == nullptr || !t->is_string () || t->get_string ().empty ())
      co_return result (catalog_status::malformed_response,
                        "token missing from init response",
                        r.http_status);

    // Replace the session as a whole.
    //
    session_ = auth_session (std::string (t->get_string ().c_str ()),
                             ep.search (path),
                             now);

    trace << "obtained catalog token";
    co_return result (session_->token);
  }

  template <typename C>
  asio::awaitable<catalog_result<auth_session>> basic_catalog_session<C>::
  ensure_fresh ()
  {
    using result = catalog_result<auth_session>;

    std::string u (co_await endpoint ());
    catalog_result<std::string> t (co_await token ());

    if (!t)
      co_return result::failure (t);

    co_return result (auth_session (*t.value, std::move (u), session_->obtained_at));
  }

  template <typename C>
  void basic_catalog_session<C>::
  invalidate ()
  {
    discovered_ = false;
    search_path_ = std::nullopt;
    build_id_ = std::nullopt;
    session_ = std::nullopt;
  }
}
