#pragma once

#include <chrono>
#include <cstdint>
#include <exception>
#include <optional>
#include <map>
#include <string>
#include <utility>
#include <vector>

#include <boost/asio.hpp>
#include <boost/asio/steady_timer.hpp>
#include <boost/system/system_error.hpp>

#include <hltb/http/http-types.hxx>
#include <hltb/http/http-request.hxx>
#include <hltb/http/http-response.hxx>

namespace hltb
{
  namespace asio = boost::asio;

  // Canned HTTP client for tests.
  //
  // Responses are registered per URL, either exact or by prefix (for URLs
  // carrying a timestamp). Requests to unregistered URLs fail like an
  // unreachable host would. Every request is recorded.
  //
  class fake_http_client
  {
  public:
    using string_type   = std::string;
    using request_type  = basic_http_request<string_type>;
    using response_type = basic_http_response<string_type>;
    using headers_type  = request_type::headers_type;

    struct route
    {
      std::uint16_t status = 200;
      std::string body;
      bool fail = false;                       // Throw as if unreachable.
      std::chrono::milliseconds delay {0};
    };

    // Register a response. Re-registering replaces it.
    //
    void
    on (const std::string& url,
        std::uint16_t status,
        std::string body,
        std::chrono::milliseconds delay = std::chrono::milliseconds (0))
    {
      route r;
      r.status = status;
      r.body = std::move (body);
      r.delay = delay;
      exact_[url] = std::move (r);
    }

    void
    on_prefix (const std::string& prefix, std::uint16_t status, std::string body)
    {
      route r;
      r.status = status;
      r.body = std::move (body);
      prefix_[prefix] = std::move (r);
    }

    void
    fail (const std::string& url)
    {
      route r;
      r.fail = true;
      exact_[url] = std::move (r);
    }

    void
    forget (const std::string& url)
    {
      exact_.erase (url);
    }

    asio::awaitable<response_type>
    request (request_type req)
    {
      requests_.push_back (req);

      const route* r (match (req.url));

      if (r != nullptr && r->delay.count () != 0)
      {
        // Copy before suspending: the route may be replaced meanwhile.
        //
        route c (*r);

        asio::steady_timer t (co_await asio::this_coro::executor, c.delay);
        co_await t.async_wait (asio::use_awaitable);

        co_return respond (c, req.url);
      }

      if (r == nullptr)
        throw boost::system::system_error (
          asio::error::host_not_found, "resolve " + req.url);

      co_return respond (*r, req.url);
    }

    // Requests whose URL starts with the prefix (an exact URL counts too).
    //
    std::size_t
    calls (const std::string& prefix) const
    {
      std::size_t n (0);

      for (const request_type& r: requests_)
        if (r.url.compare (0, prefix.size (), prefix) == 0)
          ++n;

      return n;
    }

    // Requests to exactly this URL, of any method unless one is given.
    //
    std::size_t
    count (const std::string& url,
           std::optional<http_method> m = std::nullopt) const
    {
      std::size_t n (0);

      for (const request_type& r: requests_)
        if (r.url == url && (!m || r.method == *m))
          ++n;

      return n;
    }

    const std::vector<request_type>&
    requests () const noexcept
    {
      return requests_;
    }

  private:
    const route*
    match (const std::string& url) const
    {
      auto i (exact_.find (url));
      if (i != exact_.end ())
        return &i->second;

      // Longest registered prefix wins.
      //
      const route* r (nullptr);
      std::size_t n (0);

      for (const auto& p: prefix_)
      {
        if (p.first.size () >= n && url.compare (0, p.first.size (), p.first) == 0)
        {
          r = &p.second;
          n = p.first.size ();
        }
      }

      return r;
    }

    static response_type
    respond (const route& r, const std::string& url)
    {
      if (r.fail)
        throw boost::system::system_error (
          asio::error::connection_refused, "connect " + url);

      return response_type (static_cast<http_status> (r.status), r.body);
    }

  private:
    std::map<std::string, route> exact_;
    std::map<std::string, route> prefix_;
    std::vector<request_type> requests_;
  };

  // Run a coroutine to completion on a fresh context and return its value.
  //
  template <typename R>
  R
  run_awaitable (asio::io_context& ioc, asio::awaitable<R> a)
  {
    std::exception_ptr ex;
    std::optional<R> r;

    asio::co_spawn (ioc,
                    std::move (a),
                    [&ex, &r] (std::exception_ptr e, R v)
                    {
                      if (e)
                        ex = e;
                      else
                        r = std::move (v);
                    });

    ioc.restart ();
    ioc.run ();

    if (ex)
      std::rethrow_exception (ex);

    return std::move (*r);
  }

  inline void
  run_awaitable (asio::io_context& ioc, asio::awaitable<void> a)
  {
    std::exception_ptr ex;

    asio::co_spawn (ioc,
                    std::move (a),
                    [&ex] (std::exception_ptr e) {ex = e;});

    ioc.restart ();
    ioc.run ();

    if (ex)
      std::rethrow_exception (ex);
  }
}
