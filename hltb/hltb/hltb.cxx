#include <iostream>
#include <memory>
#include <stdexcept>
#include <vector>

#include <boost/asio.hpp>
#include <boost/asio/co_spawn.hpp>

#include <hltb/hltb-log.hxx>
#include <hltb/hltb-config.hxx>
#include <hltb/hltb-lookup.hxx>
#include <hltb/hltb-options.hxx>

#include <hltb/http/http-client.hxx>
#include <hltb/steam/steam-users.hxx>

#include <hltb/version.hxx>

using namespace std;
namespace asio = boost::asio;

namespace hltb
{
  static void
  print_hours (ostream& o, const char* what, double h)
  {
    o << "  " << what << ' ';

    if (h > 0)
      o << h << 'h';
    else
      o << '-';
  }

  static void
  print_result (ostream& o, steam_app_id app, const lookup_result& r)
  {
    o << app << ": ";

    if (!r.data)
    {
      o << "no data";

      if (!r.searched_name.empty ())
        o << " (searched \"" << r.searched_name << "\")";
    }
    else
    {
      const catalog_record& d (*r.data);

      o << d.title << " [" << d.catalog_id << ']';

      if (d.has_times ())
      {
        print_hours (o, "main", d.main_hours);
        print_hours (o, "main+extra", d.main_extra_hours);
        print_hours (o, "completionist", d.completionist_hours);
      }
      else
        o << "  no times submitted";
    }

    if (r.from_cache)
      o << (r.pending ? " (cached, refreshing)" : " (cached)");

    o << '\n';
  }

  // Map the command line onto the runtime configuration.
  //
  static runtime_config
  configure (const options& opt)
  {
    runtime_config c;

    c.cache_root = opt.cache_dir_specified ()
      ? fs::path (opt.cache_dir ())
      : default_cache_root ();

    if (opt.user_specified ())
    {
      if (!valid_steam_id (opt.user ()))
        throw invalid_argument ("invalid SteamID64 '" + opt.user () + "'");

      c.user = opt.user ();
    }
    else if (optional<string> u = detect_steam_user ())
    {
      info << "acting Steam user " << *u;
      c.user = move (*u);
    }
    else
      info << "no Steam user found, library import disabled";

    c.ids.mode = to_id_refresh_mode (opt.id_refresh ());
    c.ids.max_age = chrono::hours (24) * opt.id_max_age_days ();
    c.results.ttl = chrono::hours (opt.ttl_hours ());

    c.verify = opt.verify ();
    c.timeout = chrono::seconds (opt.timeout ());

    return c;
  }

  // One session: import if due, then every requested lookup. Waits for
  // background refreshes so that their results get printed too.
  //
  static asio::awaitable<int>
  run (lookup_coordinator& l, const options& opt, const runtime_config& c)
  {
    int r (0);

    bool imported (co_await l.import_library (c.user, opt.import ()));

    if (opt.import () && !imported)
    {
      error << "unable to import library mappings"
            << (c.user.empty () ? " without a Steam user" : "");
      r = 1;
    }

    vector<shared_ptr<refresh_task>> pending;

    for (steam_app_id app: opt.app ())
    {
      lookup_result x (co_await l.resolve (app));
      print_result (cout, app, x);

      if (x.pending)
        pending.push_back (move (x.pending));
    }

    for (const shared_ptr<refresh_task>& t: pending)
    {
      co_await t->wait ();

      if (!t->result ())
        info << "app " << t->app () << ": kept cached entry";
    }

    co_return r;
  }
}

int
main (int argc, char* argv[])
{
  using namespace hltb;

  try
  {
    options opt (argc, argv);

    if (opt.version ())
    {
      cout << "hltb " << HLTB_VERSION_ID << "\n";
      return 0;
    }

    if (opt.help ())
    {
      auto& o (cout);

      o << "usage: hltb [options]" << "\n"
        << "options:"             << "\n";

      opt.print_usage (o);

      return 0;
    }

    if (opt.quiet ())
      verb = 0;
    else if (opt.trace ())
      verb = 3;
    else if (opt.verbose ())
      verb = 2;

    runtime_config cfg (configure (opt));

    cache_database db (cfg.cache_root);

    if (!db.check ())
      warn << "cache database " << db.path () << " failed integrity check";

    asio::io_context ioc;

    http_client_traits<> t;
    t.connect_timeout = static_cast<uint32_t> (cfg.timeout.count ());
    t.request_timeout = static_cast<uint32_t> (cfg.timeout.count ());

    http_client client (ioc, t);
    lookup_coordinator lookup (client, db, cfg);

    if (opt.clear_cache ())
    {
      lookup.clear (true, true);
      info << "cleared cache in " << cfg.cache_root;
    }

    // A refresh that completes after the whole list was printed. The
    // display is the terminal, so "current" is whatever was printed last.
    //
    lookup.on_display ([] (steam_app_id app, const lookup_result& r)
                       {
                         cout << "updated ";
                         print_result (cout, app, r);
                       });

    int exit_code (0);

    asio::co_spawn (
      ioc,
      run (lookup, opt, cfg),
      [&exit_code] (exception_ptr ex, int r)
      {
        exit_code = r;

        if (ex)
        {
          try { rethrow_exception (ex); }
          catch (const exception& e)
          {
            cerr << "error: " << e.what () << "\n";
            exit_code = 1;
          }
        }
      });

    ioc.run ();

    if (opt.stats ())
      cout << lookup.stats ();

    return exit_code;
  }
  catch (const cli::exception& ex)
  {
    cerr << "error: " << ex.what () << "\n";
    return 1;
  }
  catch (const exception& ex)
  {
    cerr << "error: " << ex.what () << "\n";
    return 1;
  }
}
