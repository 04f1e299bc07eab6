#include <hltb/steam/steam-users.hxx>

#include <cstdlib>
#include <stdexcept>
#include <system_error>

#include <hltb/hltb-log.hxx>
#include <hltb/steam/steam-parser.hxx>

using namespace std;

namespace hltb
{
  optional<steam_paths>
  find_steam ()
  {
    vector<fs::path> cs;

    if (const char* h = getenv ("HOME"))
    {
      fs::path hp (h);

      cs.push_back (hp / ".steam" / "steam");
      cs.push_back (hp / ".local" / "share" / "Steam");
      cs.push_back (hp / ".var" / "app" / "com.valvesoftware.Steam" /
                    ".local" / "share" / "Steam");
      cs.push_back (hp / "Library" / "Application Support" / "Steam");
    }

    if (const char* x = getenv ("XDG_DATA_HOME"))
      cs.push_back (fs::path (x) / "Steam");

    cs.push_back ("/usr/share/steam");
    cs.push_back ("/usr/local/share/steam");

    for (const fs::path& p: cs)
    {
      // A root we can use has the login list; a bare install that never
      // signed in is of no help.
      //
      error_code ec;
      fs::path lu (p / "config" / "loginusers.vdf");

      if (fs::is_regular_file (lu, ec))
      {
        steam_paths r;
        r.root = p;
        r.login_users = move (lu);
        return r;
      }
    }

    return nullopt;
  }

  optional<steam_account>
  acting_account (const vector<steam_account>& as)
  {
    const steam_account* r (nullptr);

    for (const steam_account& a: as)
    {
      if (a.most_recent)
        return a;

      if (r == nullptr || a.timestamp > r->timestamp)
        r = &a;
    }

    return r != nullptr ? optional<steam_account> (*r) : nullopt;
  }

  optional<string>
  detect_steam_user ()
  {
    optional<steam_paths> sp (find_steam ());

    if (!sp)
    {
      info << "no local Steam client found";
      return nullopt;
    }

    vector<steam_account> as;

    try
    {
      as = parse_login_users (vdf_parser::parse_file (sp->login_users));
    }
    catch (const runtime_error& e)
    {
      warn << "unable to read " << sp->login_users.string () << ": " << e.what ();
      return nullopt;
    }

    optional<steam_account> a (acting_account (as));

    if (!a)
      return nullopt;

    info << "acting Steam user " << a->steam_id
         << " (" << a->account_name << ")";

    return a->steam_id;
  }
}
