#include <hltb/resolve/resolve-overrides.hxx>

#include <algorithm>
#include <stdexcept>

using namespace std;

namespace hltb
{
  override_table::
  override_table (vector<name_override> es)
    : entries_ (move (es))
  {
    for (size_t i (0); i < entries_.size (); ++i)
    {
      const name_override& e (entries_[i]);

      if (e.title.empty ())
        throw invalid_argument ("empty override title for app " +
                                to_string (e.app));

      if (i != 0 && entries_[i - 1].app >= e.app)
        throw invalid_argument ("override table not strictly ascending at app " +
                                to_string (e.app));
    }
  }

  optional<string> override_table::
  find (steam_app_id id) const
  {
    auto i (lower_bound (entries_.begin (), entries_.end (), id,
                         [] (const name_override& e, steam_app_id v)
                         {
                           return e.app < v;
                         }));

    if (i != entries_.end () && i->app == id)
      return i->title;

    return nullopt;
  }

  // Keep sorted by app id.
  //
  const override_table& override_table::
  builtin ()
  {
    static const override_table t ({
      {292030,  "The Witcher 3: Wild Hunt"},
      {570940,  "Dark Souls Remastered"},
      {1004640, "Final Fantasy Tactics: The Ivalice Chronicles"},
      {1151640, "Horizon Zero Dawn"},
      {1174180, "Red Dead Redemption 2"}
    });

    return t;
  }
}
