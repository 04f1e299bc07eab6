#include <hltb/match/match-selector.hxx>

#include <algorithm>

#include <hltb/match/match-name.hxx>

using namespace std;

namespace hltb
{
  optional<match_candidate>
  select_best_match (const string& q, const vector<catalog_record>& cs)
  {
    for (const catalog_record& c: cs)
    {
      if (equal_icase (c.title, q))
        return match_candidate (c, 0, true);
    }

    const catalog_record* best (nullptr);
    size_t bd (0);

    for (const catalog_record& c: cs)
    {
      size_t d (edit_distance (q, c.title));

      // Strictly less: the first of equals stays.
      //
      if (best == nullptr || d < bd)
      {
        best = &c;
        bd = d;
      }
    }

    if (best != nullptr && bd <= match_threshold (q, best->title))
      return match_candidate (*best, bd, false);

    return nullopt;
  }

  vector<match_candidate>
  threshold_candidates (const string& q, const vector<catalog_record>& cs)
  {
    vector<match_candidate> r;

    for (const catalog_record& c: cs)
    {
      size_t d (edit_distance (q, c.title));

      if (d <= match_threshold (q, c.title))
        r.emplace_back (c, d, d == 0 && equal_icase (q, c.title));
    }

    stable_sort (r.begin (), r.end (),
                 [] (const match_candidate& x, const match_candidate& y)
                 {
                   return x.score < y.score;
                 });

    return r;
  }
}
