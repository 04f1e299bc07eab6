#include <hltb/catalog/catalog-api.hxx>

#include <sstream>

using namespace std;

namespace hltb
{
  vector<string>
  search_terms (const string& q)
  {
    vector<string> r;
    istringstream is (q);

    for (string w; is >> w; )
      r.push_back (move (w));

    return r;
  }
}
