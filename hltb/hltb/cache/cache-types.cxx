#include <hltb/cache/cache-types.hxx>

#include <stdexcept>

using namespace std;

namespace hltb
{
  id_refresh_mode
  to_id_refresh_mode (const string& s)
  {
    if (s == "max-age")       return id_refresh_mode::max_age;
    if (s == "every-session") return id_refresh_mode::every_session;

    throw invalid_argument ("invalid id refresh mode '" + s + "'");
  }
}
