#include <hltb/hltb-config.hxx>

#include <cstdlib>

using namespace std;

namespace hltb
{
  fs::path
  default_cache_root ()
  {
    // XDG wants an absolute path; a relative one is to be ignored.
    //
    if (const char* x = getenv ("XDG_CACHE_HOME"); x != nullptr && *x == '/')
      return fs::path (x) / "hltb";

    if (const char* h = getenv ("HOME"); h != nullptr && *h != '\0')
      return fs::path (h) / ".cache" / "hltb";

    return fs::path (".hltb");
  }
}
