#include <hltb/hltb-log.hxx>

#include <iostream>

using namespace std;

namespace hltb
{
  uint16_t verb (1);

  const diag_mark error {"error: ",   0};
  const diag_mark warn  {"warning: ", 1};
  const diag_mark info  {"info: ",    2};
  const diag_mark trace {"trace: ",   3};

  diag_record::
  ~diag_record ()
  {
    if (active_)
    {
      os_ << '\n';
      cerr << prefix_ << os_.str () << flush;
    }
  }
}
