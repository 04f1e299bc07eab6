#pragma once

#include <cstdint>
#include <sstream>
#include <utility>

namespace hltb
{
  // Diagnostics verbosity.
  //
  // 0 - errors only
  // 1 - warnings (default)
  // 2 - progress information (--verbose)
  // 3 - every request and cache decision (--trace)
  //
  extern std::uint16_t verb;

  // A diagnostics line. Accumulates and writes itself to stderr, prefixed,
  // when destroyed so that concurrent coroutines never interleave halves of
  // a line.
  //
  class diag_record
  {
  public:
    diag_record (const char* prefix, bool active)
      : prefix_ (prefix), active_ (active) {}

    diag_record (diag_record&& r) noexcept
      : os_ (std::move (r.os_)), prefix_ (r.prefix_), active_ (r.active_)
    {
      r.active_ = false;
    }

    diag_record (const diag_record&) = delete;
    diag_record& operator= (const diag_record&) = delete;

    ~diag_record ();

    template <typename T>
    diag_record&
    operator<< (const T& x)
    {
      if (active_)
        os_ << x;

      return *this;
    }

  private:
    std::ostringstream os_;
    const char* prefix_;
    bool active_;
  };

  // Start a record with `error << "..."`.
  //
  struct diag_mark
  {
    const char* prefix;
    std::uint16_t level;

    template <typename T>
    diag_record
    operator<< (const T& x) const
    {
      diag_record r (prefix, verb >= level);
      r << x;
      return r;
    }
  };

  extern const diag_mark error;
  extern const diag_mark warn;
  extern const diag_mark info;
  extern const diag_mark trace;
}
