#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

#include <hltb/catalog/catalog-types.hxx>
#include <hltb/cache/cache-id.hxx>

namespace hltb
{
  // What an import did to the id cache.
  //
  struct reconcile_summary
  {
    std::size_t received = 0;
    std::size_t dropped = 0;  // Rows without a catalog id.
    std::size_t stored = 0;

    // The cache was replaced. False means it was left as it was.
    //
    bool
    applied () const noexcept
    {
      return stored != 0;
    }
  };

  // Bulk import to id cache.
  //
  // The whole cache is replaced in one go or not at all. An import that
  // yields nothing usable never touches what we have: an empty answer says
  // more about the profile's visibility today than about the library.
  //
  class id_reconciler
  {
  public:
    explicit
    id_reconciler (id_cache& c) : cache_ (c) {}

    reconcile_summary
    reconcile (const std::vector<import_mapping>&,
               const std::string& owner,
               std::int64_t now);

  private:
    id_cache& cache_;
  };
}
