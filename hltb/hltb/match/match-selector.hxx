#pragma once

#include <string>
#include <vector>
#include <cstddef>
#include <cstdint>
#include <optional>

#include <hltb/catalog/catalog-types.hxx>

namespace hltb
{
  // A search hit scored against the query.
  //
  struct match_candidate
  {
    catalog_record record;
    std::size_t score;  // Edit distance to the query, 0 for exact.
    bool exact;
    bool verified;      // Confirmed by the catalog's own storefront id.

    match_candidate () : score (0), exact (false), verified (false) {}

    match_candidate (catalog_record r, std::size_t s, bool e)
      : record (std::move (r)), score (s), exact (e), verified (false) {}

    std::uint64_t
    catalog_id () const noexcept
    {
      return record.catalog_id;
    }

    const std::string&
    title () const noexcept
    {
      return record.title;
    }
  };

  // Pick the best candidate for the query, first rule that applies:
  //
  // 1. The first candidate whose title equals the query ignoring case. No
  //    distances are computed.
  //
  // 2. The candidate with the smallest edit distance, if that distance is
  //    within match_threshold(). Ties go to the earlier candidate: the
  //    catalog's relevance order is kept as is.
  //
  // 3. Nothing. That is a confirmed miss, not an error.
  //
  std::optional<match_candidate>
  select_best_match (const std::string& query,
                     const std::vector<catalog_record>& candidates);

  // Every candidate within threshold, by ascending distance and in catalog
  // order among equals. Input for verification when the pick is ambiguous.
  //
  std::vector<match_candidate>
  threshold_candidates (const std::string& query,
                        const std::vector<catalog_record>& candidates);
}
