#pragma once

#include <string>
#include <vector>
#include <cstddef>

namespace hltb
{
  // Strip glyphs and decorative punctuation that routinely differ between
  // the storefront and the catalog without changing what game is meant:
  // trademark/registration marks, typographic quotes and dashes, runs of
  // whitespace.
  //
  std::string
  sanitize_name (const std::string&);

  // Additionally strip edition and suffix qualifiers ("Enhanced Edition",
  // "Remastered", "(2013)", ...). Only defined on sanitized input. Never
  // returns a longer string, and never an empty one: if everything would go
  // the input is returned as is.
  //
  std::string
  simplify_name (const std::string& sanitized);

  // Case-insensitive Levenshtein distance. Operates on bytes and folds ASCII
  // case only.
  //
  std::size_t
  edit_distance (const std::string&, const std::string&);

  bool
  equal_icase (const std::string&, const std::string&) noexcept;

  // Largest distance still accepted as a match between the two strings:
  // 20% of the longer one, but at least 5.
  //
  std::size_t
  match_threshold (const std::string&, const std::string&) noexcept;

  // A storefront title and its derived search forms.
  //
  struct name_query
  {
    std::string raw;
    std::string sanitized;
    std::string simplified;

    name_query () = default;

    explicit
    name_query (std::string r);

    // Queries to issue, in order: sanitized, then simplified if it differs.
    //
    std::vector<std::string>
    plan () const;
  };
}
