#pragma once

#include <optional>
#include <string>
#include <vector>

#include <hltb/steam/steam-types.hxx>

namespace hltb
{
  // Exact catalog title for an app whose storefront title no amount of
  // normalization will match.
  //
  struct name_override
  {
    steam_app_id app;
    std::string title;
  };

  // Manually curated override table.
  //
  // Entries are sorted by app id, strictly ascending, with non-empty titles.
  // A table that isn't is a configuration error and is rejected on
  // construction with std::invalid_argument.
  //
  class override_table
  {
  public:
    override_table () = default;

    explicit
    override_table (std::vector<name_override>);

    std::optional<std::string>
    find (steam_app_id) const;

    std::size_t
    size () const noexcept
    {
      return entries_.size ();
    }

    const std::vector<name_override>&
    entries () const noexcept
    {
      return entries_;
    }

    // The table shipped with the program.
    //
    static const override_table&
    builtin ();

  private:
    std::vector<name_override> entries_;
  };
}
