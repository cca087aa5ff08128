#include "regions.hpp"

#include <array>
#include <utility>

namespace powerscore::model {

namespace {

constexpr std::array<std::pair<std::string_view, std::string_view>, 51> kStateToRegion = {{
    {"AK", "pacific"},
    {"AL", "east_south_central"},
    {"AR", "west_south_central"},
    {"AZ", "mountain"},
    {"CA", "pacific"},
    {"CO", "mountain"},
    {"CT", "new_england"},
    {"DC", "south_atlantic"},
    {"DE", "south_atlantic"},
    {"FL", "south_atlantic"},
    {"GA", "south_atlantic"},
    {"HI", "pacific"},
    {"IA", "west_north_central"},
    {"ID", "mountain"},
    {"IL", "east_north_central"},
    {"IN", "east_north_central"},
    {"KS", "west_north_central"},
    {"KY", "east_south_central"},
    {"LA", "west_south_central"},
    {"MA", "new_england"},
    {"MD", "south_atlantic"},
    {"ME", "new_england"},
    {"MI", "east_north_central"},
    {"MN", "west_north_central"},
    {"MO", "west_north_central"},
    {"MS", "east_south_central"},
    {"MT", "mountain"},
    {"NC", "south_atlantic"},
    {"ND", "west_north_central"},
    {"NE", "west_north_central"},
    {"NH", "new_england"},
    {"NJ", "middle_atlantic"},
    {"NM", "mountain"},
    {"NV", "mountain"},
    {"NY", "middle_atlantic"},
    {"OH", "east_north_central"},
    {"OK", "west_south_central"},
    {"OR", "pacific"},
    {"PA", "middle_atlantic"},
    {"RI", "new_england"},
    {"SC", "south_atlantic"},
    {"SD", "west_north_central"},
    {"TN", "east_south_central"},
    {"TX", "west_south_central"},
    {"UT", "mountain"},
    {"VA", "south_atlantic"},
    {"VT", "new_england"},
    {"WA", "pacific"},
    {"WI", "east_north_central"},
    {"WV", "south_atlantic"},
    {"WY", "mountain"},
}};

} // namespace

std::optional<std::string_view> RegionForState(std::string_view state_code) {
  for (const auto& [state, region] : kStateToRegion) {
    if (state == state_code) {
      return region;
    }
  }
  return std::nullopt;
}

} // namespace powerscore::model
