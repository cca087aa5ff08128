#pragma once

#include <optional>
#include <string_view>

namespace powerscore::model {

/*
  US state code -> census division, nine regions plus DC.
  Used by schedule connectivity to count distinct regions played.
*/
std::optional<std::string_view> RegionForState(std::string_view state_code);

} // namespace powerscore::model
