#pragma once

#include <compare>
#include <string>

namespace powerscore::model {

/*
  Ranking group: (age bracket, gender). Age 14 means U14.
*/
struct CohortKey {
  int         age = 0;
  std::string gender;

  auto operator<=>(const CohortKey&) const = default;
  bool operator==(const CohortKey&) const  = default;

  std::string ToString() const {
    return "U" + std::to_string(age) + "/" + gender;
  }
};

} // namespace powerscore::model
