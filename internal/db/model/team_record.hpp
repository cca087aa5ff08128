#pragma once

#include <string>

namespace powerscore::db::model {

/*
  Team directory entry. state_code is a two-letter US code or empty
  when unknown.
*/
struct TeamRecord {
  std::string team_id;
  std::string state_code;
};

} // namespace powerscore::db::model
