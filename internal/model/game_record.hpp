#pragma once

#include <string>

#include "internal/util/date.hpp"

namespace powerscore::model {

/*
  One played match seen from one team's perspective.

  Every match contributes two records sharing a game_id.
  Immutable once produced by ingest.
*/
struct GameRecord {
  std::string game_id;
  util::Date  date{};

  std::string team_id;
  std::string opponent_id;

  int         age = 0;
  std::string gender;
  int         opponent_age = 0;
  std::string opponent_gender;

  int goals_for     = 0;
  int goals_against = 0;

  bool        is_home = false;
  std::string provider;
};

} // namespace powerscore::model
