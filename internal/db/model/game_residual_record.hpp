#pragma once

#include <string>

namespace powerscore::db::model {

/*
  Home-perspective residual of one game (actual margin minus predicted).
  The away residual is the negation and is not stored.
*/
struct GameResidualRecord {
  std::string game_id;
  double      residual = 0.0;
  std::string snapshot_date; // YYYY-MM-DD
};

} // namespace powerscore::db::model
