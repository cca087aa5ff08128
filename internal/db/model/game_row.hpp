#pragma once

#include <optional>
#include <string>

namespace powerscore::db::model {

/*
  One stored game perspective, as imported.

  Fields are nullable because providers deliver incomplete rows;
  ingest decides what is usable. Keyed by (game_id, team_id).
*/
struct GameRow {
  std::string game_id;
  std::string date; // YYYY-MM-DD

  std::string team_id;
  std::string opponent_id;

  std::optional<int>         age;
  std::optional<std::string> gender;
  std::optional<int>         opponent_age;
  std::optional<std::string> opponent_gender;

  std::optional<int> goals_for;
  std::optional<int> goals_against;

  std::optional<std::string> home_team_id;
  std::string                provider;
};

} // namespace powerscore::db::model
