#pragma once

#include <optional>
#include <string>

namespace powerscore::db::model {

/*
  Published ranking row, one per (team_id, age, gender).
  Overwritten by every run.
*/
struct RankingRecord {
  std::string team_id;
  int         age = 0;
  std::string gender;

  std::string status;
  int         games_played        = 0;
  int         games_last_180_days = 0;
  std::string last_game; // YYYY-MM-DD

  double off_norm = 0.0;
  double def_norm = 0.0;
  double sos      = 0.0;
  double sos_norm = 0.0;
  double scf      = 1.0;

  double perf_centered        = 0.0;
  double powerscore_core      = 0.0;
  double powerscore_adj       = 0.0;
  double power_score_final    = 0.0;
  double ml_norm              = 0.0;
  double powerscore_ml        = 0.0;
  double power_score_final_ml = 0.0;

  std::optional<int> sos_rank;
  std::optional<int> rank_in_cohort;
  std::optional<int> rank_in_cohort_ml;
  std::optional<int> rank_change_7d;
  std::optional<int> rank_change_30d;

  std::string snapshot_date; // YYYY-MM-DD of the run
};

} // namespace powerscore::db::model
