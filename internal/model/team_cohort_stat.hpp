#pragma once

#include <optional>
#include <string>
#include <string_view>

#include "internal/model/cohort_key.hpp"
#include "internal/util/date.hpp"

namespace powerscore::model {

enum class TeamStatus {
  kActive,
  kInactive,
  kNotEnoughRankedGames,
};

enum class SampleFlag {
  kOk,
  kLowSample,
};

std::string_view ToString(TeamStatus status);
std::string_view ToString(SampleFlag flag);
std::optional<TeamStatus> ParseTeamStatus(std::string_view text);

/*
  One row per (team_id, age, gender) per run.

  Each engine stage reads the fields written by earlier stages and
  fills in its own; no stage reaches outside its cohort's rows except
  through the read-only strength maps.
*/
struct TeamCohortStat {
  std::string team_id;
  int         age = 0;
  std::string gender;

  // aggregator
  double     off_raw             = 0.0;
  double     sad_raw             = 0.0;
  double     def_raw             = 0.0;
  int        games_played        = 0;
  int        games_last_180_days = 0;
  util::Date last_game{};

  // shrinkage
  double off_shrunk = 0.0;
  double sad_shrunk = 0.0;
  double def_shrunk = 0.0;
  double off_norm   = 0.5;
  double def_norm   = 0.5;

  double power_presos = 0.5;
  double anchor       = 1.0;
  double abs_strength = 0.5;

  // sos
  double             sos_raw  = 0.5;
  double             sos      = 0.5;
  double             sos_norm = 0.5;
  std::optional<int> sos_rank;

  double scf                = 1.0;
  int    bridge_games       = 0;
  int    unique_opp_states  = 0;
  int    unique_opp_regions = 0;
  bool   is_isolated        = false;
  int    component_id       = 0;
  int    component_size     = 0;

  SampleFlag sample_flag = SampleFlag::kOk;
  TeamStatus status      = TeamStatus::kActive;

  // performance
  double perf_raw      = 0.0;
  double perf_centered = 0.0;

  // power
  double powerscore_core   = 0.0;
  double provisional_mult  = 1.0;
  double powerscore_adj    = 0.0;
  double power_score_final = 0.0;

  // predictive layer
  double ml_overperf          = 0.0;
  double ml_norm              = 0.0;
  double powerscore_ml        = 0.0;
  double power_score_final_ml = 0.0;

  std::optional<int> rank_in_cohort;
  std::optional<int> rank_in_cohort_ml;
  std::optional<int> rank_change_7d;
  std::optional<int> rank_change_30d;

  CohortKey Cohort() const {
    return {age, gender};
  }
};

} // namespace powerscore::model
