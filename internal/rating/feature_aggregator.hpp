#pragma once

#include <vector>

#include "internal/model/game_record.hpp"
#include "internal/model/team_cohort_stat.hpp"
#include "internal/rating/settings.hpp"
#include "internal/util/date.hpp"

namespace powerscore::rating {

/*
  One window game after guarding, capping and weighting.

  goals_for/goals_against are the outlier-guarded values; `game`
  keeps the raw record for the margin and cohort fields.
*/
struct PreparedGame {
  model::GameRecord game;

  double goals_for     = 0.0;
  double goals_against = 0.0;
  double goal_diff     = 0.0; // capped at +-goal_diff_cap

  int    rank_recency = 0;   // 1 = most recent
  double weight       = 0.0; // normalized recency weight, sums to 1 per team

  int Margin() const {
    return game.goals_for - game.goals_against;
  }
};

struct AggregateResult {
  // Recency-capped games ordered by team_id, then rank_recency.
  std::vector<PreparedGame>          games;
  std::vector<model::TeamCohortStat> teams;
};

/*
  FeatureAggregator

  Window filter -> per-team game outlier guard -> goal-diff cap ->
  recency cap -> recency weights -> per (team, age, gender) raw
  offense/defense and sample counts.
*/
class FeatureAggregator {
 public:
  explicit FeatureAggregator(const Settings& settings);

  AggregateResult Aggregate(const std::vector<model::GameRecord>& games, util::Date today) const;

  // Raw offense/defense from already prepared games. Used again after
  // opponent adjustment rewrites goals_for/goals_against.
  std::vector<model::TeamCohortStat> Summarize(const std::vector<PreparedGame>& games, util::Date today) const;

 private:
  const Settings& settings_;
};

} // namespace powerscore::rating
