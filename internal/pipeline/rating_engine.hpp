#pragma once

#include <cstddef>
#include <vector>

#include "internal/ml/predictive_layer.hpp"
#include "internal/model/game_record.hpp"
#include "internal/model/team_cohort_stat.hpp"
#include "internal/rating/connectivity.hpp"
#include "internal/rating/feature_aggregator.hpp"
#include "internal/rating/settings.hpp"
#include "internal/util/date.hpp"

namespace powerscore::pipeline {

struct EngineOutput {
  // Recency-capped games the ML layer scores.
  std::vector<rating::PreparedGame> games;

  // One row per (team_id, age, gender), ordered by that key.
  std::vector<model::TeamCohortStat> teams;

  std::size_t          cohort_count = 0;
  ml::PredictiveResult predictive;
};

/*
  RatingEngine

  The pure computation: no store, no clock, no cache.

    Aggregate -> Shrink (+ opponent adjust)
      -> per cohort on the worker pool: SOS -> Performance -> Power
      -> Predictive layer

  Same games, directory, today and settings give bit-identical output
  regardless of the worker count.
*/
class RatingEngine {
 public:
  RatingEngine(const rating::Settings& settings, std::size_t worker_threads);

  EngineOutput Compute(const std::vector<model::GameRecord>& games, const rating::TeamDirectory& directory, util::Date today) const;

  // Everything up to and including Power; this is what gets cached.
  EngineOutput ComputeCore(const std::vector<model::GameRecord>& games, const rating::TeamDirectory& directory,
                           util::Date today) const;

  void ApplyPredictive(EngineOutput& output) const;

 private:
  const rating::Settings& settings_;
  std::size_t             worker_threads_;
};

} // namespace powerscore::pipeline
