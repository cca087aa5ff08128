#pragma once

#include <cstddef>
#include <memory>
#include <string>
#include <vector>

#include "internal/ml/regressor.hpp"
#include "internal/model/team_cohort_stat.hpp"
#include "internal/rating/feature_aggregator.hpp"
#include "internal/rating/settings.hpp"
#include "internal/rating/team_maps.hpp"

namespace powerscore::ml {

// Home-perspective residual of one game.
struct GameResidual {
  std::string game_id;
  double      residual = 0.0;
};

struct PredictiveResult {
  bool        enabled       = false;
  std::size_t training_rows = 0;
  std::string model_name;

  std::vector<GameResidual> residuals; // sorted by game_id, empty when disabled or not exported
};

/*
  PredictiveLayer

  Learns margin ~ f(team power, opponent power, power gap, age gap,
  cross-gender) on games older than the holdout, scores every game,
  and blends each team's recency-weighted residual into its score.

  With too few training rows the layer is a pass-through:
  powerscore_ml = powerscore_core and rank_in_cohort_ml = rank_in_cohort.
*/
class PredictiveLayer {
 public:
  explicit PredictiveLayer(const rating::Settings& settings);

  PredictiveResult Apply(std::vector<model::TeamCohortStat>& teams, const std::vector<rating::PreparedGame>& games) const;

  static std::vector<double> Features(const rating::PreparedGame& game, const rating::TeamValueMap& core);

  std::unique_ptr<Regressor> MakeModel(rating::ModelKind kind) const;

 private:
  void PassThrough(std::vector<model::TeamCohortStat>& teams) const;
  void Blend(std::vector<model::TeamCohortStat>& teams) const;

  const rating::Settings& settings_;
};

} // namespace powerscore::ml
