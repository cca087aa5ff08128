#pragma once

#include <vector>

#include "internal/model/team_cohort_stat.hpp"
#include "internal/rating/feature_aggregator.hpp"
#include "internal/rating/settings.hpp"
#include "internal/util/date.hpp"

namespace powerscore::rating {

/*
  ShrinkageNormalizer

  Per cohort:
    1. empirical-Bayes shrink of off/sad toward the cohort mean
    2. ridge defense transform
    3. team-level outlier guard
    4. off/def normalization (percentile or z-sigmoid)
    5. power_presos and anchored abs_strength

  AdjustForOpponents() rescales each game's goals by the opponent's
  abs_strength relative to the global mean, re-aggregates and runs
  the same five steps again.
*/
class ShrinkageNormalizer {
 public:
  explicit ShrinkageNormalizer(const Settings& settings);

  void Apply(std::vector<model::TeamCohortStat>& teams) const;

  std::vector<model::TeamCohortStat> AdjustForOpponents(const std::vector<PreparedGame>&          games,
                                                        const std::vector<model::TeamCohortStat>& teams, util::Date today) const;

 private:
  void ApplyCohort(std::vector<model::TeamCohortStat>& teams, const std::vector<std::size_t>& rows) const;

  const Settings& settings_;
};

} // namespace powerscore::rating
