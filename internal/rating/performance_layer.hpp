#pragma once

#include <vector>

#include "internal/model/team_cohort_stat.hpp"
#include "internal/rating/feature_aggregator.hpp"
#include "internal/rating/settings.hpp"
#include "internal/rating/team_maps.hpp"

namespace powerscore::rating {

/*
  Over/under-performance against the margin implied by the pre-SOS
  power gap, recency-decayed and centered within the cohort.
*/
class PerformanceLayer {
 public:
  PerformanceLayer(const Settings& settings, const TeamValueMap& power, const TeamValueMap& strength);

  void Apply(std::vector<model::TeamCohortStat>& cohort, const std::vector<const PreparedGame*>& games) const;

  double GameContribution(const PreparedGame& game) const;

 private:
  const Settings&     settings_;
  const TeamValueMap& power_;
  const TeamValueMap& strength_;
};

} // namespace powerscore::rating
