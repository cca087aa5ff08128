#pragma once

#include <optional>
#include <vector>

#include "internal/model/team_cohort_stat.hpp"
#include "internal/rating/settings.hpp"
#include "internal/util/date.hpp"

namespace powerscore::rating {

/*
  PowerScoreComposer

  core = weighted off/def/sos/perf blend, clipped to [0,1]
  adj  = core * provisional multiplier
  final = min(adj * anchor, anchor)

  Status is decided from recent activity; only Active teams are
  ranked, by adj, then sos, then team_id.
*/
class PowerScoreComposer {
 public:
  PowerScoreComposer(const Settings& settings, util::Date today);

  void Apply(std::vector<model::TeamCohortStat>& cohort) const;

  double            ProvisionalMultiplier(int games_played) const;
  model::TeamStatus StatusFor(const model::TeamCohortStat& team) const;

 private:
  const Settings& settings_;
  util::Date      today_;
};

// 1..n over Active rows by score desc, sos desc, team_id asc; others nullopt.
std::vector<std::optional<int>> RankActive(const std::vector<model::TeamCohortStat>& cohort, const std::vector<double>& scores);

} // namespace powerscore::rating
