#pragma once

#include <string>
#include <utility>
#include <vector>

#include "internal/model/team_cohort_stat.hpp"
#include "internal/rating/connectivity.hpp"
#include "internal/rating/feature_aggregator.hpp"
#include "internal/rating/settings.hpp"
#include "internal/rating/team_maps.hpp"
#include "internal/util/date.hpp"

namespace powerscore::rating {

/*
  Weighted opponent edges of one cohort, after the repeat-opponent cap.
  edges[i] belongs to teams[i] of the cohort table.
*/
struct SosGraph {
  struct Edge {
    std::string opponent_id;
    double      weight = 0.0;
  };

  std::vector<std::string>       team_ids;
  std::vector<std::vector<Edge>> edges;

  // Cohort row index of an opponent, or -1 when outside the cohort.
  std::vector<std::vector<int>> opponent_rows;
};

/*
  SosEngine

  Strength of schedule for one cohort:

    per-game weights -> repeat-opponent cap -> direct pass
    -> fixed number of refinement passes (transitive blend)
    -> schedule connectivity (bubble damping, isolation cap)
    -> per-component percentile -> low-sample shrink -> sos_rank

  The strength map and team directory are shared read-only across
  cohorts; Apply() only touches the rows it is given.
*/
class SosEngine {
 public:
  SosEngine(const Settings& settings, const TeamValueMap& strength, const TeamDirectory& directory);

  void Apply(std::vector<model::TeamCohortStat>& cohort, const std::vector<const PreparedGame*>& games, util::Date today) const;

  SosGraph BuildGraph(const std::vector<model::TeamCohortStat>& cohort, const std::vector<const PreparedGame*>& games,
                      util::Date today) const;

  std::vector<double> DirectPass(const SosGraph& graph) const;

  // previous -> next. Pure; no convergence test.
  std::vector<double> Refine(const SosGraph& graph, const std::vector<double>& direct, const std::vector<double>& previous) const;

 private:
  void ApplyConnectivity(std::vector<model::TeamCohortStat>& cohort, const std::vector<const PreparedGame*>& games) const;
  void NormalizeByComponent(std::vector<model::TeamCohortStat>& cohort, const std::vector<const PreparedGame*>& games) const;
  void ShrinkLowSample(std::vector<model::TeamCohortStat>& cohort) const;
  void AssignSosRank(std::vector<model::TeamCohortStat>& cohort) const;

  const Settings&      settings_;
  const TeamValueMap&  strength_;
  const TeamDirectory& directory_;
};

} // namespace powerscore::rating
