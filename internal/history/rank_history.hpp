#pragma once

#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <vector>

#include "internal/db/api/repository.hpp"
#include "internal/db/model/snapshot_record.hpp"
#include "internal/model/team_cohort_stat.hpp"
#include "internal/util/date.hpp"

namespace powerscore::history {

struct HistorySettings {
  int snapshot_retention_days = 90;
  int lookup_tolerance_days   = 3;
  int snapshot_batch_size     = 500;
};

// ML rank when present, else the core rank.
std::optional<int> PreferredRank(std::optional<int> ml_rank, std::optional<int> core_rank);

// historical - current (positive means the team moved up); absent if either is.
std::optional<int> RankChange(std::optional<int> historical, std::optional<int> current);

// A past rank together with the cohort it was earned in.
struct HistoricalRank {
  int         rank = 0;
  int         age  = 0;
  std::string gender;

  bool SameCohort(const model::TeamCohortStat& team) const {
    return age == team.age && gender == team.gender;
  }
};

/*
  Per team, the snapshot nearest `target` within +-tolerance days.
  Equal distance goes to the later snapshot. Teams whose chosen
  snapshot carries no rank are left out.
*/
std::map<std::string, HistoricalRank> HistoricalRanks(const std::vector<db::model::SnapshotRecord>& snapshots, util::Date target,
                                           int tolerance_days);

/*
  RankHistory

  Daily rank snapshots: reads the 7/30-day-ago ranks to fill rank
  deltas, builds today's snapshot rows and purges old ones.
*/
class RankHistory {
 public:
  RankHistory(db::Repository& repo, HistorySettings settings);

  // A delta is only filled when the past snapshot was taken in the
  // row's own cohort; a team ranked in several cohorts gets deltas for
  // the one it was snapshotted in.
  void ApplyDeltas(std::vector<model::TeamCohortStat>& teams, util::Date today);

  std::map<std::string, HistoricalRank> RanksAround(util::Date target);

  // One row per ranked team; a team ranked in several cohorts keeps its
  // busiest cohort.
  std::vector<db::model::SnapshotRecord> BuildSnapshots(const std::vector<model::TeamCohortStat>& teams, util::Date today) const;

  db::Result Prune(util::Date today, std::uint64_t& deleted);

  const HistorySettings& Settings() const {
    return settings_;
  }

 private:
  db::Repository& repo_;
  HistorySettings settings_;
};

} // namespace powerscore::history
