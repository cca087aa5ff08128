#pragma once

#include <optional>
#include <string>

namespace powerscore::db::model {

/*
  Daily rank snapshot. Upserted on (team_id, snapshot_date) so a
  same-day re-run overwrites; purged after the retention window.
*/
struct SnapshotRecord {
  std::string team_id;
  std::string snapshot_date; // YYYY-MM-DD
  int         age = 0;
  std::string gender;

  std::optional<int> rank_in_cohort;
  std::optional<int> rank_in_cohort_ml;

  double power_score_final = 0.0;
  double powerscore_ml     = 0.0;
};

} // namespace powerscore::db::model
