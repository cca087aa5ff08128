#pragma once

#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "internal/db/api/result.hpp"
#include "internal/db/api/transaction.hpp"
#include "internal/db/model/cache_record.hpp"
#include "internal/db/model/game_residual_record.hpp"
#include "internal/db/model/game_row.hpp"
#include "internal/db/model/ranking_record.hpp"
#include "internal/db/model/snapshot_record.hpp"
#include "internal/db/model/team_record.hpp"

namespace powerscore::db {

/*
  Repository abstraction.

  - All reads and writes go through a Transaction
  - Reads inside a transaction see its writes
  - Upserts are idempotent on the natural key of each table
  - Dates are ISO "YYYY-MM-DD" strings; ranges are inclusive

  The DB is the source of truth for:
    games and the team directory (inputs)
    rankings, snapshots and residuals (outputs)
    cached engine output
*/

class Repository {
 public:
  virtual ~Repository() = default;

  // ---------------------------------------------------------------------
  // Transactions
  // ---------------------------------------------------------------------

  virtual std::unique_ptr<Transaction> Begin() = 0;

  // ---------------------------------------------------------------------
  // Games (key: game_id, team_id)
  // ---------------------------------------------------------------------

  virtual Result UpsertGame(Transaction&, const model::GameRow&) = 0;

  // Empty provider matches every provider. Ordered by date, game_id, team_id.
  virtual std::vector<model::GameRow> ListGames(Transaction&, const std::string& from_date, const std::string& to_date,
                                                const std::string& provider) = 0;

  // ---------------------------------------------------------------------
  // Team directory (key: team_id)
  // ---------------------------------------------------------------------

  virtual Result UpsertTeam(Transaction&, const model::TeamRecord&) = 0;

  virtual std::vector<model::TeamRecord> ListTeams(Transaction&) = 0;

  // ---------------------------------------------------------------------
  // Rankings (key: team_id, age, gender)
  // ---------------------------------------------------------------------

  virtual Result UpsertRanking(Transaction&, const model::RankingRecord&) = 0;

  // Ordered by rank_in_cohort (unranked last), then team_id.
  virtual std::vector<model::RankingRecord> ListRankings(Transaction&, int age, const std::string& gender) = 0;

  // ---------------------------------------------------------------------
  // Rank snapshots (key: team_id, snapshot_date)
  // ---------------------------------------------------------------------

  virtual Result UpsertSnapshot(Transaction&, const model::SnapshotRecord&) = 0;

  virtual std::vector<model::SnapshotRecord> ListSnapshots(Transaction&, const std::string& from_date, const std::string& to_date) = 0;

  virtual std::vector<model::SnapshotRecord> ListSnapshotsForTeam(Transaction&, const std::string& team_id) = 0;

  // Deletes snapshots dated strictly before cutoff_date.
  virtual Result DeleteSnapshotsBefore(Transaction&, const std::string& cutoff_date, std::uint64_t& deleted) = 0;

  // ---------------------------------------------------------------------
  // Per-game residuals (key: game_id)
  // ---------------------------------------------------------------------

  virtual Result UpsertGameResidual(Transaction&, const model::GameResidualRecord&) = 0;

  virtual std::optional<model::GameResidualRecord> GetGameResidual(Transaction&, const std::string& game_id) = 0;

  // ---------------------------------------------------------------------
  // Result cache (key: cache_key)
  // ---------------------------------------------------------------------

  virtual Result PutCacheEntry(Transaction&, const model::CacheRecord&) = 0;

  virtual std::optional<model::CacheRecord> GetCacheEntry(Transaction&, const std::string& cache_key) = 0;
};

} // namespace powerscore::db
