#pragma once

#include <memory>

#include "internal/db/api/repository.hpp"
#include "sqlite_db.hpp"
#include "sqlite_tx.hpp"

namespace powerscore::db::sqlite {

class SqliteRepository final : public db::Repository {
 public:
  explicit SqliteRepository(std::shared_ptr<SqliteDB> db);

  std::unique_ptr<Transaction> Begin() override;

  Result UpsertGame(Transaction&, const model::GameRow&) override;
  std::vector<model::GameRow> ListGames(Transaction&, const std::string& from_date, const std::string& to_date,
                                        const std::string& provider) override;

  Result UpsertTeam(Transaction&, const model::TeamRecord&) override;
  std::vector<model::TeamRecord> ListTeams(Transaction&) override;

  Result UpsertRanking(Transaction&, const model::RankingRecord&) override;
  std::vector<model::RankingRecord> ListRankings(Transaction&, int age, const std::string& gender) override;

  Result UpsertSnapshot(Transaction&, const model::SnapshotRecord&) override;
  std::vector<model::SnapshotRecord> ListSnapshots(Transaction&, const std::string& from_date, const std::string& to_date) override;
  std::vector<model::SnapshotRecord> ListSnapshotsForTeam(Transaction&, const std::string& team_id) override;
  Result DeleteSnapshotsBefore(Transaction&, const std::string& cutoff_date, std::uint64_t& deleted) override;

  Result UpsertGameResidual(Transaction&, const model::GameResidualRecord&) override;
  std::optional<model::GameResidualRecord> GetGameResidual(Transaction&, const std::string& game_id) override;

  Result PutCacheEntry(Transaction&, const model::CacheRecord&) override;
  std::optional<model::CacheRecord> GetCacheEntry(Transaction&, const std::string& cache_key) override;

 private:
  std::shared_ptr<SqliteDB> db_;

  static SqliteTransaction& TX(Transaction& t);
  static Result             Translate(sqlite3* db, int rc);
};

} // namespace powerscore::db::sqlite
