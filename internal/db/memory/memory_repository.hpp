#pragma once

#include <cstdint>
#include <map>
#include <mutex>
#include <string>
#include <tuple>
#include <utility>

#include "internal/db/api/repository.hpp"

namespace powerscore::db::memory {

class MemoryTransaction;

/*
  In-process repository used by tests and the "memory" backend.

  Ordered maps keep listing order identical to the SQL backends.
*/
class MemoryRepository final : public db::Repository {
 public:
  MemoryRepository();

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
  friend class MemoryTransaction;

  struct State {
    // (game_id, team_id)
    std::map<std::pair<std::string, std::string>, model::GameRow> games;
    std::map<std::string, model::TeamRecord>                       teams;
    // (team_id, age, gender)
    std::map<std::tuple<std::string, int, std::string>, model::RankingRecord> rankings;
    // (team_id, snapshot_date)
    std::map<std::pair<std::string, std::string>, model::SnapshotRecord> snapshots;
    std::map<std::string, model::GameResidualRecord>                     residuals;
    std::map<std::string, model::CacheRecord>                            cache;
  };

  std::mutex    mutex_;
  State         committed_;
  std::uint64_t committed_version_ = 0;
};

} // namespace powerscore::db::memory
