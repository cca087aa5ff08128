#include "memory_repository.hpp"

#include <algorithm>

#include "memory_tx.hpp"

namespace powerscore::db::memory {

MemoryRepository::MemoryRepository() = default;

std::unique_ptr<db::Transaction> MemoryRepository::Begin() {
  return std::make_unique<MemoryTransaction>(*this);
}

static MemoryTransaction& TX(db::Transaction& tx) {
  return static_cast<MemoryTransaction&>(tx);
}

// ------------------------------------------------------------------
// Games
// ------------------------------------------------------------------

Result MemoryRepository::UpsertGame(Transaction& t, const model::GameRow& r) {
  TX(t).Mutable().games[{r.game_id, r.team_id}] = r;
  return Result::Ok();
}

std::vector<model::GameRow> MemoryRepository::ListGames(Transaction& t, const std::string& from_date, const std::string& to_date,
                                                        const std::string& provider) {
  std::vector<model::GameRow> out;
  for (const auto& [_, row] : TX(t).View().games) {
    if (row.date < from_date || row.date > to_date) continue;
    if (!provider.empty() && row.provider != provider) continue;
    out.push_back(row);
  }
  std::stable_sort(out.begin(), out.end(), [](const model::GameRow& a, const model::GameRow& b) {
    return std::tie(a.date, a.game_id, a.team_id) < std::tie(b.date, b.game_id, b.team_id);
  });
  return out;
}

// ------------------------------------------------------------------
// Teams
// ------------------------------------------------------------------

Result MemoryRepository::UpsertTeam(Transaction& t, const model::TeamRecord& r) {
  TX(t).Mutable().teams[r.team_id] = r;
  return Result::Ok();
}

std::vector<model::TeamRecord> MemoryRepository::ListTeams(Transaction& t) {
  std::vector<model::TeamRecord> out;
  for (const auto& [_, team] : TX(t).View().teams) {
    out.push_back(team);
  }
  return out;
}

// ------------------------------------------------------------------
// Rankings
// ------------------------------------------------------------------

Result MemoryRepository::UpsertRanking(Transaction& t, const model::RankingRecord& r) {
  TX(t).Mutable().rankings[{r.team_id, r.age, r.gender}] = r;
  return Result::Ok();
}

std::vector<model::RankingRecord> MemoryRepository::ListRankings(Transaction& t, int age, const std::string& gender) {
  std::vector<model::RankingRecord> out;
  for (const auto& [_, ranking] : TX(t).View().rankings) {
    if (ranking.age == age && ranking.gender == gender) out.push_back(ranking);
  }
  std::stable_sort(out.begin(), out.end(), [](const model::RankingRecord& a, const model::RankingRecord& b) {
    if (a.rank_in_cohort.has_value() != b.rank_in_cohort.has_value()) return a.rank_in_cohort.has_value();
    if (a.rank_in_cohort != b.rank_in_cohort) return *a.rank_in_cohort < *b.rank_in_cohort;
    return a.team_id < b.team_id;
  });
  return out;
}

// ------------------------------------------------------------------
// Snapshots
// ------------------------------------------------------------------

Result MemoryRepository::UpsertSnapshot(Transaction& t, const model::SnapshotRecord& r) {
  TX(t).Mutable().snapshots[{r.team_id, r.snapshot_date}] = r;
  return Result::Ok();
}

std::vector<model::SnapshotRecord> MemoryRepository::ListSnapshots(Transaction& t, const std::string& from_date, const std::string& to_date) {
  std::vector<model::SnapshotRecord> out;
  for (const auto& [_, snapshot] : TX(t).View().snapshots) {
    if (snapshot.snapshot_date >= from_date && snapshot.snapshot_date <= to_date) out.push_back(snapshot);
  }
  return out;
}

std::vector<model::SnapshotRecord> MemoryRepository::ListSnapshotsForTeam(Transaction& t, const std::string& team_id) {
  std::vector<model::SnapshotRecord> out;
  const auto&                        snapshots = TX(t).View().snapshots;
  for (auto it = snapshots.lower_bound({team_id, ""}); it != snapshots.end() && it->first.first == team_id; ++it) {
    out.push_back(it->second);
  }
  return out;
}

Result MemoryRepository::DeleteSnapshotsBefore(Transaction& t, const std::string& cutoff_date, std::uint64_t& deleted) {
  deleted = std::erase_if(TX(t).Mutable().snapshots, [&](const auto& entry) { return entry.second.snapshot_date < cutoff_date; });
  return Result::Ok();
}

// ------------------------------------------------------------------
// Residuals
// ------------------------------------------------------------------

Result MemoryRepository::UpsertGameResidual(Transaction& t, const model::GameResidualRecord& r) {
  TX(t).Mutable().residuals[r.game_id] = r;
  return Result::Ok();
}

std::optional<model::GameResidualRecord> MemoryRepository::GetGameResidual(Transaction& t, const std::string& game_id) {
  const auto& residuals = TX(t).View().residuals;
  auto        it        = residuals.find(game_id);
  if (it == residuals.end()) return std::nullopt;
  return it->second;
}

// ------------------------------------------------------------------
// Cache
// ------------------------------------------------------------------

Result MemoryRepository::PutCacheEntry(Transaction& t, const model::CacheRecord& r) {
  TX(t).Mutable().cache[r.cache_key] = r;
  return Result::Ok();
}

std::optional<model::CacheRecord> MemoryRepository::GetCacheEntry(Transaction& t, const std::string& cache_key) {
  const auto& cache = TX(t).View().cache;
  auto        it    = cache.find(cache_key);
  if (it == cache.end()) return std::nullopt;
  return it->second;
}

} // namespace powerscore::db::memory
