#include <cassert>
#include <chrono>
#include <cstdlib>
#include <filesystem>
#include <functional>
#include <iostream>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

#include "internal/db/api/repository.hpp"
#include "internal/db/memory/memory_repository.hpp"

#if POWERSCORE_DB_SQLITE
#include "internal/db/sqlite/sqlite_db.hpp"
#include "internal/db/sqlite/sqlite_repository.hpp"
#endif

#if POWERSCORE_DB_POSTGRES
#include "internal/db/postgres/pg_pool.hpp"
#include "internal/db/postgres/pg_repository.hpp"
#endif

namespace {

using powerscore::db::ErrorCode;
using powerscore::db::Repository;
using powerscore::db::Result;
using powerscore::db::memory::MemoryRepository;
using powerscore::db::model::CacheRecord;
using powerscore::db::model::GameResidualRecord;
using powerscore::db::model::GameRow;
using powerscore::db::model::RankingRecord;
using powerscore::db::model::SnapshotRecord;
using powerscore::db::model::TeamRecord;

uint64_t NowMs() {
  return std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::system_clock::now().time_since_epoch()).count();
}

struct BackendFactory {
  std::string                                       name;
  std::function<std::shared_ptr<Repository>()>      make_repository;
  std::function<bool()>                             supports_restart;
  std::function<void(std::shared_ptr<Repository>&)> restart;
  std::function<void()>                             cleanup;
};

GameRow Row(const std::string& game_id, const std::string& date, const std::string& team, const std::string& opp,
            const std::string& provider) {
  GameRow row;
  row.game_id         = game_id;
  row.date            = date;
  row.team_id         = team;
  row.opponent_id     = opp;
  row.age             = 14;
  row.gender          = "male";
  row.opponent_age    = 14;
  row.opponent_gender = "male";
  row.goals_for       = 2;
  row.goals_against   = 1;
  row.home_team_id    = team;
  row.provider        = provider;
  return row;
}

void VerifyGames(Repository& repo, const std::string& prefix) {
  {
    auto tx = repo.Begin();
    assert(repo.UpsertGame(*tx, Row(prefix + "g2", "2025-03-02", prefix + "A", prefix + "B", "gotsport")));
    assert(repo.UpsertGame(*tx, Row(prefix + "g1", "2025-03-01", prefix + "B", prefix + "A", "gotsport")));
    assert(repo.UpsertGame(*tx, Row(prefix + "g1", "2025-03-01", prefix + "A", prefix + "B", "gotsport")));
    assert(repo.UpsertGame(*tx, Row(prefix + "g3", "2025-04-10", prefix + "A", prefix + "C", "other")));

    // missing optional fields survive as empty
    GameRow sparse = Row(prefix + "g4", "2025-05-01", prefix + "C", prefix + "A", "other");
    sparse.age.reset();
    sparse.goals_for.reset();
    sparse.home_team_id.reset();
    assert(repo.UpsertGame(*tx, sparse));

    // upsert on (game_id, team_id) overwrites
    GameRow changed   = Row(prefix + "g2", "2025-03-02", prefix + "A", prefix + "B", "gotsport");
    changed.goals_for = 5;
    assert(repo.UpsertGame(*tx, changed));
    tx->Commit();
  }

  auto tx = repo.Begin();

  auto all = repo.ListGames(*tx, "2025-01-01", "2025-12-31", "");
  std::vector<GameRow> mine;
  for (const auto& g : all) {
    if (g.game_id.rfind(prefix, 0) == 0) mine.push_back(g);
  }
  assert(mine.size() == 5);
  // ordered by date, game_id, team_id
  assert(mine[0].game_id == prefix + "g1" && mine[0].team_id == prefix + "A");
  assert(mine[1].game_id == prefix + "g1" && mine[1].team_id == prefix + "B");
  assert(mine[2].game_id == prefix + "g2");
  assert(mine[2].goals_for == 5);
  assert(mine[4].game_id == prefix + "g4");
  assert(!mine[4].age.has_value());
  assert(!mine[4].goals_for.has_value());
  assert(!mine[4].home_team_id.has_value());
  assert(mine[4].goals_against == 1);

  // inclusive date range
  auto march = repo.ListGames(*tx, "2025-03-01", "2025-03-02", "");
  std::size_t in_march = 0;
  for (const auto& g : march) {
    if (g.game_id.rfind(prefix, 0) == 0) ++in_march;
  }
  assert(in_march == 3);

  auto other = repo.ListGames(*tx, "2025-01-01", "2025-12-31", "other");
  std::size_t from_other = 0;
  for (const auto& g : other) {
    assert(g.provider == "other");
    if (g.game_id.rfind(prefix, 0) == 0) ++from_other;
  }
  assert(from_other == 2);
  tx->Commit();
}

void VerifyTeams(Repository& repo, const std::string& prefix) {
  {
    auto tx = repo.Begin();
    assert(repo.UpsertTeam(*tx, TeamRecord{prefix + "B", "NV"}));
    assert(repo.UpsertTeam(*tx, TeamRecord{prefix + "A", "CA"}));
    assert(repo.UpsertTeam(*tx, TeamRecord{prefix + "A", "AZ"}));
    tx->Commit();
  }

  auto                    tx = repo.Begin();
  std::vector<TeamRecord> mine;
  for (const auto& t : repo.ListTeams(*tx)) {
    if (t.team_id.rfind(prefix, 0) == 0) mine.push_back(t);
  }
  tx->Commit();

  assert(mine.size() == 2);
  assert(mine[0].team_id == prefix + "A");
  assert(mine[0].state_code == "AZ");
  assert(mine[1].state_code == "NV");
}

RankingRecord Ranking(const std::string& team, int age, std::optional<int> rank, double score) {
  RankingRecord r;
  r.team_id           = team;
  r.age               = age;
  r.gender            = "female";
  r.status            = rank ? "Active" : "Inactive";
  r.games_played      = 12;
  r.last_game         = "2025-05-20";
  r.sos               = 0.6;
  r.power_score_final = score;
  r.rank_in_cohort    = rank;
  r.rank_change_7d    = rank ? std::optional<int>(2) : std::nullopt;
  r.snapshot_date     = "2025-06-01";
  return r;
}

void VerifyRankings(Repository& repo, const std::string& prefix) {
  const int age = 11;
  {
    auto tx = repo.Begin();
    assert(repo.UpsertRanking(*tx, Ranking(prefix + "C", age, std::nullopt, 0.1)));
    assert(repo.UpsertRanking(*tx, Ranking(prefix + "B", age, 2, 0.4)));
    assert(repo.UpsertRanking(*tx, Ranking(prefix + "A", age, 1, 0.5)));
    assert(repo.UpsertRanking(*tx, Ranking(prefix + "A", age + 1, 1, 0.9)));
    // a re-run overwrites
    assert(repo.UpsertRanking(*tx, Ranking(prefix + "B", age, 2, 0.45)));
    tx->Commit();
  }

  auto tx       = repo.Begin();
  auto rankings = repo.ListRankings(*tx, age, "female");
  tx->Commit();

  std::vector<RankingRecord> mine;
  for (const auto& r : rankings) {
    if (r.team_id.rfind(prefix, 0) == 0) mine.push_back(r);
  }
  assert(mine.size() == 3);
  assert(mine[0].team_id == prefix + "A");
  assert(mine[1].team_id == prefix + "B");
  assert(mine[1].power_score_final == 0.45);
  assert(mine[1].rank_change_7d == 2);
  assert(!mine[1].rank_change_30d.has_value());
  // unranked rows last
  assert(mine[2].team_id == prefix + "C");
  assert(!mine[2].rank_in_cohort.has_value());
  assert(mine[2].status == "Inactive");
}

void VerifySnapshots(Repository& repo, const std::string& prefix) {
  {
    auto tx = repo.Begin();
    for (const std::string date : {"2024-01-05", "2024-01-10", "2024-02-01"}) {
      SnapshotRecord s;
      s.team_id           = prefix + "A";
      s.snapshot_date     = date;
      s.age               = 14;
      s.gender            = "male";
      s.rank_in_cohort    = 3;
      s.power_score_final = 0.5;
      assert(repo.UpsertSnapshot(*tx, s));
    }
    SnapshotRecord same_day;
    same_day.team_id        = prefix + "A";
    same_day.snapshot_date  = "2024-02-01";
    same_day.age            = 14;
    same_day.gender         = "male";
    same_day.rank_in_cohort = 1;
    assert(repo.UpsertSnapshot(*tx, same_day));
    tx->Commit();
  }

  {
    auto tx      = repo.Begin();
    auto history = repo.ListSnapshotsForTeam(*tx, prefix + "A");
    assert(history.size() == 3);
    assert(history[0].snapshot_date == "2024-01-05");
    assert(history[2].rank_in_cohort == 1);
    assert(!history[2].rank_in_cohort_ml.has_value());

    std::size_t in_range = 0;
    for (const auto& s : repo.ListSnapshots(*tx, "2024-01-10", "2024-02-01")) {
      if (s.team_id == prefix + "A") ++in_range;
    }
    assert(in_range == 2);
    tx->Commit();
  }

  {
    auto          tx      = repo.Begin();
    std::uint64_t deleted = 0;
    assert(repo.DeleteSnapshotsBefore(*tx, "2024-01-10", deleted));
    assert(deleted == 1);
    tx->Commit();
  }

  auto tx = repo.Begin();
  assert(repo.ListSnapshotsForTeam(*tx, prefix + "A").size() == 2);
  tx->Commit();
}

void VerifyResidualsAndCache(Repository& repo, const std::string& prefix) {
  {
    auto tx = repo.Begin();
    assert(repo.UpsertGameResidual(*tx, GameResidualRecord{prefix + "g1", 1.25, "2025-06-01"}));
    assert(repo.UpsertGameResidual(*tx, GameResidualRecord{prefix + "g1", -0.5, "2025-06-02"}));

    std::string payload("\x00\x01" "binary" "\xff", 9);
    assert(repo.PutCacheEntry(*tx, CacheRecord{prefix + "key", NowMs(), payload}));
    tx->Commit();
  }

  auto tx       = repo.Begin();
  auto residual = repo.GetGameResidual(*tx, prefix + "g1");
  assert(residual.has_value());
  assert(residual->residual == -0.5);
  assert(residual->snapshot_date == "2025-06-02");
  assert(!repo.GetGameResidual(*tx, prefix + "missing").has_value());

  auto entry = repo.GetCacheEntry(*tx, prefix + "key");
  assert(entry.has_value());
  assert(entry->payload.size() == 9);
  assert(entry->payload[0] == '\x00');
  assert(!repo.GetCacheEntry(*tx, prefix + "other").has_value());
  tx->Commit();
}

void VerifyRollbackBehavior(Repository& repo, const std::string& prefix) {
  {
    auto tx = repo.Begin();
    assert(repo.UpsertTeam(*tx, TeamRecord{prefix + "R", "TX"}));
    tx->Rollback();
  }
  {
    // destroyed without commit
    auto tx = repo.Begin();
    assert(repo.UpsertTeam(*tx, TeamRecord{prefix + "S", "TX"}));
  }
  {
    // a chunk whose last upsert failed is dropped as a whole
    auto tx = repo.Begin();
    assert(repo.UpsertTeam(*tx, TeamRecord{prefix + "F", "TX"}));
    auto result = tx->Finish(Result::Err(ErrorCode::ConstraintViolation, "rejected"));
    assert(!result);
    assert(result.Describe() == "constraint_violation: rejected");
    assert(tx->IsFinished());
  }
  {
    auto tx = repo.Begin();
    assert(repo.UpsertTeam(*tx, TeamRecord{prefix + "K", "TX"}));
    assert(tx->Finish(Result::Ok()));
    assert(tx->IsFinished());
  }

  auto tx   = repo.Begin();
  bool kept = false;
  for (const auto& t : repo.ListTeams(*tx)) {
    assert(t.team_id != prefix + "R");
    assert(t.team_id != prefix + "S");
    assert(t.team_id != prefix + "F");
    kept = kept || t.team_id == prefix + "K";
  }
  assert(kept);
  tx->Commit();
}

void VerifyRestartDurability(BackendFactory& backend, const std::string& prefix) {
  if (!backend.supports_restart()) {
    return;
  }

  auto repo = backend.make_repository();
  {
    auto tx = repo->Begin();
    assert(repo->UpsertTeam(*tx, TeamRecord{prefix + "D", "WA"}));
    assert(repo->UpsertRanking(*tx, Ranking(prefix + "D", 16, 1, 0.7)));
    tx->Commit();
  }

  backend.restart(repo);

  auto tx    = repo->Begin();
  bool found = false;
  for (const auto& t : repo->ListTeams(*tx)) {
    found = found || (t.team_id == prefix + "D" && t.state_code == "WA");
  }
  assert(found);
  auto rankings = repo->ListRankings(*tx, 16, "female");
  assert(!rankings.empty());
  tx->Commit();
}

BackendFactory MakeMemoryFactory() {
  return BackendFactory{
      .name             = "memory",
      .make_repository  = []() { return std::make_shared<MemoryRepository>(); },
      .supports_restart = []() { return false; },
      .restart          = [](std::shared_ptr<Repository>&) {},
      .cleanup          = []() {},
  };
}

#if POWERSCORE_DB_SQLITE
BackendFactory MakeSqliteFactory() {
  auto db_path = (std::filesystem::temp_directory_path() / ("powerscore_integration_sqlite_" + std::to_string(NowMs()) + ".db")).string();

  auto make_repo = [db_path]() {
    auto db = std::make_shared<powerscore::db::sqlite::SqliteDB>(db_path);
    db->BootstrapSchema();
    return std::make_shared<powerscore::db::sqlite::SqliteRepository>(std::move(db));
  };

  return BackendFactory{
      .name             = "sqlite",
      .make_repository  = make_repo,
      .supports_restart = []() { return true; },
      .restart          = [make_repo](std::shared_ptr<Repository>& repo) { repo = make_repo(); },
      .cleanup          = [db_path]() { std::filesystem::remove(db_path); },
  };
}
#endif

#if POWERSCORE_DB_POSTGRES
BackendFactory MakePostgresFactory() {
  const char* uri = std::getenv("POWERSCORE_TEST_POSTGRES_URI");
  if (uri == nullptr || std::string(uri).empty()) {
    throw std::runtime_error("POWERSCORE_TEST_POSTGRES_URI is not set");
  }

  auto conninfo  = std::string(uri);
  auto make_repo = [conninfo]() {
    auto pool = std::make_shared<powerscore::db::postgres::PgPool>(conninfo);
    pool->BootstrapSchema();
    return std::make_shared<powerscore::db::postgres::PgRepository>(std::move(pool));
  };

  return BackendFactory{
      .name             = "postgres",
      .make_repository  = make_repo,
      .supports_restart = []() { return true; },
      .restart          = [make_repo](std::shared_ptr<Repository>& repo) { repo = make_repo(); },
      .cleanup          = []() {},
  };
}
#endif

void RunBackendSuite(BackendFactory& backend) {
  std::cout << "running backend suite: " << backend.name << "\n";
  const std::string prefix = backend.name + "-" + std::to_string(NowMs()) + "-";

  {
    auto repo = backend.make_repository();
    VerifyGames(*repo, prefix);
    VerifyTeams(*repo, prefix);
    VerifyRankings(*repo, prefix);
    VerifySnapshots(*repo, prefix);
    VerifyResidualsAndCache(*repo, prefix);
    VerifyRollbackBehavior(*repo, prefix);
  }

  VerifyRestartDurability(backend, prefix + "durable-");

  backend.cleanup();
}

} // namespace

int main() {
  std::vector<BackendFactory> backends;
  backends.push_back(MakeMemoryFactory());

#if POWERSCORE_DB_SQLITE
  backends.push_back(MakeSqliteFactory());
#endif

#if POWERSCORE_DB_POSTGRES
  try {
    backends.push_back(MakePostgresFactory());
  } catch (const std::exception& ex) {
    std::cout << "skipping postgres integration suite: " << ex.what() << "\n";
  }
#endif

  for (auto& backend : backends) {
    RunBackendSuite(backend);
  }

  std::cout << "powerscore_integration_repository_parity: pass\n";
  return 0;
}
