#include "internal/pipeline/batch_writer.hpp"

#include <cassert>
#include <chrono>
#include <iostream>
#include <stdexcept>
#include <string>
#include <vector>

#include "internal/db/memory/memory_repository.hpp"

namespace {

using namespace powerscore;
using db::ErrorCode;
using db::Result;
using db::Transaction;
using db::model::TeamRecord;
using pipeline::BatchWriter;
using pipeline::WriterSettings;

/*
  Delegates to MemoryRepository and injects failures into team upserts.
*/
class FlakyRepository final : public db::Repository {
 public:
  int         fail_next = 0;
  std::string poison_team;
  std::string throw_team;
  int         upsert_calls = 0;

  std::unique_ptr<Transaction> Begin() override {
    return inner_.Begin();
  }

  Result UpsertGame(Transaction& tx, const db::model::GameRow& row) override {
    return inner_.UpsertGame(tx, row);
  }
  std::vector<db::model::GameRow> ListGames(Transaction& tx, const std::string& from, const std::string& to,
                                            const std::string& provider) override {
    return inner_.ListGames(tx, from, to, provider);
  }

  Result UpsertTeam(Transaction& tx, const TeamRecord& team) override {
    ++upsert_calls;
    if (fail_next > 0) {
      --fail_next;
      return Result::Err(ErrorCode::Busy, "database is locked");
    }
    if (team.team_id == poison_team) {
      return Result::Err(ErrorCode::ConstraintViolation, "rejected " + team.team_id);
    }
    if (team.team_id == throw_team) {
      throw std::runtime_error("connection reset");
    }
    return inner_.UpsertTeam(tx, team);
  }
  std::vector<TeamRecord> ListTeams(Transaction& tx) override {
    return inner_.ListTeams(tx);
  }

  Result UpsertRanking(Transaction& tx, const db::model::RankingRecord& r) override {
    return inner_.UpsertRanking(tx, r);
  }
  std::vector<db::model::RankingRecord> ListRankings(Transaction& tx, int age, const std::string& gender) override {
    return inner_.ListRankings(tx, age, gender);
  }

  Result UpsertSnapshot(Transaction& tx, const db::model::SnapshotRecord& s) override {
    return inner_.UpsertSnapshot(tx, s);
  }
  std::vector<db::model::SnapshotRecord> ListSnapshots(Transaction& tx, const std::string& from, const std::string& to) override {
    return inner_.ListSnapshots(tx, from, to);
  }
  std::vector<db::model::SnapshotRecord> ListSnapshotsForTeam(Transaction& tx, const std::string& team_id) override {
    return inner_.ListSnapshotsForTeam(tx, team_id);
  }
  Result DeleteSnapshotsBefore(Transaction& tx, const std::string& cutoff, std::uint64_t& deleted) override {
    return inner_.DeleteSnapshotsBefore(tx, cutoff, deleted);
  }

  Result UpsertGameResidual(Transaction& tx, const db::model::GameResidualRecord& r) override {
    return inner_.UpsertGameResidual(tx, r);
  }
  std::optional<db::model::GameResidualRecord> GetGameResidual(Transaction& tx, const std::string& game_id) override {
    return inner_.GetGameResidual(tx, game_id);
  }

  Result PutCacheEntry(Transaction& tx, const db::model::CacheRecord& c) override {
    return inner_.PutCacheEntry(tx, c);
  }
  std::optional<db::model::CacheRecord> GetCacheEntry(Transaction& tx, const std::string& key) override {
    return inner_.GetCacheEntry(tx, key);
  }

 private:
  db::memory::MemoryRepository inner_;
};

std::vector<TeamRecord> Teams(const std::vector<std::string>& ids) {
  std::vector<TeamRecord> out;
  for (const auto& id : ids) out.push_back({id, "CA"});
  return out;
}

BatchWriter::Upsert<TeamRecord> UpsertTeam() {
  return [](db::Repository& r, Transaction& tx, const TeamRecord& t) { return r.UpsertTeam(tx, t); };
}

std::vector<std::string> StoredIds(db::Repository& repo) {
  auto tx    = repo.Begin();
  auto teams = repo.ListTeams(*tx);
  tx->Commit();

  std::vector<std::string> out;
  for (const auto& t : teams) out.push_back(t.team_id);
  return out;
}

WriterSettings SmallBatches() {
  WriterSettings s;
  s.batch_size         = 2;
  s.max_retries        = 3;
  s.initial_backoff_ms = 100;
  s.backoff_multiplier = 2.0;
  s.max_backoff_ms     = 5000;
  return s;
}

void TestTransientFailureIsRetried() {
  FlakyRepository repo;
  repo.fail_next = 2;

  std::vector<std::chrono::milliseconds> sleeps;
  BatchWriter writer(repo, SmallBatches(), [&](std::chrono::milliseconds d) { sleeps.push_back(d); });

  auto summary = writer.Write<TeamRecord>("teams", Teams({"A", "B", "C", "D", "E"}), UpsertTeam());

  assert(summary.Ok());
  assert(summary.table == "teams");
  assert(summary.batches_total == 3);
  assert(summary.batches_written == 3);
  assert(summary.rows_written == 5);
  assert(sleeps.size() == 2);
  assert(sleeps[0] == std::chrono::milliseconds(100));
  assert(sleeps[1] == std::chrono::milliseconds(200));
  assert(StoredIds(repo).size() == 5);
}

void TestPersistentFailureSkipsOnlyThatBatch() {
  FlakyRepository repo;
  repo.poison_team = "C";

  std::vector<std::chrono::milliseconds> sleeps;
  BatchWriter writer(repo, SmallBatches(), [&](std::chrono::milliseconds d) { sleeps.push_back(d); });

  auto summary = writer.Write<TeamRecord>("teams", Teams({"A", "B", "C", "D", "E", "F"}), UpsertTeam());

  assert(!summary.Ok());
  assert(summary.batches_total == 3);
  assert(summary.batches_failed == 1);
  assert(summary.rows_failed == 2);
  assert(summary.rows_written == 4);
  assert(summary.errors.size() == 1);
  assert(summary.errors[0] == "constraint_violation: rejected C");
  assert(sleeps.size() == 3);

  // the failed batch is rolled back as a whole
  const auto stored = StoredIds(repo);
  assert((stored == std::vector<std::string>{"A", "B", "E", "F"}));
}

void TestBackendExceptionIsCountedNotRaised() {
  FlakyRepository repo;
  repo.throw_team = "B";

  auto settings        = SmallBatches();
  settings.max_retries = 1;
  int         sleeps   = 0;
  BatchWriter writer(repo, settings, [&](std::chrono::milliseconds) { ++sleeps; });

  auto summary = writer.Write<TeamRecord>("teams", Teams({"A", "B", "C"}), UpsertTeam());
  assert(summary.batches_failed == 1);
  assert(summary.rows_written == 1);
  assert(summary.errors[0] == "connection reset");
  assert(sleeps == 1);
}

void TestEmptyInputWritesNothing() {
  FlakyRepository repo;
  BatchWriter     writer(repo, SmallBatches(), [](std::chrono::milliseconds) {});

  auto summary = writer.Write<TeamRecord>("teams", {}, UpsertTeam());
  assert(summary.Ok());
  assert(summary.batches_total == 0);
  assert(repo.upsert_calls == 0);
}

void TestBackoffIsCapped() {
  FlakyRepository repo;
  auto            settings = SmallBatches();
  settings.max_backoff_ms  = 300;
  BatchWriter writer(repo, settings, [](std::chrono::milliseconds) {});

  assert(writer.BackoffFor(0) == std::chrono::milliseconds(100));
  assert(writer.BackoffFor(1) == std::chrono::milliseconds(200));
  assert(writer.BackoffFor(2) == std::chrono::milliseconds(300));
  assert(writer.BackoffFor(5) == std::chrono::milliseconds(300));
}

} // namespace

int main() {
  TestTransientFailureIsRetried();
  TestPersistentFailureSkipsOnlyThatBatch();
  TestBackendExceptionIsCountedNotRaised();
  TestEmptyInputWritesNothing();
  TestBackoffIsCapped();

  std::cout << "batch_writer_test: pass\n";
  return 0;
}
