#include "internal/pipeline/ranking_pipeline.hpp"

#include <cassert>
#include <chrono>
#include <iostream>
#include <string>
#include <vector>

#include "internal/db/memory/memory_repository.hpp"
#include "internal/util/date.hpp"

namespace {

using namespace powerscore;
using db::memory::MemoryRepository;
using db::model::GameRow;
using pipeline::PipelineSettings;
using pipeline::RankingPipeline;
using pipeline::RunOptions;
using util::AddDays;
using util::FormatDate;
using util::ParseDateOrThrow;

const auto kToday = ParseDateOrThrow("2025-06-01");

GameRow Perspective(const std::string& id, util::Date date, const std::string& team, const std::string& opp, int gf, int ga,
                    bool home, const std::string& provider) {
  GameRow row;
  row.game_id       = id;
  row.date          = FormatDate(date);
  row.team_id       = team;
  row.opponent_id   = opp;
  row.age           = 14;
  row.gender        = "Male";
  row.goals_for     = gf;
  row.goals_against = ga;
  row.provider      = provider;
  if (home) row.home_team_id = team;
  return row;
}

void AddMatch(std::vector<GameRow>& rows, const std::string& id, util::Date date, const std::string& home, const std::string& away,
              int hg, int ag, const std::string& provider = "gotsport") {
  rows.push_back(Perspective(id, date, home, away, hg, ag, true, provider));
  rows.push_back(Perspective(id, date, away, home, ag, hg, false, provider));
}

// 72 valid rows plus two the validator rejects.
std::vector<GameRow> SeedRows() {
  std::vector<GameRow> rows;
  for (int round = 0; round < 6; ++round) {
    const auto  day = AddDays(kToday, -10 * round - 1);
    std::string id  = "r" + std::to_string(round) + "-";
    AddMatch(rows, id + "ab", day, "A", "B", 2, 0);
    AddMatch(rows, id + "ac", day, "A", "C", 3, 0);
    AddMatch(rows, id + "ad", day, "A", "D", 4, 1);
    AddMatch(rows, id + "bc", day, "B", "C", 2, 1);
    AddMatch(rows, id + "bd", day, "B", "D", 3, 1);
    AddMatch(rows, id + "cd", day, "C", "D", 1, 0);
  }

  GameRow unscored = Perspective("x1", AddDays(kToday, -3), "A", "B", 0, 0, true, "gotsport");
  unscored.goals_for.reset();
  rows.push_back(unscored);

  rows.push_back(Perspective("x2", AddDays(kToday, -3), "C", "C", 1, 1, true, "gotsport"));

  // outside the window
  AddMatch(rows, "old", AddDays(kToday, -400), "A", "B", 9, 0);
  return rows;
}

void Seed(MemoryRepository& repo) {
  auto tx = repo.Begin();
  for (const auto& row : SeedRows()) {
    assert(repo.UpsertGame(*tx, row));
  }
  for (const auto& [team, state] : std::vector<std::pair<std::string, std::string>>{{"A", "CA"}, {"B", "NV"}, {"C", "AZ"}, {"D", "OR"}}) {
    assert(repo.UpsertTeam(*tx, db::model::TeamRecord{team, state}));
  }

  // A sat third a week ago
  db::model::SnapshotRecord week_ago;
  week_ago.team_id        = "A";
  week_ago.snapshot_date  = FormatDate(AddDays(kToday, -7));
  week_ago.age            = 14;
  week_ago.gender         = "male";
  week_ago.rank_in_cohort = 3;
  assert(repo.UpsertSnapshot(*tx, week_ago));

  // beyond retention
  db::model::SnapshotRecord stale = week_ago;
  stale.snapshot_date             = FormatDate(AddDays(kToday, -200));
  assert(repo.UpsertSnapshot(*tx, stale));
  tx->Commit();
}

PipelineSettings Settings() {
  PipelineSettings s;
  s.worker_threads      = 2;
  s.rating_config_bytes = "rating-config";
  return s;
}

RankingPipeline MakePipeline(MemoryRepository& repo, PipelineSettings settings = Settings()) {
  return RankingPipeline(repo, std::move(settings), [](std::chrono::milliseconds) {});
}

void TestFullRunWritesEveryTable() {
  MemoryRepository repo;
  Seed(repo);

  auto summary = MakePipeline(repo).Run(RunOptions{kToday, false});

  assert(summary.rows_loaded == 74);
  assert(summary.rows_skipped == 2);
  assert(summary.ingest.SkippedFor(ingest::SkipReason::kNoScore) == 1);
  assert(summary.ingest.SkippedFor(ingest::SkipReason::kSelfPlay) == 1);
  assert(summary.teams == 4);
  assert(summary.cohorts == 1);
  assert(summary.teams_ranked == 4);
  assert(!summary.cache_hit);
  assert(!summary.cache_key.empty());
  assert(!summary.ml_enabled);
  assert(summary.WritesOk());
  assert(summary.rankings.rows_written == 4);
  assert(summary.snapshots.rows_written == 4);
  assert(summary.residuals.rows_written == 0);
  assert(summary.snapshots_pruned == 1);

  auto tx       = repo.Begin();
  auto rankings = repo.ListRankings(*tx, 14, "male");
  assert(rankings.size() == 4);
  assert(rankings[0].team_id == "A");
  assert(rankings[0].rank_in_cohort == 1);
  assert(rankings[0].status == "Active");
  assert(rankings[0].snapshot_date == "2025-06-01");
  assert(rankings[0].rank_change_7d == 2);
  assert(!rankings[0].rank_change_30d.has_value());
  assert(rankings[0].games_played == 18);

  auto history = repo.ListSnapshotsForTeam(*tx, "A");
  assert(history.size() == 2);
  assert(history[1].snapshot_date == "2025-06-01");
  assert(history[1].rank_in_cohort == 1);

  assert(repo.GetCacheEntry(*tx, summary.cache_key).has_value());
  tx->Commit();
}

void TestSecondRunHitsCache() {
  MemoryRepository repo;
  Seed(repo);

  auto pipeline = MakePipeline(repo);
  auto first    = pipeline.Run(RunOptions{kToday, false});
  auto second   = pipeline.Run(RunOptions{kToday, false});

  assert(!first.cache_hit);
  assert(second.cache_hit);
  assert(first.cache_key == second.cache_key);
  assert(first.table.size() == second.table.size());
  for (std::size_t i = 0; i < first.table.size(); ++i) {
    assert(first.table[i].team_id == second.table[i].team_id);
    assert(first.table[i].power_score_final == second.table[i].power_score_final);
    assert(first.table[i].rank_in_cohort == second.table[i].rank_in_cohort);
  }

  // same-day snapshots are overwritten, not duplicated
  auto tx = repo.Begin();
  assert(repo.ListSnapshotsForTeam(*tx, "B").size() == 1);
  tx->Commit();

  auto rebuilt = pipeline.Run(RunOptions{kToday, true});
  assert(!rebuilt.cache_hit);
  assert(rebuilt.cache_key == first.cache_key);
}

void TestCacheKeyFollowsInputs() {
  MemoryRepository repo;
  Seed(repo);

  auto pipeline = MakePipeline(repo);
  auto today    = pipeline.Run(RunOptions{kToday, false});
  auto tomorrow = pipeline.Run(RunOptions{AddDays(kToday, 1), false});
  assert(!tomorrow.cache_hit);
  assert(today.cache_key != tomorrow.cache_key);

  {
    auto tx = repo.Begin();
    assert(repo.UpsertGame(*tx, Perspective("new", kToday, "D", "A", 1, 1, true, "gotsport")));
    tx->Commit();
  }
  auto changed = pipeline.Run(RunOptions{kToday, false});
  assert(!changed.cache_hit);
  assert(changed.cache_key != today.cache_key);
}

const model::TeamCohortStat& Row(const pipeline::RunSummary& summary, const std::string& team_id) {
  for (const auto& row : summary.table) {
    if (row.team_id == team_id) return row;
  }
  assert(false && "team missing from table");
  return summary.table.front();
}

void TestTeamStateChangeInvalidatesCache() {
  MemoryRepository repo;
  Seed(repo);

  auto pipeline = MakePipeline(repo);
  auto before   = pipeline.Run(RunOptions{kToday, false});
  assert(!before.cache_hit);

  // every team now plays out of one state, so connectivity collapses
  {
    auto tx = repo.Begin();
    for (const auto* team : {"A", "B", "C", "D"}) {
      assert(repo.UpsertTeam(*tx, db::model::TeamRecord{team, "CA"}));
    }
    tx->Commit();
  }

  auto after = pipeline.Run(RunOptions{kToday, false});
  assert(!after.cache_hit);
  assert(after.cache_key != before.cache_key);
  assert(Row(after, "A").scf != Row(before, "A").scf);

  auto rebuilt = pipeline.Run(RunOptions{kToday, true});
  assert(rebuilt.cache_key == after.cache_key);
  for (const auto* team : {"A", "B", "C", "D"}) {
    assert(Row(rebuilt, team).scf == Row(after, team).scf);
    assert(Row(rebuilt, team).power_score_final == Row(after, team).power_score_final);
  }
}

void TestDisabledCacheAlwaysRecomputes() {
  MemoryRepository repo;
  Seed(repo);

  auto settings          = Settings();
  settings.cache_enabled = false;
  auto pipeline          = MakePipeline(repo, settings);

  assert(!pipeline.Run(RunOptions{kToday, false}).cache_hit);
  assert(!pipeline.Run(RunOptions{kToday, false}).cache_hit);
}

void TestProviderFilter() {
  MemoryRepository repo;
  Seed(repo);
  {
    auto                 tx = repo.Begin();
    std::vector<GameRow> extra;
    AddMatch(extra, "p1", AddDays(kToday, -2), "E", "F", 1, 0, "other");
    for (const auto& row : extra) {
      assert(repo.UpsertGame(*tx, row));
    }
    tx->Commit();
  }

  auto settings            = Settings();
  settings.provider_filter = "other";
  auto summary             = MakePipeline(repo, settings).Run(RunOptions{kToday, false});
  assert(summary.rows_loaded == 2);
  assert(summary.teams == 2);
  // two games are too few to rank
  assert(summary.teams_ranked == 0);
}

void TestEmptyStore() {
  MemoryRepository repo;
  auto             summary = MakePipeline(repo).Run(RunOptions{kToday, false});
  assert(summary.rows_loaded == 0);
  assert(summary.teams == 0);
  assert(summary.WritesOk());
  assert(summary.rankings.batches_total == 0);
}

} // namespace

int main() {
  TestFullRunWritesEveryTable();
  TestSecondRunHitsCache();
  TestCacheKeyFollowsInputs();
  TestTeamStateChangeInvalidatesCache();
  TestDisabledCacheAlwaysRecomputes();
  TestProviderFilter();
  TestEmptyStore();

  std::cout << "powerscore_integration_ranking_pipeline: pass\n";
  return 0;
}
