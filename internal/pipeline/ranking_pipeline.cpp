#include "ranking_pipeline.hpp"

#include <chrono>

#include "internal/observability/logging.hpp"
#include "internal/observability/spans.hpp"
#include "internal/pipeline/rating_engine.hpp"
#include "internal/pipeline/result_cache.hpp"
#include "internal/util/time.hpp"

namespace powerscore::pipeline {

namespace {

rating::TeamDirectory LoadDirectory(db::Repository& repo) {
  auto tx    = repo.Begin();
  auto teams = repo.ListTeams(*tx);
  tx->Commit();

  rating::TeamDirectory out;
  for (auto& t : teams) {
    if (!t.state_code.empty()) {
      out.emplace(std::move(t.team_id), std::move(t.state_code));
    }
  }
  return out;
}

std::vector<db::model::GameRow> LoadGames(db::Repository& repo, util::Date from, util::Date to, const std::string& provider) {
  auto tx   = repo.Begin();
  auto rows = repo.ListGames(*tx, util::FormatDate(from), util::FormatDate(to), provider);
  tx->Commit();
  return rows;
}

void LogWrites(const BatchWriteSummary& s) {
  POWERSCORE_LOG_INFO("table written", {observability::StringField("table", s.table),
                                        observability::IntField("rows_written", static_cast<std::int64_t>(s.rows_written)),
                                        observability::IntField("rows_failed", static_cast<std::int64_t>(s.rows_failed)),
                                        observability::IntField("batches_failed", static_cast<std::int64_t>(s.batches_failed))});
}

} // namespace

db::model::RankingRecord ToRankingRecord(const model::TeamCohortStat& t, util::Date today) {
  db::model::RankingRecord r;
  r.team_id              = t.team_id;
  r.age                  = t.age;
  r.gender               = t.gender;
  r.status               = std::string(model::ToString(t.status));
  r.games_played         = t.games_played;
  r.games_last_180_days  = t.games_last_180_days;
  r.last_game            = util::FormatDate(t.last_game);
  r.off_norm             = t.off_norm;
  r.def_norm             = t.def_norm;
  r.sos                  = t.sos;
  r.sos_norm             = t.sos_norm;
  r.scf                  = t.scf;
  r.perf_centered        = t.perf_centered;
  r.powerscore_core      = t.powerscore_core;
  r.powerscore_adj       = t.powerscore_adj;
  r.power_score_final    = t.power_score_final;
  r.ml_norm              = t.ml_norm;
  r.powerscore_ml        = t.powerscore_ml;
  r.power_score_final_ml = t.power_score_final_ml;
  r.sos_rank             = t.sos_rank;
  r.rank_in_cohort       = t.rank_in_cohort;
  r.rank_in_cohort_ml    = t.rank_in_cohort_ml;
  r.rank_change_7d       = t.rank_change_7d;
  r.rank_change_30d      = t.rank_change_30d;
  r.snapshot_date        = util::FormatDate(today);
  return r;
}

RankingPipeline::RankingPipeline(db::Repository& repo, PipelineSettings settings, Sleeper sleeper)
    : repo_(repo), settings_(std::move(settings)), sleeper_(std::move(sleeper)) {
}

RunSummary RankingPipeline::Run(const RunOptions& options) {
  observability::StageSpan span(observability::Stage::kRun);
  const auto               started = std::chrono::steady_clock::now();
  const auto               today   = options.today;
  const auto               from    = util::AddDays(today, -settings_.rating.window.window_days);

  RunSummary summary;
  POWERSCORE_LOG_INFO("ranking run started", {observability::StringField("today", util::FormatDate(today)),
                                              observability::StringField("provider", settings_.provider_filter),
                                              observability::BoolField("force_rebuild", options.force_rebuild)});

  const auto rows      = LoadGames(repo_, from, today, settings_.provider_filter);
  const auto directory = LoadDirectory(repo_);
  summary.rows_loaded  = rows.size();

  const auto games     = ingest::GameValidator::Validate(rows, summary.ingest);
  summary.rows_skipped = summary.ingest.TotalSkipped();

  RatingEngine engine(settings_.rating, settings_.worker_threads);
  ResultCache  cache(repo_, settings_.cache_enabled);

  summary.cache_key = ResultCache::ComputeKey(games, directory, settings_.rating.window.window_days, settings_.provider_filter,
                                              today, settings_.rating_config_bytes);

  std::optional<EngineOutput> output;
  if (!options.force_rebuild) {
    output = cache.Lookup(summary.cache_key);
  }
  summary.cache_hit = output.has_value();

  if (!output) {
    output = engine.ComputeCore(games, directory, today);
    auto stored = cache.Store(summary.cache_key, *output);
    if (!stored) {
      POWERSCORE_LOG_WARN("continuing without cache entry", {observability::StringField("error", stored.Describe())});
    }
  }
  engine.ApplyPredictive(*output);

  history::RankHistory history(repo_, settings_.history);
  history.ApplyDeltas(output->teams, today);

  // rankings
  std::vector<db::model::RankingRecord> rankings;
  rankings.reserve(output->teams.size());
  for (const auto& t : output->teams) {
    rankings.push_back(ToRankingRecord(t, today));
    if (t.rank_in_cohort) ++summary.teams_ranked;
  }

  BatchWriter writer(repo_, settings_.writer, sleeper_);
  summary.rankings = writer.Write<db::model::RankingRecord>(
      "rankings", rankings, [](db::Repository& repo, db::Transaction& tx, const db::model::RankingRecord& r) {
        return repo.UpsertRanking(tx, r);
      });

  // snapshots use their own batch size
  auto snapshot_settings       = settings_.writer;
  snapshot_settings.batch_size = settings_.history.snapshot_batch_size;
  BatchWriter snapshot_writer(repo_, snapshot_settings, sleeper_);
  summary.snapshots = snapshot_writer.Write<db::model::SnapshotRecord>(
      "ranking_history", history.BuildSnapshots(output->teams, today),
      [](db::Repository& repo, db::Transaction& tx, const db::model::SnapshotRecord& s) { return repo.UpsertSnapshot(tx, s); });

  std::vector<db::model::GameResidualRecord> residuals;
  residuals.reserve(output->predictive.residuals.size());
  for (const auto& r : output->predictive.residuals) {
    residuals.push_back({r.game_id, r.residual, util::FormatDate(today)});
  }
  summary.residuals = writer.Write<db::model::GameResidualRecord>(
      "game_residuals", residuals,
      [](db::Repository& repo, db::Transaction& tx, const db::model::GameResidualRecord& r) { return repo.UpsertGameResidual(tx, r); });

  LogWrites(summary.rankings);
  LogWrites(summary.snapshots);
  LogWrites(summary.residuals);

  auto pruned = history.Prune(today, summary.snapshots_pruned);
  if (!pruned) {
    POWERSCORE_LOG_ERROR("snapshot prune failed", {observability::StringField("error", pruned.Describe())});
  }

  summary.teams      = output->teams.size();
  summary.cohorts    = output->cohort_count;
  summary.ml_enabled = output->predictive.enabled;
  summary.table      = std::move(output->teams);

  observability::Metrics::Instance().RecordTeamsRanked(summary.teams_ranked);
  span.SetCount("teams", static_cast<std::int64_t>(summary.teams));
  span.SetCount("teams_ranked", static_cast<std::int64_t>(summary.teams_ranked));
  span.SetFlag("cache_hit", summary.cache_hit);
  span.SetFlag("writes_ok", summary.WritesOk());

  POWERSCORE_LOG_INFO("ranking run finished",
                      {observability::IntField("rows_loaded", static_cast<std::int64_t>(summary.rows_loaded)),
                       observability::IntField("rows_skipped", static_cast<std::int64_t>(summary.rows_skipped)),
                       observability::IntField("teams", static_cast<std::int64_t>(summary.teams)),
                       observability::IntField("cohorts", static_cast<std::int64_t>(summary.cohorts)),
                       observability::IntField("teams_ranked", static_cast<std::int64_t>(summary.teams_ranked)),
                       observability::BoolField("ml_enabled", summary.ml_enabled),
                       observability::BoolField("cache_hit", summary.cache_hit),
                       observability::IntField("snapshots_pruned", static_cast<std::int64_t>(summary.snapshots_pruned)),
                       observability::DoubleField("elapsed_ms", util::ElapsedMs(started))});
  return summary;
}

} // namespace powerscore::pipeline
