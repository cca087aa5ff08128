#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

#include "internal/db/api/repository.hpp"
#include "internal/db/model/ranking_record.hpp"
#include "internal/history/rank_history.hpp"
#include "internal/ingest/game_validator.hpp"
#include "internal/model/team_cohort_stat.hpp"
#include "internal/pipeline/batch_writer.hpp"
#include "internal/rating/settings.hpp"
#include "internal/util/date.hpp"

namespace powerscore::pipeline {

struct PipelineSettings {
  rating::Settings         rating{};
  history::HistorySettings history{};
  WriterSettings           writer{};
  bool                     cache_enabled = true;
  std::string              provider_filter;
  std::size_t              worker_threads = 0;

  // Deterministic bytes of the rating config section; part of the cache key.
  std::string rating_config_bytes;
};

struct RunOptions {
  util::Date today{};
  bool       force_rebuild = false;
};

struct RunSummary {
  std::size_t          rows_loaded  = 0;
  std::size_t          rows_skipped = 0;
  ingest::IngestReport ingest;

  std::size_t teams        = 0;
  std::size_t cohorts      = 0;
  std::size_t teams_ranked = 0;

  bool        ml_enabled = false;
  bool        cache_hit  = false;
  std::string cache_key;

  BatchWriteSummary rankings;
  BatchWriteSummary snapshots;
  BatchWriteSummary residuals;

  std::uint64_t snapshots_pruned = 0;

  // Final rows as written to rankings.
  std::vector<model::TeamCohortStat> table;

  bool WritesOk() const {
    return rankings.Ok() && snapshots.Ok() && residuals.Ok();
  }
};

db::model::RankingRecord ToRankingRecord(const model::TeamCohortStat& team, util::Date today);

/*
  RankingPipeline

  One batch run against a repository:

    load window games + team directory -> ingest -> cache lookup
    -> engine (core stages on a miss, predictive always)
    -> rank deltas -> batched writes -> snapshot pruning

  Load failures propagate as exceptions. Write failures are retried,
  then counted in the summary; they never abort the run.
*/
class RankingPipeline {
 public:
  RankingPipeline(db::Repository& repo, PipelineSettings settings, Sleeper sleeper = {});

  RunSummary Run(const RunOptions& options);

  const PipelineSettings& Settings() const {
    return settings_;
  }

 private:
  db::Repository&  repo_;
  PipelineSettings settings_;
  Sleeper          sleeper_;
};

} // namespace powerscore::pipeline
