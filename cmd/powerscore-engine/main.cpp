#include <iostream>
#include <optional>
#include <string>

#include "internal/config/config_loader.hpp"
#include "internal/factory.hpp"
#include "internal/observability/logging.hpp"
#include "internal/observability/spans.hpp"
#include "internal/pipeline/ranking_pipeline.hpp"
#include "internal/util/date.hpp"

using powerscore::observability::BoolField;
using powerscore::observability::IntField;
using powerscore::observability::StringField;

namespace {

struct Args {
  std::string                           config_path;
  std::optional<powerscore::util::Date> today;
  bool                                  force_rebuild = false;
};

void Usage() {
  std::cerr << "Usage: powerscore-engine <config.yaml> [--today YYYY-MM-DD] [--force-rebuild]" << std::endl;
}

std::optional<Args> ParseArgs(int argc, char** argv) {
  Args args;
  for (int i = 1; i < argc; ++i) {
    const std::string arg = argv[i];
    if (arg == "--force-rebuild") {
      args.force_rebuild = true;
    } else if (arg == "--today") {
      if (i + 1 >= argc) return std::nullopt;
      args.today = powerscore::util::ParseDate(argv[++i]);
      if (!args.today) {
        std::cerr << "invalid --today date: " << argv[i] << std::endl;
        return std::nullopt;
      }
    } else if (!arg.empty() && arg[0] == '-') {
      return std::nullopt;
    } else if (args.config_path.empty()) {
      args.config_path = arg;
    } else {
      return std::nullopt;
    }
  }
  if (args.config_path.empty()) return std::nullopt;
  return args;
}

void Shutdown() {
  powerscore::observability::ShutdownLogging();
  powerscore::observability::ShutdownMetrics();
  powerscore::observability::ShutdownTracing();
}

void LogTable(const powerscore::pipeline::BatchWriteSummary& summary) {
  POWERSCORE_LOG_INFO("Table written", {StringField("table", summary.table), IntField("rows_written", summary.rows_written),
                                        IntField("rows_failed", summary.rows_failed),
                                        IntField("batches_failed", summary.batches_failed)});
}

} // namespace

int main(int argc, char** argv) {
  const auto args = ParseArgs(argc, argv);
  if (!args) {
    Usage();
    return 1;
  }

  try {
    // ------------------------------------------------------------
    // Load configuration
    // ------------------------------------------------------------
    auto config = powerscore::config::ConfigLoader::LoadFromYaml(args->config_path);

    powerscore::pipeline::RunOptions options;
    options.today         = args->today.value_or(powerscore::util::Today());
    options.force_rebuild = args->force_rebuild;

    const powerscore::observability::RunIdentity run{powerscore::util::FormatDate(options.today), options.force_rebuild};
    powerscore::observability::InitializeTracing(config, run);
    powerscore::observability::InitializeMetrics(config, run);
    powerscore::observability::InitializeLogging(config);

    // ------------------------------------------------------------
    // Build application (validates before opening the database)
    // ------------------------------------------------------------
    auto app = powerscore::factory::Build(config);

    POWERSCORE_LOG_INFO("powerscore-engine started", {StringField("today", powerscore::util::FormatDate(options.today)),
                                                      BoolField("force_rebuild", options.force_rebuild)});

    powerscore::pipeline::RankingPipeline pipeline(*app.repository, app.settings);
    const auto                            summary = pipeline.Run(options);

    LogTable(summary.rankings);
    LogTable(summary.snapshots);
    LogTable(summary.residuals);
    POWERSCORE_LOG_INFO("powerscore-engine finished",
                        {IntField("rows_loaded", summary.rows_loaded), IntField("rows_skipped", summary.rows_skipped),
                         IntField("teams", summary.teams), IntField("cohorts", summary.cohorts),
                         IntField("teams_ranked", summary.teams_ranked), BoolField("ml_enabled", summary.ml_enabled),
                         BoolField("cache_hit", summary.cache_hit), IntField("snapshots_pruned", summary.snapshots_pruned),
                         BoolField("writes_ok", summary.WritesOk())});

    Shutdown();
  } catch (const std::exception& e) {
    POWERSCORE_LOG_ERROR("Fatal error", {StringField("error", e.what())});
    Shutdown();
    return 2;
  }

  return 0;
}
