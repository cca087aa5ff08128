#include "internal/config/config_loader.hpp"

#include <cassert>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <stdexcept>
#include <string>

#include "internal/config/config_validator.hpp"
#include "internal/util/errors.hpp"

namespace {

using powerscore::config::ConfigLoader;
using powerscore::config::ConfigValidator;
using powerscore::util::InvalidConfig;

const std::string kValidYaml = R"(logging:
  level: info
  include_trace_context: false

observability:
  tracing_enabled: false
  metrics_enabled: false
  otlp_endpoint: "localhost:4317"
  transport: OTLP_TRANSPORT_GRPC
  metrics_export_interval_ms: 10000

database:
  sqlite:
    path: "powerscore.db"

rating:
  window:
    window_days: 365
    inactive_hide_days: 180
    max_games_for_rank: 30
    goal_diff_cap: 6
    outlier_guard_zscore: 2.5
    recency_weight_decay: 0.05

  shrinkage:
    shrink_tau: 8.0
    ridge_ga: 0.25
    team_outlier_guard_zscore: 2.5
    norm_mode: NORM_MODE_PERCENTILE
    opponent_adjust_enabled: true
    opponent_adjust_clip_min: 0.4
    opponent_adjust_clip_max: 1.6

  sos:
    recency_decay_rate: 0.005
    adapt_k: 0.1
    sos_repeat_cap: 2
    sos_iterations: 1
    sos_transitivity_lambda: 0.0
    unranked_sos_base: 0.35
    min_bridge_games: 2
    pagerank_alpha: 0.85
    pagerank_dampening_enabled: true
    scf_enabled: true
    scf_diversity_divisor: 3.0
    scf_floor: 0.4
    scf_min_unique_states: 2
    isolation_sos_cap: 0.70
    min_component_size_for_full_sos: 30
    min_games_for_top_sos: 10
    min_games_for_sos_rank: 10

  performance:
    perf_game_scale: 0.15
    decay_rate: 0.08
    threshold: 2.0
    goal_scale: 5.0
    adaptive_k_alpha: 0.5
    adaptive_k_beta: 0.6

  power:
    off_weight: 0.25
    def_weight: 0.25
    sos_weight: 0.40
    perf_blend_weight: 0.10
    age_anchors:
      10: 0.400
      11: 0.475
      12: 0.550
      13: 0.625
      14: 0.700
      15: 0.775
      16: 0.850
      17: 0.925
      18: 1.000
      19: 1.000
    default_anchor: 0.70
    min_games_provisional: 5
    provisional_full_games: 15
    provisional_low_mult: 0.85
    provisional_mid_mult: 0.95

  ml:
    enabled: true
    alpha: 0.12
    recency_decay_lambda: 0.06
    min_team_games_for_residual: 6
    residual_clip_goals: 3.5
    min_training_rows: 200
    norm_mode: NORM_MODE_PERCENTILE
    holdout_days: 30
    model: MODEL_KIND_GRADIENT_BOOSTING
    gradient_boosting:
      n_estimators: 220
      max_depth: 5
      learning_rate: 0.08
      subsample: 0.9
      colsample: 0.9
      reg_lambda: 1.0
      min_samples_leaf: 1
    random_forest:
      n_estimators: 240
      max_depth: 18
      min_samples_leaf: 2
      max_features: 1.0
    seed: 42
    export_game_residuals: true

history:
  snapshot_retention_days: 90
  lookup_tolerance_days: 3
  snapshot_batch_size: 500

writer:
  batch_size: 500
  max_retries: 3
  initial_backoff_ms: 100
  backoff_multiplier: 2.0
  max_backoff_ms: 5000

cache:
  enabled: true

ingest:
  provider_filter: ""

workers:
  threads: 0
)";

std::string Replace(std::string text, const std::string& from, const std::string& to) {
  auto pos = text.find(from);
  assert(pos != std::string::npos);
  text.replace(pos, from.size(), to);
  return text;
}

std::filesystem::path WriteYaml(const std::string& test_name, const std::string& yaml_content) {
  const auto base_dir = std::filesystem::temp_directory_path() / "powerscore_config_loader_tests";
  std::filesystem::create_directories(base_dir);

  const auto    file_path = base_dir / (test_name + ".yaml");
  std::ofstream out(file_path);
  out << yaml_content;
  out.close();

  return file_path;
}

bool HasViolation(const InvalidConfig& e, const std::string& needle) {
  for (const auto& v : e.Violations()) {
    if (v.find(needle) != std::string::npos) return true;
  }
  return false;
}

void TestShippedDefaultsParse() {
  const auto path   = WriteYaml("valid", kValidYaml);
  auto       config = ConfigLoader::LoadFromYaml(path.string());

  assert(config.database().has_sqlite());
  assert(config.database().sqlite().path() == "powerscore.db");
  assert(config.rating().power().age_anchors().at(14) == 0.700);
  assert(config.rating().ml().model() == powerscore::runtime::config::MODEL_KIND_GRADIENT_BOOSTING);

  auto settings = ConfigValidator::BuildSettings(config);
  assert(settings.window.window_days == 365);
  assert(settings.sos.unranked_sos_base == 0.35);
  assert(settings.power.sos_weight == 0.40);
  assert(settings.power.AnchorFor(14) == 0.700);
  assert(settings.power.AnchorFor(7) == 0.70);
  assert(settings.ml.seed == 42u);
  assert(settings.ml.model == powerscore::rating::ModelKind::kGradientBoosting);
  assert(settings.shrinkage.norm_mode == powerscore::rating::NormMode::kPercentile);
}

void TestScalarEscapingForQuotedAndBackslashValues() {
  auto yaml   = Replace(kValidYaml, R"(path: "powerscore.db")", R"(path: "C:\\ps\\\"quoted\"\\db.sqlite")");
  auto config = ConfigLoader::LoadFromYamlString(yaml);
  assert(config.database().sqlite().path() == "C:\\ps\\\"quoted\"\\db.sqlite");
}

void TestQuotedNumberStaysString() {
  auto yaml   = Replace(kValidYaml, R"(provider_filter: "")", R"(provider_filter: "2024")");
  auto config = ConfigLoader::LoadFromYamlString(yaml);
  assert(config.ingest().provider_filter() == "2024");
}

void TestUnknownFieldsAreRejected() {
  auto yaml = Replace(kValidYaml, "cache:\n  enabled: true", "cache:\n  enabled: true\n  ttl_days: 3");

  bool threw = false;
  try {
    (void)ConfigLoader::LoadFromYamlString(yaml);
  } catch (const InvalidConfig&) {
    threw = true;
  }
  assert(threw);
}

void TestMissingRequiredFieldIsReported() {
  auto yaml   = Replace(kValidYaml, "    shrink_tau: 8.0\n", "");
  auto config = ConfigLoader::LoadFromYamlString(yaml);

  bool threw = false;
  try {
    ConfigValidator::Validate(config);
  } catch (const InvalidConfig& e) {
    threw = true;
    assert(HasViolation(e, "rating.shrinkage.shrink_tau is required"));
  }
  assert(threw);
}

void TestWeightsMustSumToOne() {
  auto yaml   = Replace(kValidYaml, "sos_weight: 0.40", "sos_weight: 0.50");
  auto config = ConfigLoader::LoadFromYamlString(yaml);

  bool threw = false;
  try {
    ConfigValidator::Validate(config);
  } catch (const InvalidConfig& e) {
    threw = true;
    assert(HasViolation(e, "must sum to 1.0"));
  }
  assert(threw);
}

void TestEveryViolationIsCollected() {
  auto yaml = Replace(kValidYaml, "pagerank_alpha: 0.85", "pagerank_alpha: 1.5");
  yaml      = Replace(yaml, "goal_diff_cap: 6", "goal_diff_cap: 0");
  yaml      = Replace(yaml, "      max_features: 1.0\n", "");
  auto config = ConfigLoader::LoadFromYamlString(yaml);

  bool threw = false;
  try {
    ConfigValidator::Validate(config);
  } catch (const InvalidConfig& e) {
    threw = true;
    assert(e.Violations().size() == 3);
    assert(HasViolation(e, "rating.sos.pagerank_alpha must be in [0, 1]"));
    assert(HasViolation(e, "rating.window.goal_diff_cap"));
    assert(HasViolation(e, "rating.ml.random_forest.max_features is required"));
  }
  assert(threw);
}

void TestDatabaseBackendIsRequired() {
  auto yaml   = Replace(kValidYaml, "database:\n  sqlite:\n    path: \"powerscore.db\"\n", "");
  auto config = ConfigLoader::LoadFromYamlString(yaml);

  bool threw = false;
  try {
    ConfigValidator::Validate(config);
  } catch (const InvalidConfig& e) {
    threw = true;
    assert(HasViolation(e, "database must configure one of"));
  }
  assert(threw);
}

void TestMissingFileThrows() {
  bool threw = false;
  try {
    (void)ConfigLoader::LoadFromYaml("/nonexistent/powerscore.yaml");
  } catch (const std::runtime_error&) {
    threw = true;
  }
  assert(threw);
}

} // namespace

int main() {
  TestShippedDefaultsParse();
  TestScalarEscapingForQuotedAndBackslashValues();
  TestQuotedNumberStaysString();
  TestUnknownFieldsAreRejected();
  TestMissingRequiredFieldIsReported();
  TestWeightsMustSumToOne();
  TestEveryViolationIsCollected();
  TestDatabaseBackendIsRequired();
  TestMissingFileThrows();

  std::cout << "config_loader_test: pass\n";
  return 0;
}
