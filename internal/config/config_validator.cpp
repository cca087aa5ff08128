#include "config_validator.hpp"

#include <cmath>
#include <string>
#include <vector>

#include "internal/util/errors.hpp"

namespace powerscore::config {

namespace cfg = powerscore::runtime::config;

namespace {

constexpr double kWeightSumTolerance = 1e-6;

class Violations {
 public:
  void Add(std::string message) {
    items_.push_back(std::move(message));
  }

  void Range(bool has, double value, double lo, double hi, const char* section, const char* field) {
    if (!has) {
      Add(std::string(section) + "." + field + " is required");
      return;
    }
    if (!std::isfinite(value) || value < lo || value > hi) {
      Add(std::string(section) + "." + field + " must be in [" + Format(lo) + ", " + Format(hi) + "], got " + Format(value));
    }
  }

  void Positive(bool has, double value, const char* section, const char* field) {
    if (!has) {
      Add(std::string(section) + "." + field + " is required");
      return;
    }
    if (!std::isfinite(value) || value <= 0.0) {
      Add(std::string(section) + "." + field + " must be > 0, got " + Format(value));
    }
  }

  void Present(bool has, const char* section, const char* field) {
    if (!has) {
      Add(std::string(section) + "." + field + " is required");
    }
  }

  bool Empty() const {
    return items_.empty();
  }

  std::vector<std::string> Take() {
    return std::move(items_);
  }

 private:
  static std::string Format(double v) {
    auto s = std::to_string(v);
    while (s.size() > 1 && s.back() == '0') s.pop_back();
    if (!s.empty() && s.back() == '.') s.pop_back();
    return s;
  }

  std::vector<std::string> items_;
};

constexpr double kMax = 1e12;

void ValidateWindow(const cfg::WindowConfig& w, Violations& v) {
  const char* s = "rating.window";
  v.Range(w.has_window_days(), w.window_days(), 1, 3650, s, "window_days");
  v.Range(w.has_inactive_hide_days(), w.inactive_hide_days(), 1, 3650, s, "inactive_hide_days");
  v.Range(w.has_max_games_for_rank(), w.max_games_for_rank(), 1, 1000, s, "max_games_for_rank");
  v.Range(w.has_goal_diff_cap(), w.goal_diff_cap(), 1, 100, s, "goal_diff_cap");
  v.Positive(w.has_outlier_guard_zscore(), w.outlier_guard_zscore(), s, "outlier_guard_zscore");
  v.Range(w.has_recency_weight_decay(), w.recency_weight_decay(), 0, 10, s, "recency_weight_decay");
}

void ValidateShrinkage(const cfg::ShrinkageConfig& sh, Violations& v) {
  const char* s = "rating.shrinkage";
  v.Range(sh.has_shrink_tau(), sh.shrink_tau(), 0, kMax, s, "shrink_tau");
  v.Positive(sh.has_ridge_ga(), sh.ridge_ga(), s, "ridge_ga");
  v.Positive(sh.has_team_outlier_guard_zscore(), sh.team_outlier_guard_zscore(), s, "team_outlier_guard_zscore");
  if (sh.norm_mode() == cfg::NORM_MODE_UNSPECIFIED) {
    v.Add("rating.shrinkage.norm_mode is required");
  }
  v.Present(sh.has_opponent_adjust_enabled(), s, "opponent_adjust_enabled");
  v.Positive(sh.has_opponent_adjust_clip_min(), sh.opponent_adjust_clip_min(), s, "opponent_adjust_clip_min");
  v.Positive(sh.has_opponent_adjust_clip_max(), sh.opponent_adjust_clip_max(), s, "opponent_adjust_clip_max");
  if (sh.has_opponent_adjust_clip_min() && sh.has_opponent_adjust_clip_max() &&
      sh.opponent_adjust_clip_min() > sh.opponent_adjust_clip_max()) {
    v.Add("rating.shrinkage.opponent_adjust_clip_min must not exceed opponent_adjust_clip_max");
  }
}

void ValidateSos(const cfg::SosConfig& so, Violations& v) {
  const char* s = "rating.sos";
  v.Range(so.has_recency_decay_rate(), so.recency_decay_rate(), 0, 10, s, "recency_decay_rate");
  v.Range(so.has_adapt_k(), so.adapt_k(), 0, 10, s, "adapt_k");
  v.Range(so.has_sos_repeat_cap(), so.sos_repeat_cap(), 1, 1000, s, "sos_repeat_cap");
  v.Range(so.has_sos_iterations(), so.sos_iterations(), 1, 100, s, "sos_iterations");
  v.Range(so.has_sos_transitivity_lambda(), so.sos_transitivity_lambda(), 0, 1, s, "sos_transitivity_lambda");
  v.Range(so.has_unranked_sos_base(), so.unranked_sos_base(), 0, 1, s, "unranked_sos_base");
  v.Range(so.has_min_bridge_games(), so.min_bridge_games(), 0, 1000, s, "min_bridge_games");
  v.Range(so.has_pagerank_alpha(), so.pagerank_alpha(), 0, 1, s, "pagerank_alpha");
  v.Present(so.has_pagerank_dampening_enabled(), s, "pagerank_dampening_enabled");
  v.Present(so.has_scf_enabled(), s, "scf_enabled");
  v.Positive(so.has_scf_diversity_divisor(), so.scf_diversity_divisor(), s, "scf_diversity_divisor");
  v.Range(so.has_scf_floor(), so.scf_floor(), 0, 1, s, "scf_floor");
  v.Range(so.has_scf_min_unique_states(), so.scf_min_unique_states(), 0, 100, s, "scf_min_unique_states");
  v.Range(so.has_isolation_sos_cap(), so.isolation_sos_cap(), 0, 1, s, "isolation_sos_cap");
  v.Range(so.has_min_component_size_for_full_sos(), so.min_component_size_for_full_sos(), 1, 1000000, s,
          "min_component_size_for_full_sos");
  v.Range(so.has_min_games_for_top_sos(), so.min_games_for_top_sos(), 1, 1000, s, "min_games_for_top_sos");
  v.Range(so.has_min_games_for_sos_rank(), so.min_games_for_sos_rank(), 0, 1000, s, "min_games_for_sos_rank");
}

void ValidatePerformance(const cfg::PerformanceConfig& p, Violations& v) {
  const char* s = "rating.performance";
  v.Range(p.has_perf_game_scale(), p.perf_game_scale(), 0, kMax, s, "perf_game_scale");
  v.Range(p.has_decay_rate(), p.decay_rate(), 0, 10, s, "decay_rate");
  v.Range(p.has_threshold(), p.threshold(), 0, 100, s, "threshold");
  v.Positive(p.has_goal_scale(), p.goal_scale(), s, "goal_scale");
  v.Range(p.has_adaptive_k_alpha(), p.adaptive_k_alpha(), 0, kMax, s, "adaptive_k_alpha");
  v.Range(p.has_adaptive_k_beta(), p.adaptive_k_beta(), 0, kMax, s, "adaptive_k_beta");
}

void ValidatePower(const cfg::PowerConfig& p, Violations& v) {
  const char* s = "rating.power";
  v.Range(p.has_off_weight(), p.off_weight(), 0, 1, s, "off_weight");
  v.Range(p.has_def_weight(), p.def_weight(), 0, 1, s, "def_weight");
  v.Range(p.has_sos_weight(), p.sos_weight(), 0, 1, s, "sos_weight");
  v.Range(p.has_perf_blend_weight(), p.perf_blend_weight(), 0, 1, s, "perf_blend_weight");
  if (p.has_off_weight() && p.has_def_weight() && p.has_sos_weight() && p.has_perf_blend_weight()) {
    const double sum = p.off_weight() + p.def_weight() + p.sos_weight() + p.perf_blend_weight();
    if (std::fabs(sum - 1.0) > kWeightSumTolerance) {
      v.Add("rating.power weights (off + def + sos + perf_blend) must sum to 1.0, got " + std::to_string(sum));
    }
  }

  if (p.age_anchors().empty()) {
    v.Add("rating.power.age_anchors must not be empty");
  }
  for (const auto& [age, anchor] : p.age_anchors()) {
    if (!(anchor > 0.0 && anchor <= 1.0)) {
      v.Add("rating.power.age_anchors[" + std::to_string(age) + "] must be in (0, 1]");
    }
  }
  v.Range(p.has_default_anchor(), p.default_anchor(), 0, 1, s, "default_anchor");
  v.Range(p.has_min_games_provisional(), p.min_games_provisional(), 0, 1000, s, "min_games_provisional");
  v.Range(p.has_provisional_full_games(), p.provisional_full_games(), 0, 1000, s, "provisional_full_games");
  if (p.has_min_games_provisional() && p.has_provisional_full_games() && p.provisional_full_games() < p.min_games_provisional()) {
    v.Add("rating.power.provisional_full_games must be >= min_games_provisional");
  }
  v.Range(p.has_provisional_low_mult(), p.provisional_low_mult(), 0, 1, s, "provisional_low_mult");
  v.Range(p.has_provisional_mid_mult(), p.provisional_mid_mult(), 0, 1, s, "provisional_mid_mult");
}

void ValidateMl(const cfg::MlConfig& m, Violations& v) {
  const char* s = "rating.ml";
  v.Present(m.has_enabled(), s, "enabled");
  v.Range(m.has_alpha(), m.alpha(), 0, 10, s, "alpha");
  v.Range(m.has_recency_decay_lambda(), m.recency_decay_lambda(), 0, 10, s, "recency_decay_lambda");
  v.Range(m.has_min_team_games_for_residual(), m.min_team_games_for_residual(), 1, 1000, s, "min_team_games_for_residual");
  v.Positive(m.has_residual_clip_goals(), m.residual_clip_goals(), s, "residual_clip_goals");
  v.Range(m.has_min_training_rows(), m.min_training_rows(), 1, kMax, s, "min_training_rows");
  if (m.norm_mode() == cfg::NORM_MODE_UNSPECIFIED) {
    v.Add("rating.ml.norm_mode is required");
  }
  v.Range(m.has_holdout_days(), m.holdout_days(), 0, 3650, s, "holdout_days");
  if (m.model() == cfg::MODEL_KIND_UNSPECIFIED) {
    v.Add("rating.ml.model is required");
  }
  v.Present(m.has_export_game_residuals(), s, "export_game_residuals");

  const auto& gb = m.gradient_boosting();
  const char* g  = "rating.ml.gradient_boosting";
  v.Range(gb.has_n_estimators(), gb.n_estimators(), 1, 100000, g, "n_estimators");
  v.Range(gb.has_max_depth(), gb.max_depth(), 1, 64, g, "max_depth");
  v.Range(gb.has_learning_rate(), gb.learning_rate(), 1e-9, 1, g, "learning_rate");
  v.Range(gb.has_subsample(), gb.subsample(), 1e-9, 1, g, "subsample");
  v.Range(gb.has_colsample(), gb.colsample(), 1e-9, 1, g, "colsample");
  v.Range(gb.has_reg_lambda(), gb.reg_lambda(), 0, kMax, g, "reg_lambda");
  v.Range(gb.has_min_samples_leaf(), gb.min_samples_leaf(), 1, 100000, g, "min_samples_leaf");

  const auto& rf = m.random_forest();
  const char* r  = "rating.ml.random_forest";
  v.Range(rf.has_n_estimators(), rf.n_estimators(), 1, 100000, r, "n_estimators");
  v.Range(rf.has_max_depth(), rf.max_depth(), 1, 64, r, "max_depth");
  v.Range(rf.has_min_samples_leaf(), rf.min_samples_leaf(), 1, 100000, r, "min_samples_leaf");
  v.Range(rf.has_max_features(), rf.max_features(), 1e-9, 1, r, "max_features");
}

void ValidateHistory(const cfg::HistoryConfig& h, Violations& v) {
  const char* s = "history";
  v.Range(h.has_snapshot_retention_days(), h.snapshot_retention_days(), 1, 36500, s, "snapshot_retention_days");
  v.Range(h.has_lookup_tolerance_days(), h.lookup_tolerance_days(), 0, 365, s, "lookup_tolerance_days");
  v.Range(h.has_snapshot_batch_size(), h.snapshot_batch_size(), 1, 1000000, s, "snapshot_batch_size");
}

void ValidateWriter(const cfg::WriterConfig& w, Violations& v) {
  const char* s = "writer";
  v.Range(w.has_batch_size(), w.batch_size(), 1, 1000000, s, "batch_size");
  v.Range(w.has_max_retries(), w.max_retries(), 0, 100, s, "max_retries");
  v.Range(w.has_initial_backoff_ms(), w.initial_backoff_ms(), 0, 600000, s, "initial_backoff_ms");
  v.Range(w.has_backoff_multiplier(), w.backoff_multiplier(), 1, 100, s, "backoff_multiplier");
  v.Range(w.has_max_backoff_ms(), w.max_backoff_ms(), 0, 3600000, s, "max_backoff_ms");
  if (w.has_initial_backoff_ms() && w.has_max_backoff_ms() && w.max_backoff_ms() < w.initial_backoff_ms()) {
    v.Add("writer.max_backoff_ms must be >= initial_backoff_ms");
  }
}

void ValidateDatabase(const cfg::DatabaseConfig& d, Violations& v) {
  switch (d.backend_case()) {
    case cfg::DatabaseConfig::kSqlite:
      if (d.sqlite().path().empty()) {
        v.Add("database.sqlite.path must not be empty");
      }
      break;
    case cfg::DatabaseConfig::kPostgres:
      if (d.postgres().connection_uri().empty()) {
        v.Add("database.postgres.connection_uri must not be empty");
      }
      break;
    case cfg::DatabaseConfig::kMemory:
      break;
    case cfg::DatabaseConfig::BACKEND_NOT_SET:
      v.Add("database must configure one of sqlite, postgres, memory");
      break;
  }
}

rating::NormMode ToNormMode(cfg::NormMode mode) {
  return mode == cfg::NORM_MODE_ZSCORE ? rating::NormMode::kZScore : rating::NormMode::kPercentile;
}

} // namespace

void ConfigValidator::Validate(const cfg::RuntimeConfig& config) {
  Violations v;

  if (!config.has_rating()) {
    v.Add("rating section is required");
  }
  const auto& rating = config.rating();
  ValidateWindow(rating.window(), v);
  ValidateShrinkage(rating.shrinkage(), v);
  ValidateSos(rating.sos(), v);
  ValidatePerformance(rating.performance(), v);
  ValidatePower(rating.power(), v);
  ValidateMl(rating.ml(), v);
  ValidateHistory(config.history(), v);
  ValidateWriter(config.writer(), v);
  ValidateDatabase(config.database(), v);

  if (!v.Empty()) {
    throw util::InvalidConfig(v.Take());
  }
}

rating::Settings ConfigValidator::BuildSettings(const cfg::RuntimeConfig& config) {
  Validate(config);

  const auto&      r = config.rating();
  rating::Settings s;

  s.window.window_days          = r.window().window_days();
  s.window.inactive_hide_days   = r.window().inactive_hide_days();
  s.window.max_games_for_rank   = r.window().max_games_for_rank();
  s.window.goal_diff_cap        = r.window().goal_diff_cap();
  s.window.outlier_guard_zscore = r.window().outlier_guard_zscore();
  s.window.recency_weight_decay = r.window().recency_weight_decay();

  s.shrinkage.shrink_tau                = r.shrinkage().shrink_tau();
  s.shrinkage.ridge_ga                  = r.shrinkage().ridge_ga();
  s.shrinkage.team_outlier_guard_zscore = r.shrinkage().team_outlier_guard_zscore();
  s.shrinkage.norm_mode                 = ToNormMode(r.shrinkage().norm_mode());
  s.shrinkage.opponent_adjust_enabled   = r.shrinkage().opponent_adjust_enabled();
  s.shrinkage.opponent_adjust_clip_min  = r.shrinkage().opponent_adjust_clip_min();
  s.shrinkage.opponent_adjust_clip_max  = r.shrinkage().opponent_adjust_clip_max();

  const auto& so                        = r.sos();
  s.sos.recency_decay_rate              = so.recency_decay_rate();
  s.sos.adapt_k                         = so.adapt_k();
  s.sos.sos_repeat_cap                  = so.sos_repeat_cap();
  s.sos.sos_iterations                  = so.sos_iterations();
  s.sos.sos_transitivity_lambda         = so.sos_transitivity_lambda();
  s.sos.unranked_sos_base               = so.unranked_sos_base();
  s.sos.min_bridge_games                = so.min_bridge_games();
  s.sos.pagerank_alpha                  = so.pagerank_alpha();
  s.sos.pagerank_dampening_enabled      = so.pagerank_dampening_enabled();
  s.sos.scf_enabled                     = so.scf_enabled();
  s.sos.scf_diversity_divisor           = so.scf_diversity_divisor();
  s.sos.scf_floor                       = so.scf_floor();
  s.sos.scf_min_unique_states           = so.scf_min_unique_states();
  s.sos.isolation_sos_cap               = so.isolation_sos_cap();
  s.sos.min_component_size_for_full_sos = so.min_component_size_for_full_sos();
  s.sos.min_games_for_top_sos           = so.min_games_for_top_sos();
  s.sos.min_games_for_sos_rank          = so.min_games_for_sos_rank();

  const auto& p                  = r.performance();
  s.performance.perf_game_scale  = p.perf_game_scale();
  s.performance.decay_rate       = p.decay_rate();
  s.performance.threshold        = p.threshold();
  s.performance.goal_scale       = p.goal_scale();
  s.performance.adaptive_k_alpha = p.adaptive_k_alpha();
  s.performance.adaptive_k_beta  = p.adaptive_k_beta();

  const auto& pw             = r.power();
  s.power.off_weight         = pw.off_weight();
  s.power.def_weight         = pw.def_weight();
  s.power.sos_weight         = pw.sos_weight();
  s.power.perf_blend_weight  = pw.perf_blend_weight();
  s.power.age_anchors.clear();
  for (const auto& [age, anchor] : pw.age_anchors()) {
    s.power.age_anchors[age] = anchor;
  }
  s.power.default_anchor         = pw.default_anchor();
  s.power.min_games_provisional  = pw.min_games_provisional();
  s.power.provisional_full_games = pw.provisional_full_games();
  s.power.provisional_low_mult   = pw.provisional_low_mult();
  s.power.provisional_mid_mult   = pw.provisional_mid_mult();

  const auto& m                      = r.ml();
  s.ml.enabled                       = m.enabled();
  s.ml.alpha                         = m.alpha();
  s.ml.recency_decay_lambda          = m.recency_decay_lambda();
  s.ml.min_team_games_for_residual   = m.min_team_games_for_residual();
  s.ml.residual_clip_goals           = m.residual_clip_goals();
  s.ml.min_training_rows             = m.min_training_rows();
  s.ml.norm_mode                     = ToNormMode(m.norm_mode());
  s.ml.holdout_days                  = m.holdout_days();
  s.ml.model                         = m.model() == cfg::MODEL_KIND_RANDOM_FOREST ? rating::ModelKind::kRandomForest
                                                                                   : rating::ModelKind::kGradientBoosting;
  s.ml.gradient_boosting.n_estimators     = m.gradient_boosting().n_estimators();
  s.ml.gradient_boosting.max_depth        = m.gradient_boosting().max_depth();
  s.ml.gradient_boosting.learning_rate    = m.gradient_boosting().learning_rate();
  s.ml.gradient_boosting.subsample        = m.gradient_boosting().subsample();
  s.ml.gradient_boosting.colsample        = m.gradient_boosting().colsample();
  s.ml.gradient_boosting.reg_lambda       = m.gradient_boosting().reg_lambda();
  s.ml.gradient_boosting.min_samples_leaf = m.gradient_boosting().min_samples_leaf();
  s.ml.random_forest.n_estimators         = m.random_forest().n_estimators();
  s.ml.random_forest.max_depth            = m.random_forest().max_depth();
  s.ml.random_forest.min_samples_leaf     = m.random_forest().min_samples_leaf();
  s.ml.random_forest.max_features         = m.random_forest().max_features();
  if (m.has_seed()) {
    s.ml.seed = m.seed();
  }
  s.ml.export_game_residuals = m.export_game_residuals();

  return s;
}

} // namespace powerscore::config
