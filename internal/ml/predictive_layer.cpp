#include "predictive_layer.hpp"

#include <algorithm>
#include <cmath>
#include <map>
#include <tuple>

#include "internal/ml/gradient_boosting.hpp"
#include "internal/ml/random_forest.hpp"
#include "internal/observability/logging.hpp"
#include "internal/rating/normalization.hpp"
#include "internal/rating/power_score_composer.hpp"

namespace powerscore::ml {

namespace {

constexpr double kFallbackPower = 0.5;

bool AllFinite(const std::vector<double>& values) {
  return std::all_of(values.begin(), values.end(), [](double v) { return std::isfinite(v); });
}

using TeamKey = std::tuple<std::string, int, std::string>;

} // namespace

PredictiveLayer::PredictiveLayer(const rating::Settings& settings) : settings_(settings) {
}

std::vector<double> PredictiveLayer::Features(const rating::PreparedGame& p, const rating::TeamValueMap& core) {
  const double team_power = rating::LookupOr(core, p.game.team_id, kFallbackPower);
  const double opp_power  = rating::LookupOr(core, p.game.opponent_id, kFallbackPower);
  return {
      team_power,
      opp_power,
      team_power - opp_power,
      static_cast<double>(std::abs(p.game.age - p.game.opponent_age)),
      p.game.gender == p.game.opponent_gender ? 0.0 : 1.0,
  };
}

std::unique_ptr<Regressor> PredictiveLayer::MakeModel(rating::ModelKind kind) const {
  const auto& cfg = settings_.ml;
  if (kind == rating::ModelKind::kRandomForest) {
    RandomForestParams p;
    p.n_estimators     = cfg.random_forest.n_estimators;
    p.max_depth        = cfg.random_forest.max_depth;
    p.min_samples_leaf = cfg.random_forest.min_samples_leaf;
    p.max_features     = cfg.random_forest.max_features;
    p.seed             = cfg.seed;
    return std::make_unique<RandomForest>(p);
  }

  GradientBoostingParams p;
  p.n_estimators     = cfg.gradient_boosting.n_estimators;
  p.max_depth        = cfg.gradient_boosting.max_depth;
  p.learning_rate    = cfg.gradient_boosting.learning_rate;
  p.subsample        = cfg.gradient_boosting.subsample;
  p.colsample        = cfg.gradient_boosting.colsample;
  p.reg_lambda       = cfg.gradient_boosting.reg_lambda;
  p.min_samples_leaf = cfg.gradient_boosting.min_samples_leaf;
  p.seed             = cfg.seed;
  return std::make_unique<GradientBoosting>(p);
}

PredictiveResult PredictiveLayer::Apply(std::vector<model::TeamCohortStat>& teams, const std::vector<rating::PreparedGame>& games) const {
  const auto&      cfg = settings_.ml;
  PredictiveResult result;

  if (!cfg.enabled || games.empty()) {
    POWERSCORE_LOG_INFO("predictive layer disabled", {observability::BoolField("configured", cfg.enabled)});
    PassThrough(teams);
    return result;
  }

  const auto core = rating::BuildTeamValueMap(teams, &model::TeamCohortStat::powerscore_core);

  util::Date max_date = games.front().game.date;
  for (const auto& p : games) {
    max_date = std::max(max_date, p.game.date);
  }
  const auto cutoff = util::AddDays(max_date, -cfg.holdout_days);

  std::vector<std::vector<double>> features;
  features.reserve(games.size());
  Dataset train;
  for (const auto& p : games) {
    features.push_back(Features(p, core));
    if (p.game.date < cutoff) {
      train.x.push_back(features.back());
      train.y.push_back(static_cast<double>(p.Margin()));
    }
  }
  result.training_rows = train.Rows();

  if (train.Rows() < static_cast<std::size_t>(cfg.min_training_rows)) {
    POWERSCORE_LOG_WARN("predictive layer disabled, too few training rows",
                        {observability::IntField("training_rows", static_cast<std::int64_t>(train.Rows())),
                         observability::IntField("min_training_rows", cfg.min_training_rows)});
    PassThrough(teams);
    return result;
  }

  auto model = MakeModel(cfg.model);
  model->Fit(train);
  auto predictions = model->PredictAll(features);

  if (!AllFinite(predictions) && cfg.model == rating::ModelKind::kGradientBoosting) {
    POWERSCORE_LOG_WARN("gradient boosting produced non-finite predictions, falling back to random forest");
    model = MakeModel(rating::ModelKind::kRandomForest);
    model->Fit(train);
    predictions = model->PredictAll(features);
  }
  if (!AllFinite(predictions)) {
    POWERSCORE_LOG_ERROR("predictive model produced non-finite predictions, layer disabled");
    PassThrough(teams);
    return result;
  }

  result.enabled    = true;
  result.model_name = std::string(model->Name());

  // residuals per team-cohort, most recent first
  struct Scored {
    util::Date  date;
    std::string game_id;
    double      residual;
  };
  std::map<TeamKey, std::vector<Scored>> per_team;
  std::map<std::string, double>          home_residuals;
  for (std::size_t i = 0; i < games.size(); ++i) {
    const auto&  p        = games[i];
    const double residual = static_cast<double>(p.Margin()) - predictions[i];
    per_team[{p.game.team_id, p.game.age, p.game.gender}].push_back({p.game.date, p.game.game_id, residual});
    if (p.game.is_home) {
      home_residuals.emplace(p.game.game_id, residual);
    }
  }

  for (auto& t : teams) {
    t.ml_overperf = 0.0;
    auto it       = per_team.find({t.team_id, t.age, t.gender});
    if (it == per_team.end() || it->second.size() < static_cast<std::size_t>(cfg.min_team_games_for_residual)) continue;

    auto& rows = it->second;
    std::sort(rows.begin(), rows.end(), [](const Scored& a, const Scored& b) {
      if (a.date != b.date) return a.date > b.date;
      return a.game_id < b.game_id;
    });

    double num = 0.0;
    double den = 0.0;
    for (std::size_t k = 0; k < rows.size(); ++k) {
      const double w = std::exp(-cfg.recency_decay_lambda * static_cast<double>(k));
      num += w * rows[k].residual;
      den += w;
    }
    t.ml_overperf = rating::Clip(num / den, -cfg.residual_clip_goals, cfg.residual_clip_goals);
  }

  Blend(teams);

  if (cfg.export_game_residuals) {
    result.residuals.reserve(home_residuals.size());
    for (const auto& [game_id, residual] : home_residuals) {
      result.residuals.push_back({game_id, residual});
    }
  }

  POWERSCORE_LOG_INFO("predictive layer applied", {observability::StringField("model", result.model_name),
                                                   observability::IntField("training_rows", static_cast<std::int64_t>(train.Rows())),
                                                   observability::IntField("scored_rows", static_cast<std::int64_t>(games.size()))});
  return result;
}

void PredictiveLayer::Blend(std::vector<model::TeamCohortStat>& teams) const {
  const auto& cfg = settings_.ml;

  for (const auto& [cohort, rows] : rating::GroupByCohort(teams)) {
    std::vector<double> overperf;
    overperf.reserve(rows.size());
    for (auto i : rows) {
      overperf.push_back(teams[i].ml_overperf);
    }

    std::vector<double> norm(rows.size(), 0.5);
    if (rows.size() >= 2) {
      norm = rating::Normalize(overperf, cfg.norm_mode);
    }

    std::vector<model::TeamCohortStat> cohort_rows;
    std::vector<double>                scores;
    cohort_rows.reserve(rows.size());
    for (std::size_t k = 0; k < rows.size(); ++k) {
      auto& t   = teams[rows[k]];
      t.ml_norm = rating::Clip(norm[k] - 0.5, -0.5, 0.5);

      t.powerscore_ml        = rating::Clip((t.powerscore_core + cfg.alpha * t.ml_norm) / (1.0 + 0.5 * cfg.alpha), 0.0, 1.0);
      t.power_score_final_ml = std::min(t.powerscore_ml * t.provisional_mult * t.anchor, t.anchor);

      cohort_rows.push_back(t);
      scores.push_back(t.powerscore_ml * t.provisional_mult);
    }

    const auto ranks = rating::RankActive(cohort_rows, scores);
    for (std::size_t k = 0; k < rows.size(); ++k) {
      teams[rows[k]].rank_in_cohort_ml = ranks[k];
    }
  }
}

void PredictiveLayer::PassThrough(std::vector<model::TeamCohortStat>& teams) const {
  for (auto& t : teams) {
    t.ml_overperf          = 0.0;
    t.ml_norm              = 0.0;
    t.powerscore_ml        = t.powerscore_core;
    t.power_score_final_ml = std::min(t.powerscore_ml * t.provisional_mult * t.anchor, t.anchor);
    t.rank_in_cohort_ml    = t.rank_in_cohort;
  }
}

} // namespace powerscore::ml
