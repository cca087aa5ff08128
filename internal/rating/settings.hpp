#pragma once

#include <cstdint>
#include <map>

namespace powerscore::rating {

enum class NormMode {
  kPercentile,
  kZScore,
};

enum class ModelKind {
  kGradientBoosting,
  kRandomForest,
};

/*
  Immutable engine constants.

  Built once from the validated RuntimeConfig and passed by const
  reference into every stage. Defaults() mirrors the shipped YAML.
*/
struct Settings {
  struct Window {
    int    window_days          = 365;
    int    inactive_hide_days   = 180;
    int    max_games_for_rank   = 30;
    int    goal_diff_cap        = 6;
    double outlier_guard_zscore = 2.5;
    double recency_weight_decay = 0.05;
  };

  struct Shrinkage {
    double   shrink_tau                = 8.0;
    double   ridge_ga                  = 0.25;
    double   team_outlier_guard_zscore = 2.5;
    NormMode norm_mode                 = NormMode::kPercentile;
    bool     opponent_adjust_enabled   = true;
    double   opponent_adjust_clip_min  = 0.4;
    double   opponent_adjust_clip_max  = 1.6;
  };

  struct Sos {
    double recency_decay_rate              = 0.005;
    double adapt_k                         = 0.1;
    int    sos_repeat_cap                  = 2;
    int    sos_iterations                  = 1;
    double sos_transitivity_lambda         = 0.0;
    double unranked_sos_base               = 0.35;
    int    min_bridge_games                = 2;
    double pagerank_alpha                  = 0.85;
    bool   pagerank_dampening_enabled      = true;
    bool   scf_enabled                     = true;
    double scf_diversity_divisor           = 3.0;
    double scf_floor                       = 0.4;
    int    scf_min_unique_states           = 2;
    double isolation_sos_cap               = 0.70;
    int    min_component_size_for_full_sos = 30;
    int    min_games_for_top_sos           = 10;
    int    min_games_for_sos_rank          = 10;
  };

  struct Performance {
    double perf_game_scale  = 0.15;
    double decay_rate       = 0.08;
    double threshold        = 2.0;
    double goal_scale       = 5.0;
    double adaptive_k_alpha = 0.5;
    double adaptive_k_beta  = 0.6;
  };

  struct Power {
    double off_weight        = 0.25;
    double def_weight        = 0.25;
    double sos_weight        = 0.40;
    double perf_blend_weight = 0.10;

    std::map<int, double> age_anchors = {
        {10, 0.400}, {11, 0.475}, {12, 0.550}, {13, 0.625}, {14, 0.700},
        {15, 0.775}, {16, 0.850}, {17, 0.925}, {18, 1.000}, {19, 1.000},
    };
    double default_anchor = 0.70;

    int    min_games_provisional  = 5;
    int    provisional_full_games = 15;
    double provisional_low_mult   = 0.85;
    double provisional_mid_mult   = 0.95;

    double AnchorFor(int age) const {
      auto it = age_anchors.find(age);
      return it == age_anchors.end() ? default_anchor : it->second;
    }
  };

  struct GradientBoosting {
    int    n_estimators     = 220;
    int    max_depth        = 5;
    double learning_rate    = 0.08;
    double subsample        = 0.9;
    double colsample        = 0.9;
    double reg_lambda       = 1.0;
    int    min_samples_leaf = 1;
  };

  struct RandomForest {
    int    n_estimators     = 240;
    int    max_depth        = 18;
    int    min_samples_leaf = 2;
    double max_features     = 1.0;
  };

  struct Ml {
    bool             enabled                     = true;
    double           alpha                       = 0.12;
    double           recency_decay_lambda        = 0.06;
    int              min_team_games_for_residual = 6;
    double           residual_clip_goals         = 3.5;
    int              min_training_rows           = 200;
    NormMode         norm_mode                   = NormMode::kPercentile;
    int              holdout_days                = 30;
    ModelKind        model                       = ModelKind::kGradientBoosting;
    GradientBoosting gradient_boosting{};
    RandomForest     random_forest{};
    std::uint32_t    seed                  = 42;
    bool             export_game_residuals = true;
  };

  Window      window{};
  Shrinkage   shrinkage{};
  Sos         sos{};
  Performance performance{};
  Power       power{};
  Ml          ml{};

  static Settings Defaults() {
    return Settings{};
  }
};

} // namespace powerscore::rating
