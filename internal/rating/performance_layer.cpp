#include "performance_layer.hpp"

#include <cmath>
#include <map>

#include "internal/rating/normalization.hpp"

namespace powerscore::rating {

namespace {
constexpr double kFallback = 0.5;
}

PerformanceLayer::PerformanceLayer(const Settings& settings, const TeamValueMap& power, const TeamValueMap& strength)
    : settings_(settings), power_(power), strength_(strength) {
}

double PerformanceLayer::GameContribution(const PreparedGame& p) const {
  const auto& cfg = settings_.performance;

  const double exp_margin =
      cfg.goal_scale * (LookupOr(power_, p.game.team_id, kFallback) - LookupOr(power_, p.game.opponent_id, kFallback));

  double delta = p.goal_diff - exp_margin;
  if (std::fabs(delta) < cfg.threshold) {
    delta = 0.0;
  }

  const double gap   = std::fabs(LookupOr(strength_, p.game.team_id, kFallback) - LookupOr(strength_, p.game.opponent_id, kFallback));
  const double k     = cfg.adaptive_k_alpha * (1.0 + cfg.adaptive_k_beta * gap);
  const double decay = std::exp(-cfg.decay_rate * static_cast<double>(p.rank_recency - 1));

  return cfg.perf_game_scale * delta * decay * k * p.weight;
}

void PerformanceLayer::Apply(std::vector<model::TeamCohortStat>& cohort, const std::vector<const PreparedGame*>& games) const {
  std::map<std::string, double> sums;
  for (const auto* p : games) {
    sums[p->game.team_id] += GameContribution(*p);
  }

  std::vector<double> raw;
  raw.reserve(cohort.size());
  for (auto& t : cohort) {
    auto it    = sums.find(t.team_id);
    t.perf_raw = it == sums.end() ? 0.0 : it->second;
    raw.push_back(t.perf_raw);
  }

  if (cohort.size() < 2) {
    for (auto& t : cohort) {
      t.perf_centered = 0.0;
    }
    return;
  }

  const auto pct = PercentileNorm(raw);
  for (std::size_t i = 0; i < cohort.size(); ++i) {
    cohort[i].perf_centered = pct[i] - 0.5;
  }
}

} // namespace powerscore::rating
