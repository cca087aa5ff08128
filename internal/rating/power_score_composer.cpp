#include "power_score_composer.hpp"

#include <algorithm>

#include "internal/rating/normalization.hpp"

namespace powerscore::rating {

PowerScoreComposer::PowerScoreComposer(const Settings& settings, util::Date today) : settings_(settings), today_(today) {
}

double PowerScoreComposer::ProvisionalMultiplier(int games_played) const {
  const auto& cfg = settings_.power;
  if (games_played < cfg.min_games_provisional) return cfg.provisional_low_mult;
  if (games_played < cfg.provisional_full_games) return cfg.provisional_mid_mult;
  return 1.0;
}

model::TeamStatus PowerScoreComposer::StatusFor(const model::TeamCohortStat& t) const {
  if (t.games_last_180_days == 0 || util::DaysBetween(t.last_game, today_) >= settings_.window.inactive_hide_days) {
    return model::TeamStatus::kInactive;
  }
  if (t.games_last_180_days < settings_.power.min_games_provisional) {
    return model::TeamStatus::kNotEnoughRankedGames;
  }
  return model::TeamStatus::kActive;
}

void PowerScoreComposer::Apply(std::vector<model::TeamCohortStat>& cohort) const {
  const auto& cfg = settings_.power;

  std::vector<double> scores;
  scores.reserve(cohort.size());
  for (auto& t : cohort) {
    const double core = cfg.off_weight * t.off_norm + cfg.def_weight * t.def_norm + cfg.sos_weight * t.sos_norm +
                        cfg.perf_blend_weight * t.perf_centered;

    t.powerscore_core   = Clip(core, 0.0, 1.0);
    t.provisional_mult  = ProvisionalMultiplier(t.games_played);
    t.powerscore_adj    = t.powerscore_core * t.provisional_mult;
    t.anchor            = cfg.AnchorFor(t.age);
    t.power_score_final = std::min(t.powerscore_adj * t.anchor, t.anchor);
    t.status            = StatusFor(t);
    scores.push_back(t.powerscore_adj);
  }

  const auto ranks = RankActive(cohort, scores);
  for (std::size_t i = 0; i < cohort.size(); ++i) {
    cohort[i].rank_in_cohort = ranks[i];
  }
}

std::vector<std::optional<int>> RankActive(const std::vector<model::TeamCohortStat>& cohort, const std::vector<double>& scores) {
  std::vector<std::size_t> order;
  for (std::size_t i = 0; i < cohort.size(); ++i) {
    if (cohort[i].status == model::TeamStatus::kActive) order.push_back(i);
  }

  std::sort(order.begin(), order.end(), [&](std::size_t a, std::size_t b) {
    if (scores[a] != scores[b]) return scores[a] > scores[b];
    if (cohort[a].sos != cohort[b].sos) return cohort[a].sos > cohort[b].sos;
    return cohort[a].team_id < cohort[b].team_id;
  });

  std::vector<std::optional<int>> out(cohort.size());
  for (std::size_t r = 0; r < order.size(); ++r) {
    out[order[r]] = static_cast<int>(r) + 1;
  }
  return out;
}

} // namespace powerscore::rating
