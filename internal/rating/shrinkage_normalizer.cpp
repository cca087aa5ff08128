#include "shrinkage_normalizer.hpp"

#include "internal/observability/logging.hpp"
#include "internal/rating/normalization.hpp"
#include "internal/rating/team_maps.hpp"

namespace powerscore::rating {

ShrinkageNormalizer::ShrinkageNormalizer(const Settings& settings) : settings_(settings) {
}

void ShrinkageNormalizer::Apply(std::vector<model::TeamCohortStat>& teams) const {
  for (const auto& [cohort, rows] : GroupByCohort(teams)) {
    ApplyCohort(teams, rows);
  }
}

void ShrinkageNormalizer::ApplyCohort(std::vector<model::TeamCohortStat>& teams, const std::vector<std::size_t>& rows) const {
  const auto& cfg = settings_.shrinkage;

  std::vector<double> off;
  std::vector<double> sad;
  off.reserve(rows.size());
  sad.reserve(rows.size());
  for (auto i : rows) {
    off.push_back(teams[i].off_raw);
    sad.push_back(teams[i].sad_raw);
  }
  const double mu_off = Mean(off);
  const double mu_sad = Mean(sad);

  std::vector<double> off_shrunk;
  std::vector<double> def_shrunk;
  for (auto i : rows) {
    auto&        t  = teams[i];
    const double gp = static_cast<double>(t.games_played);
    const double w  = gp / (gp + cfg.shrink_tau);

    t.off_shrunk = t.off_raw * w + mu_off * (1.0 - w);
    t.sad_shrunk = t.sad_raw * w + mu_sad * (1.0 - w);
    t.def_shrunk = 1.0 / (t.sad_shrunk + cfg.ridge_ga);

    off_shrunk.push_back(t.off_shrunk);
    def_shrunk.push_back(t.def_shrunk);
  }

  ClipOutliers(off_shrunk, cfg.team_outlier_guard_zscore);
  ClipOutliers(def_shrunk, cfg.team_outlier_guard_zscore);

  const auto off_norm = Normalize(off_shrunk, cfg.norm_mode);
  const auto def_norm = Normalize(def_shrunk, cfg.norm_mode);

  for (std::size_t k = 0; k < rows.size(); ++k) {
    auto& t        = teams[rows[k]];
    t.off_shrunk   = off_shrunk[k];
    t.def_shrunk   = def_shrunk[k];
    t.off_norm     = Clip(off_norm[k], 0.0, 1.0);
    t.def_norm     = Clip(def_norm[k], 0.0, 1.0);
    t.power_presos = 0.5 * t.off_norm + 0.5 * t.def_norm;
    t.anchor       = settings_.power.AnchorFor(t.age);
    t.abs_strength = Clip(t.power_presos * t.anchor, 0.0, 1.0);
  }
}

std::vector<model::TeamCohortStat> ShrinkageNormalizer::AdjustForOpponents(const std::vector<PreparedGame>&          games,
                                                                           const std::vector<model::TeamCohortStat>& teams,
                                                                           util::Date                                today) const {
  const auto& cfg      = settings_.shrinkage;
  const auto  strength = BuildTeamValueMap(teams, &model::TeamCohortStat::abs_strength);
  const auto  baseline = MeanValue(strength);

  if (baseline <= 0.0) {
    POWERSCORE_LOG_WARN("opponent adjustment skipped, zero strength baseline");
    return teams;
  }

  std::vector<PreparedGame> adjusted = games;
  int                       unknown  = 0;
  for (auto& p : adjusted) {
    auto   it = strength.find(p.game.opponent_id);
    double s  = settings_.sos.unranked_sos_base;
    if (it == strength.end()) {
      ++unknown;
    } else {
      s = it->second;
    }

    const double off_mult = Clip(s / baseline, cfg.opponent_adjust_clip_min, cfg.opponent_adjust_clip_max);
    const double def_mult = s > 0.0 ? Clip(baseline / s, cfg.opponent_adjust_clip_min, cfg.opponent_adjust_clip_max)
                                    : cfg.opponent_adjust_clip_max;
    p.goals_for *= off_mult;
    p.goals_against *= def_mult;
  }

  if (unknown > 0) {
    POWERSCORE_LOG_DEBUG("opponent adjustment used unranked base", {observability::IntField("games", unknown)});
  }

  auto out = FeatureAggregator(settings_).Summarize(adjusted, today);
  Apply(out);
  return out;
}

} // namespace powerscore::rating
