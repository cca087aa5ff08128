#include "feature_aggregator.hpp"

#include <algorithm>
#include <cmath>
#include <map>
#include <tuple>

#include "internal/rating/normalization.hpp"
#include "internal/rating/team_maps.hpp"

namespace powerscore::rating {

FeatureAggregator::FeatureAggregator(const Settings& settings) : settings_(settings) {
}

AggregateResult FeatureAggregator::Aggregate(const std::vector<model::GameRecord>& games, util::Date today) const {
  const auto& cfg          = settings_.window;
  const auto  window_start = util::AddDays(today, -cfg.window_days);

  std::map<std::string, std::vector<PreparedGame>> by_team;
  for (const auto& g : games) {
    if (g.date < window_start || g.date > today) continue;

    PreparedGame p;
    p.game          = g;
    p.goals_for     = g.goals_for;
    p.goals_against = g.goals_against;
    by_team[g.team_id].push_back(std::move(p));
  }

  AggregateResult result;
  for (auto& [team_id, rows] : by_team) {
    std::vector<double> gf;
    std::vector<double> ga;
    gf.reserve(rows.size());
    ga.reserve(rows.size());
    for (const auto& r : rows) {
      gf.push_back(r.goals_for);
      ga.push_back(r.goals_against);
    }
    ClipOutliers(gf, cfg.outlier_guard_zscore);
    ClipOutliers(ga, cfg.outlier_guard_zscore);

    const double cap = static_cast<double>(cfg.goal_diff_cap);
    for (std::size_t i = 0; i < rows.size(); ++i) {
      rows[i].goals_for     = gf[i];
      rows[i].goals_against = ga[i];
      rows[i].goal_diff     = Clip(gf[i] - ga[i], -cap, cap);
    }

    std::sort(rows.begin(), rows.end(), [](const PreparedGame& a, const PreparedGame& b) {
      if (a.game.date != b.game.date) return a.game.date > b.game.date;
      return std::tie(a.game.game_id, a.game.opponent_id) < std::tie(b.game.game_id, b.game.opponent_id);
    });
    if (rows.size() > static_cast<std::size_t>(cfg.max_games_for_rank)) {
      rows.resize(static_cast<std::size_t>(cfg.max_games_for_rank));
    }

    double total = 0.0;
    for (std::size_t i = 0; i < rows.size(); ++i) {
      rows[i].rank_recency = static_cast<int>(i) + 1;
      rows[i].weight       = std::exp(-cfg.recency_weight_decay * static_cast<double>(i));
      total += rows[i].weight;
    }
    for (auto& r : rows) {
      r.weight /= total;
      result.games.push_back(std::move(r));
    }
  }

  result.teams = Summarize(result.games, today);
  return result;
}

std::vector<model::TeamCohortStat> FeatureAggregator::Summarize(const std::vector<PreparedGame>& games, util::Date today) const {
  struct Acc {
    double     gf_w     = 0.0;
    double     ga_w     = 0.0;
    double     w        = 0.0;
    int        games    = 0;
    int        recent   = 0;
    util::Date last_game{};
  };

  const auto recent_start = util::AddDays(today, -settings_.window.inactive_hide_days);

  std::map<std::tuple<std::string, int, std::string>, Acc> accs;
  for (const auto& p : games) {
    auto& acc = accs[{p.game.team_id, p.game.age, p.game.gender}];
    acc.gf_w += p.goals_for * p.weight;
    acc.ga_w += p.goals_against * p.weight;
    acc.w += p.weight;
    ++acc.games;
    if (p.game.date >= recent_start) ++acc.recent;
    if (acc.games == 1 || p.game.date > acc.last_game) acc.last_game = p.game.date;
  }

  std::vector<model::TeamCohortStat> out;
  out.reserve(accs.size());
  for (const auto& [key, acc] : accs) {
    model::TeamCohortStat t;
    t.team_id = std::get<0>(key);
    t.age     = std::get<1>(key);
    t.gender  = std::get<2>(key);

    t.off_raw = acc.w > 0.0 ? acc.gf_w / acc.w : 0.0;
    t.sad_raw = acc.w > 0.0 ? acc.ga_w / acc.w : 0.0;
    t.def_raw = 1.0 / (t.sad_raw + settings_.shrinkage.ridge_ga);

    t.games_played        = acc.games;
    t.games_last_180_days = acc.recent;
    t.last_game           = acc.last_game;
    t.anchor              = settings_.power.AnchorFor(t.age);
    out.push_back(std::move(t));
  }

  SortTable(out);
  return out;
}

} // namespace powerscore::rating
