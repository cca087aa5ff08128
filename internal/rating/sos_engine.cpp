#include "sos_engine.hpp"

#include <algorithm>
#include <cmath>
#include <map>

#include "internal/rating/normalization.hpp"
#include "internal/rating/union_find.hpp"

namespace powerscore::rating {

namespace {

constexpr double kNeutralSos = 0.5;

std::map<std::string, int> RowIndex(const std::vector<model::TeamCohortStat>& cohort) {
  std::map<std::string, int> out;
  for (std::size_t i = 0; i < cohort.size(); ++i) {
    out.emplace(cohort[i].team_id, static_cast<int>(i));
  }
  return out;
}

std::vector<std::vector<const PreparedGame*>> GamesPerRow(const std::vector<model::TeamCohortStat>& cohort,
                                                          const std::vector<const PreparedGame*>&   games) {
  const auto                                    rows = RowIndex(cohort);
  std::vector<std::vector<const PreparedGame*>> out(cohort.size());
  for (const auto* p : games) {
    auto it = rows.find(p->game.team_id);
    if (it != rows.end()) {
      out[static_cast<std::size_t>(it->second)].push_back(p);
    }
  }
  return out;
}

} // namespace

SosEngine::SosEngine(const Settings& settings, const TeamValueMap& strength, const TeamDirectory& directory)
    : settings_(settings), strength_(strength), directory_(directory) {
}

SosGraph SosEngine::BuildGraph(const std::vector<model::TeamCohortStat>& cohort, const std::vector<const PreparedGame*>& games,
                               util::Date today) const {
  const auto& cfg  = settings_.sos;
  const auto  rows = RowIndex(cohort);

  struct Weighted {
    const PreparedGame* game;
    double              w_sos;
  };

  SosGraph graph;
  graph.team_ids.reserve(cohort.size());
  for (const auto& t : cohort) {
    graph.team_ids.push_back(t.team_id);
  }
  graph.edges.resize(cohort.size());
  graph.opponent_rows.resize(cohort.size());

  const auto per_row = GamesPerRow(cohort, games);
  for (std::size_t i = 0; i < cohort.size(); ++i) {
    std::map<std::string, std::vector<Weighted>> by_opponent;
    for (const auto* p : per_row[i]) {
      const double days    = static_cast<double>(std::max(0, util::DaysBetween(p->game.date, today)));
      const double w_game  = std::exp(-cfg.recency_decay_rate * days);
      const double k_adapt = std::exp(-cfg.adapt_k * std::fabs(p->goal_diff));
      by_opponent[p->game.opponent_id].push_back({p, w_game * k_adapt});
    }

    for (auto& [opponent_id, list] : by_opponent) {
      std::sort(list.begin(), list.end(), [](const Weighted& a, const Weighted& b) {
        if (a.w_sos != b.w_sos) return a.w_sos > b.w_sos;
        if (a.game->game.date != b.game->game.date) return a.game->game.date > b.game->game.date;
        return a.game->game.game_id < b.game->game.game_id;
      });
      if (list.size() > static_cast<std::size_t>(cfg.sos_repeat_cap)) {
        list.resize(static_cast<std::size_t>(cfg.sos_repeat_cap));
      }

      auto it  = rows.find(opponent_id);
      int  row = it == rows.end() ? -1 : it->second;
      for (const auto& w : list) {
        graph.edges[i].push_back({opponent_id, w.w_sos});
        graph.opponent_rows[i].push_back(row);
      }
    }
  }
  return graph;
}

std::vector<double> SosEngine::DirectPass(const SosGraph& graph) const {
  const double        unranked = settings_.sos.unranked_sos_base;
  std::vector<double> out(graph.team_ids.size(), unranked);

  for (std::size_t i = 0; i < graph.edges.size(); ++i) {
    double num = 0.0;
    double den = 0.0;
    for (const auto& e : graph.edges[i]) {
      num += LookupOr(strength_, e.opponent_id, unranked) * e.weight;
      den += e.weight;
    }
    out[i] = den > 0.0 ? Clip(num / den, 0.0, 1.0) : unranked;
  }
  return out;
}

std::vector<double> SosEngine::Refine(const SosGraph& graph, const std::vector<double>& direct,
                                      const std::vector<double>& previous) const {
  const double        unranked = settings_.sos.unranked_sos_base;
  const double        lambda   = settings_.sos.sos_transitivity_lambda;
  std::vector<double> out(direct.size(), unranked);

  for (std::size_t i = 0; i < graph.edges.size(); ++i) {
    double num = 0.0;
    double den = 0.0;
    for (std::size_t k = 0; k < graph.edges[i].size(); ++k) {
      const auto&  e   = graph.edges[i][k];
      const int    row = graph.opponent_rows[i][k];
      const double s   = row >= 0 ? previous[static_cast<std::size_t>(row)] : LookupOr(strength_, e.opponent_id, unranked);
      num += s * e.weight;
      den += e.weight;
    }
    const double trans = den > 0.0 ? num / den : unranked;
    out[i]             = Clip((1.0 - lambda) * direct[i] + lambda * trans, 0.0, 1.0);
  }
  return out;
}

void SosEngine::Apply(std::vector<model::TeamCohortStat>& cohort, const std::vector<const PreparedGame*>& games,
                      util::Date today) const {
  if (cohort.empty()) return;

  const auto graph  = BuildGraph(cohort, games, today);
  const auto direct = DirectPass(graph);

  auto      sos    = direct;
  const int passes = std::max(1, settings_.sos.sos_iterations);
  for (int pass = 2; pass <= passes; ++pass) {
    sos = Refine(graph, direct, sos);
  }

  for (std::size_t i = 0; i < cohort.size(); ++i) {
    cohort[i].sos = sos[i];
  }

  ApplyConnectivity(cohort, games);
  NormalizeByComponent(cohort, games);
  ShrinkLowSample(cohort);
  AssignSosRank(cohort);
}

void SosEngine::ApplyConnectivity(std::vector<model::TeamCohortStat>& cohort, const std::vector<const PreparedGame*>& games) const {
  const auto&          cfg = settings_.sos;
  ConnectivityAnalyzer analyzer(cfg, directory_);
  const bool           active  = analyzer.Active();
  const auto           per_row = GamesPerRow(cohort, games);

  for (std::size_t i = 0; i < cohort.size(); ++i) {
    auto& t   = cohort[i];
    t.sos_raw = t.sos;

    const auto c         = analyzer.Analyze(t.team_id, per_row[i]);
    t.scf                = c.scf;
    t.bridge_games       = c.bridge_games;
    t.unique_opp_states  = c.unique_opp_states;
    t.unique_opp_regions = c.unique_opp_regions;
    t.is_isolated        = c.is_isolated;
    if (!active) continue;

    double s = t.sos;
    if (t.is_isolated && cfg.pagerank_dampening_enabled) {
      s = cfg.pagerank_alpha * s + (1.0 - cfg.pagerank_alpha) * kNeutralSos;
    }
    s = kNeutralSos + t.scf * (s - kNeutralSos);
    if (t.bridge_games < cfg.min_bridge_games) {
      s = std::min(s, cfg.isolation_sos_cap);
    }
    t.sos = Clip(s, 0.0, 1.0);
  }
}

void SosEngine::NormalizeByComponent(std::vector<model::TeamCohortStat>& cohort, const std::vector<const PreparedGame*>& games) const {
  // Cohort rows take node ids 0..n-1; outside opponents are appended.
  std::map<std::string, std::size_t> nodes;
  for (std::size_t i = 0; i < cohort.size(); ++i) {
    nodes.emplace(cohort[i].team_id, i);
  }
  std::vector<std::pair<std::size_t, std::size_t>> edges;
  for (const auto* p : games) {
    auto team = nodes.find(p->game.team_id);
    if (team == nodes.end()) continue;
    auto [opp, inserted] = nodes.emplace(p->game.opponent_id, nodes.size());
    edges.emplace_back(team->second, opp->second);
  }

  UnionFind uf(nodes.size());
  for (const auto& [a, b] : edges) {
    uf.Union(a, b);
  }

  std::map<std::size_t, std::vector<std::size_t>> members;
  std::map<std::size_t, int>                      component_ids;
  for (std::size_t i = 0; i < cohort.size(); ++i) {
    const auto root = uf.Find(i);
    if (!component_ids.count(root)) {
      const int next      = static_cast<int>(component_ids.size());
      component_ids[root] = next;
    }
    members[root].push_back(i);
  }

  const double threshold = static_cast<double>(settings_.sos.min_component_size_for_full_sos);
  for (const auto& [root, rows] : members) {
    std::vector<double> values;
    values.reserve(rows.size());
    for (auto i : rows) {
      values.push_back(cohort[i].sos);
    }

    const auto   norm = SpanPercentileNorm(values);
    const double m    = static_cast<double>(rows.size());
    for (std::size_t k = 0; k < rows.size(); ++k) {
      auto&  t = cohort[rows[k]];
      double v = norm[k];
      if (m < threshold) {
        v = kNeutralSos + (m / threshold) * (v - kNeutralSos);
      }
      t.sos_norm       = Clip(v, 0.0, 1.0);
      t.component_id   = component_ids[root];
      t.component_size = static_cast<int>(rows.size());
    }
  }
}

void SosEngine::ShrinkLowSample(std::vector<model::TeamCohortStat>& cohort) const {
  const int min_games = settings_.sos.min_games_for_top_sos;
  for (auto& t : cohort) {
    if (t.games_played >= min_games) {
      t.sample_flag = model::SampleFlag::kOk;
      continue;
    }
    const double f = static_cast<double>(t.games_played) / static_cast<double>(min_games);
    t.sample_flag  = model::SampleFlag::kLowSample;
    t.sos_norm     = Clip(kNeutralSos + f * f * (t.sos_norm - kNeutralSos), 0.0, 1.0);
  }
}

void SosEngine::AssignSosRank(std::vector<model::TeamCohortStat>& cohort) const {
  std::vector<std::size_t> eligible;
  std::vector<double>      values;
  for (std::size_t i = 0; i < cohort.size(); ++i) {
    cohort[i].sos_rank.reset();
    if (cohort[i].games_played >= settings_.sos.min_games_for_sos_rank) {
      eligible.push_back(i);
      values.push_back(cohort[i].sos_norm);
    }
  }

  const auto ranks = MinRanksDescending(values);
  for (std::size_t k = 0; k < eligible.size(); ++k) {
    cohort[eligible[k]].sos_rank = ranks[k];
  }
}

} // namespace powerscore::rating
