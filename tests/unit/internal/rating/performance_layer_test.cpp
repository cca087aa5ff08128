#include "internal/rating/performance_layer.hpp"

#include <cassert>
#include <cmath>
#include <iostream>
#include <string>
#include <vector>

namespace {

using powerscore::model::TeamCohortStat;
using powerscore::rating::PerformanceLayer;
using powerscore::rating::PreparedGame;
using powerscore::rating::Settings;
using powerscore::rating::TeamValueMap;

bool Near(double a, double b, double eps = 1e-9) {
  return std::fabs(a - b) < eps;
}

PreparedGame Game(const std::string& team, const std::string& opp, double gd, int rank_recency = 1, double weight = 1.0) {
  PreparedGame p;
  p.game.team_id     = team;
  p.game.opponent_id = opp;
  p.goal_diff        = gd;
  p.rank_recency     = rank_recency;
  p.weight           = weight;
  return p;
}

TeamCohortStat Team(const std::string& id) {
  TeamCohortStat t;
  t.team_id = id;
  return t;
}

void TestSmallDeltasAreIgnored() {
  auto         settings = Settings::Defaults();
  TeamValueMap power    = {{"A", 0.6}, {"B", 0.4}};
  TeamValueMap strength = power;

  PerformanceLayer layer(settings, power, strength);

  // expected margin 5 * 0.2 = 1, actual 2: |delta| = 1 < threshold 2
  assert(Near(layer.GameContribution(Game("A", "B", 2.0)), 0.0));
}

void TestOverperformanceContributes() {
  auto         settings = Settings::Defaults();
  TeamValueMap power    = {{"A", 0.5}, {"B", 0.5}};
  TeamValueMap strength = {{"A", 0.7}, {"B", 0.5}};

  PerformanceLayer layer(settings, power, strength);

  const auto&  cfg      = settings.performance;
  const double k        = cfg.adaptive_k_alpha * (1.0 + cfg.adaptive_k_beta * 0.2);
  const double expected = cfg.perf_game_scale * 4.0 * k * 0.5;
  assert(Near(layer.GameContribution(Game("A", "B", 4.0, 1, 0.5)), expected));

  // older games decay
  const double older = layer.GameContribution(Game("A", "B", 4.0, 3, 0.5));
  assert(Near(older, expected * std::exp(-cfg.decay_rate * 2.0)));

  assert(layer.GameContribution(Game("A", "B", -4.0)) < 0.0);
}

void TestCenteredWithinCohort() {
  auto         settings = Settings::Defaults();
  TeamValueMap power    = {{"A", 0.5}, {"B", 0.5}, {"C", 0.5}};
  TeamValueMap strength = power;

  std::vector<TeamCohortStat> cohort = {Team("A"), Team("B"), Team("C")};
  std::vector<PreparedGame>   games  = {Game("A", "B", 5.0), Game("B", "A", -5.0), Game("C", "A", 0.0)};

  std::vector<const PreparedGame*> ptrs;
  for (const auto& g : games) ptrs.push_back(&g);

  PerformanceLayer(settings, power, strength).Apply(cohort, ptrs);
  assert(cohort[0].perf_raw > 0.0);
  assert(cohort[1].perf_raw < 0.0);
  assert(Near(cohort[0].perf_centered, 1.0 - 0.5));
  assert(Near(cohort[1].perf_centered, 1.0 / 3.0 - 0.5));
  assert(Near(cohort[2].perf_centered, 2.0 / 3.0 - 0.5));
}

void TestSingleTeamCohortIsZero() {
  auto         settings = Settings::Defaults();
  TeamValueMap power;
  TeamValueMap strength;

  std::vector<TeamCohortStat>      cohort = {Team("A")};
  std::vector<PreparedGame>        games  = {Game("A", "X", 8.0)};
  std::vector<const PreparedGame*> ptrs   = {&games[0]};

  PerformanceLayer(settings, power, strength).Apply(cohort, ptrs);
  assert(cohort[0].perf_raw > 0.0);
  assert(Near(cohort[0].perf_centered, 0.0));
}

} // namespace

int main() {
  TestSmallDeltasAreIgnored();
  TestOverperformanceContributes();
  TestCenteredWithinCohort();
  TestSingleTeamCohortIsZero();

  std::cout << "performance_layer_test: pass\n";
  return 0;
}
