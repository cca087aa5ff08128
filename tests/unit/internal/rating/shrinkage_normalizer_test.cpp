#include "internal/rating/shrinkage_normalizer.hpp"

#include <cassert>
#include <cmath>
#include <iostream>
#include <string>
#include <vector>

#include "internal/util/date.hpp"

namespace {

using powerscore::model::TeamCohortStat;
using powerscore::rating::PreparedGame;
using powerscore::rating::Settings;
using powerscore::rating::ShrinkageNormalizer;

bool Near(double a, double b, double eps = 1e-9) {
  return std::fabs(a - b) < eps;
}

TeamCohortStat Team(const std::string& id, double off, double sad, int games) {
  TeamCohortStat t;
  t.team_id      = id;
  t.age          = 14;
  t.gender       = "male";
  t.off_raw      = off;
  t.sad_raw      = sad;
  t.games_played = games;
  return t;
}

void TestSingleTeamCohortIsMidpoint() {
  auto settings = Settings::Defaults();

  std::vector<TeamCohortStat> teams = {Team("A", 4.0, 0.0, 20)};
  ShrinkageNormalizer(settings).Apply(teams);

  assert(Near(teams[0].off_norm, 0.5));
  assert(Near(teams[0].def_norm, 0.5));
  assert(Near(teams[0].power_presos, 0.5));
  assert(Near(teams[0].abs_strength, 0.5 * settings.power.AnchorFor(14)));
}

void TestShrinkPullsSmallSamplesToMean() {
  auto settings                 = Settings::Defaults();
  settings.shrinkage.shrink_tau = 8.0;

  std::vector<TeamCohortStat> teams = {Team("A", 4.0, 1.0, 8), Team("B", 0.0, 1.0, 8)};
  ShrinkageNormalizer(settings).Apply(teams);

  // w = 8/16, cohort mean 2.0
  assert(Near(teams[0].off_shrunk, 3.0));
  assert(Near(teams[1].off_shrunk, 1.0));
  assert(Near(teams[0].def_shrunk, 1.0 / (1.0 + settings.shrinkage.ridge_ga)));
  assert(teams[0].off_norm > teams[1].off_norm);
  assert(Near(teams[0].def_norm, teams[1].def_norm));
}

void TestCohortsNormalizeIndependently() {
  auto settings = Settings::Defaults();

  auto older = Team("C", 0.1, 5.0, 10);
  older.age  = 16;

  std::vector<TeamCohortStat> teams = {Team("A", 3.0, 1.0, 10), Team("B", 1.0, 2.0, 10), older};
  ShrinkageNormalizer(settings).Apply(teams);

  assert(Near(teams[0].off_norm, 1.0));
  assert(Near(teams[1].off_norm, 0.5));
  assert(Near(teams[2].off_norm, 0.5));
  assert(Near(teams[2].anchor, settings.power.AnchorFor(16)));
}

PreparedGame Prepared(const std::string& team, const std::string& opp, double gf, double ga) {
  PreparedGame p;
  p.game.game_id       = team + opp;
  p.game.date          = powerscore::util::ParseDateOrThrow("2025-05-01");
  p.game.team_id       = team;
  p.game.opponent_id   = opp;
  p.game.age           = 14;
  p.game.gender        = "male";
  p.game.goals_for     = static_cast<int>(gf);
  p.game.goals_against = static_cast<int>(ga);
  p.goals_for          = gf;
  p.goals_against      = ga;
  p.weight             = 1.0;
  return p;
}

void TestOpponentAdjustmentRewardsGoalsAgainstStrongTeams() {
  auto settings = Settings::Defaults();
  auto today    = powerscore::util::ParseDateOrThrow("2025-06-01");

  // A and B score the same, but A does it against the strong team.
  std::vector<TeamCohortStat> teams = {Team("A", 2.0, 1.0, 1), Team("B", 2.0, 1.0, 1), Team("S", 1.0, 1.0, 1),
                                       Team("W", 1.0, 1.0, 1)};
  teams[0].abs_strength = 0.5;
  teams[1].abs_strength = 0.5;
  teams[2].abs_strength = 0.9;
  teams[3].abs_strength = 0.1;

  std::vector<PreparedGame> games = {Prepared("A", "S", 2, 1), Prepared("B", "W", 2, 1), Prepared("S", "A", 1, 2),
                                     Prepared("W", "B", 1, 2)};

  auto adjusted = ShrinkageNormalizer(settings).AdjustForOpponents(games, teams, today);
  assert(adjusted.size() == 4);
  assert(adjusted[0].team_id == "A");
  assert(adjusted[1].team_id == "B");
  assert(adjusted[0].off_raw > adjusted[1].off_raw);
  assert(adjusted[0].sad_raw < adjusted[1].sad_raw);
  assert(adjusted[0].power_presos > adjusted[1].power_presos);
}

} // namespace

int main() {
  TestSingleTeamCohortIsMidpoint();
  TestShrinkPullsSmallSamplesToMean();
  TestCohortsNormalizeIndependently();
  TestOpponentAdjustmentRewardsGoalsAgainstStrongTeams();

  std::cout << "shrinkage_normalizer_test: pass\n";
  return 0;
}
