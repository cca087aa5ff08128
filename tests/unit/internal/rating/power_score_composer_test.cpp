#include "internal/rating/power_score_composer.hpp"

#include <cassert>
#include <cmath>
#include <iostream>
#include <string>
#include <vector>

#include "internal/util/date.hpp"

namespace {

using powerscore::model::TeamCohortStat;
using powerscore::model::TeamStatus;
using powerscore::rating::PowerScoreComposer;
using powerscore::rating::RankActive;
using powerscore::rating::Settings;
using powerscore::util::AddDays;
using powerscore::util::ParseDateOrThrow;

const auto kToday = ParseDateOrThrow("2025-06-01");

bool Near(double a, double b, double eps = 1e-9) {
  return std::fabs(a - b) < eps;
}

TeamCohortStat Team(const std::string& id, double off, double def, double sos, int games = 20) {
  TeamCohortStat t;
  t.team_id             = id;
  t.age                 = 14;
  t.gender              = "male";
  t.off_norm            = off;
  t.def_norm            = def;
  t.sos_norm            = sos;
  t.sos                 = sos;
  t.games_played        = games;
  t.games_last_180_days = games;
  t.last_game           = AddDays(kToday, -3);
  return t;
}

void TestProvisionalMultiplierSteps() {
  auto               settings = Settings::Defaults();
  PowerScoreComposer composer(settings, kToday);

  assert(Near(composer.ProvisionalMultiplier(0), settings.power.provisional_low_mult));
  assert(Near(composer.ProvisionalMultiplier(4), settings.power.provisional_low_mult));
  assert(Near(composer.ProvisionalMultiplier(5), settings.power.provisional_mid_mult));
  assert(Near(composer.ProvisionalMultiplier(14), settings.power.provisional_mid_mult));
  assert(Near(composer.ProvisionalMultiplier(15), 1.0));
}

void TestScoreComposition() {
  auto settings = Settings::Defaults();

  std::vector<TeamCohortStat> cohort = {Team("A", 0.8, 0.6, 0.5)};
  cohort[0].perf_centered            = 0.2;
  PowerScoreComposer(settings, kToday).Apply(cohort);

  const auto&  p    = settings.power;
  const double core = p.off_weight * 0.8 + p.def_weight * 0.6 + p.sos_weight * 0.5 + p.perf_blend_weight * 0.2;
  assert(Near(cohort[0].powerscore_core, core));
  assert(Near(cohort[0].powerscore_adj, core));
  assert(Near(cohort[0].power_score_final, core * p.AnchorFor(14)));
  assert(cohort[0].power_score_final <= p.AnchorFor(14));
  assert(cohort[0].rank_in_cohort == 1);
}

void TestStatusRules() {
  auto               settings = Settings::Defaults();
  PowerScoreComposer composer(settings, kToday);

  auto stale      = Team("A", 0.5, 0.5, 0.5);
  stale.last_game = AddDays(kToday, -settings.window.inactive_hide_days);
  assert(composer.StatusFor(stale) == TeamStatus::kInactive);

  auto none                = Team("B", 0.5, 0.5, 0.5);
  none.games_last_180_days = 0;
  assert(composer.StatusFor(none) == TeamStatus::kInactive);

  auto thin = Team("C", 0.5, 0.5, 0.5, 3);
  assert(composer.StatusFor(thin) == TeamStatus::kNotEnoughRankedGames);

  assert(composer.StatusFor(Team("D", 0.5, 0.5, 0.5)) == TeamStatus::kActive);
}

void TestOnlyActiveTeamsAreRanked() {
  auto settings = Settings::Defaults();

  auto                        thin   = Team("C", 1.0, 1.0, 1.0, 3);
  std::vector<TeamCohortStat> cohort = {Team("A", 0.4, 0.4, 0.4), Team("B", 0.6, 0.6, 0.6), thin};
  PowerScoreComposer(settings, kToday).Apply(cohort);

  assert(cohort[0].rank_in_cohort == 2);
  assert(cohort[1].rank_in_cohort == 1);
  assert(!cohort[2].rank_in_cohort);
  assert(Near(cohort[2].provisional_mult, settings.power.provisional_low_mult));
}

void TestTieBreakBySosThenTeamId() {
  std::vector<TeamCohortStat> cohort = {Team("C", 0.5, 0.5, 0.5), Team("B", 0.5, 0.5, 0.5), Team("A", 0.5, 0.5, 0.4)};
  std::vector<double>         scores = {0.7, 0.7, 0.7};

  auto ranks = RankActive(cohort, scores);
  assert(ranks[1] == 1);
  assert(ranks[0] == 2);
  assert(ranks[2] == 3);
}

} // namespace

int main() {
  TestProvisionalMultiplierSteps();
  TestScoreComposition();
  TestStatusRules();
  TestOnlyActiveTeamsAreRanked();
  TestTieBreakBySosThenTeamId();

  std::cout << "power_score_composer_test: pass\n";
  return 0;
}
