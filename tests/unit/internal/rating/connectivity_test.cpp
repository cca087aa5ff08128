#include "internal/rating/connectivity.hpp"

#include <cassert>
#include <cmath>
#include <iostream>
#include <string>
#include <vector>

namespace {

using powerscore::rating::ConnectivityAnalyzer;
using powerscore::rating::PreparedGame;
using powerscore::rating::Settings;
using powerscore::rating::TeamDirectory;

bool Near(double a, double b, double eps = 1e-9) {
  return std::fabs(a - b) < eps;
}

std::vector<PreparedGame> Schedule(const std::string& team, const std::vector<std::string>& opponents) {
  std::vector<PreparedGame> out;
  for (const auto& opp : opponents) {
    PreparedGame p;
    p.game.game_id     = team + "-" + opp;
    p.game.team_id     = team;
    p.game.opponent_id = opp;
    out.push_back(p);
  }
  return out;
}

std::vector<const PreparedGame*> Pointers(const std::vector<PreparedGame>& games) {
  std::vector<const PreparedGame*> out;
  for (const auto& g : games) out.push_back(&g);
  return out;
}

void TestFourRegionScheduleBeatsSingleRegion() {
  auto                settings  = Settings::Defaults();
  const TeamDirectory directory = {{"T", "CA"},  {"NY1", "NY"}, {"TX1", "TX"}, {"FL1", "FL"},
                                   {"IL1", "IL"}, {"CA1", "CA"}, {"CA2", "CA"}, {"CA3", "CA"}};
  ConnectivityAnalyzer analyzer(settings.sos, directory);
  assert(analyzer.Active());

  const auto wide  = Schedule("T", {"NY1", "TX1", "FL1", "IL1"});
  const auto local = Schedule("T", {"CA1", "CA2", "CA3", "CA1"});

  auto spread = analyzer.Analyze("T", Pointers(wide));
  auto bubble = analyzer.Analyze("T", Pointers(local));

  assert(spread.unique_opp_states == 4);
  assert(spread.unique_opp_regions == 4);
  assert(spread.bridge_games == 4);
  assert(!spread.is_isolated);
  assert(Near(spread.scf, 1.0));

  assert(bubble.unique_opp_states == 1);
  assert(bubble.unique_opp_regions == 1);
  assert(bubble.bridge_games == 0);
  assert(bubble.is_isolated);
  assert(Near(bubble.scf, settings.sos.scf_floor));
  assert(spread.scf > bubble.scf);
}

void TestBridgeGamesCountOutOfStateOpponents() {
  auto                settings  = Settings::Defaults();
  const TeamDirectory directory = {{"T", "CA"}, {"CA1", "CA"}, {"NV1", "NV"}, {"OR1", "OR"}};
  ConnectivityAnalyzer analyzer(settings.sos, directory);

  // one bridge game, unknown opponent ignored
  auto one = analyzer.Analyze("T", Pointers(Schedule("T", {"CA1", "NV1", "UNKNOWN"})));
  assert(one.bridge_games == 1);
  assert(one.unique_opp_states == 2);
  assert(one.is_isolated);

  auto two = analyzer.Analyze("T", Pointers(Schedule("T", {"CA1", "NV1", "OR1"})));
  assert(two.bridge_games == 2);
  assert(two.unique_opp_states == 3);
  assert(two.unique_opp_regions == 2);
  assert(!two.is_isolated);
  assert(Near(two.scf, 1.0));
}

void TestUnknownHomeStateCountsEveryKnownOpponent() {
  auto                settings  = Settings::Defaults();
  const TeamDirectory directory = {{"CA1", "CA"}, {"CA2", "CA"}};
  ConnectivityAnalyzer analyzer(settings.sos, directory);

  auto c = analyzer.Analyze("T", Pointers(Schedule("T", {"CA1", "CA2"})));
  assert(c.bridge_games == 2);
  assert(c.unique_opp_states == 1);
  assert(c.is_isolated);
}

void TestInactiveWithoutDirectory() {
  auto                settings = Settings::Defaults();
  const TeamDirectory empty;
  ConnectivityAnalyzer analyzer(settings.sos, empty);
  assert(!analyzer.Active());

  auto c = analyzer.Analyze("T", Pointers(Schedule("T", {"A", "B"})));
  assert(Near(c.scf, 1.0));
  assert(!c.is_isolated);

  settings.sos.scf_enabled = false;
  const TeamDirectory  directory = {{"T", "CA"}};
  ConnectivityAnalyzer disabled(settings.sos, directory);
  assert(!disabled.Active());
}

} // namespace

int main() {
  TestFourRegionScheduleBeatsSingleRegion();
  TestBridgeGamesCountOutOfStateOpponents();
  TestUnknownHomeStateCountsEveryKnownOpponent();
  TestInactiveWithoutDirectory();

  std::cout << "connectivity_test: pass\n";
  return 0;
}
