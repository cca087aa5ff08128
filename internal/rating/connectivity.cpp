#include "connectivity.hpp"

#include <algorithm>
#include <set>
#include <string_view>

#include "internal/model/regions.hpp"

namespace powerscore::rating {

namespace {

std::string_view StateOf(const TeamDirectory& directory, const std::string& team_id) {
  auto it = directory.find(team_id);
  if (it == directory.end()) return {};
  return it->second;
}

} // namespace

ConnectivityAnalyzer::ConnectivityAnalyzer(const Settings::Sos& settings, const TeamDirectory& directory)
    : settings_(settings), directory_(directory) {
}

bool ConnectivityAnalyzer::Active() const {
  return settings_.scf_enabled && !directory_.empty();
}

Connectivity ConnectivityAnalyzer::Analyze(const std::string& team_id, const std::vector<const PreparedGame*>& games) const {
  Connectivity out;
  if (!Active()) return out;

  const auto home_state = StateOf(directory_, team_id);

  std::set<std::string_view> states;
  std::set<std::string_view> regions;
  for (const auto* p : games) {
    const auto opp_state = StateOf(directory_, p->game.opponent_id);
    if (opp_state.empty()) continue;

    states.insert(opp_state);
    if (auto region = model::RegionForState(opp_state)) {
      regions.insert(*region);
    }
    if (opp_state != home_state) {
      ++out.bridge_games;
    }
  }

  out.unique_opp_states  = static_cast<int>(states.size());
  out.unique_opp_regions = static_cast<int>(regions.size());

  const double diversity = std::min(static_cast<double>(out.unique_opp_states) / settings_.scf_diversity_divisor, 1.0);
  const double region_bonus =
      out.unique_opp_regions > 1 ? std::min(static_cast<double>(out.unique_opp_regions - 1) * 0.1, 0.2) : 0.0;

  out.scf         = std::clamp(diversity + region_bonus, settings_.scf_floor, 1.0);
  out.is_isolated = out.bridge_games < settings_.min_bridge_games || out.unique_opp_states < settings_.scf_min_unique_states;
  return out;
}

} // namespace powerscore::rating
