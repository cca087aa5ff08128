#include "team_maps.hpp"

#include <algorithm>
#include <tuple>

namespace powerscore::rating {

TeamValueMap BuildTeamValueMap(const std::vector<model::TeamCohortStat>& teams, double model::TeamCohortStat::*field) {
  TeamValueMap               out;
  std::map<std::string, int> games;

  for (const auto& t : teams) {
    auto it = games.find(t.team_id);
    if (it != games.end() && it->second >= t.games_played) {
      continue;
    }
    games[t.team_id] = t.games_played;
    out[t.team_id]   = t.*field;
  }
  return out;
}

double LookupOr(const TeamValueMap& map, const std::string& team_id, double fallback) {
  auto it = map.find(team_id);
  return it == map.end() ? fallback : it->second;
}

double MeanValue(const TeamValueMap& map) {
  if (map.empty()) return 0.0;
  double sum = 0.0;
  for (const auto& [id, value] : map) {
    sum += value;
  }
  return sum / static_cast<double>(map.size());
}

std::map<model::CohortKey, std::vector<std::size_t>> GroupByCohort(const std::vector<model::TeamCohortStat>& teams) {
  std::map<model::CohortKey, std::vector<std::size_t>> out;
  for (std::size_t i = 0; i < teams.size(); ++i) {
    out[teams[i].Cohort()].push_back(i);
  }
  return out;
}

void SortTable(std::vector<model::TeamCohortStat>& teams) {
  std::sort(teams.begin(), teams.end(), [](const auto& a, const auto& b) {
    return std::tie(a.team_id, a.age, a.gender) < std::tie(b.team_id, b.age, b.gender);
  });
}

} // namespace powerscore::rating
