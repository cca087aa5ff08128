#pragma once

#include <cstddef>
#include <map>
#include <string>
#include <vector>

#include "internal/model/cohort_key.hpp"
#include "internal/model/team_cohort_stat.hpp"

namespace powerscore::rating {

/*
  Read-only team_id -> value lookups shared across cohort stages.

  A team listed in several cohorts contributes the row with the most
  games (first in table order on a tie), so one id maps to one value.
*/
using TeamValueMap = std::map<std::string, double>;

TeamValueMap BuildTeamValueMap(const std::vector<model::TeamCohortStat>& teams, double model::TeamCohortStat::*field);

double LookupOr(const TeamValueMap& map, const std::string& team_id, double fallback);

double MeanValue(const TeamValueMap& map);

// Row indices per cohort, in table order.
std::map<model::CohortKey, std::vector<std::size_t>> GroupByCohort(const std::vector<model::TeamCohortStat>& teams);

// Stable table order used by every stage: team_id, age, gender.
void SortTable(std::vector<model::TeamCohortStat>& teams);

} // namespace powerscore::rating
