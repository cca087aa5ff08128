#include "team_cohort_stat.hpp"

namespace powerscore::model {

std::string_view ToString(TeamStatus status) {
  switch (status) {
    case TeamStatus::kActive:
      return "Active";
    case TeamStatus::kInactive:
      return "Inactive";
    case TeamStatus::kNotEnoughRankedGames:
      return "Not Enough Ranked Games";
  }
  return "Unknown";
}

std::string_view ToString(SampleFlag flag) {
  return flag == SampleFlag::kLowSample ? "LOW_SAMPLE" : "OK";
}

std::optional<TeamStatus> ParseTeamStatus(std::string_view text) {
  if (text == "Active") return TeamStatus::kActive;
  if (text == "Inactive") return TeamStatus::kInactive;
  if (text == "Not Enough Ranked Games") return TeamStatus::kNotEnoughRankedGames;
  return std::nullopt;
}

} // namespace powerscore::model
