#pragma once

#include <map>
#include <string>
#include <vector>

#include "internal/rating/feature_aggregator.hpp"
#include "internal/rating/settings.hpp"

namespace powerscore::rating {

// team_id -> two-letter state code, from the teams table.
using TeamDirectory = std::map<std::string, std::string>;

struct Connectivity {
  double scf                = 1.0;
  int    bridge_games       = 0;
  int    unique_opp_states  = 0;
  int    unique_opp_regions = 0;
  bool   is_isolated        = false;
};

/*
  Schedule connectivity factor.

  Measures how far a team's schedule reaches outside its home state.
  A closed regional bubble (teams only playing each other) gets a low
  factor, which later pulls its SOS toward neutral.
*/
class ConnectivityAnalyzer {
 public:
  ConnectivityAnalyzer(const Settings::Sos& settings, const TeamDirectory& directory);

  // False when SCF is disabled or there is no directory to read states from.
  bool Active() const;

  // `games` are one team's games; opponent states come from the directory.
  Connectivity Analyze(const std::string& team_id, const std::vector<const PreparedGame*>& games) const;

 private:
  const Settings::Sos& settings_;
  const TeamDirectory& directory_;
};

} // namespace powerscore::rating
