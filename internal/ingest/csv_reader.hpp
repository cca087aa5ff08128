#pragma once

#include <istream>
#include <string>
#include <vector>

#include "internal/db/model/game_row.hpp"
#include "internal/db/model/team_record.hpp"

namespace powerscore::ingest {

/*
  CSV import for the admin CLI.

  Columns are matched by header name, so order is free and extra
  columns are ignored. Empty or non-numeric cells become empty
  optionals and are judged later by GameValidator.

  Game header: game_id,date,team_id,opponent_id,age,gender,
               opponent_age,opponent_gender,goals_for,goals_against
               [,home_team_id][,provider]
  Team header: team_id,state_code
*/

std::vector<std::string> SplitCsvLine(const std::string& line);

// Throws util::InvalidArgument when a required column is missing.
std::vector<db::model::GameRow>    ReadGameRows(std::istream& in);
std::vector<db::model::TeamRecord> ReadTeamRecords(std::istream& in);

// Throws util::NotFound when the file cannot be opened.
std::vector<db::model::GameRow>    ReadGameRowsFromFile(const std::string& path);
std::vector<db::model::TeamRecord> ReadTeamRecordsFromFile(const std::string& path);

} // namespace powerscore::ingest
