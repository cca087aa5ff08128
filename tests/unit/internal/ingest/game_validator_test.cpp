#include "internal/ingest/game_validator.hpp"

#include <cassert>
#include <iostream>
#include <vector>

#include "internal/util/date.hpp"

namespace {

using powerscore::db::model::GameRow;
using powerscore::ingest::GameValidator;
using powerscore::ingest::IngestReport;
using powerscore::ingest::SkipReason;

GameRow CompleteRow() {
  GameRow row;
  row.game_id       = "g1";
  row.date          = "2025-03-01";
  row.team_id       = "A";
  row.opponent_id   = "B";
  row.age           = 14;
  row.gender        = " Male ";
  row.goals_for     = 3;
  row.goals_against = 1;
  row.provider      = "gotsport";
  return row;
}

void TestCompleteRowConverts() {
  auto row         = CompleteRow();
  row.home_team_id = "A";

  SkipReason reason = SkipReason::kNoScore;
  auto       game   = GameValidator::Convert(row, reason);
  assert(game);
  assert(game->gender == "male");
  assert(game->date == *powerscore::util::ParseDate("2025-03-01"));
  assert(game->is_home);
  assert(game->goals_for == 3 && game->goals_against == 1);
  assert(game->provider == "gotsport");
}

void TestOpponentCohortFallsBackToTeam() {
  auto row            = CompleteRow();
  row.opponent_gender = std::string("  ");

  SkipReason reason = SkipReason::kNoScore;
  auto       game   = GameValidator::Convert(row, reason);
  assert(game);
  assert(game->opponent_age == 14);
  assert(game->opponent_gender == "male");
  assert(!game->is_home);
}

void TestIncompleteRowsAreSkippedAndCounted() {
  std::vector<GameRow> rows;
  rows.push_back(CompleteRow());

  auto no_score      = CompleteRow();
  no_score.goals_for = std::nullopt;
  rows.push_back(no_score);

  auto bad_date = CompleteRow();
  bad_date.date = "2025-13-40";
  rows.push_back(bad_date);

  auto empty_team    = CompleteRow();
  empty_team.team_id = "";
  rows.push_back(empty_team);

  auto self_play        = CompleteRow();
  self_play.opponent_id = "A";
  rows.push_back(self_play);

  auto no_gender   = CompleteRow();
  no_gender.gender = std::nullopt;
  rows.push_back(no_gender);

  auto no_age = CompleteRow();
  no_age.age  = std::nullopt;
  rows.push_back(no_age);

  IngestReport report;
  auto         games = GameValidator::Validate(rows, report);

  assert(games.size() == 1);
  assert(report.rows_in == 7);
  assert(report.rows_accepted == 1);
  assert(report.SkippedFor(SkipReason::kNoScore) == 1);
  assert(report.SkippedFor(SkipReason::kBadDate) == 1);
  assert(report.SkippedFor(SkipReason::kEmptyTeamId) == 1);
  assert(report.SkippedFor(SkipReason::kSelfPlay) == 1);
  assert(report.SkippedFor(SkipReason::kMissingCohort) == 2);
  assert(report.TotalSkipped() == 6);
}

void TestZeroZeroDrawIsKept() {
  auto row          = CompleteRow();
  row.goals_for     = 0;
  row.goals_against = 0;

  IngestReport report;
  auto         games = GameValidator::Validate({row}, report);
  assert(games.size() == 1);
  assert(report.TotalSkipped() == 0);
}

} // namespace

int main() {
  TestCompleteRowConverts();
  TestOpponentCohortFallsBackToTeam();
  TestIncompleteRowsAreSkippedAndCounted();
  TestZeroZeroDrawIsKept();

  std::cout << "game_validator_test: pass\n";
  return 0;
}
