#include "game_validator.hpp"

#include <algorithm>
#include <cctype>
#include <numeric>
#include <string>

#include "internal/observability/logging.hpp"
#include "internal/util/date.hpp"

namespace powerscore::ingest {

namespace {

std::string NormalizeGender(const std::string& raw) {
  auto begin = std::find_if_not(raw.begin(), raw.end(), [](unsigned char c) { return std::isspace(c); });
  auto end   = std::find_if_not(raw.rbegin(), raw.rend(), [](unsigned char c) { return std::isspace(c); }).base();

  std::string out;
  if (begin < end) {
    out.assign(begin, end);
  }
  std::transform(out.begin(), out.end(), out.begin(), [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  return out;
}

void Count(IngestReport& report, SkipReason reason) {
  ++report.skipped[static_cast<std::size_t>(reason)];
}

} // namespace

std::string_view ToString(SkipReason reason) {
  switch (reason) {
    case SkipReason::kNoScore:
      return "no_score";
    case SkipReason::kBadDate:
      return "bad_date";
    case SkipReason::kEmptyTeamId:
      return "empty_team_id";
    case SkipReason::kSelfPlay:
      return "self_play";
    case SkipReason::kMissingCohort:
      return "missing_cohort";
  }
  return "unknown";
}

std::size_t IngestReport::TotalSkipped() const {
  return std::accumulate(skipped.begin(), skipped.end(), std::size_t{0});
}

std::optional<model::GameRecord> GameValidator::Convert(const db::model::GameRow& row, SkipReason& reason) {
  if (!row.goals_for || !row.goals_against) {
    reason = SkipReason::kNoScore;
    return std::nullopt;
  }

  auto date = util::ParseDate(row.date);
  if (!date) {
    reason = SkipReason::kBadDate;
    return std::nullopt;
  }

  if (row.team_id.empty() || row.opponent_id.empty()) {
    reason = SkipReason::kEmptyTeamId;
    return std::nullopt;
  }

  if (row.team_id == row.opponent_id) {
    reason = SkipReason::kSelfPlay;
    return std::nullopt;
  }

  std::string gender = row.gender ? NormalizeGender(*row.gender) : std::string{};
  if (!row.age || gender.empty()) {
    reason = SkipReason::kMissingCohort;
    return std::nullopt;
  }

  model::GameRecord game;
  game.game_id     = row.game_id;
  game.date        = *date;
  game.team_id     = row.team_id;
  game.opponent_id = row.opponent_id;
  game.age         = *row.age;
  game.gender      = gender;

  game.opponent_age = row.opponent_age.value_or(*row.age);
  if (row.opponent_gender) {
    game.opponent_gender = NormalizeGender(*row.opponent_gender);
  }
  if (game.opponent_gender.empty()) {
    game.opponent_gender = gender;
  }

  game.goals_for     = *row.goals_for;
  game.goals_against = *row.goals_against;
  game.is_home       = row.home_team_id && *row.home_team_id == row.team_id;
  game.provider      = row.provider;
  return game;
}

std::vector<model::GameRecord> GameValidator::Validate(const std::vector<db::model::GameRow>& rows, IngestReport& report) {
  std::vector<model::GameRecord> out;
  out.reserve(rows.size());

  report.rows_in += rows.size();
  for (const auto& row : rows) {
    SkipReason reason = SkipReason::kNoScore;
    if (auto game = Convert(row, reason)) {
      out.push_back(std::move(*game));
      ++report.rows_accepted;
    } else {
      Count(report, reason);
    }
  }

  if (report.TotalSkipped() > 0) {
    POWERSCORE_LOG_WARN("ingest skipped incomplete rows",
                        {observability::IntField("skipped", static_cast<std::int64_t>(report.TotalSkipped())),
                         observability::IntField("no_score", static_cast<std::int64_t>(report.SkippedFor(SkipReason::kNoScore))),
                         observability::IntField("bad_date", static_cast<std::int64_t>(report.SkippedFor(SkipReason::kBadDate))),
                         observability::IntField("empty_team_id", static_cast<std::int64_t>(report.SkippedFor(SkipReason::kEmptyTeamId))),
                         observability::IntField("self_play", static_cast<std::int64_t>(report.SkippedFor(SkipReason::kSelfPlay))),
                         observability::IntField("missing_cohort",
                                                 static_cast<std::int64_t>(report.SkippedFor(SkipReason::kMissingCohort)))});
  }
  return out;
}

} // namespace powerscore::ingest
