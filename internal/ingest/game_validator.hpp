#pragma once

#include <array>
#include <cstddef>
#include <optional>
#include <string_view>
#include <vector>

#include "internal/db/model/game_row.hpp"
#include "internal/model/game_record.hpp"

namespace powerscore::ingest {

enum class SkipReason {
  kNoScore,
  kBadDate,
  kEmptyTeamId,
  kSelfPlay,
  kMissingCohort,
};

inline constexpr std::size_t kSkipReasonCount = 5;

std::string_view ToString(SkipReason reason);

struct IngestReport {
  std::size_t rows_in       = 0;
  std::size_t rows_accepted = 0;

  std::array<std::size_t, kSkipReasonCount> skipped{};

  std::size_t SkippedFor(SkipReason reason) const {
    return skipped[static_cast<std::size_t>(reason)];
  }

  std::size_t TotalSkipped() const;
};

/*
  GameValidator

  Turns stored rows into immutable GameRecords.

  - Incomplete rows are skipped and counted, never fatal
  - Gender is trimmed and lower-cased
  - Missing opponent age/gender fall back to the team's own
  - is_home is true when home_team_id names this row's team
*/
class GameValidator {
 public:
  static std::vector<model::GameRecord> Validate(const std::vector<db::model::GameRow>& rows, IngestReport& report);

  // Returns nullopt and sets reason when the row is unusable.
  static std::optional<model::GameRecord> Convert(const db::model::GameRow& row, SkipReason& reason);
};

} // namespace powerscore::ingest
