#pragma once

#include <chrono>
#include <optional>
#include <string>
#include <string_view>

namespace powerscore::util {

/*
  Civil dates at day precision.

  Stored as ISO-8601 "YYYY-MM-DD" text in every backend so that
  lexical order equals chronological order.
*/

using Date = std::chrono::sys_days;

std::optional<Date> ParseDate(std::string_view text);

// Throws InvalidArgument on malformed input.
Date ParseDateOrThrow(std::string_view text);

std::string FormatDate(Date date);

// Whole days from `from` to `to` (positive when `to` is later).
int DaysBetween(Date from, Date to);

Date AddDays(Date date, int days);

Date Today();

int ToEpochDays(Date date);
Date FromEpochDays(int days);

} // namespace powerscore::util
