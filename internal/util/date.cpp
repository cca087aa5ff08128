#include "date.hpp"

#include <charconv>
#include <cstdio>

#include "internal/util/errors.hpp"

namespace powerscore::util {

namespace {

bool ParseInt(std::string_view text, int& out) {
  if (text.empty()) return false;
  auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), out);
  return ec == std::errc{} && ptr == text.data() + text.size();
}

} // namespace

std::optional<Date> ParseDate(std::string_view text) {
  // Accept "YYYY-MM-DD" with an optional time suffix ("T..." or " ...").
  if (text.size() > 10 && (text[10] == 'T' || text[10] == ' ')) {
    text = text.substr(0, 10);
  }
  if (text.size() != 10 || text[4] != '-' || text[7] != '-') {
    return std::nullopt;
  }

  int y = 0;
  int m = 0;
  int d = 0;
  if (!ParseInt(text.substr(0, 4), y) || !ParseInt(text.substr(5, 2), m) || !ParseInt(text.substr(8, 2), d)) {
    return std::nullopt;
  }

  std::chrono::year_month_day ymd{std::chrono::year{y}, std::chrono::month{static_cast<unsigned>(m)},
                                  std::chrono::day{static_cast<unsigned>(d)}};
  if (!ymd.ok()) {
    return std::nullopt;
  }
  return Date{ymd};
}

Date ParseDateOrThrow(std::string_view text) {
  auto date = ParseDate(text);
  if (!date) {
    throw InvalidArgument("invalid date (expected YYYY-MM-DD): " + std::string(text));
  }
  return *date;
}

std::string FormatDate(Date date) {
  std::chrono::year_month_day ymd{date};
  char buf[16];
  std::snprintf(buf, sizeof(buf), "%04d-%02u-%02u", static_cast<int>(ymd.year()), static_cast<unsigned>(ymd.month()),
                static_cast<unsigned>(ymd.day()));
  return buf;
}

int DaysBetween(Date from, Date to) {
  return static_cast<int>((to - from).count());
}

Date AddDays(Date date, int days) {
  return date + std::chrono::days{days};
}

Date Today() {
  return std::chrono::floor<std::chrono::days>(std::chrono::system_clock::now());
}

int ToEpochDays(Date date) {
  return static_cast<int>(date.time_since_epoch().count());
}

Date FromEpochDays(int days) {
  return Date{std::chrono::days{days}};
}

} // namespace powerscore::util
