#pragma once

#include <chrono>
#include <cstdint>

namespace powerscore::util {

/*
  Wall-clock helpers. Engine math never reads the clock; only
  "today" is injected by the caller.
*/

using Clock     = std::chrono::system_clock;
using TimePoint = Clock::time_point;

TimePoint Now();

uint64_t ToUnixMillis(TimePoint tp);

double ElapsedMs(std::chrono::steady_clock::time_point start);

} // namespace powerscore::util
