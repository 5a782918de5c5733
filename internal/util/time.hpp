#pragma once

#include <chrono>
#include <cstdint>
#include <string>
#include <string_view>

namespace eventcache::util {

/*
  Time utilities — single place to control clock source later.
*/

using Clock     = std::chrono::system_clock;
using TimePoint = Clock::time_point;

TimePoint Now();

int64_t ToUnixMillis(TimePoint tp);
TimePoint FromUnixMillis(int64_t millis);

// Renders epoch milliseconds as "2026-02-10T00:00:00.000Z".
std::string FormatIso8601Millis(int64_t millis);

/*
  Parses an ISO-8601 timestamp with an explicit zone ("Z" or "+hh:mm").

  Accepted: YYYY-MM-DDTHH:MM:SS[.fff...](Z|+hh:mm|-hh:mm)
  Throws std::invalid_argument on anything else, including naive timestamps.
*/
int64_t ParseIso8601Millis(std::string_view text);

} // namespace eventcache::util
