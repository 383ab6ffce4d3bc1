#pragma once

#include <chrono>
#include <cstdint>
#include <string>

namespace favorites::util {

/*
  Time utilities: one place for the clock source and formatting.

  Patterns are strftime patterns rendered in the local time zone.
*/

using Clock     = std::chrono::system_clock;
using TimePoint = Clock::time_point;

inline constexpr const char* kMinutePattern    = "%Y-%m-%d %H:%M";
inline constexpr const char* kIsoSecondPattern = "%Y-%m-%dT%H:%M:%S";
inline constexpr const char* kFileStampPattern = "%Y-%m-%d_%H%M";

TimePoint Now();

std::int64_t ToUnixSeconds(TimePoint tp);
uint64_t     ToUnixMillis(TimePoint tp);

std::string FormatLocal(std::int64_t epoch_seconds, const char* pattern);
std::string FormatLocal(TimePoint tp, const char* pattern);

} // namespace favorites::util
