#pragma once

#include <chrono>
#include <cstdint>
#include <string>

namespace speechmaker::util {

/*
  Clock access and timestamp formatting for ids, error records and file names.
*/

using Clock     = std::chrono::system_clock;
using TimePoint = Clock::time_point;

TimePoint Now();

uint64_t ToUnixMillis(TimePoint tp);

// Compact UTC stamp usable in file names: 2024-05-01T10-22-03-123Z
std::string FileSafeTimestamp(TimePoint tp);

} // namespace speechmaker::util
