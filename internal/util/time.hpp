#pragma once

#include <chrono>
#include <cstdint>

namespace chunkscribe::util {

/*
  Time utilities. Rows store wall-clock unix milliseconds.
*/

using Clock     = std::chrono::system_clock;
using TimePoint = Clock::time_point;

TimePoint Now();

uint64_t ToUnixMillis(TimePoint tp);
uint64_t NowMillis();

} // namespace chunkscribe::util
