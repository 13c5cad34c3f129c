#pragma once

#include <chrono>
#include <cstdint>

namespace flightline::util {

/*
  Time utilities. Single place to control the clock source.
*/

using Clock     = std::chrono::system_clock;
using TimePoint = Clock::time_point;

TimePoint Now();

uint64_t  ToUnixMillis(TimePoint tp);
TimePoint FromUnixMillis(uint64_t millis);

// Milliseconds elapsed on the steady clock since start.
double ElapsedMs(std::chrono::steady_clock::time_point start);

} // namespace flightline::util
