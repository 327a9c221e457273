#pragma once

#include <chrono>
#include <cstdint>

namespace songqueue::util {

/*
  Time utilities: single place to control clock source later.

  Persisted timestamps are unix milliseconds.
*/

using Clock     = std::chrono::system_clock;
using TimePoint = Clock::time_point;

TimePoint Now();

uint64_t ToUnixMillis(TimePoint tp);

// Unix milliseconds, strictly greater than any value previously returned in this process.
uint64_t NowMillis();

} // namespace songqueue::util
