#pragma once

#include <chrono>
#include <cstdint>
#include <functional>

namespace draft::util {

/*
  Time utilities: the one place that reads the system clock.

  Persisted timestamps are unix epoch milliseconds.
*/

using Clock     = std::chrono::system_clock;
using TimePoint = Clock::time_point;

// Injectable millisecond clock (tests pin time through this).
using MillisClock = std::function<uint64_t()>;

TimePoint Now();

uint64_t ToUnixMillis(TimePoint tp);
uint64_t NowMillis();

constexpr uint64_t kMillisPerDay = 24ULL * 60 * 60 * 1000;

} // namespace draft::util
