#pragma once

#include <chrono>
#include <cstdint>

namespace bridge::util {

/*
  Wall and steady clock helpers.
*/

using Clock     = std::chrono::system_clock;
using TimePoint = Clock::time_point;

TimePoint Now();

uint64_t ToUnixMillis(TimePoint tp);

} // namespace bridge::util
