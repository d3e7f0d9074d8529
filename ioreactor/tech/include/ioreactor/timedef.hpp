#pragma once

#include <chrono>

namespace ioreactor {

/// Alias some types to make it easier to use
/// Deadlines of the reactor (timers, per-descriptor timeouts) are all expressed with the monotonic
/// steady_clock so that wall clock adjustments never fire or delay them.
using SysClock = std::chrono::system_clock;
using SysTimePoint = SysClock::time_point;

using SteadyClock = std::chrono::steady_clock;
using SteadyTimePoint = SteadyClock::time_point;
using SteadyDuration = SteadyClock::duration;

}  // namespace ioreactor
