#pragma once

#include <chrono>

namespace ferry {

/// All client-side timing (deadlines, pool idle expiry, request timing) uses the monotonic clock.
using SteadyClock = std::chrono::steady_clock;
using SteadyTimePoint = SteadyClock::time_point;
using SteadyDuration = SteadyClock::duration;

}  // namespace ferry
