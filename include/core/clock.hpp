#pragma once

#include <chrono>
#include <functional>

namespace readrouter {

/// Monotonic time source used by routers; injectable so tests can move time.
using SteadyClock = std::chrono::steady_clock;
using ClockFn = std::function<SteadyClock::time_point()>;

[[nodiscard]] inline ClockFn system_clock_fn() {
    return [] { return SteadyClock::now(); };
}

} // namespace readrouter
