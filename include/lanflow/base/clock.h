#ifndef LANFLOW_BASE_CLOCK_H
#define LANFLOW_BASE_CLOCK_H

#include <chrono>
#include <functional>

namespace lanflow {

using SteadyClock = std::chrono::steady_clock;
using TimePoint = SteadyClock::time_point;
using Milliseconds = std::chrono::milliseconds;

// Time source injected into components that make timing decisions
using ClockFn = std::function<TimePoint()>;

inline ClockFn steady_clock_fn() {
    return [] { return SteadyClock::now(); };
}

} // namespace lanflow

#endif // LANFLOW_BASE_CLOCK_H
