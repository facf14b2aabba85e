#pragma once

#include <chrono>
#include <functional>

namespace keyco {

using TimePoint = std::chrono::steady_clock::time_point;

// Source of "now" for time-dependent state machines. An empty Clock means
// std::chrono::steady_clock.
using Clock = std::function<TimePoint()>;

inline TimePoint Now(const Clock& clock) {
    return clock ? clock() : std::chrono::steady_clock::now();
}

} // namespace keyco
