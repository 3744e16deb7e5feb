#pragma once

#include <chrono>
#include <cstdint>
#include <functional>

namespace edgexfer::core {

using TimePoint = std::chrono::system_clock::time_point;

/**
 * @brief Injectable wall clock
 *
 * Components that reason about staleness or expiry take a Clock so tests can
 * move time without sleeping.
 */
using Clock = std::function<TimePoint()>;

inline Clock system_clock() {
    return [] { return std::chrono::system_clock::now(); };
}

inline std::int64_t to_unix_millis(TimePoint tp) {
    return std::chrono::duration_cast<std::chrono::milliseconds>(tp.time_since_epoch()).count();
}

inline TimePoint from_unix_millis(std::int64_t millis) {
    return TimePoint(std::chrono::milliseconds(millis));
}

} // namespace edgexfer::core
