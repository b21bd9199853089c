#pragma once

/**
 * Time utilities
 *
 * All bot timestamps are wall-clock nanoseconds since the Unix epoch so
 * that cooldowns and confirmation windows line up with candle times and
 * broker fill times. Components take a ClockFn so tests and the replay
 * runner can drive time explicitly.
 */

#include <chrono>
#include <cstdint>
#include <functional>

namespace tradebot {
namespace util {

using ClockFn = std::function<uint64_t()>;

constexpr uint64_t NANOS_PER_SECOND = 1'000'000'000ULL;
constexpr uint64_t NANOS_PER_MINUTE = 60 * NANOS_PER_SECOND;
constexpr uint64_t NANOS_PER_DAY = 24 * 60 * NANOS_PER_MINUTE;

/**
 * Returns current time in nanoseconds since steady_clock epoch.
 * Monotonic, for measuring elapsed time only.
 */
inline uint64_t now_ns() {
    auto now = std::chrono::steady_clock::now();
    return std::chrono::duration_cast<std::chrono::nanoseconds>(now.time_since_epoch()).count();
}

/**
 * Returns current wall-clock time in nanoseconds since Unix epoch.
 */
inline uint64_t wall_clock_ns() {
    auto now = std::chrono::system_clock::now();
    return std::chrono::duration_cast<std::chrono::nanoseconds>(now.time_since_epoch()).count();
}

inline ClockFn system_clock() {
    return []() { return wall_clock_ns(); };
}

constexpr uint64_t minutes_to_ns(int64_t minutes) {
    return minutes <= 0 ? 0 : static_cast<uint64_t>(minutes) * NANOS_PER_MINUTE;
}

constexpr uint64_t seconds_to_ns(int64_t seconds) {
    return seconds <= 0 ? 0 : static_cast<uint64_t>(seconds) * NANOS_PER_SECOND;
}

inline double ns_to_minutes(uint64_t ns) {
    return static_cast<double>(ns) / static_cast<double>(NANOS_PER_MINUTE);
}

// UTC calendar day number, used for daily trade and loss limits
constexpr uint64_t day_index(uint64_t ts_ns) {
    return ts_ns / NANOS_PER_DAY;
}

} // namespace util
} // namespace tradebot
