#pragma once

/**
 * Time utilities for the chart agent
 *
 * Provides consistent timestamp generation across all components.
 */

#include <chrono>
#include <cstdint>
#include <ctime>
#include <string>

namespace chartagent {
namespace util {

/**
 * Returns current time in nanoseconds since steady_clock epoch.
 * Used for cycle latency measurement.
 *
 * Note: steady_clock is monotonic (never goes backwards) and suitable for
 * measuring elapsed time. Not suitable for wall-clock time.
 */
inline uint64_t now_ns() {
    auto now = std::chrono::steady_clock::now();
    return std::chrono::duration_cast<std::chrono::nanoseconds>(
        now.time_since_epoch()
    ).count();
}

/**
 * Returns current wall-clock time in nanoseconds since Unix epoch.
 * Used for snapshot and trade timestamps that are persisted.
 */
inline uint64_t wall_clock_ns() {
    auto now = std::chrono::system_clock::now();
    return std::chrono::duration_cast<std::chrono::nanoseconds>(
        now.time_since_epoch()
    ).count();
}

/**
 * Format a wall-clock timestamp with strftime (local time).
 *
 * Example: format_wall_clock(ts, "%Y%m%d_%H%M%S") -> "20240131_142501"
 */
inline std::string format_wall_clock(uint64_t wall_ns, const char* fmt) {
    std::time_t secs = static_cast<std::time_t>(wall_ns / 1000000000ULL);
    std::tm tm_buf{};
    localtime_r(&secs, &tm_buf);
    char buf[64];
    size_t len = std::strftime(buf, sizeof(buf), fmt, &tm_buf);
    return std::string(buf, len);
}

}  // namespace util
}  // namespace chartagent
