#pragma once

/// @file clock.hpp
/// @brief Wall-clock abstraction shared by every time-dependent component.
///
/// Signed URL expiry, budget windows, breaker cool-downs and mode dwell all
/// compare against wall-clock time. Components take a ClockFn so tests can
/// drive time explicitly.

#include <chrono>
#include <cstdint>
#include <functional>

namespace pgw::foundation {

using Timestamp = std::chrono::system_clock::time_point;

/// Source of the current time.
using ClockFn = std::function<Timestamp()>;

/// The production clock.
inline ClockFn systemClock() {
    return [] { return std::chrono::system_clock::now(); };
}

[[nodiscard]] inline int64_t toUnixMillis(Timestamp t) {
    return std::chrono::duration_cast<std::chrono::milliseconds>(t.time_since_epoch()).count();
}

[[nodiscard]] inline int64_t toUnixSeconds(Timestamp t) {
    return std::chrono::duration_cast<std::chrono::seconds>(t.time_since_epoch()).count();
}

[[nodiscard]] inline Timestamp fromUnixMillis(int64_t millis) {
    return Timestamp(std::chrono::duration_cast<Timestamp::duration>(
        std::chrono::milliseconds(millis)));
}

[[nodiscard]] inline Timestamp fromUnixSeconds(int64_t seconds) {
    return Timestamp(std::chrono::duration_cast<Timestamp::duration>(
        std::chrono::seconds(seconds)));
}

} // namespace pgw::foundation
