#pragma once

/// @file latency_sampler.hpp
/// @brief Sliding sample of provider call latencies feeding the latency trigger.

#include "pgw/foundation/clock.hpp"

#include <chrono>
#include <cstddef>
#include <deque>
#include <mutex>
#include <optional>

namespace pgw::service {

struct LatencySamplerConfig {
    /// Most recent samples kept.
    std::size_t capacity = 128;

    /// p95 above this is "elevated".
    std::chrono::milliseconds threshold{2000};

    /// Samples older than this are ignored, so a quiet provider path (for
    /// instance photos switched off in WATCH) recovers instead of holding
    /// its last bad window forever.
    std::chrono::seconds maxAge{300};

    /// Below this many fresh samples the trigger reports ok.
    std::size_t minSamples = 5;
};

/// Process-local latency window. Each replica judges its own view of
/// provider latency; the samples are not persisted.
class LatencySampler {
public:
    explicit LatencySampler(LatencySamplerConfig config = {},
                            foundation::ClockFn clock = foundation::systemClock());

    void record(std::chrono::milliseconds latency);

    /// 95th percentile (nearest rank) of fresh samples; nullopt when empty.
    [[nodiscard]] std::optional<std::chrono::milliseconds> p95() const;

    [[nodiscard]] bool isOk() const;

    [[nodiscard]] std::size_t sampleCount() const;

    void clear();

private:
    struct Sample {
        foundation::Timestamp at;
        std::chrono::milliseconds latency;
    };

    std::optional<std::chrono::milliseconds> percentileLocked(double pct,
                                                              std::size_t* fresh) const;

    LatencySamplerConfig config_;
    foundation::ClockFn clock_;
    mutable std::mutex mutex_;
    std::deque<Sample> samples_;
};

}  // namespace pgw::service
