/// @file latency_sampler.cpp
/// @brief LatencySampler implementation.

#include "pgw/service/latency_sampler.hpp"

#include <algorithm>
#include <cmath>
#include <vector>

namespace pgw::service {

LatencySampler::LatencySampler(LatencySamplerConfig config, foundation::ClockFn clock)
    : config_(config), clock_(std::move(clock)) {
    config_.capacity = std::max<std::size_t>(config_.capacity, 1);
}

void LatencySampler::record(std::chrono::milliseconds latency) {
    std::lock_guard lock(mutex_);
    samples_.push_back(Sample{clock_(), latency});
    while (samples_.size() > config_.capacity) {
        samples_.pop_front();
    }
}

std::optional<std::chrono::milliseconds>
LatencySampler::percentileLocked(double pct, std::size_t* fresh) const {
    auto cutoff = clock_() - config_.maxAge;
    std::vector<std::chrono::milliseconds> values;
    values.reserve(samples_.size());
    for (const auto& sample : samples_) {
        if (sample.at >= cutoff) {
            values.push_back(sample.latency);
        }
    }
    if (fresh != nullptr) {
        *fresh = values.size();
    }
    if (values.empty()) {
        return std::nullopt;
    }
    std::sort(values.begin(), values.end());
    auto rank = static_cast<std::size_t>(std::ceil(pct * static_cast<double>(values.size())));
    return values[std::clamp<std::size_t>(rank, 1, values.size()) - 1];
}

std::optional<std::chrono::milliseconds> LatencySampler::p95() const {
    std::lock_guard lock(mutex_);
    return percentileLocked(0.95, nullptr);
}

bool LatencySampler::isOk() const {
    std::lock_guard lock(mutex_);
    std::size_t fresh = 0;
    auto value = percentileLocked(0.95, &fresh);
    if (!value || fresh < config_.minSamples) {
        return true;
    }
    return *value <= config_.threshold;
}

std::size_t LatencySampler::sampleCount() const {
    std::lock_guard lock(mutex_);
    return samples_.size();
}

void LatencySampler::clear() {
    std::lock_guard lock(mutex_);
    samples_.clear();
}

}  // namespace pgw::service
