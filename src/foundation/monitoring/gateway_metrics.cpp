/// @file gateway_metrics.cpp
/// @brief In-memory GatewayMetrics implementation.

#include "pgw/foundation/gateway_metrics.hpp"

#include <cmath>
#include <mutex>
#include <sstream>

namespace pgw::foundation {

HistogramBuckets HistogramBuckets::upstreamLatencyMs() {
    return HistogramBuckets{{25, 50, 100, 250, 500, 1000, 2000, 5000, 10000}};
}

std::string seriesKey(std::string_view name, const MetricLabels& labels) {
    std::string key(name);
    if (labels.empty()) {
        return key;
    }
    key += '{';
    bool first = true;
    for (const auto& [k, v] : labels) {
        if (!first) {
            key += ',';
        }
        key += k;
        key += "=\"";
        key += v;
        key += '"';
        first = false;
    }
    key += '}';
    return key;
}

std::string_view healthStatusName(HealthStatus status) {
    switch (status) {
        case HealthStatus::Healthy:   return "healthy";
        case HealthStatus::Degraded:  return "degraded";
        case HealthStatus::Unhealthy: return "unhealthy";
    }
    return "unknown";
}

namespace {

struct HistogramData {
    std::vector<double> boundaries;
    std::vector<uint64_t> bucketCounts;  // cumulative; last slot is +Inf
    uint64_t totalCount{0};
    double totalSum{0.0};

    explicit HistogramData(std::vector<double> bounds)
        : boundaries(std::move(bounds)), bucketCounts(boundaries.size() + 1, 0) {}

    void record(double value) {
        for (std::size_t i = 0; i < boundaries.size(); ++i) {
            if (value <= boundaries[i]) {
                ++bucketCounts[i];
            }
        }
        ++bucketCounts.back();
        ++totalCount;
        totalSum += value;
    }
};

std::string formatDouble(double value) {
    if (std::isinf(value)) {
        return value > 0 ? "+Inf" : "-Inf";
    }
    if (std::isnan(value)) {
        return "NaN";
    }
    std::ostringstream oss;
    oss << value;
    return oss.str();
}

// Metric family name without the label block, for the TYPE line.
std::string_view familyName(std::string_view key) {
    auto brace = key.find('{');
    return brace == std::string_view::npos ? key : key.substr(0, brace);
}

}  // namespace

struct GatewayMetrics::Impl {
    mutable std::mutex counterMutex;
    std::map<std::string, uint64_t> counters;

    mutable std::mutex gaugeMutex;
    std::map<std::string, double> gauges;

    mutable std::mutex histogramMutex;
    std::map<std::string, HistogramData> histograms;

    mutable std::mutex healthMutex;
    std::map<std::string, HealthStatus> componentHealth;
};

GatewayMetrics::GatewayMetrics() : impl_(std::make_unique<Impl>()) {}

GatewayMetrics::~GatewayMetrics() = default;

GatewayMetrics::GatewayMetrics(GatewayMetrics&&) noexcept = default;

GatewayMetrics& GatewayMetrics::operator=(GatewayMetrics&&) noexcept = default;

void GatewayMetrics::incrementCounter(std::string_view name, uint64_t value) {
    std::lock_guard lock(impl_->counterMutex);
    impl_->counters[std::string(name)] += value;
}

void GatewayMetrics::incrementCounter(std::string_view name, const MetricLabels& labels,
                                      uint64_t value) {
    auto key = seriesKey(name, labels);
    std::lock_guard lock(impl_->counterMutex);
    impl_->counters[key] += value;
}

uint64_t GatewayMetrics::counterValue(std::string_view name,
                                      const MetricLabels& labels) const {
    auto key = seriesKey(name, labels);
    std::lock_guard lock(impl_->counterMutex);
    auto it = impl_->counters.find(key);
    return it == impl_->counters.end() ? 0 : it->second;
}

void GatewayMetrics::setGauge(std::string_view name, double value) {
    std::lock_guard lock(impl_->gaugeMutex);
    impl_->gauges[std::string(name)] = value;
}

void GatewayMetrics::setGauge(std::string_view name, const MetricLabels& labels,
                              double value) {
    auto key = seriesKey(name, labels);
    std::lock_guard lock(impl_->gaugeMutex);
    impl_->gauges[key] = value;
}

double GatewayMetrics::gaugeValue(std::string_view name, const MetricLabels& labels) const {
    auto key = seriesKey(name, labels);
    std::lock_guard lock(impl_->gaugeMutex);
    auto it = impl_->gauges.find(key);
    return it == impl_->gauges.end() ? 0.0 : it->second;
}

void GatewayMetrics::registerHistogram(std::string_view name, HistogramBuckets buckets) {
    std::lock_guard lock(impl_->histogramMutex);
    impl_->histograms.try_emplace(std::string(name), std::move(buckets.boundaries));
}

void GatewayMetrics::recordHistogram(std::string_view name, double value) {
    std::lock_guard lock(impl_->histogramMutex);
    auto it = impl_->histograms.find(std::string(name));
    if (it != impl_->histograms.end()) {
        it->second.record(value);
    }
}

uint64_t GatewayMetrics::histogramCount(std::string_view name) const {
    std::lock_guard lock(impl_->histogramMutex);
    auto it = impl_->histograms.find(std::string(name));
    return it == impl_->histograms.end() ? 0 : it->second.totalCount;
}

void GatewayMetrics::setComponentHealth(std::string_view component, HealthStatus status) {
    std::lock_guard lock(impl_->healthMutex);
    impl_->componentHealth[std::string(component)] = status;
}

HealthCheckResult GatewayMetrics::healthCheck() const {
    std::lock_guard lock(impl_->healthMutex);

    HealthCheckResult result;
    result.timestamp = std::chrono::system_clock::now();
    result.components = impl_->componentHealth;
    for (const auto& [_, status] : impl_->componentHealth) {
        if (static_cast<uint8_t>(status) > static_cast<uint8_t>(result.status)) {
            result.status = status;
        }
    }
    return result;
}

std::string GatewayMetrics::scrape() const {
    std::ostringstream out;
    std::string_view lastFamily;

    {
        std::lock_guard lock(impl_->counterMutex);
        for (const auto& [key, value] : impl_->counters) {
            auto family = familyName(key);
            if (family != lastFamily) {
                out << "# TYPE " << family << " counter\n";
                lastFamily = family;
            }
            out << key << ' ' << value << '\n';
        }
    }

    {
        std::lock_guard lock(impl_->gaugeMutex);
        lastFamily = {};
        for (const auto& [key, value] : impl_->gauges) {
            auto family = familyName(key);
            if (family != lastFamily) {
                out << "# TYPE " << family << " gauge\n";
                lastFamily = family;
            }
            out << key << ' ' << formatDouble(value) << '\n';
        }
    }

    {
        std::lock_guard lock(impl_->histogramMutex);
        for (const auto& [name, data] : impl_->histograms) {
            out << "# TYPE " << name << " histogram\n";
            for (std::size_t i = 0; i < data.boundaries.size(); ++i) {
                out << name << "_bucket{le=\"" << formatDouble(data.boundaries[i]) << "\"} "
                    << data.bucketCounts[i] << '\n';
            }
            out << name << "_bucket{le=\"+Inf\"} " << data.bucketCounts.back() << '\n';
            out << name << "_sum " << formatDouble(data.totalSum) << '\n';
            out << name << "_count " << data.totalCount << '\n';
        }
    }

    return out.str();
}

void GatewayMetrics::reset() {
    {
        std::lock_guard lock(impl_->counterMutex);
        impl_->counters.clear();
    }
    {
        std::lock_guard lock(impl_->gaugeMutex);
        impl_->gauges.clear();
    }
    {
        std::lock_guard lock(impl_->histogramMutex);
        impl_->histograms.clear();
    }
    {
        std::lock_guard lock(impl_->healthMutex);
        impl_->componentHealth.clear();
    }
}

GatewayMetrics& GatewayMetrics::instance() {
    static GatewayMetrics inst;
    return inst;
}

}  // namespace pgw::foundation
