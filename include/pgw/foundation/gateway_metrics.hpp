#pragma once

/// @file gateway_metrics.hpp
/// @brief In-process counters, gauges and histograms with Prometheus text export.

#include <chrono>
#include <cstdint>
#include <map>
#include <memory>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace pgw::foundation {

/// Upper bounds of histogram buckets ("le" semantics).
struct HistogramBuckets {
    /// Upstream latency buckets in milliseconds.
    static HistogramBuckets upstreamLatencyMs();

    std::vector<double> boundaries;
};

/// Label set attached to a metric series, e.g. {{"outcome", "OK"}}.
using MetricLabels = std::vector<std::pair<std::string, std::string>>;

/// Build the series key `name{k="v",...}` used for labelled metrics.
[[nodiscard]] std::string seriesKey(std::string_view name, const MetricLabels& labels);

/// Health of a gateway dependency as reported on /readyz.
enum class HealthStatus : uint8_t {
    Healthy,
    Degraded,
    Unhealthy
};

struct HealthCheckResult {
    HealthStatus status{HealthStatus::Healthy};
    std::map<std::string, HealthStatus> components;
    std::chrono::system_clock::time_point timestamp{};
};

[[nodiscard]] std::string_view healthStatusName(HealthStatus status);

/// Metrics registry for the gateway process.
///
/// Series are created on first use. All operations are thread-safe; the
/// request path only takes short per-kind locks.
///
/// @code
///   auto& metrics = GatewayMetrics::instance();
///   metrics.incrementCounter("pgw_media_requests_total", {{"outcome", "OK"}});
///   metrics.recordHistogram("pgw_upstream_latency_ms", 182.0);
///   std::string text = metrics.scrape();
/// @endcode
class GatewayMetrics {
public:
    GatewayMetrics();
    ~GatewayMetrics();

    GatewayMetrics(const GatewayMetrics&) = delete;
    GatewayMetrics& operator=(const GatewayMetrics&) = delete;
    GatewayMetrics(GatewayMetrics&&) noexcept;
    GatewayMetrics& operator=(GatewayMetrics&&) noexcept;

    void incrementCounter(std::string_view name, uint64_t value = 1);
    void incrementCounter(std::string_view name, const MetricLabels& labels,
                          uint64_t value = 1);

    /// 0 if the series does not exist.
    [[nodiscard]] uint64_t counterValue(std::string_view name,
                                        const MetricLabels& labels = {}) const;

    void setGauge(std::string_view name, double value);
    void setGauge(std::string_view name, const MetricLabels& labels, double value);

    /// 0.0 if the series does not exist.
    [[nodiscard]] double gaugeValue(std::string_view name,
                                    const MetricLabels& labels = {}) const;

    /// Registering an existing histogram keeps its current buckets.
    void registerHistogram(std::string_view name, HistogramBuckets buckets);

    /// Observations on an unregistered histogram are dropped.
    void recordHistogram(std::string_view name, double value);

    [[nodiscard]] uint64_t histogramCount(std::string_view name) const;

    void setComponentHealth(std::string_view component, HealthStatus status);

    /// Overall status is the worst component status.
    [[nodiscard]] HealthCheckResult healthCheck() const;

    /// Prometheus text exposition format, series sorted by key.
    [[nodiscard]] std::string scrape() const;

    void reset();

    static GatewayMetrics& instance();

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
};

} // namespace pgw::foundation
