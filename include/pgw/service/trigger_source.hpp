#pragma once

/// @file trigger_source.hpp
/// @brief Sampling of service mode triggers and the periodic evaluator.

#include "pgw/service/service_mode.hpp"

#include <chrono>
#include <condition_variable>
#include <memory>
#include <mutex>
#include <thread>

namespace pgw::service {

class BudgetTracker;
class CircuitBreaker;
class LatencySampler;
class ProviderHealthStore;

/// Produces a consistent snapshot of the four mode triggers.
class ITriggerSource {
public:
    virtual ~ITriggerSource() = default;

    [[nodiscard]] virtual ServiceTriggers sample() = 0;
};

/// Samples the gateway's own components.
///
/// A trigger whose backing store cannot be read reports the unhealthy value,
/// so a store outage escalates the mode instead of hiding problems.
class GatewayTriggerSource : public ITriggerSource {
public:
    GatewayTriggerSource(std::shared_ptr<ProviderHealthStore> health,
                         std::shared_ptr<BudgetTracker> budget,
                         std::shared_ptr<CircuitBreaker> breaker,
                         std::shared_ptr<LatencySampler> latency);

    [[nodiscard]] ServiceTriggers sample() override;

private:
    std::shared_ptr<ProviderHealthStore> health_;
    std::shared_ptr<BudgetTracker> budget_;
    std::shared_ptr<CircuitBreaker> breaker_;
    std::shared_ptr<LatencySampler> latency_;
};

/// Background thread feeding the controller a fresh sample every interval,
/// which bounds the staleness of the published mode.
class ServiceModeEvaluator {
public:
    ServiceModeEvaluator(ServiceModeController& controller,
                         std::shared_ptr<ITriggerSource> source,
                         std::chrono::milliseconds interval = std::chrono::seconds(5));
    ~ServiceModeEvaluator();

    ServiceModeEvaluator(const ServiceModeEvaluator&) = delete;
    ServiceModeEvaluator& operator=(const ServiceModeEvaluator&) = delete;

    void start();
    void stop();

    /// Sample and recompute once on the calling thread.
    ServiceModeState evaluateOnce();

    [[nodiscard]] bool isRunning() const;

private:
    void run();

    ServiceModeController& controller_;
    std::shared_ptr<ITriggerSource> source_;
    std::chrono::milliseconds interval_;

    mutable std::mutex mutex_;
    std::condition_variable wake_;
    bool running_{false};
    std::thread thread_;
};

}  // namespace pgw::service
