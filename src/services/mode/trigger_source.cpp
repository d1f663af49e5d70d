/// @file trigger_source.cpp
/// @brief GatewayTriggerSource and ServiceModeEvaluator.

#include "pgw/service/trigger_source.hpp"

#include "pgw/foundation/gateway_logger.hpp"
#include "pgw/service/budget_tracker.hpp"
#include "pgw/service/circuit_breaker.hpp"
#include "pgw/service/latency_sampler.hpp"
#include "pgw/service/provider_health_store.hpp"

namespace pgw::service {

using foundation::LogCategory;

GatewayTriggerSource::GatewayTriggerSource(std::shared_ptr<ProviderHealthStore> health,
                                           std::shared_ptr<BudgetTracker> budget,
                                           std::shared_ptr<CircuitBreaker> breaker,
                                           std::shared_ptr<LatencySampler> latency)
    : health_(std::move(health)),
      budget_(std::move(budget)),
      breaker_(std::move(breaker)),
      latency_(std::move(latency)) {}

ServiceTriggers GatewayTriggerSource::sample() {
    ServiceTriggers triggers;

    auto healthy = health_->allHealthy();
    if (!healthy) {
        PGW_LOG_WARN(LogCategory::Mode, "provider health unreadable: " +
                                        std::string(healthy.error().message()));
    }
    triggers.providerHealthy = healthy.valueOr(false);

    auto budgetOk = budget_->isOk();
    if (!budgetOk) {
        PGW_LOG_WARN(LogCategory::Mode, "budget unreadable: " +
                                        std::string(budgetOk.error().message()));
    }
    triggers.budgetOk = budgetOk.valueOr(false);

    auto closed = breaker_->isClosed();
    if (!closed) {
        PGW_LOG_WARN(LogCategory::Mode, "circuit state unreadable: " +
                                        std::string(closed.error().message()));
    }
    triggers.circuitBreakerClosed = closed.valueOr(false);

    triggers.latencyOk = latency_->isOk();
    return triggers;
}

ServiceModeEvaluator::ServiceModeEvaluator(ServiceModeController& controller,
                                           std::shared_ptr<ITriggerSource> source,
                                           std::chrono::milliseconds interval)
    : controller_(controller), source_(std::move(source)), interval_(interval) {}

ServiceModeEvaluator::~ServiceModeEvaluator() {
    stop();
}

void ServiceModeEvaluator::start() {
    std::lock_guard lock(mutex_);
    if (running_) {
        return;
    }
    running_ = true;
    thread_ = std::thread([this] { run(); });
}

void ServiceModeEvaluator::stop() {
    {
        std::lock_guard lock(mutex_);
        if (!running_) {
            return;
        }
        running_ = false;
    }
    wake_.notify_all();
    if (thread_.joinable()) {
        thread_.join();
    }
}

bool ServiceModeEvaluator::isRunning() const {
    std::lock_guard lock(mutex_);
    return running_;
}

ServiceModeState ServiceModeEvaluator::evaluateOnce() {
    return controller_.recompute(source_->sample());
}

void ServiceModeEvaluator::run() {
    std::unique_lock lock(mutex_);
    while (running_) {
        lock.unlock();
        evaluateOnce();
        lock.lock();
        wake_.wait_for(lock, interval_, [this] { return !running_; });
    }
}

}  // namespace pgw::service
