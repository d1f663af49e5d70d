/// @file budget_tracker.cpp
/// @brief BudgetTracker implementation.

#include "pgw/service/budget_tracker.hpp"

#include "pgw/foundation/gateway_logger.hpp"
#include "pgw/foundation/gateway_metrics.hpp"

namespace pgw::service {

using foundation::ErrorCode;
using foundation::GatewayError;
using foundation::GatewayResult;
using foundation::LogCategory;
using foundation::Timestamp;

BudgetTracker::BudgetTracker(std::shared_ptr<foundation::IKeyValueStore> store,
                             BudgetConfig config,
                             foundation::ClockFn clock)
    : store_(std::move(store)),
      config_(std::move(config)),
      clock_(std::move(clock)),
      key_("budget:" + config_.endpointClass) {
    if (config_.window.count() <= 0) {
        config_.window = std::chrono::hours(24);
    }
}

Timestamp BudgetTracker::windowStartFor(Timestamp at) const {
    auto sinceEpoch = std::chrono::duration_cast<std::chrono::seconds>(at.time_since_epoch());
    auto windows = sinceEpoch.count() / config_.window.count();
    return foundation::fromUnixSeconds(windows * config_.window.count());
}

GatewayResult<BudgetCounter>
BudgetTracker::decode(const std::optional<foundation::VersionedValue>& stored,
                      Timestamp now) const {
    BudgetCounter counter;
    counter.windowStart = windowStartFor(now);
    counter.limit = config_.limit;
    if (!stored) {
        return GatewayResult<BudgetCounter>::ok(counter);
    }

    auto node = foundation::decodeRecord(stored->value);
    if (!node) {
        return GatewayResult<BudgetCounter>::err(node.error());
    }
    const YAML::Node& record = node.value();
    try {
        auto storedStart = foundation::fromUnixMillis(record["window_start"].as<int64_t>());
        if (storedStart + config_.window > now) {
            counter.windowStart = storedStart;
            counter.spent = record["spent"].as<double>(0.0);
        }
    } catch (const YAML::Exception& e) {
        return GatewayResult<BudgetCounter>::err(
            GatewayError(ErrorCode::RecordCorrupt, "budget record " + key_ + ": " + e.what()));
    }
    return GatewayResult<BudgetCounter>::ok(counter);
}

GatewayResult<BudgetCounter> BudgetTracker::recordSpend(double amount) {
    if (amount < 0.0) {
        return GatewayResult<BudgetCounter>::err(
            GatewayError(ErrorCode::InvalidArgument, "spend amount must not be negative"));
    }

    BudgetCounter updated;
    auto now = clock_();
    auto result = foundation::updateWithRetry(
        *store_, key_,
        [&](const std::optional<foundation::VersionedValue>& current)
            -> GatewayResult<std::optional<std::string>> {
            auto counter = decode(current, now);
            if (!counter) {
                return GatewayResult<std::optional<std::string>>::err(counter.error());
            }
            updated = counter.value();
            updated.spent += amount;

            YAML::Node node;
            node["window_start"] = foundation::toUnixMillis(updated.windowStart);
            node["spent"] = updated.spent;
            node["limit"] = updated.limit;
            return GatewayResult<std::optional<std::string>>::ok(foundation::encodeRecord(node));
        });
    if (!result) {
        return GatewayResult<BudgetCounter>::err(result.error());
    }

    foundation::GatewayMetrics::instance().setGauge(
        "pgw_budget_spent", {{"endpoint_class", config_.endpointClass}}, updated.spent);
    if (updated.spent >= updated.limit && updated.spent - amount < updated.limit) {
        PGW_LOG_WARN(LogCategory::Budget,
                     "budget for " + config_.endpointClass + " exhausted: spent " +
                     std::to_string(updated.spent) + " of " + std::to_string(updated.limit));
    }
    return GatewayResult<BudgetCounter>::ok(updated);
}

GatewayResult<BudgetCounter> BudgetTracker::snapshot() const {
    auto stored = store_->get(key_);
    if (!stored) {
        return GatewayResult<BudgetCounter>::err(stored.error());
    }
    return decode(stored.value(), clock_());
}

GatewayResult<bool> BudgetTracker::isOk() const {
    auto counter = snapshot();
    if (!counter) {
        return GatewayResult<bool>::err(counter.error());
    }
    return GatewayResult<bool>::ok(counter.value().isOk());
}

}  // namespace pgw::service
