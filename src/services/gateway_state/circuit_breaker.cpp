/// @file circuit_breaker.cpp
/// @brief CircuitBreaker state machine over the versioned key-value store.

#include "pgw/service/circuit_breaker.hpp"

#include "pgw/foundation/gateway_logger.hpp"
#include "pgw/foundation/gateway_metrics.hpp"

#include <algorithm>
#include <cmath>

namespace pgw::service {

using foundation::ErrorCode;
using foundation::GatewayError;
using foundation::GatewayResult;
using foundation::LogCategory;
using foundation::Timestamp;

std::optional<CircuitStatus> parseCircuitStatus(std::string_view text) {
    if (text == "closed") {
        return CircuitStatus::Closed;
    }
    if (text == "open") {
        return CircuitStatus::Open;
    }
    if (text == "half_open") {
        return CircuitStatus::HalfOpen;
    }
    return std::nullopt;
}

namespace {

std::string encodeState(const CircuitBreakerState& state) {
    YAML::Node node;
    node["status"] = std::string(toString(state.status));
    node["failures"] = state.consecutiveFailures;
    node["open_count"] = state.openCount;
    if (state.openedAt) {
        node["opened_at"] = foundation::toUnixMillis(*state.openedAt);
    }
    if (state.nextProbeAt) {
        node["next_probe_at"] = foundation::toUnixMillis(*state.nextProbeAt);
    }
    if (state.lease != 0) {
        node["lease"] = state.lease;
    }
    return foundation::encodeRecord(node);
}

GatewayResult<CircuitBreakerState>
decodeState(const std::optional<foundation::VersionedValue>& stored) {
    CircuitBreakerState state;
    if (!stored) {
        return GatewayResult<CircuitBreakerState>::ok(state);
    }
    auto node = foundation::decodeRecord(stored->value);
    if (!node) {
        return GatewayResult<CircuitBreakerState>::err(node.error());
    }
    const YAML::Node& record = node.value();
    try {
        auto status = parseCircuitStatus(record["status"].as<std::string>());
        if (!status) {
            return GatewayResult<CircuitBreakerState>::err(
                GatewayError(ErrorCode::RecordCorrupt, "unknown circuit status"));
        }
        state.status = *status;
        state.consecutiveFailures = record["failures"].as<uint32_t>(0);
        state.openCount = record["open_count"].as<uint32_t>(0);
        if (record["opened_at"]) {
            state.openedAt = foundation::fromUnixMillis(record["opened_at"].as<int64_t>());
        }
        if (record["next_probe_at"]) {
            state.nextProbeAt = foundation::fromUnixMillis(record["next_probe_at"].as<int64_t>());
        }
        state.lease = record["lease"].as<uint64_t>(0);
    } catch (const YAML::Exception& e) {
        return GatewayResult<CircuitBreakerState>::err(
            GatewayError(ErrorCode::RecordCorrupt, std::string("circuit record: ") + e.what()));
    }
    return GatewayResult<CircuitBreakerState>::ok(state);
}

/// Back to Closed with cleared counters; the lease sequence carries on.
void closeCircuit(CircuitBreakerState& state) {
    auto lease = state.lease;
    state = CircuitBreakerState{};
    state.lease = lease;
}

bool holdsLease(const CircuitBreakerState& state, const CircuitPermit& permit) {
    return permit.lease != 0 && permit.lease == state.lease;
}

double statusGauge(CircuitStatus status) {
    switch (status) {
        case CircuitStatus::Closed:   return 0.0;
        case CircuitStatus::HalfOpen: return 1.0;
        case CircuitStatus::Open:     return 2.0;
    }
    return 0.0;
}

}  // namespace

CircuitBreaker::CircuitBreaker(std::shared_ptr<foundation::IKeyValueStore> store,
                               CircuitBreakerConfig config,
                               foundation::ClockFn clock)
    : store_(std::move(store)),
      config_(std::move(config)),
      clock_(std::move(clock)),
      key_("circuit:" + config_.name) {
    config_.failureThreshold = std::max<uint32_t>(config_.failureThreshold, 1);
    config_.backoffMultiplier = std::max(config_.backoffMultiplier, 1.0);
}

std::chrono::seconds CircuitBreaker::coolDownFor(uint32_t openCount) const {
    if (openCount <= 1) {
        return std::min(config_.coolDown, config_.maxCoolDown);
    }
    double scaled = static_cast<double>(config_.coolDown.count()) *
                    std::pow(config_.backoffMultiplier, static_cast<double>(openCount - 1));
    double cap = static_cast<double>(config_.maxCoolDown.count());
    return std::chrono::seconds(static_cast<int64_t>(std::min(scaled, cap)));
}

void CircuitBreaker::openCircuit(CircuitBreakerState& state, Timestamp now) const {
    state.status = CircuitStatus::Open;
    ++state.openCount;
    state.openedAt = now;
    state.nextProbeAt = now + coolDownFor(state.openCount);
}

GatewayResult<CircuitBreakerState> CircuitBreaker::mutate(const Transition& transition) {
    CircuitBreakerState before;
    CircuitBreakerState after;
    auto result = foundation::updateWithRetry(
        *store_, key_,
        [&](const std::optional<foundation::VersionedValue>& current)
            -> GatewayResult<std::optional<std::string>> {
            auto decoded = decodeState(current);
            if (!decoded) {
                return GatewayResult<std::optional<std::string>>::err(decoded.error());
            }
            before = decoded.value();
            after = before;
            if (!transition(after)) {
                return GatewayResult<std::optional<std::string>>::ok(std::nullopt);
            }
            return GatewayResult<std::optional<std::string>>::ok(encodeState(after));
        });
    if (!result) {
        return GatewayResult<CircuitBreakerState>::err(result.error());
    }
    if (before.status != after.status) {
        publish(before.status, after);
    }
    return GatewayResult<CircuitBreakerState>::ok(after);
}

void CircuitBreaker::publish(CircuitStatus before, const CircuitBreakerState& after) const {
    foundation::GatewayMetrics::instance().setGauge(
        "pgw_circuit_state", {{"endpoint_class", config_.name}}, statusGauge(after.status));

    std::string msg = "circuit " + config_.name + " " + std::string(toString(before)) +
                      " -> " + std::string(toString(after.status));
    if (after.status == CircuitStatus::Open && after.openedAt && after.nextProbeAt) {
        auto coolDown = std::chrono::duration_cast<std::chrono::seconds>(
            *after.nextProbeAt - *after.openedAt);
        msg += " (open #" + std::to_string(after.openCount) + ", probe in " +
               std::to_string(coolDown.count()) + "s)";
        PGW_LOG_WARN(LogCategory::Circuit, msg);
        return;
    }
    PGW_LOG_INFO(LogCategory::Circuit, msg);
}

CircuitPermit CircuitBreaker::allowRequest() {
    auto now = clock_();
    CircuitPermit permit;
    auto result = mutate([&](CircuitBreakerState& state) {
        if (state.status == CircuitStatus::Closed) {
            permit = CircuitPermit{true, 0};
            return false;
        }
        if (state.nextProbeAt && now < *state.nextProbeAt) {
            permit = CircuitPermit{};
            return false;
        }
        // Cool-down over (Open) or the previous lease expired (HalfOpen).
        state.status = CircuitStatus::HalfOpen;
        state.nextProbeAt = now + config_.coolDown;
        ++state.lease;
        permit = CircuitPermit{true, state.lease};
        return true;
    });

    if (!result) {
        PGW_LOG_WARN(LogCategory::Circuit,
                     "circuit " + config_.name + " unreadable, rejecting call: " +
                     std::string(result.error().message()));
        permit = CircuitPermit{};
    }
    if (!permit) {
        rejected_.fetch_add(1, std::memory_order_relaxed);
        foundation::GatewayMetrics::instance().incrementCounter(
            "pgw_circuit_rejections_total", {{"endpoint_class", config_.name}});
    }
    return permit;
}

GatewayResult<CircuitBreakerState> CircuitBreaker::recordSuccess(const CircuitPermit& permit) {
    return mutate([&permit](CircuitBreakerState& state) {
        switch (state.status) {
            case CircuitStatus::Closed:
                if (state.consecutiveFailures == 0) {
                    return false;
                }
                state.consecutiveFailures = 0;
                return true;

            case CircuitStatus::HalfOpen:
                if (!holdsLease(state, permit)) {
                    return false;
                }
                closeCircuit(state);
                return true;

            case CircuitStatus::Open:
                // A call admitted before the circuit opened.
                return false;
        }
        return false;
    });
}

GatewayResult<CircuitBreakerState> CircuitBreaker::recordFailure(const CircuitPermit& permit) {
    auto now = clock_();
    return mutate([this, now, &permit](CircuitBreakerState& state) {
        switch (state.status) {
            case CircuitStatus::Closed:
                ++state.consecutiveFailures;
                if (state.consecutiveFailures >= config_.failureThreshold) {
                    openCircuit(state, now);
                }
                return true;

            case CircuitStatus::HalfOpen:
                if (!holdsLease(state, permit)) {
                    return false;
                }
                ++state.consecutiveFailures;
                openCircuit(state, now);
                return true;

            case CircuitStatus::Open:
                return false;
        }
        return false;
    });
}

GatewayResult<CircuitBreakerState> CircuitBreaker::forceOpen() {
    auto now = clock_();
    return mutate([this, now](CircuitBreakerState& state) {
        state.status = CircuitStatus::Open;
        state.openCount = std::max<uint32_t>(state.openCount, 1);
        state.openedAt = now;
        state.nextProbeAt = now + config_.coolDown;
        return true;
    });
}

GatewayResult<void> CircuitBreaker::reset() {
    auto result = mutate([](CircuitBreakerState& state) {
        closeCircuit(state);
        return true;
    });
    if (!result) {
        return GatewayResult<void>::err(result.error());
    }
    return GatewayResult<void>::ok();
}

GatewayResult<CircuitBreakerState> CircuitBreaker::state() const {
    auto stored = store_->get(key_);
    if (!stored) {
        return GatewayResult<CircuitBreakerState>::err(stored.error());
    }
    return decodeState(stored.value());
}

GatewayResult<bool> CircuitBreaker::isClosed() const {
    auto current = state();
    if (!current) {
        return GatewayResult<bool>::err(current.error());
    }
    return GatewayResult<bool>::ok(current.value().status == CircuitStatus::Closed);
}

uint64_t CircuitBreaker::rejectedCount() const noexcept {
    return rejected_.load(std::memory_order_relaxed);
}

}  // namespace pgw::service
