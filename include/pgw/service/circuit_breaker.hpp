#pragma once

/// @file circuit_breaker.hpp
/// @brief Store-backed circuit breaker for a provider endpoint class.
///
/// Implements Closed -> Open -> HalfOpen with exponential cool-down on
/// repeated opens. State lives in the shared key-value store so every
/// gateway replica sees the same breaker.

#include "pgw/foundation/clock.hpp"
#include "pgw/foundation/gateway_result.hpp"
#include "pgw/foundation/kv_store.hpp"

#include <atomic>
#include <chrono>
#include <cstdint>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <string_view>

namespace pgw::service {

enum class CircuitStatus : uint8_t {
    Closed,   ///< Calls pass through.
    Open,     ///< Calls are short-circuited until nextProbeAt.
    HalfOpen  ///< One probe call is in flight.
};

[[nodiscard]] constexpr std::string_view toString(CircuitStatus s) {
    switch (s) {
        case CircuitStatus::Closed:   return "closed";
        case CircuitStatus::Open:     return "open";
        case CircuitStatus::HalfOpen: return "half_open";
    }
    return "unknown";
}

[[nodiscard]] std::optional<CircuitStatus> parseCircuitStatus(std::string_view text);

struct CircuitBreakerConfig {
    /// Endpoint class; the breaker is stored as `circuit:<name>`.
    std::string name = "places";

    /// Consecutive failures in Closed that open the circuit.
    uint32_t failureThreshold = 5;

    /// Cool-down after the first open. Also the lease granted to a probe.
    std::chrono::seconds coolDown{30};

    /// Upper bound for the backed-off cool-down.
    std::chrono::seconds maxCoolDown{600};

    /// Cool-down growth per consecutive open.
    double backoffMultiplier = 2.0;
};

struct CircuitBreakerState {
    CircuitStatus status{CircuitStatus::Closed};
    uint32_t consecutiveFailures{0};

    /// Opens since the circuit was last closed; drives the backoff.
    uint32_t openCount{0};

    std::optional<foundation::Timestamp> openedAt;

    /// Open: earliest probe time. HalfOpen: expiry of the granted probe.
    std::optional<foundation::Timestamp> nextProbeAt;

    /// Id of the most recent HalfOpen lease. Grows across closes so a
    /// stale holder never matches a later lease.
    uint64_t lease{0};
};

/// Outcome of CircuitBreaker::allowRequest().
struct CircuitPermit {
    bool allowed{false};

    /// Non-zero when this call holds the HalfOpen lease. Only the holder's
    /// result settles a half-open circuit.
    uint64_t lease{0};

    explicit operator bool() const noexcept { return allowed; }
};

/// Circuit breaker protecting provider calls.
///
/// @code
///   CircuitBreaker breaker(store, CircuitBreakerConfig{.name = "places"});
///   auto permit = breaker.allowRequest();
///   if (!permit) {
///       return circuitOpen();          // fail fast
///   }
///   auto reply = client.resolveMedia(...);
///   reply ? breaker.recordSuccess(permit) : breaker.recordFailure(permit);
/// @endcode
///
/// Every transition is a compare-and-set on the stored state, so exactly
/// one replica wins the Open -> HalfOpen probe.
class CircuitBreaker {
public:
    CircuitBreaker(std::shared_ptr<foundation::IKeyValueStore> store,
                   CircuitBreakerConfig config,
                   foundation::ClockFn clock = foundation::systemClock());

    /// Whether a call may proceed. Grants the single HalfOpen lease when the
    /// cool-down has elapsed. Fails closed: a store error rejects the call.
    [[nodiscard]] CircuitPermit allowRequest();

    /// Settle a call. In HalfOpen only the current lease holder counts;
    /// results of calls admitted earlier leave the state untouched.
    foundation::GatewayResult<CircuitBreakerState> recordSuccess(const CircuitPermit& permit = {});

    foundation::GatewayResult<CircuitBreakerState> recordFailure(const CircuitPermit& permit = {});

    /// Administrative override: open the circuit now with the base cool-down.
    foundation::GatewayResult<CircuitBreakerState> forceOpen();

    /// Administrative override: close the circuit and clear all counters.
    foundation::GatewayResult<void> reset();

    [[nodiscard]] foundation::GatewayResult<CircuitBreakerState> state() const;

    /// status == Closed.
    [[nodiscard]] foundation::GatewayResult<bool> isClosed() const;

    /// Cool-down applied after the @p openCount-th consecutive open.
    [[nodiscard]] std::chrono::seconds coolDownFor(uint32_t openCount) const;

    /// Calls rejected by this instance since construction.
    [[nodiscard]] uint64_t rejectedCount() const noexcept;

    [[nodiscard]] std::string_view name() const noexcept { return config_.name; }

    [[nodiscard]] const CircuitBreakerConfig& config() const noexcept { return config_; }

private:
    using Transition = std::function<bool(CircuitBreakerState&)>;

    /// Apply @p transition atomically; it returns false for "no change".
    foundation::GatewayResult<CircuitBreakerState> mutate(const Transition& transition);

    void openCircuit(CircuitBreakerState& state, foundation::Timestamp now) const;
    void publish(CircuitStatus before, const CircuitBreakerState& after) const;

    std::shared_ptr<foundation::IKeyValueStore> store_;
    CircuitBreakerConfig config_;
    foundation::ClockFn clock_;
    std::string key_;
    std::atomic<uint64_t> rejected_{0};
};

}  // namespace pgw::service
