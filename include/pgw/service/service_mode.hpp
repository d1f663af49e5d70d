#pragma once

/// @file service_mode.hpp
/// @brief Service mode: one discrete severity level derived from the
///        provider health, budget, latency and circuit triggers.

#include "pgw/foundation/clock.hpp"
#include "pgw/foundation/gateway_result.hpp"
#include "pgw/foundation/kv_store.hpp"
#include "pgw/foundation/signal.hpp"

#include <chrono>
#include <cstdint>
#include <deque>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace pgw::service {

class FeatureFlagStore;

/// Ordered by severity.
enum class ServiceMode : uint8_t {
    Nominal  = 0,
    Watch    = 1,
    Degraded = 2,
    Outage   = 3
};

[[nodiscard]] constexpr std::string_view toString(ServiceMode mode) {
    switch (mode) {
        case ServiceMode::Nominal:  return "NOMINAL";
        case ServiceMode::Watch:    return "WATCH";
        case ServiceMode::Degraded: return "DEGRADED";
        case ServiceMode::Outage:   return "OUTAGE";
    }
    return "UNKNOWN";
}

[[nodiscard]] std::optional<ServiceMode> parseServiceMode(std::string_view text);

[[nodiscard]] constexpr bool isMoreSevere(ServiceMode a, ServiceMode b) {
    return static_cast<uint8_t>(a) > static_cast<uint8_t>(b);
}

struct ServiceTriggers {
    bool providerHealthy{true};
    bool budgetOk{true};
    bool latencyOk{true};
    bool circuitBreakerClosed{true};

    bool operator==(const ServiceTriggers&) const = default;
};

namespace mode_reason {
inline constexpr std::string_view kCircuitOpen = "circuit_open";
inline constexpr std::string_view kBudgetExceeded = "budget_exceeded";
inline constexpr std::string_view kProviderUnhealthy = "provider_unhealthy";
inline constexpr std::string_view kElevatedLatency = "elevated_latency";
inline constexpr std::string_view kNominal = "all_systems_nominal";
}  // namespace mode_reason

struct ModeDecision {
    ServiceMode mode{ServiceMode::Nominal};
    std::string reason;
};

/// Most severe applicable rule wins:
/// open circuit > budget > provider health > latency > nominal.
[[nodiscard]] ModeDecision resolveMode(const ServiceTriggers& triggers);

struct ServiceModeState {
    ServiceMode currentMode{ServiceMode::Nominal};
    std::string reason{mode_reason::kNominal};

    /// Changes only when currentMode changes.
    foundation::Timestamp enteredAt{};

    /// Latest sampled triggers, even while a relaxation is held back.
    ServiceTriggers triggers;
};

struct ModeTransition {
    ServiceMode from{ServiceMode::Nominal};
    ServiceMode to{ServiceMode::Nominal};
    std::string reason;
    ServiceTriggers triggers;
    foundation::Timestamp at{};
    bool forced{false};
};

/// Flag values applied to FeatureFlagStore when @p mode is entered.
[[nodiscard]] std::map<std::string, bool> featureProfile(ServiceMode mode);

/// Flag reason written by a profile, e.g. "service_mode_WATCH_elevated_latency".
[[nodiscard]] std::string profileReason(ServiceMode mode, std::string_view reason);

/// True if @p reason was written by a mode profile rather than an operator.
[[nodiscard]] bool isProfileReason(std::string_view reason);

struct ServiceModeConfig {
    /// How long a less severe trigger set must hold before it is committed.
    std::chrono::seconds dwell{60};

    std::size_t historyLimit = 50;

    bool applyFeatureProfiles = true;
};

/// Process-wide holder of the current ServiceModeState.
///
/// initialize() loads the persisted state; recompute() is the single entry
/// point that moves it. Escalations commit immediately; relaxations commit
/// only after the same trigger set has been observed for the dwell period.
/// Every committed transition is persisted under `service_mode`, applied to
/// the feature flags, recorded in history and published to subscribers.
class ServiceModeController {
public:
    using Subscriber = std::function<void(const ModeTransition&)>;
    using SubscriptionId = foundation::Signal<const ModeTransition&>::SlotId;

    ServiceModeController(std::shared_ptr<foundation::IKeyValueStore> store,
                          std::shared_ptr<FeatureFlagStore> flags,
                          ServiceModeConfig config = {},
                          foundation::ClockFn clock = foundation::systemClock());

    /// Load the persisted state, or start NOMINAL and persist it.
    foundation::GatewayResult<ServiceModeState> initialize();

    /// Feed a fresh trigger sample. Returns the state after the sample.
    ServiceModeState recompute(const ServiceTriggers& triggers);

    /// Commit @p mode immediately, bypassing hysteresis. The override holds
    /// (samples still update the triggers) until clearOverride().
    ServiceModeState forceMode(ServiceMode mode, std::string reason);

    /// Resume trigger-driven evaluation after forceMode().
    void clearOverride();

    [[nodiscard]] bool isOverridden() const;

    [[nodiscard]] ServiceModeState current() const;

    /// currentMode >= DEGRADED.
    [[nodiscard]] bool shouldRefuseOptionalFeatures() const;

    /// Committed transitions, newest first.
    [[nodiscard]] std::vector<ModeTransition> history() const;

    SubscriptionId subscribe(Subscriber subscriber);
    bool unsubscribe(SubscriptionId id);

private:
    struct PendingRelaxation {
        ServiceTriggers triggers;
        foundation::Timestamp since{};
    };

    /// Caller holds mutex_. Returns the transition to publish.
    ModeTransition commitLocked(ModeDecision decision, const ServiceTriggers& triggers,
                                foundation::Timestamp now, bool forced);

    void publish(const ModeTransition& transition, const ServiceModeState& state);
    void persist(const ServiceModeState& state);
    void applyProfile(const ModeTransition& transition);

    std::shared_ptr<foundation::IKeyValueStore> store_;
    std::shared_ptr<FeatureFlagStore> flags_;
    ServiceModeConfig config_;
    foundation::ClockFn clock_;

    /// Held from commit through publish so that the persisted record, the
    /// flag profile and subscribers see transitions in commit order.
    /// Subscribers must not call recompute() or forceMode().
    std::mutex publishMutex_;

    mutable std::mutex mutex_;
    ServiceModeState state_;
    std::optional<PendingRelaxation> pending_;
    bool overridden_{false};
    std::deque<ModeTransition> history_;

    foundation::Signal<const ModeTransition&> onTransition_;
};

/// Encode/decode the persisted `service_mode` record.
[[nodiscard]] std::string encodeModeState(const ServiceModeState& state);
[[nodiscard]] foundation::GatewayResult<ServiceModeState> decodeModeState(std::string_view text);

}  // namespace pgw::service
