/// @file service_mode.cpp
/// @brief Mode resolution, hysteresis and publication.

#include "pgw/service/service_mode.hpp"

#include "pgw/foundation/gateway_logger.hpp"
#include "pgw/foundation/gateway_metrics.hpp"
#include "pgw/service/feature_flag_store.hpp"

namespace pgw::service {

using foundation::ErrorCode;
using foundation::GatewayError;
using foundation::GatewayResult;
using foundation::LogCategory;
using foundation::Timestamp;

namespace {

constexpr std::string_view kModeKey = "service_mode";
constexpr std::string_view kProfilePrefix = "service_mode_";

}  // namespace

std::optional<ServiceMode> parseServiceMode(std::string_view text) {
    for (auto mode : {ServiceMode::Nominal, ServiceMode::Watch,
                      ServiceMode::Degraded, ServiceMode::Outage}) {
        if (text == toString(mode)) {
            return mode;
        }
    }
    return std::nullopt;
}

ModeDecision resolveMode(const ServiceTriggers& triggers) {
    if (!triggers.circuitBreakerClosed) {
        return {ServiceMode::Outage, std::string(mode_reason::kCircuitOpen)};
    }
    if (!triggers.budgetOk) {
        return {ServiceMode::Degraded, std::string(mode_reason::kBudgetExceeded)};
    }
    if (!triggers.providerHealthy) {
        return {ServiceMode::Degraded, std::string(mode_reason::kProviderUnhealthy)};
    }
    if (!triggers.latencyOk) {
        return {ServiceMode::Watch, std::string(mode_reason::kElevatedLatency)};
    }
    return {ServiceMode::Nominal, std::string(mode_reason::kNominal)};
}

std::map<std::string, bool> featureProfile(ServiceMode mode) {
    std::map<std::string, bool> profile;
    bool optionalOn = mode == ServiceMode::Nominal;
    bool providerOn = mode == ServiceMode::Nominal || mode == ServiceMode::Watch;
    profile[std::string(flags::kPhotosEnabled)] = optionalOn;
    profile[std::string(flags::kOpenNowEnabled)] = optionalOn;
    profile[std::string(flags::kProviderSearchEnabled)] = providerOn;
    profile[std::string(flags::kAutocompleteEnabled)] = providerOn;
    profile[std::string(flags::kMapSearchEnabled)] = providerOn;
    return profile;
}

std::string profileReason(ServiceMode mode, std::string_view reason) {
    return std::string(kProfilePrefix) + std::string(toString(mode)) + "_" + std::string(reason);
}

bool isProfileReason(std::string_view reason) {
    return reason.substr(0, kProfilePrefix.size()) == kProfilePrefix;
}

std::string encodeModeState(const ServiceModeState& state) {
    YAML::Node node;
    node["mode"] = std::string(toString(state.currentMode));
    node["reason"] = state.reason;
    node["entered_at"] = foundation::toUnixMillis(state.enteredAt);
    node["triggers"]["provider_healthy"] = state.triggers.providerHealthy;
    node["triggers"]["budget_ok"] = state.triggers.budgetOk;
    node["triggers"]["latency_ok"] = state.triggers.latencyOk;
    node["triggers"]["circuit_closed"] = state.triggers.circuitBreakerClosed;
    return foundation::encodeRecord(node);
}

GatewayResult<ServiceModeState> decodeModeState(std::string_view text) {
    auto node = foundation::decodeRecord(text);
    if (!node) {
        return GatewayResult<ServiceModeState>::err(node.error());
    }
    const YAML::Node& record = node.value();
    try {
        auto mode = parseServiceMode(record["mode"].as<std::string>());
        if (!mode) {
            return GatewayResult<ServiceModeState>::err(
                GatewayError(ErrorCode::RecordCorrupt, "unknown service mode"));
        }
        ServiceModeState state;
        state.currentMode = *mode;
        state.reason = record["reason"].as<std::string>(std::string());
        state.enteredAt = foundation::fromUnixMillis(record["entered_at"].as<int64_t>(0));
        const YAML::Node triggers = record["triggers"];
        if (triggers) {
            state.triggers.providerHealthy = triggers["provider_healthy"].as<bool>(true);
            state.triggers.budgetOk = triggers["budget_ok"].as<bool>(true);
            state.triggers.latencyOk = triggers["latency_ok"].as<bool>(true);
            state.triggers.circuitBreakerClosed = triggers["circuit_closed"].as<bool>(true);
        }
        return GatewayResult<ServiceModeState>::ok(std::move(state));
    } catch (const YAML::Exception& e) {
        return GatewayResult<ServiceModeState>::err(
            GatewayError(ErrorCode::RecordCorrupt, std::string("service mode record: ") + e.what()));
    }
}

ServiceModeController::ServiceModeController(std::shared_ptr<foundation::IKeyValueStore> store,
                                             std::shared_ptr<FeatureFlagStore> flags,
                                             ServiceModeConfig config,
                                             foundation::ClockFn clock)
    : store_(std::move(store)),
      flags_(std::move(flags)),
      config_(config),
      clock_(std::move(clock)) {
    state_.enteredAt = clock_();
}

GatewayResult<ServiceModeState> ServiceModeController::initialize() {
    std::lock_guard publishLock(publishMutex_);
    auto stored = store_->get(kModeKey);
    if (!stored) {
        return GatewayResult<ServiceModeState>::err(stored.error());
    }

    ServiceModeState loaded;
    loaded.enteredAt = clock_();
    bool fresh = true;
    if (stored.value()) {
        auto decoded = decodeModeState(stored.value()->value);
        if (decoded) {
            loaded = decoded.value();
            fresh = false;
        } else {
            PGW_LOG_WARN(LogCategory::Mode,
                         "discarding unreadable service mode record: " +
                         std::string(decoded.error().message()));
        }
    }

    {
        std::lock_guard lock(mutex_);
        state_ = loaded;
        pending_.reset();
    }
    if (fresh) {
        persist(loaded);
    }
    foundation::GatewayMetrics::instance().setGauge(
        "pgw_service_mode", static_cast<double>(static_cast<uint8_t>(loaded.currentMode)));
    PGW_LOG_INFO(LogCategory::Mode,
                 "service mode " + std::string(toString(loaded.currentMode)) +
                 " (" + loaded.reason + ")");
    return GatewayResult<ServiceModeState>::ok(loaded);
}

ModeTransition ServiceModeController::commitLocked(ModeDecision decision,
                                                   const ServiceTriggers& triggers,
                                                   Timestamp now, bool forced) {
    ModeTransition transition{state_.currentMode, decision.mode, decision.reason,
                              triggers, now, forced};
    state_ = ServiceModeState{decision.mode, std::move(decision.reason), now, triggers};
    pending_.reset();

    history_.push_front(transition);
    while (history_.size() > config_.historyLimit) {
        history_.pop_back();
    }
    return transition;
}

ServiceModeState ServiceModeController::recompute(const ServiceTriggers& triggers) {
    std::lock_guard publishLock(publishMutex_);
    auto now = clock_();
    auto decision = resolveMode(triggers);

    std::optional<ModeTransition> transition;
    ServiceModeState snapshot;
    bool dirty = false;
    {
        std::lock_guard lock(mutex_);
        if (overridden_) {
            dirty = !(state_.triggers == triggers);
            state_ = ServiceModeState{state_.currentMode, state_.reason, state_.enteredAt, triggers};
        } else if (isMoreSevere(decision.mode, state_.currentMode)) {
            transition = commitLocked(std::move(decision), triggers, now, false);
        } else if (decision.mode == state_.currentMode) {
            pending_.reset();
            dirty = state_.reason != decision.reason || !(state_.triggers == triggers);
            state_ = ServiceModeState{state_.currentMode, std::move(decision.reason),
                                      state_.enteredAt, triggers};
        } else {
            if (!pending_ || !(pending_->triggers == triggers)) {
                pending_ = PendingRelaxation{triggers, now};
            }
            if (now - pending_->since >= config_.dwell) {
                transition = commitLocked(std::move(decision), triggers, now, false);
            } else {
                dirty = !(state_.triggers == triggers);
                state_ = ServiceModeState{state_.currentMode, state_.reason,
                                          state_.enteredAt, triggers};
            }
        }
        snapshot = state_;
    }

    if (transition) {
        publish(*transition, snapshot);
    } else if (dirty) {
        persist(snapshot);
    }
    return snapshot;
}

ServiceModeState ServiceModeController::forceMode(ServiceMode mode, std::string reason) {
    std::lock_guard publishLock(publishMutex_);
    auto now = clock_();
    std::optional<ModeTransition> transition;
    ServiceModeState snapshot;
    {
        std::lock_guard lock(mutex_);
        overridden_ = true;
        if (mode != state_.currentMode) {
            transition = commitLocked(ModeDecision{mode, std::move(reason)}, state_.triggers,
                                      now, true);
        } else {
            state_ = ServiceModeState{state_.currentMode, std::move(reason),
                                      state_.enteredAt, state_.triggers};
        }
        snapshot = state_;
    }

    PGW_LOG_WARN(LogCategory::Mode,
                 "service mode forced to " + std::string(toString(mode)) + " (" +
                 snapshot.reason + ")");
    if (transition) {
        publish(*transition, snapshot);
    } else {
        persist(snapshot);
    }
    return snapshot;
}

void ServiceModeController::clearOverride() {
    std::lock_guard lock(mutex_);
    if (overridden_) {
        overridden_ = false;
        pending_.reset();
        PGW_LOG_INFO(LogCategory::Mode, "service mode override cleared");
    }
}

bool ServiceModeController::isOverridden() const {
    std::lock_guard lock(mutex_);
    return overridden_;
}

ServiceModeState ServiceModeController::current() const {
    std::lock_guard lock(mutex_);
    return state_;
}

bool ServiceModeController::shouldRefuseOptionalFeatures() const {
    std::lock_guard lock(mutex_);
    return !isMoreSevere(ServiceMode::Degraded, state_.currentMode);
}

std::vector<ModeTransition> ServiceModeController::history() const {
    std::lock_guard lock(mutex_);
    return std::vector<ModeTransition>(history_.begin(), history_.end());
}

ServiceModeController::SubscriptionId ServiceModeController::subscribe(Subscriber subscriber) {
    return onTransition_.connect(std::move(subscriber));
}

bool ServiceModeController::unsubscribe(SubscriptionId id) {
    return onTransition_.disconnect(id);
}

void ServiceModeController::publish(const ModeTransition& transition,
                                    const ServiceModeState& state) {
    auto message = "service mode " + std::string(toString(transition.from)) + " -> " +
                   std::string(toString(transition.to)) + " (" + transition.reason + ")";
    if (isMoreSevere(transition.to, transition.from)) {
        PGW_LOG_WARN(LogCategory::Mode, message);
    } else {
        PGW_LOG_INFO(LogCategory::Mode, message);
    }
    foundation::GatewayMetrics::instance().setGauge(
        "pgw_service_mode", static_cast<double>(static_cast<uint8_t>(transition.to)));
    foundation::GatewayMetrics::instance().incrementCounter(
        "pgw_service_mode_transitions_total", {{"to", std::string(toString(transition.to))}});

    persist(state);
    applyProfile(transition);
    onTransition_.emit(transition);
}

void ServiceModeController::persist(const ServiceModeState& state) {
    auto record = encodeModeState(state);
    auto result = foundation::updateWithRetry(
        *store_, kModeKey,
        [&record](const std::optional<foundation::VersionedValue>&)
            -> GatewayResult<std::optional<std::string>> {
            return GatewayResult<std::optional<std::string>>::ok(record);
        });
    if (!result) {
        PGW_LOG_WARN(LogCategory::Mode,
                     "failed to persist service mode: " + std::string(result.error().message()));
    }
}

void ServiceModeController::applyProfile(const ModeTransition& transition) {
    if (!config_.applyFeatureProfiles || !flags_) {
        return;
    }
    auto reason = profileReason(transition.to, transition.reason);
    for (const auto& [key, enabled] : featureProfile(transition.to)) {
        auto result = flags_->set(key, enabled, reason);
        if (!result) {
            PGW_LOG_WARN(LogCategory::Mode,
                         "failed to apply " + std::string(toString(transition.to)) +
                         " profile to " + key + ": " + std::string(result.error().message()));
        }
    }
}

}  // namespace pgw::service
