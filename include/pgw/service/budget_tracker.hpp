#pragma once

/// @file budget_tracker.hpp
/// @brief Fixed-window spend counter guarding a metered provider budget.

#include "pgw/foundation/clock.hpp"
#include "pgw/foundation/gateway_result.hpp"
#include "pgw/foundation/kv_store.hpp"

#include <chrono>
#include <memory>
#include <string>

namespace pgw::service {

struct BudgetConfig {
    /// Counter identity; stored as `budget:<endpointClass>`.
    std::string endpointClass = "photos";

    /// Window length. Windows are aligned to multiples of this length since
    /// the Unix epoch, so a 24h window starts at 00:00 UTC.
    std::chrono::seconds window{std::chrono::hours(24)};

    double limit = 5000.0;
};

struct BudgetCounter {
    foundation::Timestamp windowStart{};
    double spent{0.0};
    double limit{0.0};

    [[nodiscard]] bool isOk() const noexcept { return spent < limit; }
    [[nodiscard]] double remaining() const noexcept { return spent < limit ? limit - spent : 0.0; }
};

/// Budget counter shared through the durable store.
///
/// Rollover is lazy: a counter whose window has elapsed reads as zero spend
/// in the current window, and the next recordSpend() writes the new window.
/// Spend is added with compare-and-set so concurrent writers never lose an
/// increment.
class BudgetTracker {
public:
    BudgetTracker(std::shared_ptr<foundation::IKeyValueStore> store,
                  BudgetConfig config,
                  foundation::ClockFn clock = foundation::systemClock());

    /// Add @p amount to the current window.
    /// @return The counter after the increment; InvalidArgument for a
    ///         negative amount.
    foundation::GatewayResult<BudgetCounter> recordSpend(double amount);

    /// Current window's counter.
    [[nodiscard]] foundation::GatewayResult<BudgetCounter> snapshot() const;

    /// spent < limit in the current window.
    [[nodiscard]] foundation::GatewayResult<bool> isOk() const;

    /// Start of the window containing @p at.
    [[nodiscard]] foundation::Timestamp windowStartFor(foundation::Timestamp at) const;

    [[nodiscard]] const BudgetConfig& config() const noexcept { return config_; }

private:
    foundation::GatewayResult<BudgetCounter>
    decode(const std::optional<foundation::VersionedValue>& stored,
           foundation::Timestamp now) const;

    std::shared_ptr<foundation::IKeyValueStore> store_;
    BudgetConfig config_;
    foundation::ClockFn clock_;
    std::string key_;
};

}  // namespace pgw::service
