#pragma once

/// @file provider_health_store.hpp
/// @brief Per-service provider health flags persisted under `health:<service>`.

#include "pgw/foundation/clock.hpp"
#include "pgw/foundation/gateway_result.hpp"
#include "pgw/foundation/kv_store.hpp"

#include <map>
#include <memory>
#include <optional>
#include <string>
#include <string_view>

namespace pgw::service {

inline constexpr std::string_view kPlacesService = "places";
inline constexpr std::string_view kMapsService = "maps";

/// Health flags set by probes or operators. An unknown service is healthy.
class ProviderHealthStore {
public:
    explicit ProviderHealthStore(std::shared_ptr<foundation::IKeyValueStore> store,
                                 foundation::ClockFn clock = foundation::systemClock());

    foundation::GatewayResult<void> setHealth(std::string_view service, bool healthy,
                                              std::optional<std::string> reason = std::nullopt);

    [[nodiscard]] foundation::GatewayResult<bool> isHealthy(std::string_view service) const;

    /// True only if every stored service is healthy.
    [[nodiscard]] foundation::GatewayResult<bool> allHealthy() const;

    [[nodiscard]] foundation::GatewayResult<std::map<std::string, bool>> getAll() const;

    /// Seed the places and maps services as healthy where absent.
    foundation::GatewayResult<int> initDefaults();

private:
    std::shared_ptr<foundation::IKeyValueStore> store_;
    foundation::ClockFn clock_;
};

}  // namespace pgw::service
