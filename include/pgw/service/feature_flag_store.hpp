#pragma once

/// @file feature_flag_store.hpp
/// @brief Durable feature flags gating provider-backed code paths.

#include "pgw/foundation/clock.hpp"
#include "pgw/foundation/gateway_result.hpp"
#include "pgw/foundation/kv_store.hpp"

#include <map>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace pgw::service {

/// Well-known flag keys.
namespace flags {
inline constexpr std::string_view kPhotosEnabled = "photos_enabled";
inline constexpr std::string_view kOpenNowEnabled = "open_now_enabled";
inline constexpr std::string_view kProviderSearchEnabled = "provider_search_enabled";
inline constexpr std::string_view kAutocompleteEnabled = "autocomplete_enabled";
inline constexpr std::string_view kMapSearchEnabled = "map_search_enabled";
}  // namespace flags

/// Keys seeded by FeatureFlagStore::initDefaults().
[[nodiscard]] std::vector<std::string> defaultFlagKeys();

struct FeatureFlag {
    std::string key;
    bool enabled{true};
    std::optional<std::string> reason;
    foundation::Timestamp updatedAt{};
};

/// Feature flags persisted under `flag:<key>`.
///
/// A missing flag is enabled. Flags exist to switch costly features off, so
/// callers that cannot read the store (get() returns an error) are expected
/// to proceed as if the flag were enabled.
class FeatureFlagStore {
public:
    explicit FeatureFlagStore(std::shared_ptr<foundation::IKeyValueStore> store,
                              foundation::ClockFn clock = foundation::systemClock());

    /// @return true when enabled or absent; an error only when the store
    ///         itself failed.
    [[nodiscard]] foundation::GatewayResult<bool> get(std::string_view key) const;

    /// Full record including the disable reason; nullopt when absent.
    [[nodiscard]] foundation::GatewayResult<std::optional<FeatureFlag>>
    find(std::string_view key) const;

    /// Every stored flag plus any default key not yet stored (as enabled).
    [[nodiscard]] foundation::GatewayResult<std::map<std::string, bool>> getAll() const;

    /// Upsert a flag.
    foundation::GatewayResult<void> set(std::string_view key, bool enabled,
                                        std::optional<std::string> reason = std::nullopt);

    /// Seed the default keys as enabled where absent. Idempotent.
    /// @return Number of keys created by this call.
    foundation::GatewayResult<int> initDefaults();

private:
    std::shared_ptr<foundation::IKeyValueStore> store_;
    foundation::ClockFn clock_;
};

}  // namespace pgw::service
