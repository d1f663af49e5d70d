/// @file feature_flag_store.cpp
/// @brief FeatureFlagStore over the versioned key-value store.

#include "pgw/service/feature_flag_store.hpp"

#include "pgw/foundation/gateway_logger.hpp"

namespace pgw::service {

using foundation::ErrorCode;
using foundation::GatewayError;
using foundation::GatewayResult;
using foundation::LogCategory;

namespace {

constexpr std::string_view kFlagPrefix = "flag:";

std::string flagKey(std::string_view key) {
    return std::string(kFlagPrefix) + std::string(key);
}

std::string encodeFlag(bool enabled, const std::optional<std::string>& reason,
                       foundation::Timestamp at) {
    YAML::Node node;
    node["enabled"] = enabled;
    if (reason) {
        node["reason"] = *reason;
    }
    node["updated_at"] = foundation::toUnixMillis(at);
    return foundation::encodeRecord(node);
}

GatewayResult<FeatureFlag> decodeFlag(std::string_view key, const std::string& text) {
    auto node = foundation::decodeRecord(text);
    if (!node) {
        return GatewayResult<FeatureFlag>::err(node.error());
    }
    const YAML::Node& record = node.value();
    try {
        FeatureFlag flag;
        flag.key = std::string(key);
        flag.enabled = record["enabled"].as<bool>(true);
        if (record["reason"]) {
            flag.reason = record["reason"].as<std::string>();
        }
        flag.updatedAt = foundation::fromUnixMillis(record["updated_at"].as<int64_t>(0));
        return GatewayResult<FeatureFlag>::ok(std::move(flag));
    } catch (const YAML::Exception& e) {
        return GatewayResult<FeatureFlag>::err(
            GatewayError(ErrorCode::RecordCorrupt,
                         "flag '" + std::string(key) + "' is corrupt: " + e.what()));
    }
}

}  // namespace

std::vector<std::string> defaultFlagKeys() {
    return {
        std::string(flags::kPhotosEnabled),
        std::string(flags::kOpenNowEnabled),
        std::string(flags::kProviderSearchEnabled),
        std::string(flags::kAutocompleteEnabled),
        std::string(flags::kMapSearchEnabled),
    };
}

FeatureFlagStore::FeatureFlagStore(std::shared_ptr<foundation::IKeyValueStore> store,
                                   foundation::ClockFn clock)
    : store_(std::move(store)), clock_(std::move(clock)) {}

GatewayResult<std::optional<FeatureFlag>> FeatureFlagStore::find(std::string_view key) const {
    auto stored = store_->get(flagKey(key));
    if (!stored) {
        return GatewayResult<std::optional<FeatureFlag>>::err(stored.error());
    }
    if (!stored.value()) {
        return GatewayResult<std::optional<FeatureFlag>>::ok(std::nullopt);
    }
    auto flag = decodeFlag(key, stored.value()->value);
    if (!flag) {
        return GatewayResult<std::optional<FeatureFlag>>::err(flag.error());
    }
    return GatewayResult<std::optional<FeatureFlag>>::ok(std::move(flag).value());
}

GatewayResult<bool> FeatureFlagStore::get(std::string_view key) const {
    auto flag = find(key);
    if (!flag) {
        return GatewayResult<bool>::err(flag.error());
    }
    return GatewayResult<bool>::ok(flag.value() ? flag.value()->enabled : true);
}

GatewayResult<std::map<std::string, bool>> FeatureFlagStore::getAll() const {
    auto entries = store_->scan(kFlagPrefix);
    if (!entries) {
        return GatewayResult<std::map<std::string, bool>>::err(entries.error());
    }

    std::map<std::string, bool> out;
    for (const auto& key : defaultFlagKeys()) {
        out[key] = true;
    }
    for (const auto& [storeKey, entry] : entries.value()) {
        auto key = storeKey.substr(kFlagPrefix.size());
        auto flag = decodeFlag(key, entry.value);
        if (!flag) {
            PGW_LOG_WARN(LogCategory::Store,
                         "skipping corrupt flag record: " + std::string(flag.error().message()));
            continue;
        }
        out[key] = flag.value().enabled;
    }
    return GatewayResult<std::map<std::string, bool>>::ok(std::move(out));
}

GatewayResult<void> FeatureFlagStore::set(std::string_view key, bool enabled,
                                          std::optional<std::string> reason) {
    if (key.empty()) {
        return GatewayResult<void>::err(
            GatewayError(ErrorCode::InvalidArgument, "flag key must not be empty"));
    }
    auto record = encodeFlag(enabled, reason, clock_());
    auto result = foundation::updateWithRetry(
        *store_, flagKey(key),
        [&record](const std::optional<foundation::VersionedValue>&)
            -> GatewayResult<std::optional<std::string>> {
            return GatewayResult<std::optional<std::string>>::ok(record);
        });
    if (result) {
        PGW_LOG_INFO(LogCategory::Gateway,
                     "flag " + std::string(key) + (enabled ? " enabled" : " disabled") +
                     (reason ? " (" + *reason + ")" : std::string()));
    }
    return result;
}

GatewayResult<int> FeatureFlagStore::initDefaults() {
    int created = 0;
    auto now = clock_();
    for (const auto& key : defaultFlagKeys()) {
        auto written = store_->compareAndSet(flagKey(key), 0, encodeFlag(true, std::nullopt, now));
        if (!written) {
            return GatewayResult<int>::err(written.error());
        }
        if (written.value()) {
            ++created;
        }
    }
    return GatewayResult<int>::ok(created);
}

}  // namespace pgw::service
