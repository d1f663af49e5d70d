/// @file provider_health_store.cpp
/// @brief ProviderHealthStore implementation.

#include "pgw/service/provider_health_store.hpp"

#include "pgw/foundation/gateway_logger.hpp"

namespace pgw::service {

using foundation::ErrorCode;
using foundation::GatewayError;
using foundation::GatewayResult;
using foundation::LogCategory;

namespace {

constexpr std::string_view kHealthPrefix = "health:";

std::string encodeHealth(bool healthy, const std::optional<std::string>& reason,
                         foundation::Timestamp at) {
    YAML::Node node;
    node["healthy"] = healthy;
    if (reason) {
        node["reason"] = *reason;
    }
    node["updated_at"] = foundation::toUnixMillis(at);
    return foundation::encodeRecord(node);
}

GatewayResult<bool> decodeHealthy(const std::string& text) {
    auto node = foundation::decodeRecord(text);
    if (!node) {
        return GatewayResult<bool>::err(node.error());
    }
    const YAML::Node& record = node.value();
    try {
        return GatewayResult<bool>::ok(record["healthy"].as<bool>(true));
    } catch (const YAML::Exception& e) {
        return GatewayResult<bool>::err(
            GatewayError(ErrorCode::RecordCorrupt, std::string("health record: ") + e.what()));
    }
}

}  // namespace

ProviderHealthStore::ProviderHealthStore(std::shared_ptr<foundation::IKeyValueStore> store,
                                         foundation::ClockFn clock)
    : store_(std::move(store)), clock_(std::move(clock)) {}

GatewayResult<void> ProviderHealthStore::setHealth(std::string_view service, bool healthy,
                                                   std::optional<std::string> reason) {
    auto record = encodeHealth(healthy, reason, clock_());
    auto result = foundation::updateWithRetry(
        *store_, std::string(kHealthPrefix) + std::string(service),
        [&record](const std::optional<foundation::VersionedValue>&)
            -> GatewayResult<std::optional<std::string>> {
            return GatewayResult<std::optional<std::string>>::ok(record);
        });
    if (result && !healthy) {
        PGW_LOG_WARN(LogCategory::Provider,
                     "provider service " + std::string(service) + " marked unhealthy" +
                     (reason ? ": " + *reason : std::string()));
    }
    return result;
}

GatewayResult<bool> ProviderHealthStore::isHealthy(std::string_view service) const {
    auto stored = store_->get(std::string(kHealthPrefix) + std::string(service));
    if (!stored) {
        return GatewayResult<bool>::err(stored.error());
    }
    if (!stored.value()) {
        return GatewayResult<bool>::ok(true);
    }
    return decodeHealthy(stored.value()->value);
}

GatewayResult<bool> ProviderHealthStore::allHealthy() const {
    auto all = getAll();
    if (!all) {
        return GatewayResult<bool>::err(all.error());
    }
    for (const auto& [service, healthy] : all.value()) {
        if (!healthy) {
            return GatewayResult<bool>::ok(false);
        }
    }
    return GatewayResult<bool>::ok(true);
}

GatewayResult<std::map<std::string, bool>> ProviderHealthStore::getAll() const {
    auto entries = store_->scan(kHealthPrefix);
    if (!entries) {
        return GatewayResult<std::map<std::string, bool>>::err(entries.error());
    }
    std::map<std::string, bool> out;
    for (const auto& [key, entry] : entries.value()) {
        auto healthy = decodeHealthy(entry.value);
        if (!healthy) {
            return GatewayResult<std::map<std::string, bool>>::err(healthy.error());
        }
        out[key.substr(kHealthPrefix.size())] = healthy.value();
    }
    return GatewayResult<std::map<std::string, bool>>::ok(std::move(out));
}

GatewayResult<int> ProviderHealthStore::initDefaults() {
    int created = 0;
    auto now = clock_();
    for (auto service : {kPlacesService, kMapsService}) {
        auto written = store_->compareAndSet(std::string(kHealthPrefix) + std::string(service), 0,
                                             encodeHealth(true, std::nullopt, now));
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
