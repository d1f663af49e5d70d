#pragma once

/// @file gateway_settings.hpp
/// @brief Startup configuration assembled from YAML and the environment.

#include "pgw/foundation/config_manager.hpp"
#include "pgw/foundation/gateway_result.hpp"
#include "pgw/foundation/gateway_logger.hpp"
#include "pgw/service/budget_tracker.hpp"
#include "pgw/service/circuit_breaker.hpp"
#include "pgw/service/curl_provider_client.hpp"
#include "pgw/service/latency_sampler.hpp"
#include "pgw/service/media_server.hpp"
#include "pgw/service/photo_proxy.hpp"
#include "pgw/service/service_mode.hpp"
#include "pgw/service/signed_url_codec.hpp"

#include <chrono>
#include <functional>
#include <optional>
#include <string>
#include <string_view>

namespace pgw::service {

enum class Environment : uint8_t {
    Development,
    Preview,
    Production
};

[[nodiscard]] constexpr std::string_view toString(Environment env) {
    switch (env) {
        case Environment::Development: return "development";
        case Environment::Preview:     return "preview";
        case Environment::Production:  return "production";
    }
    return "development";
}

[[nodiscard]] std::optional<Environment> parseEnvironment(std::string_view text);

/// Production and preview enforce media signatures.
[[nodiscard]] constexpr bool isProductionLike(Environment env) {
    return env != Environment::Development;
}

/// Environment variable lookup, injectable for tests.
using EnvLookup = std::function<std::optional<std::string>(std::string_view name)>;

/// Reads the real process environment.
[[nodiscard]] EnvLookup processEnvironment();

/// Signing secrets must be at least this long outside development.
inline constexpr std::size_t kMinProductionSecretLength = 32;

struct GatewaySettings {
    Environment environment{Environment::Development};
    std::string storeEndpoint{"memory://"};
    foundation::LogLevel logLevel{foundation::LogLevel::Info};
    bool jsonLogs{false};

    CurlProviderConfig provider;
    SigningConfig signing;
    MediaServerConfig server;
    PhotoProxyConfig proxy;
    CircuitBreakerConfig breaker;
    BudgetConfig budget;
    LatencySamplerConfig latency;
    ServiceModeConfig mode;
    std::chrono::milliseconds evaluationInterval{5000};
};

/// Build and validate settings. Environment variables PGW_ENVIRONMENT,
/// PGW_PROVIDER_API_KEY, PGW_SIGNING_SECRET, PGW_SIGNING_PREVIOUS_SECRETS
/// (comma separated) and PGW_STORE_ENDPOINT override the file.
///
/// @return ConfigMissingSecret when the provider credential or signing
///         secret is absent; ConfigInvalidValue for placeholders, short
///         production secrets, unknown environments or out-of-range tunables.
[[nodiscard]] foundation::GatewayResult<GatewaySettings>
loadGatewaySettings(const foundation::ConfigManager& config, const EnvLookup& env);

}  // namespace pgw::service
