/// @file gateway_settings.cpp
/// @brief Settings assembly and fatal startup validation.

#include "pgw/service/gateway_settings.hpp"

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <vector>

namespace pgw::service {

using foundation::ConfigManager;
using foundation::ErrorCode;
using foundation::GatewayError;
using foundation::GatewayResult;
using foundation::LogLevel;

namespace {

std::string toLower(std::string_view text) {
    std::string out(text);
    std::transform(out.begin(), out.end(), out.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return out;
}

bool isPlaceholder(std::string_view value) {
    auto lowered = toLower(value);
    return lowered.rfind("your-", 0) == 0 || lowered.rfind("your_", 0) == 0 ||
           lowered == "changeme" || lowered == "change-me";
}

std::optional<LogLevel> parseLogLevel(std::string_view text) {
    auto lowered = toLower(text);
    if (lowered == "trace")    { return LogLevel::Trace; }
    if (lowered == "debug")    { return LogLevel::Debug; }
    if (lowered == "info")     { return LogLevel::Info; }
    if (lowered == "warning" || lowered == "warn") { return LogLevel::Warning; }
    if (lowered == "error")    { return LogLevel::Error; }
    if (lowered == "critical") { return LogLevel::Critical; }
    if (lowered == "off")      { return LogLevel::Off; }
    return std::nullopt;
}

std::vector<std::string> splitList(std::string_view text) {
    std::vector<std::string> items;
    while (!text.empty()) {
        auto comma = text.find(',');
        auto item = text.substr(0, comma);
        while (!item.empty() && item.front() == ' ') { item.remove_prefix(1); }
        while (!item.empty() && item.back() == ' ') { item.remove_suffix(1); }
        if (!item.empty()) {
            items.emplace_back(item);
        }
        if (comma == std::string_view::npos) {
            break;
        }
        text.remove_prefix(comma + 1);
    }
    return items;
}

/// Environment value if set and non-empty, else the config value.
std::string resolve(const ConfigManager& config, const EnvLookup& env,
                    std::string_view envName, std::string_view configKey,
                    std::string fallback = {}) {
    if (auto value = env(envName); value && !value->empty()) {
        return *value;
    }
    return config.getOr<std::string>(configKey, std::move(fallback));
}

GatewayResult<GatewaySettings> invalid(std::string message) {
    return GatewayResult<GatewaySettings>::err(
        GatewayError(ErrorCode::ConfigInvalidValue, std::move(message)));
}

GatewayResult<GatewaySettings> missing(std::string message) {
    return GatewayResult<GatewaySettings>::err(
        GatewayError(ErrorCode::ConfigMissingSecret, std::move(message)));
}

}  // namespace

std::optional<Environment> parseEnvironment(std::string_view text) {
    auto lowered = toLower(text);
    if (lowered == "development") { return Environment::Development; }
    if (lowered == "preview")     { return Environment::Preview; }
    if (lowered == "production")  { return Environment::Production; }
    return std::nullopt;
}

EnvLookup processEnvironment() {
    return [](std::string_view name) -> std::optional<std::string> {
        const char* value = std::getenv(std::string(name).c_str());
        if (value == nullptr) {
            return std::nullopt;
        }
        return std::string(value);
    };
}

GatewayResult<GatewaySettings> loadGatewaySettings(const ConfigManager& config,
                                                   const EnvLookup& env) {
    GatewaySettings s;

    auto envName = resolve(config, env, "PGW_ENVIRONMENT", "gateway.environment", "development");
    auto environment = parseEnvironment(envName);
    if (!environment) {
        return invalid("unknown environment '" + envName + "'");
    }
    s.environment = *environment;

    auto levelName = config.getOr<std::string>("logging.level", "info");
    auto level = parseLogLevel(levelName);
    if (!level) {
        return invalid("unknown log level '" + levelName + "'");
    }
    s.logLevel = *level;

    auto logFormat = toLower(config.getOr<std::string>("logging.format", "text"));
    if (logFormat != "text" && logFormat != "json") {
        return invalid("logging.format must be text or json");
    }
    s.jsonLogs = logFormat == "json";

    s.storeEndpoint = resolve(config, env, "PGW_STORE_ENDPOINT", "gateway.store_endpoint",
                              "memory://");
    if (s.storeEndpoint != "memory://") {
        return invalid("unsupported store endpoint '" + s.storeEndpoint +
                       "' (only memory:// is available)");
    }

    // Credentials.
    s.provider.apiKey = resolve(config, env, "PGW_PROVIDER_API_KEY", "provider.api_key");
    if (s.provider.apiKey.empty()) {
        return missing("provider credential is not configured (PGW_PROVIDER_API_KEY)");
    }
    if (isPlaceholder(s.provider.apiKey)) {
        return invalid("provider credential is a placeholder value");
    }

    s.signing.primarySecret = resolve(config, env, "PGW_SIGNING_SECRET", "signing.secret");
    if (s.signing.primarySecret.empty()) {
        return missing("signing secret is not configured (PGW_SIGNING_SECRET)");
    }
    if (isPlaceholder(s.signing.primarySecret)) {
        return invalid("signing secret is a placeholder value");
    }
    if (isProductionLike(s.environment) &&
        s.signing.primarySecret.size() < kMinProductionSecretLength) {
        return invalid("signing secret must be at least " +
                       std::to_string(kMinProductionSecretLength) + " bytes in " +
                       std::string(toString(s.environment)));
    }
    if (auto previous = env("PGW_SIGNING_PREVIOUS_SECRETS"); previous && !previous->empty()) {
        s.signing.previousSecrets = splitList(*previous);
    } else {
        s.signing.previousSecrets =
            config.getOr<std::vector<std::string>>("signing.previous_secrets", {});
    }
    s.signing.defaultTtl = std::chrono::seconds(config.getOr<int>("signing.ttl_seconds", 900));

    // Provider transport.
    s.provider.baseUrl = config.getOr<std::string>("provider.base_url", s.provider.baseUrl);
    s.provider.maxPayloadBytes = config.getOr<std::size_t>("provider.max_payload_bytes",
                                                           s.provider.maxPayloadBytes);

    // HTTP surface.
    s.server.port = static_cast<uint16_t>(config.getOr<int>("gateway.port", s.server.port));
    s.server.workers = config.getOr<std::size_t>("gateway.workers", s.server.workers);
    s.server.serviceName = config.getOr<std::string>("gateway.service_name",
                                                     s.server.serviceName);

    // Proxy.
    s.proxy.enforceSignatures = isProductionLike(s.environment);
    s.proxy.resolveDeadline =
        std::chrono::milliseconds(config.getOr<int>("provider.resolve_deadline_ms", 10000));
    s.proxy.fetchDeadline =
        std::chrono::milliseconds(config.getOr<int>("provider.fetch_deadline_ms", 10000));
    s.proxy.costPerCall = config.getOr<double>("budget.cost_per_photo_call", s.proxy.costPerCall);
    s.proxy.cacheMaxAgeSec = config.getOr<int>("cache.max_age_seconds", s.proxy.cacheMaxAgeSec);
    s.proxy.cacheSharedMaxAgeSec =
        config.getOr<int>("cache.s_maxage_seconds", s.proxy.cacheSharedMaxAgeSec);
    s.proxy.cacheStaleWhileRevalidateSec = config.getOr<int>(
        "cache.stale_while_revalidate_seconds", s.proxy.cacheStaleWhileRevalidateSec);
    s.proxy.retryAfterFeatureDisabledSec = config.getOr<int>(
        "retry_after.feature_disabled_seconds", s.proxy.retryAfterFeatureDisabledSec);
    s.proxy.retryAfterRateLimitedSec =
        config.getOr<int>("retry_after.rate_limited_seconds", s.proxy.retryAfterRateLimitedSec);
    s.proxy.retryAfterCircuitOpenSec =
        config.getOr<int>("retry_after.circuit_open_seconds", s.proxy.retryAfterCircuitOpenSec);
    s.proxy.retryAfterBudgetExceededSec = config.getOr<int>(
        "retry_after.budget_exceeded_seconds", s.proxy.retryAfterBudgetExceededSec);

    // Breaker.
    s.breaker.failureThreshold =
        config.getOr<uint32_t>("circuit_breaker.failure_threshold", s.breaker.failureThreshold);
    s.breaker.coolDown = std::chrono::seconds(config.getOr<int>(
        "circuit_breaker.cool_down_seconds", static_cast<int>(s.breaker.coolDown.count())));
    s.breaker.maxCoolDown = std::chrono::seconds(config.getOr<int>(
        "circuit_breaker.max_cool_down_seconds", static_cast<int>(s.breaker.maxCoolDown.count())));
    s.breaker.backoffMultiplier =
        config.getOr<double>("circuit_breaker.backoff_multiplier", s.breaker.backoffMultiplier);

    // Budget.
    s.budget.window = std::chrono::hours(config.getOr<int>("budget.window_hours", 24));
    s.budget.limit = config.getOr<double>("budget.photo_limit", s.budget.limit);

    // Latency and mode.
    s.latency.threshold = std::chrono::milliseconds(config.getOr<int>(
        "latency.threshold_ms", static_cast<int>(s.latency.threshold.count())));
    s.latency.capacity = config.getOr<std::size_t>("latency.capacity", s.latency.capacity);
    s.latency.maxAge = std::chrono::seconds(config.getOr<int>(
        "latency.max_age_seconds", static_cast<int>(s.latency.maxAge.count())));
    s.latency.minSamples = config.getOr<std::size_t>("latency.min_samples", s.latency.minSamples);

    s.mode.dwell = std::chrono::seconds(config.getOr<int>(
        "service_mode.dwell_seconds", static_cast<int>(s.mode.dwell.count())));
    s.mode.historyLimit =
        config.getOr<std::size_t>("service_mode.history_limit", s.mode.historyLimit);
    s.mode.applyFeatureProfiles =
        config.getOr<bool>("service_mode.apply_feature_profiles", s.mode.applyFeatureProfiles);
    s.evaluationInterval = std::chrono::milliseconds(
        config.getOr<int>("service_mode.evaluation_interval_ms", 5000));

    // Range checks.
    if (s.breaker.failureThreshold == 0) {
        return invalid("circuit_breaker.failure_threshold must be at least 1");
    }
    if (s.breaker.coolDown.count() <= 0 || s.breaker.maxCoolDown < s.breaker.coolDown) {
        return invalid("circuit_breaker cool-down must be positive and not exceed the maximum");
    }
    if (s.breaker.backoffMultiplier < 1.0) {
        return invalid("circuit_breaker.backoff_multiplier must be at least 1");
    }
    if (s.budget.window.count() <= 0 || s.budget.limit <= 0.0 || s.proxy.costPerCall < 0.0) {
        return invalid("budget window and limit must be positive");
    }
    if (s.proxy.resolveDeadline.count() <= 0 || s.proxy.fetchDeadline.count() <= 0) {
        return invalid("provider deadlines must be positive");
    }
    if (s.signing.defaultTtl.count() <= 0) {
        return invalid("signing.ttl_seconds must be positive");
    }
    if (s.evaluationInterval.count() <= 0 || s.evaluationInterval > std::chrono::seconds(10)) {
        return invalid("service_mode.evaluation_interval_ms must be within (0, 10000]");
    }
    if (s.latency.capacity == 0 || s.server.workers == 0) {
        return invalid("latency.capacity and gateway.workers must be positive");
    }

    return GatewayResult<GatewaySettings>::ok(std::move(s));
}

}  // namespace pgw::service
