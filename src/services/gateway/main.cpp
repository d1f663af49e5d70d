/// @file main.cpp
/// @brief Provider gateway entry point.
///
/// Loads configuration, seeds gateway state in the store, then serves media
/// and probe endpoints until SIGINT or SIGTERM.

#include <cstdlib>
#include <iostream>
#include <memory>

#include "pgw/foundation/config_manager.hpp"
#include "pgw/foundation/gateway_logger.hpp"
#include "pgw/foundation/gateway_metrics.hpp"
#include "pgw/foundation/kv_store.hpp"
#include "pgw/service/budget_tracker.hpp"
#include "pgw/service/circuit_breaker.hpp"
#include "pgw/service/curl_provider_client.hpp"
#include "pgw/service/feature_flag_store.hpp"
#include "pgw/service/gateway_settings.hpp"
#include "pgw/service/latency_sampler.hpp"
#include "pgw/service/media_server.hpp"
#include "pgw/service/photo_proxy.hpp"
#include "pgw/service/provider_health_store.hpp"
#include "pgw/service/service_mode.hpp"
#include "pgw/service/service_runner.hpp"
#include "pgw/service/signed_url_codec.hpp"
#include "pgw/service/trigger_source.hpp"
#include "pgw/version.hpp"

namespace {

using pgw::foundation::GatewayMetrics;
using pgw::foundation::HealthStatus;
using pgw::foundation::LogCategory;

void applyLogLevel(pgw::foundation::LogLevel level) {
    auto& logger = pgw::foundation::GatewayLogger::instance();
    for (std::size_t i = 0; i < pgw::foundation::kLogCategoryCount; ++i) {
        logger.setCategoryLevel(static_cast<LogCategory>(i), level);
    }
}

HealthStatus healthForMode(pgw::service::ServiceMode mode) {
    switch (mode) {
        case pgw::service::ServiceMode::Nominal:
        case pgw::service::ServiceMode::Watch:
            return HealthStatus::Healthy;
        case pgw::service::ServiceMode::Degraded:
            return HealthStatus::Degraded;
        case pgw::service::ServiceMode::Outage:
            return HealthStatus::Unhealthy;
    }
    return HealthStatus::Unhealthy;
}

} // namespace

int main(int argc, char* argv[]) {
    using namespace pgw::service;

    SignalHandler signals;

    auto configPath = parseConfigArg(argc, argv);
    if (configPath.empty()) {
        configPath = "/etc/pgw/gateway.yaml";
    }

    pgw::foundation::ConfigManager config;
    auto loadResult = loadConfig(config, configPath);
    if (!loadResult) {
        std::cerr << "Failed to load config: " << loadResult.error().message() << "\n";
        return EXIT_FAILURE;
    }

    auto settingsResult = loadGatewaySettings(config, processEnvironment());
    if (!settingsResult) {
        std::cerr << "Fatal configuration error: " << settingsResult.error().message() << "\n";
        return EXIT_FAILURE;
    }
    const auto settings = std::move(settingsResult).value();

    applyLogLevel(settings.logLevel);
    pgw::foundation::GatewayLogger::instance().setJsonOutput(settings.jsonLogs);
    PGW_LOG_INFO(LogCategory::Core, std::string("pgw-gateway ") + pgw::Version::string +
                                    " starting in " +
                                    std::string(toString(settings.environment)));
    if (!settings.proxy.enforceSignatures) {
        PGW_LOG_WARN(LogCategory::Signing,
                     "media signature verification is DISABLED (development environment)");
    }

    // Shared state.
    auto store = std::make_shared<pgw::foundation::InMemoryKeyValueStore>();
    auto flags = std::make_shared<FeatureFlagStore>(store);
    auto health = std::make_shared<ProviderHealthStore>(store);
    auto budget = std::make_shared<BudgetTracker>(store, settings.budget);
    auto breaker = std::make_shared<CircuitBreaker>(store, settings.breaker);
    auto latency = std::make_shared<LatencySampler>(settings.latency);
    auto mode = std::make_shared<ServiceModeController>(store, flags, settings.mode);

    if (auto seeded = flags->initDefaults(); !seeded) {
        std::cerr << "Failed to seed feature flags: " << seeded.error().message() << "\n";
        return EXIT_FAILURE;
    }
    if (auto seeded = health->initDefaults(); !seeded) {
        std::cerr << "Failed to seed provider health: " << seeded.error().message() << "\n";
        return EXIT_FAILURE;
    }
    if (auto initial = mode->initialize(); !initial) {
        std::cerr << "Failed to initialize service mode: " << initial.error().message() << "\n";
        return EXIT_FAILURE;
    }

    auto& metrics = GatewayMetrics::instance();
    metrics.setComponentHealth("service_mode", healthForMode(mode->current().currentMode));
    auto subscription = mode->subscribe([&metrics](const ModeTransition& transition) {
        metrics.setComponentHealth("service_mode", healthForMode(transition.to));
    });

    auto triggers = std::make_shared<GatewayTriggerSource>(health, budget, breaker, latency);

    PhotoProxyDeps deps;
    deps.codec = std::make_shared<SignedUrlCodec>(settings.signing);
    deps.flags = flags;
    deps.mode = mode;
    deps.breaker = breaker;
    deps.budget = budget;
    deps.latency = latency;
    deps.provider = std::make_shared<CurlProviderClient>(settings.provider);
    deps.triggers = triggers;
    auto proxy = std::make_shared<PhotoProxyHandler>(settings.proxy, std::move(deps));

    MediaServer server(settings.server, proxy, mode, metrics);
    ServiceModeEvaluator evaluator(*mode, triggers, settings.evaluationInterval);

    auto startResult = server.start();
    if (!startResult) {
        std::cerr << "Failed to start media server: " << startResult.error().message() << "\n";
        return EXIT_FAILURE;
    }
    evaluator.start();
    server.setReady(true);

    std::cout << "pgw-gateway listening on port " << server.boundPort() << "\n";

    signals.waitForShutdown();

    GracefulShutdown shutdown;
    shutdown.addHook("readiness", [&server] { server.setReady(false); });
    shutdown.addHook("server", [&server] { server.stop(); });
    shutdown.addHook("evaluator", [&evaluator] { evaluator.stop(); });
    shutdown.addHook("subscriptions", [&mode, subscription] { mode->unsubscribe(subscription); });
    shutdown.addHook("logger", [] {
        auto flushed = pgw::foundation::GatewayLogger::instance().flush();
        if (!flushed) {
            std::cerr << "Failed to flush logs: " << flushed.error().message() << "\n";
        }
    });
    shutdown.execute();

    std::cout << "pgw-gateway stopped\n";
    return EXIT_SUCCESS;
}
