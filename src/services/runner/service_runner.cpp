/// @file service_runner.cpp
/// @brief Signal handling, shutdown hooks and config loading.

#include "pgw/service/service_runner.hpp"

#include "pgw/foundation/gateway_logger.hpp"

#include <csignal>
#include <cstdlib>
#include <exception>
#include <string_view>
#include <thread>

namespace pgw::service {

using foundation::LogCategory;

// -- SignalHandler -----------------------------------------------------------

std::atomic<bool> SignalHandler::shutdownFlag_{false};

void SignalHandler::handler(int /*signal*/) {
    shutdownFlag_.store(true, std::memory_order_relaxed);
}

SignalHandler::SignalHandler() {
    shutdownFlag_.store(false, std::memory_order_relaxed);
    std::signal(SIGINT, &SignalHandler::handler);
    std::signal(SIGTERM, &SignalHandler::handler);
}

SignalHandler::~SignalHandler() {
#if defined(__GNUC__) || defined(__clang__)
#pragma GCC diagnostic push
#pragma GCC diagnostic ignored "-Wold-style-cast"
#endif
    std::signal(SIGINT, SIG_DFL);
    std::signal(SIGTERM, SIG_DFL);
#if defined(__GNUC__) || defined(__clang__)
#pragma GCC diagnostic pop
#endif
}

bool SignalHandler::shutdownRequested() const noexcept {
    return shutdownFlag_.load(std::memory_order_relaxed);
}

void SignalHandler::waitForShutdown() const {
    using namespace std::chrono_literals;
    while (!shutdownFlag_.load(std::memory_order_relaxed)) {
        std::this_thread::sleep_for(100ms);
    }
}

void SignalHandler::requestShutdown() noexcept {
    shutdownFlag_.store(true, std::memory_order_relaxed);
}

// -- GracefulShutdown --------------------------------------------------------

void GracefulShutdown::addHook(std::string name, ShutdownHook hook) {
    hooks_.push_back(Hook{std::move(name), std::move(hook)});
}

std::size_t GracefulShutdown::execute() {
    auto started = std::chrono::steady_clock::now();
    std::size_t completed = 0;
    for (const auto& hook : hooks_) {
        try {
            hook.callback();
            ++completed;
            PGW_LOG_INFO(LogCategory::Core, "shutdown hook '" + hook.name + "' done");
        } catch (const std::exception& e) {
            PGW_LOG_ERROR(LogCategory::Core,
                          "shutdown hook '" + hook.name + "' failed: " + e.what());
        }
        if (std::chrono::steady_clock::now() - started > drainTimeout_) {
            PGW_LOG_WARN(LogCategory::Core, "shutdown exceeded drain timeout after hook '" +
                                            hook.name + "'");
        }
    }
    return completed;
}

std::size_t GracefulShutdown::hookCount() const {
    return hooks_.size();
}

void GracefulShutdown::setDrainTimeout(std::chrono::seconds timeout) {
    drainTimeout_ = timeout;
}

// -- Config loading ----------------------------------------------------------

foundation::GatewayResult<void>
loadConfig(foundation::ConfigManager& config, const std::filesystem::path& defaultPath) {
    std::filesystem::path configPath = defaultPath;

    const char* envPath = std::getenv("PGW_CONFIG_PATH");
    if (envPath != nullptr && *envPath != '\0') {
        configPath = envPath;
    }

    return config.load(configPath);
}

// -- CLI argument parsing ----------------------------------------------------

std::filesystem::path parseConfigArg(int argc, char* argv[]) {
    for (int i = 1; i < argc - 1; ++i) {
        if (std::string_view(argv[i]) == "--config") {  // NOLINT(cppcoreguidelines-pro-bounds-pointer-arithmetic)
            return argv[i + 1];  // NOLINT(cppcoreguidelines-pro-bounds-pointer-arithmetic)
        }
    }
    return {};
}

}  // namespace pgw::service
