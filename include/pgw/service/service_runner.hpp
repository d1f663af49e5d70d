#pragma once

/// @file service_runner.hpp
/// @brief Process lifecycle helpers for the gateway executable.
///
/// Signal handling, configuration loading, ordered shutdown hooks and CLI
/// argument parsing.

#include <atomic>
#include <chrono>
#include <cstddef>
#include <filesystem>
#include <functional>
#include <string>
#include <vector>

#include "pgw/foundation/config_manager.hpp"
#include "pgw/foundation/gateway_result.hpp"

namespace pgw::service {

/// Installs SIGINT and SIGTERM handlers and exposes a shutdown flag.
///
/// Only one SignalHandler instance should exist per process. The handler
/// performs a relaxed store on a lock-free atomic, which is
/// async-signal-safe. Default handlers are restored on destruction.
class SignalHandler {
public:
    SignalHandler();
    ~SignalHandler();

    SignalHandler(const SignalHandler&) = delete;
    SignalHandler& operator=(const SignalHandler&) = delete;

    [[nodiscard]] bool shutdownRequested() const noexcept;

    /// Block the calling thread until a shutdown signal arrives.
    void waitForShutdown() const;

    /// Raise the flag without a signal (tests, fatal runtime errors).
    static void requestShutdown() noexcept;

private:
    static std::atomic<bool> shutdownFlag_;
    static void handler(int signal);
};

using ShutdownHook = std::function<void()>;

/// Ordered shutdown: readiness off, server stop (which cancels in-flight
/// requests), evaluator stop, log flush.
///
/// @code
///   GracefulShutdown shutdown;
///   shutdown.addHook("readiness", [&] { server.setReady(false); });
///   shutdown.addHook("server",    [&] { server.stop(); });
///   shutdown.addHook("evaluator", [&] { evaluator.stop(); });
///   shutdown.execute();
/// @endcode
class GracefulShutdown {
public:
    void addHook(std::string name, ShutdownHook hook);

    /// Run every hook in registration order. A hook that throws is logged
    /// and the remaining hooks still run.
    /// @return Number of hooks that completed.
    std::size_t execute();

    [[nodiscard]] std::size_t hookCount() const;

    /// Hooks still running past this budget are reported in the log.
    void setDrainTimeout(std::chrono::seconds timeout);

private:
    struct Hook {
        std::string name;
        ShutdownHook callback;
    };
    std::vector<Hook> hooks_;
    std::chrono::seconds drainTimeout_{30};
};

/// Load a YAML configuration file into @p config.
///
/// The path is PGW_CONFIG_PATH when set, otherwise @p defaultPath.
/// @return ConfigLoadFailed on a missing or unparsable file.
[[nodiscard]] foundation::GatewayResult<void>
loadConfig(foundation::ConfigManager& config, const std::filesystem::path& defaultPath);

/// Parse `--config <path>` from command-line arguments.
/// @return The path, or an empty path if not specified.
[[nodiscard]] std::filesystem::path parseConfigArg(int argc, char* argv[]);

}  // namespace pgw::service
