#pragma once

/// @file gateway_logger.hpp
/// @brief GatewayLogger wrapping kcenon logger interfaces for category-based,
///        structured logging across the gateway.

#include <array>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>

#include "pgw/foundation/gateway_result.hpp"

namespace pgw::foundation {

/// Log severity levels.
///
/// Maps to kcenon::common::interfaces::log_level internally.
enum class LogLevel : uint8_t {
    Trace    = 0,
    Debug    = 1,
    Info     = 2,
    Warning  = 3,
    Error    = 4,
    Critical = 5,
    Off      = 6
};

/// Gateway subsystems, each with its own runtime log level.
enum class LogCategory : uint8_t {
    Core     = 0, ///< Startup, configuration, shutdown
    Gateway  = 1, ///< Request handling in the media proxy
    Provider = 2, ///< Upstream provider calls
    Store    = 3, ///< Durable key-value store access
    Signing  = 4, ///< Signed URL issuing and verification
    Mode     = 5, ///< Service mode transitions
    Budget   = 6, ///< Spend accounting
    Circuit  = 7  ///< Circuit breaker transitions
};

inline constexpr std::size_t kLogCategoryCount = 8;

constexpr std::string_view logCategoryName(LogCategory cat) {
    constexpr std::array<std::string_view, kLogCategoryCount> names = {
        "Core", "Gateway", "Provider", "Store", "Signing", "Mode", "Budget", "Circuit"
    };
    auto idx = static_cast<std::size_t>(cat);
    return idx < kLogCategoryCount ? names[idx] : "Unknown";
}

constexpr std::string_view logLevelName(LogLevel level) {
    switch (level) {
        case LogLevel::Trace:    return "TRACE";
        case LogLevel::Debug:    return "DEBUG";
        case LogLevel::Info:     return "INFO";
        case LogLevel::Warning:  return "WARNING";
        case LogLevel::Error:    return "ERROR";
        case LogLevel::Critical: return "CRITICAL";
        case LogLevel::Off:      return "OFF";
    }
    return "UNKNOWN";
}

/// Structured fields attached to a log entry.
///
/// Values must already be safe to log: never place provider response
/// content, credentials or signatures here without redacting first.
struct LogContext {
    std::optional<std::string> requestId;
    std::optional<std::string> endpointClass;
    std::optional<std::string> traceId;
    std::unordered_map<std::string, std::string> extra;
};

/// Category-filtered logger forwarding to kcenon's GlobalLoggerRegistry.
///
/// Each category resolves a named logger "pgw.<Category>" and falls back to
/// the registry's default logger. Per-category levels are atomics so the
/// enabled check on the request path never locks.
class GatewayLogger {
public:
    GatewayLogger();
    ~GatewayLogger();

    GatewayLogger(const GatewayLogger&) = delete;
    GatewayLogger& operator=(const GatewayLogger&) = delete;
    GatewayLogger(GatewayLogger&&) noexcept;
    GatewayLogger& operator=(GatewayLogger&&) noexcept;

    /// Log a message; no-op below the category's minimum level.
    void log(LogLevel level, LogCategory cat, std::string_view msg);

    /// Log a message with structured context appended as key=value pairs.
    void logWithContext(LogLevel level, LogCategory cat,
                        std::string_view msg, const LogContext& ctx);

    /// Emit one JsonLogFormatter line per record instead of plain text.
    void setJsonOutput(bool enabled);

    [[nodiscard]] bool jsonOutput() const;

    void setCategoryLevel(LogCategory cat, LogLevel minLevel);

    [[nodiscard]] LogLevel getCategoryLevel(LogCategory cat) const;

    [[nodiscard]] bool isEnabled(LogLevel level, LogCategory cat) const;

    GatewayResult<void> flush();

    /// Process-wide logger used by the PGW_LOG macros.
    static GatewayLogger& instance();

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
};

} // namespace pgw::foundation

// ---------------------------------------------------------------------------
// Convenience macros
// ---------------------------------------------------------------------------

/// PGW_MIN_LOG_LEVEL removes calls below the threshold at compile time.
/// Values: 0=Trace, 1=Debug, 2=Info, 3=Warning, 4=Error, 5=Critical, 6=Off
#ifndef PGW_MIN_LOG_LEVEL
    #define PGW_MIN_LOG_LEVEL 0
#endif

#define PGW_LOG(level, cat, msg)                                                   \
    do {                                                                           \
        _Pragma("GCC diagnostic push")                                             \
        _Pragma("GCC diagnostic ignored \"-Wtype-limits\"")                        \
        if (static_cast<int>(level) >= PGW_MIN_LOG_LEVEL &&                        \
            ::pgw::foundation::GatewayLogger::instance().isEnabled((level), (cat))) \
        {                                                                          \
            ::pgw::foundation::GatewayLogger::instance().log((level), (cat), (msg)); \
        }                                                                          \
        _Pragma("GCC diagnostic pop")                                              \
    } while (0)

#define PGW_LOG_DEBUG(cat, msg) \
    PGW_LOG(::pgw::foundation::LogLevel::Debug, (cat), (msg))

#define PGW_LOG_INFO(cat, msg) \
    PGW_LOG(::pgw::foundation::LogLevel::Info, (cat), (msg))

#define PGW_LOG_WARN(cat, msg) \
    PGW_LOG(::pgw::foundation::LogLevel::Warning, (cat), (msg))

#define PGW_LOG_ERROR(cat, msg) \
    PGW_LOG(::pgw::foundation::LogLevel::Error, (cat), (msg))
