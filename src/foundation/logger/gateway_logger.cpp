/// @file gateway_logger.cpp
/// @brief GatewayLogger implementation over kcenon common_system interfaces.

#include "pgw/foundation/gateway_logger.hpp"

#include "pgw/foundation/json_log_formatter.hpp"

#include <kcenon/common/interfaces/global_logger_registry.h>
#include <kcenon/common/interfaces/logger_interface.h>

#include <array>
#include <atomic>
#include <sstream>
#include <string>

namespace pgw::foundation {

namespace kci = kcenon::common::interfaces;

static kci::log_level mapLevel(LogLevel level) {
    switch (level) {
        case LogLevel::Trace:    return kci::log_level::trace;
        case LogLevel::Debug:    return kci::log_level::debug;
        case LogLevel::Info:     return kci::log_level::info;
        case LogLevel::Warning:  return kci::log_level::warning;
        case LogLevel::Error:    return kci::log_level::error;
        case LogLevel::Critical: return kci::log_level::critical;
        case LogLevel::Off:      return kci::log_level::off;
    }
    return kci::log_level::info;
}

// Request-path categories default to Info; Store is noisy under load.
static constexpr std::array<LogLevel, kLogCategoryCount> kDefaultCategoryLevels = {
    LogLevel::Info,     // Core
    LogLevel::Info,     // Gateway
    LogLevel::Info,     // Provider
    LogLevel::Warning,  // Store
    LogLevel::Info,     // Signing
    LogLevel::Info,     // Mode
    LogLevel::Info,     // Budget
    LogLevel::Info      // Circuit
};

static std::string formatContext(const LogContext& ctx) {
    std::ostringstream oss;
    bool first = true;

    auto append = [&](std::string_view key, std::string_view val) {
        if (!first) {
            oss << ", ";
        }
        oss << key << '=' << val;
        first = false;
    };

    if (ctx.requestId && !ctx.requestId->empty()) {
        append("request_id", *ctx.requestId);
    }
    if (ctx.endpointClass && !ctx.endpointClass->empty()) {
        append("endpoint_class", *ctx.endpointClass);
    }
    if (ctx.traceId && !ctx.traceId->empty()) {
        append("trace_id", *ctx.traceId);
    }
    for (const auto& [key, val] : ctx.extra) {
        append(key, val);
    }
    return oss.str();
}

struct GatewayLogger::Impl {
    std::array<std::atomic<LogLevel>, kLogCategoryCount> categoryLevels;
    std::array<std::string, kLogCategoryCount> loggerNames;
    std::atomic<bool> jsonOutput{false};

    Impl() {
        for (std::size_t i = 0; i < kLogCategoryCount; ++i) {
            categoryLevels[i].store(kDefaultCategoryLevels[i], std::memory_order_relaxed);
            loggerNames[i] = std::string("pgw.") +
                std::string(logCategoryName(static_cast<LogCategory>(i)));
        }
    }

    std::shared_ptr<kci::ILogger> getLogger(LogCategory cat) const {
        auto idx = static_cast<std::size_t>(cat);
        if (idx >= kLogCategoryCount) {
            return kci::GlobalLoggerRegistry::null_logger();
        }
        auto& registry = kci::GlobalLoggerRegistry::instance();
        auto logger = registry.get_logger(loggerNames[idx]);
        if (logger == kci::GlobalLoggerRegistry::null_logger()) {
            return registry.get_default_logger();
        }
        return logger;
    }

    void emit(LogLevel level, LogCategory cat, std::string_view msg,
              std::string_view ctx) const {
        std::string formatted;
        formatted.reserve(msg.size() + ctx.size() + 24);
        formatted += '[';
        formatted += logCategoryName(cat);
        formatted += "] ";
        formatted += msg;
        if (!ctx.empty()) {
            formatted += " {";
            formatted += ctx;
            formatted += '}';
        }
        write(level, cat, formatted);
    }

    void write(LogLevel level, LogCategory cat, const std::string& line) const {
        auto result = getLogger(cat)->log(mapLevel(level), line);
        (void)result;  // a failing sink must not fail the request being logged
    }
};

GatewayLogger::GatewayLogger() : impl_(std::make_unique<Impl>()) {}

GatewayLogger::~GatewayLogger() = default;

GatewayLogger::GatewayLogger(GatewayLogger&&) noexcept = default;
GatewayLogger& GatewayLogger::operator=(GatewayLogger&&) noexcept = default;

void GatewayLogger::log(LogLevel level, LogCategory cat, std::string_view msg) {
    if (!isEnabled(level, cat)) {
        return;
    }
    if (impl_->jsonOutput.load(std::memory_order_relaxed)) {
        impl_->write(level, cat, JsonLogFormatter::format(level, cat, msg));
        return;
    }
    impl_->emit(level, cat, msg, {});
}

void GatewayLogger::logWithContext(LogLevel level, LogCategory cat,
                                   std::string_view msg, const LogContext& ctx) {
    if (!isEnabled(level, cat)) {
        return;
    }
    if (impl_->jsonOutput.load(std::memory_order_relaxed)) {
        impl_->write(level, cat, JsonLogFormatter::format(level, cat, msg, ctx));
        return;
    }
    impl_->emit(level, cat, msg, formatContext(ctx));
}

void GatewayLogger::setJsonOutput(bool enabled) {
    impl_->jsonOutput.store(enabled, std::memory_order_relaxed);
}

bool GatewayLogger::jsonOutput() const {
    return impl_->jsonOutput.load(std::memory_order_relaxed);
}

void GatewayLogger::setCategoryLevel(LogCategory cat, LogLevel minLevel) {
    auto idx = static_cast<std::size_t>(cat);
    if (idx < kLogCategoryCount) {
        impl_->categoryLevels[idx].store(minLevel, std::memory_order_release);
    }
}

LogLevel GatewayLogger::getCategoryLevel(LogCategory cat) const {
    auto idx = static_cast<std::size_t>(cat);
    if (idx < kLogCategoryCount) {
        return impl_->categoryLevels[idx].load(std::memory_order_acquire);
    }
    return LogLevel::Off;
}

bool GatewayLogger::isEnabled(LogLevel level, LogCategory cat) const {
    auto idx = static_cast<std::size_t>(cat);
    if (idx >= kLogCategoryCount || level == LogLevel::Off) {
        return false;
    }
    auto minLevel = impl_->categoryLevels[idx].load(std::memory_order_acquire);
    return static_cast<uint8_t>(level) >= static_cast<uint8_t>(minLevel);
}

GatewayResult<void> GatewayLogger::flush() {
    auto& registry = kci::GlobalLoggerRegistry::instance();
    auto result = registry.get_default_logger()->flush();
    if (result.is_err()) {
        return GatewayResult<void>::err(
            GatewayError(ErrorCode::LoggerFlushFailed, "failed to flush logger"));
    }
    return GatewayResult<void>::ok();
}

GatewayLogger& GatewayLogger::instance() {
    static GatewayLogger inst;
    return inst;
}

} // namespace pgw::foundation
