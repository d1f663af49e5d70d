#pragma once

/// @file json_log_formatter.hpp
/// @brief Single-line JSON log records with request correlation.

#include "pgw/foundation/gateway_logger.hpp"

#include <string>
#include <string_view>

namespace pgw::foundation {

/// Random UUID v4 string used as a request correlation ID.
[[nodiscard]] std::string generateCorrelationId();

/// Quote and escape @p value as a JSON string literal.
[[nodiscard]] std::string jsonQuote(std::string_view value);

/// Sets the calling thread's correlation ID for its lifetime and restores
/// the previous one on destruction.
///
/// @code
///   CorrelationScope scope(generateCorrelationId());
///   handler.handle(request);   // log lines carry the same correlation_id
/// @endcode
class CorrelationScope {
public:
    explicit CorrelationScope(std::string correlationId);
    ~CorrelationScope();

    CorrelationScope(const CorrelationScope&) = delete;
    CorrelationScope& operator=(const CorrelationScope&) = delete;

    /// The current thread's correlation ID (empty if none set).
    [[nodiscard]] static const std::string& current();

private:
    std::string previous_;
};

/// Stateless formatter producing one JSON object per log record:
/// @code
///   {"timestamp":"2026-02-14T12:00:00.000Z","level":"INFO","category":"Gateway",
///    "correlation_id":"...","message":"...","request_id":"...","extra":{...}}
/// @endcode
class JsonLogFormatter {
public:
    /// LogContext::requestId takes precedence over the thread's
    /// CorrelationScope for the correlation_id field.
    [[nodiscard]] static std::string format(LogLevel level,
                                            LogCategory category,
                                            std::string_view message,
                                            const LogContext& ctx = {});
};

}  // namespace pgw::foundation
