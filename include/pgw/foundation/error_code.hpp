#pragma once

/// @file error_code.hpp
/// @brief Categorized error codes for the provider gateway.

#include <cstdint>
#include <string_view>

namespace pgw::foundation {

/// Error codes categorized by subsystem using hex ranges.
///
/// Each subsystem occupies a 256-value range (0x100), making it possible
/// to determine the error source from the code value alone.
enum class ErrorCode : uint32_t {
    // General (0x0000 - 0x00FF)
    Success = 0x0000,
    Unknown = 0x0001,
    InvalidArgument = 0x0002,
    NotFound = 0x0003,
    AlreadyExists = 0x0004,
    NotImplemented = 0x0005,
    InternalError = 0x0006,

    // Upstream / network (0x0100 - 0x01FF)
    NetworkError = 0x0100,
    UpstreamTimeout = 0x0101,
    UpstreamStatus = 0x0102,
    UpstreamMalformed = 0x0103,
    UpstreamTransport = 0x0104,
    RequestCancelled = 0x0105,
    ListenFailed = 0x0106,
    PayloadTooLarge = 0x0107,

    // Store (0x0200 - 0x02FF)
    StoreError = 0x0200,
    StoreUnavailable = 0x0201,
    StoreConflict = 0x0202,
    RecordCorrupt = 0x0203,

    // Signature (0x0300 - 0x03FF)
    SignatureMissing = 0x0300,
    SignatureExpired = 0x0301,
    SignatureInvalid = 0x0302,

    // Config (0x0400 - 0x04FF)
    ConfigLoadFailed = 0x0400,
    ConfigKeyNotFound = 0x0401,
    ConfigTypeMismatch = 0x0402,
    ConfigMissingSecret = 0x0403,
    ConfigInvalidValue = 0x0404,

    // Thread (0x0500 - 0x05FF)
    ThreadError = 0x0500,
    JobScheduleFailed = 0x0501,

    // Logger (0x0600 - 0x06FF)
    LoggerError = 0x0600,
    LoggerFlushFailed = 0x0601,

    // Gateway decisions (0x0700 - 0x07FF)
    ValidationFailed = 0x0700,
    FeatureDisabled = 0x0701,
    ServiceDegraded = 0x0702,
    CircuitOpen = 0x0703,
    BudgetExceeded = 0x0704,
};

/// Return the subsystem name for a given error code.
constexpr std::string_view errorSubsystem(ErrorCode code) {
    auto value = static_cast<uint32_t>(code);
    auto category = value & 0xFF00;
    switch (category) {
        case 0x0000: return "General";
        case 0x0100: return "Upstream";
        case 0x0200: return "Store";
        case 0x0300: return "Signature";
        case 0x0400: return "Config";
        case 0x0500: return "Thread";
        case 0x0600: return "Logger";
        case 0x0700: return "Gateway";
        default: return "Unknown";
    }
}

} // namespace pgw::foundation
