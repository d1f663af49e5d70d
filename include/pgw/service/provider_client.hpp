#pragma once

/// @file provider_client.hpp
/// @brief Seam between the gateway and the external media provider.

#include "pgw/foundation/cancellation.hpp"
#include "pgw/foundation/gateway_result.hpp"

#include <chrono>
#include <string>

namespace pgw::service {

/// Identifies one media variant at the provider.
struct MediaLookup {
    std::string resourceId;
    std::string variantRef;
    int maxHeightPx{400};
};

struct BinaryPayload {
    /// Empty when the upstream sent no Content-Type.
    std::string contentType;
    std::string body;
};

/// Two-hop provider access: resolve a media reference, then fetch the bytes.
///
/// Both calls are bounded by their own @p deadline and abort promptly once
/// @p cancel is signalled. Errors use these codes:
/// - UpstreamTimeout: the deadline elapsed
/// - UpstreamStatus: non-2xx response, context holds the int status
/// - UpstreamMalformed: a 2xx response the gateway could not interpret
/// - UpstreamTransport: DNS, connect or TLS failure
/// - RequestCancelled: @p cancel fired
/// - PayloadTooLarge: the body exceeded the configured cap
class IProviderClient {
public:
    virtual ~IProviderClient() = default;

    /// @return The binary URI for @p lookup.
    [[nodiscard]] virtual foundation::GatewayResult<std::string>
    resolveMedia(const MediaLookup& lookup,
                 std::chrono::milliseconds deadline,
                 const foundation::CancellationToken& cancel) = 0;

    [[nodiscard]] virtual foundation::GatewayResult<BinaryPayload>
    fetchBinary(const std::string& uri,
                std::chrono::milliseconds deadline,
                const foundation::CancellationToken& cancel) = 0;
};

/// HTTP status carried by an UpstreamStatus error, or 0.
[[nodiscard]] inline int upstreamStatusOf(const foundation::GatewayError& error) {
    const auto* status = error.context<int>();
    return status != nullptr ? *status : 0;
}

}  // namespace pgw::service
