#pragma once

/// @file curl_provider_client.hpp
/// @brief libcurl implementation of IProviderClient.

#include "pgw/service/provider_client.hpp"

#include <cstddef>
#include <string>

namespace pgw::service {

struct CurlProviderConfig {
    /// Sent as the X-Goog-Api-Key header on resolution calls only.
    std::string apiKey;

    std::string baseUrl = "https://places.googleapis.com/v1";

    std::size_t maxPayloadBytes = 10 * 1024 * 1024;

    std::string userAgent = "pgw-gateway";
};

/// One easy handle per call, so instances are safe to share across workers.
class CurlProviderClient : public IProviderClient {
public:
    explicit CurlProviderClient(CurlProviderConfig config);

    [[nodiscard]] foundation::GatewayResult<std::string>
    resolveMedia(const MediaLookup& lookup,
                 std::chrono::milliseconds deadline,
                 const foundation::CancellationToken& cancel) override;

    [[nodiscard]] foundation::GatewayResult<BinaryPayload>
    fetchBinary(const std::string& uri,
                std::chrono::milliseconds deadline,
                const foundation::CancellationToken& cancel) override;

    /// Resolution URL for @p lookup (never contains the credential).
    [[nodiscard]] std::string resolveUrl(const MediaLookup& lookup) const;

    /// Extract the "photoUri" field from a resolution response body.
    [[nodiscard]] static foundation::GatewayResult<std::string>
    parseResolveResponse(std::string_view body);

private:
    struct Response {
        long status{0};
        std::string contentType;
        std::string body;
    };

    foundation::GatewayResult<Response> perform(const std::string& url,
                                                bool withCredential,
                                                std::chrono::milliseconds deadline,
                                                const foundation::CancellationToken& cancel) const;

    CurlProviderConfig config_;
};

}  // namespace pgw::service
