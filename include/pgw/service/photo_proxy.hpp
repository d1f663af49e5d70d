#pragma once

/// @file photo_proxy.hpp
/// @brief Request-facing media proxy: verify, gate, fetch, respond.

#include "pgw/foundation/cancellation.hpp"
#include "pgw/foundation/gateway_result.hpp"
#include "pgw/service/http_types.hpp"
#include "pgw/service/provider_client.hpp"
#include "pgw/service/signed_url_codec.hpp"

#include <chrono>
#include <memory>
#include <optional>
#include <string>
#include <string_view>

namespace pgw::service {

class BudgetTracker;
class CircuitBreaker;
struct CircuitPermit;
class FeatureFlagStore;
class ITriggerSource;
class LatencySampler;
class ServiceModeController;

/// Machine-readable reasons carried in JSON error bodies.
namespace proxy_reason {
inline constexpr std::string_view kOk = "ok";
inline constexpr std::string_view kInvalidPath = "invalid_path";
inline constexpr std::string_view kInvalidSize = "invalid_size";
inline constexpr std::string_view kMissingSignature = "missing_signature";
inline constexpr std::string_view kExpired = "expired";
inline constexpr std::string_view kInvalidSignature = "invalid_signature";
inline constexpr std::string_view kFeatureDisabled = "feature_disabled";
inline constexpr std::string_view kCircuitOpen = "circuit_open";
inline constexpr std::string_view kBudgetExceeded = "budget_exceeded";
inline constexpr std::string_view kStateUnavailable = "state_unavailable";
inline constexpr std::string_view kNotFound = "not_found";
inline constexpr std::string_view kRateLimited = "upstream_rate_limited";
inline constexpr std::string_view kUpstreamError = "upstream_error";
inline constexpr std::string_view kUpstreamMalformed = "upstream_malformed";
inline constexpr std::string_view kPayloadTooLarge = "payload_too_large";
inline constexpr std::string_view kTimeout = "upstream_timeout";
inline constexpr std::string_view kCancelled = "cancelled";
inline constexpr std::string_view kInternal = "internal";
}  // namespace proxy_reason

struct PhotoProxyConfig {
    /// Off only in development; see GatewaySettings.
    bool enforceSignatures{true};

    std::chrono::milliseconds resolveDeadline{10000};
    std::chrono::milliseconds fetchDeadline{10000};

    /// Budget units charged per resolution call that reached the provider.
    double costPerCall{7.0};

    int retryAfterFeatureDisabledSec{300};
    int retryAfterRateLimitedSec{60};
    int retryAfterCircuitOpenSec{30};
    int retryAfterBudgetExceededSec{3600};

    int cacheMaxAgeSec{300};
    int cacheSharedMaxAgeSec{900};
    int cacheStaleWhileRevalidateSec{60};

    std::string defaultContentType{"image/jpeg"};
};

/// Collaborators of the proxy. Only triggers may be null, in which case no
/// opportunistic mode recomputation happens after bookkeeping.
struct PhotoProxyDeps {
    std::shared_ptr<SignedUrlCodec> codec;
    std::shared_ptr<FeatureFlagStore> flags;
    std::shared_ptr<ServiceModeController> mode;
    std::shared_ptr<CircuitBreaker> breaker;
    std::shared_ptr<BudgetTracker> budget;
    std::shared_ptr<LatencySampler> latency;
    std::shared_ptr<IProviderClient> provider;
    std::shared_ptr<ITriggerSource> triggers;
};

/// Parse "/media/{resourceId}/{variantRef}" plus its query string.
/// @return ValidationFailed for a bad path or an unknown size.
[[nodiscard]] foundation::GatewayResult<SignedMediaRequest>
parseMediaRequest(const HttpRequest& request);

/// Build a JSON error response with Cache-Control: no-store.
[[nodiscard]] HttpResponse errorResponse(int status, std::string_view message,
                                         std::string_view reason,
                                         std::optional<int> retryAfterSec = std::nullopt);

/// Serves GET /media/... requests.
///
/// Checks run in a fixed order and the first failing one answers:
/// request shape, signature, photo flag, service mode, budget, circuit,
/// then the resolve and fetch hops. Nothing reaches the provider unless
/// every pre-flight check passed. Flag lookup failures fail open; budget
/// and circuit lookup failures fail closed.
///
/// The committed service mode is authoritative. A photo flag disabled by a
/// mode feature profile (reason prefixed "service_mode_") applies only while
/// that profile's mode holds. An outage committed for an open circuit is left
/// to the breaker, so that the circuit still receives its half-open trial.
class PhotoProxyHandler {
public:
    PhotoProxyHandler(PhotoProxyConfig config, PhotoProxyDeps deps);

    [[nodiscard]] HttpResponse handle(const HttpRequest& request,
                                      const foundation::CancellationToken& cancel);

    [[nodiscard]] const PhotoProxyConfig& config() const noexcept { return config_; }

private:
    /// Response plus the outcome label recorded in metrics.
    struct Reply {
        HttpResponse response;
        std::string outcome;
    };

    Reply process(const HttpRequest& request, const foundation::CancellationToken& cancel);

    std::optional<Reply> checkSignature(const SignedMediaRequest& media) const;
    std::optional<Reply> preflight(CircuitPermit& permit);
    Reply fetch(const SignedMediaRequest& media, const CircuitPermit& permit,
                const foundation::CancellationToken& cancel);

    void recordResolution(const foundation::GatewayResult<std::string>& result,
                          const CircuitPermit& permit, std::chrono::milliseconds elapsed);
    void recomputeMode();

    Reply fail(int status, std::string_view message, std::string_view reason,
               std::optional<int> retryAfterSec = std::nullopt) const;
    Reply success(BinaryPayload payload) const;

    PhotoProxyConfig config_;
    PhotoProxyDeps deps_;
};

}  // namespace pgw::service
