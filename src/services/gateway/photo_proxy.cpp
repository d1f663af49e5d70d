/// @file photo_proxy.cpp
/// @brief Media proxy request pipeline.

#include "pgw/service/photo_proxy.hpp"

#include "pgw/foundation/gateway_logger.hpp"
#include "pgw/foundation/gateway_metrics.hpp"
#include "pgw/foundation/json_log_formatter.hpp"
#include "pgw/foundation/redactor.hpp"
#include "pgw/service/budget_tracker.hpp"
#include "pgw/service/circuit_breaker.hpp"
#include "pgw/service/feature_flag_store.hpp"
#include "pgw/service/latency_sampler.hpp"
#include "pgw/service/service_mode.hpp"
#include "pgw/service/trigger_source.hpp"

#include <algorithm>
#include <cctype>

namespace pgw::service {

using foundation::CancellationToken;
using foundation::ErrorCode;
using foundation::GatewayError;
using foundation::GatewayResult;
using foundation::LogCategory;
using foundation::LogLevel;

namespace {

constexpr std::string_view kRequestsMetric = "pgw_media_requests_total";
constexpr std::string_view kLatencyMetric = "pgw_upstream_latency_ms";
constexpr std::size_t kMaxRequestIdLength = 64;

const foundation::Redactor& redactor() {
    static const foundation::Redactor instance;
    return instance;
}

/// Accept a caller-supplied request id only if it is short and plain.
std::string requestIdFor(const HttpRequest& request) {
    auto supplied = request.header("x-request-id");
    if (supplied && !supplied->empty() && supplied->size() <= kMaxRequestIdLength &&
        std::all_of(supplied->begin(), supplied->end(), [](unsigned char c) {
            return std::isalnum(c) || c == '.' || c == '-' || c == '_';
        })) {
        return *supplied;
    }
    return foundation::generateCorrelationId();
}

template <typename T>
void warnOnError(const GatewayResult<T>& result, std::string_view what) {
    if (!result) {
        PGW_LOG_WARN(LogCategory::Gateway,
                     std::string(what) + " failed: " + std::string(result.error().message()));
    }
}

int retryAfterForMode(const PhotoProxyConfig& config, std::string_view reason) {
    if (reason == mode_reason::kBudgetExceeded) {
        return config.retryAfterBudgetExceededSec;
    }
    if (reason == mode_reason::kCircuitOpen) {
        return config.retryAfterCircuitOpenSec;
    }
    return config.retryAfterFeatureDisabledSec;
}

GatewayResult<SignedMediaRequest> invalidRequest(std::string message, std::string_view reason) {
    return GatewayResult<SignedMediaRequest>::err(
        GatewayError(ErrorCode::ValidationFailed, std::move(message), std::string(reason)));
}

}  // namespace

GatewayResult<SignedMediaRequest> parseMediaRequest(const HttpRequest& request) {
    auto segments = splitPath(request.path);
    if (segments.size() != 3 || segments[0] != "media") {
        return invalidRequest("expected /media/{resourceId}/{variantRef}",
                              proxy_reason::kInvalidPath);
    }

    SignedMediaRequest media;
    media.resourceId = std::move(segments[1]);
    media.variantRef = std::move(segments[2]);

    auto params = parseQueryString(request.query);
    if (auto it = params.find("size"); it != params.end()) {
        auto size = parseMediaSize(it->second);
        if (!size) {
            return invalidRequest("unknown size '" + it->second + "'", proxy_reason::kInvalidSize);
        }
        media.size = *size;
    }
    if (auto it = params.find("exp"); it != params.end()) {
        media.exp = it->second;
    }
    if (auto it = params.find("sig"); it != params.end()) {
        media.sig = it->second;
    }
    return GatewayResult<SignedMediaRequest>::ok(std::move(media));
}

HttpResponse errorResponse(int status, std::string_view message, std::string_view reason,
                           std::optional<int> retryAfterSec) {
    HttpResponse response;
    response.status = status;
    response.setHeader("Content-Type", "application/json");
    response.setHeader("Cache-Control", "no-store");
    response.setHeader("X-Content-Type-Options", "nosniff");
    if (retryAfterSec) {
        response.setHeader("Retry-After", std::to_string(*retryAfterSec));
    }
    response.body = "{\"error\":" + foundation::jsonQuote(message) +
                    ",\"reason\":" + foundation::jsonQuote(reason) + "}";
    return response;
}

PhotoProxyHandler::PhotoProxyHandler(PhotoProxyConfig config, PhotoProxyDeps deps)
    : config_(std::move(config)), deps_(std::move(deps)) {
    foundation::GatewayMetrics::instance().registerHistogram(
        kLatencyMetric, foundation::HistogramBuckets::upstreamLatencyMs());
}

HttpResponse PhotoProxyHandler::handle(const HttpRequest& request,
                                       const CancellationToken& cancel) {
    auto requestId = requestIdFor(request);
    foundation::CorrelationScope scope(requestId);

    Reply reply;
    try {
        reply = process(request, cancel);
    } catch (const std::exception& e) {
        foundation::LogContext ctx;
        ctx.requestId = requestId;
        foundation::GatewayLogger::instance().logWithContext(
            LogLevel::Error, LogCategory::Gateway,
            "unexpected fault: " + redactor().redactString(e.what()), ctx);
        reply = fail(500, "internal error", proxy_reason::kInternal);
    }

    reply.response.setHeader("X-Request-Id", requestId);
    foundation::GatewayMetrics::instance().incrementCounter(
        kRequestsMetric, {{"outcome", reply.outcome}});

    foundation::LogContext ctx;
    ctx.requestId = requestId;
    ctx.endpointClass = "photos";
    ctx.extra["status"] = std::to_string(reply.response.status);
    ctx.extra["outcome"] = reply.outcome;
    foundation::GatewayLogger::instance().logWithContext(
        LogLevel::Info, LogCategory::Gateway, "media request finished", ctx);
    return std::move(reply.response);
}

PhotoProxyHandler::Reply PhotoProxyHandler::process(const HttpRequest& request,
                                                    const CancellationToken& cancel) {
    if (cancel.isCancelled()) {
        return fail(503, "request cancelled", proxy_reason::kCancelled);
    }

    auto parsed = parseMediaRequest(request);
    if (!parsed) {
        const auto* reason = parsed.error().context<std::string>();
        PGW_LOG_DEBUG(LogCategory::Gateway,
                      "rejected media request: " + std::string(parsed.error().message()));
        return fail(400, "invalid request",
                    reason != nullptr ? std::string_view(*reason) : proxy_reason::kInvalidPath);
    }
    const auto& media = parsed.value();

    if (config_.enforceSignatures) {
        if (auto rejected = checkSignature(media)) {
            return std::move(*rejected);
        }
    }

    CircuitPermit permit;
    if (auto refused = preflight(permit)) {
        return std::move(*refused);
    }

    return fetch(media, permit, cancel);
}

std::optional<PhotoProxyHandler::Reply>
PhotoProxyHandler::checkSignature(const SignedMediaRequest& media) const {
    if (!media.exp || !media.sig || media.exp->empty() || media.sig->empty()) {
        return fail(403, "missing signature", proxy_reason::kMissingSignature);
    }
    switch (deps_.codec->verify(media.resourceId, media.variantRef, media.size,
                                *media.exp, *media.sig)) {
        case VerifyOutcome::Valid:
            return std::nullopt;
        case VerifyOutcome::Expired:
            PGW_LOG_DEBUG(LogCategory::Signing, "expired media signature");
            return fail(403, "signature expired", proxy_reason::kExpired);
        case VerifyOutcome::Invalid:
            break;
    }
    PGW_LOG_WARN(LogCategory::Signing, "invalid media signature for size " +
                                       std::string(toString(media.size)));
    return fail(403, "invalid signature", proxy_reason::kInvalidSignature);
}

std::optional<PhotoProxyHandler::Reply> PhotoProxyHandler::preflight(CircuitPermit& permit) {
    bool disabledByProfile = false;
    std::string flagReason;

    auto flag = deps_.flags->find(flags::kPhotosEnabled);
    if (!flag) {
        PGW_LOG_WARN(LogCategory::Gateway, "photo flag unreadable, serving anyway: " +
                                           std::string(flag.error().message()));
    } else if (flag.value() && !flag.value()->enabled) {
        flagReason = flag.value()->reason.value_or(std::string(proxy_reason::kFeatureDisabled));
        if (!isProfileReason(flagReason)) {
            return fail(503, "feature disabled", flagReason,
                        config_.retryAfterFeatureDisabledSec);
        }
        disabledByProfile = true;
    }

    // The committed mode is authoritative, so relaxations wait out the dwell.
    // An outage committed for an open circuit is judged by the breaker below,
    // which admits the half-open trial call: only the remaining triggers count here.
    auto state = deps_.mode->current();
    ModeDecision effective{state.currentMode, state.reason};
    if (!deps_.mode->isOverridden() && state.reason == mode_reason::kCircuitOpen) {
        auto triggers = state.triggers;
        triggers.circuitBreakerClosed = true;
        effective = resolveMode(triggers);
    }
    if (!isMoreSevere(ServiceMode::Degraded, effective.mode)) {
        return fail(503, "service degraded", effective.reason,
                    retryAfterForMode(config_, effective.reason));
    }
    // A profile flag left behind by an earlier mode does not outlive it.
    if (disabledByProfile &&
        !featureProfile(effective.mode).at(std::string(flags::kPhotosEnabled))) {
        return fail(503, "feature disabled", flagReason, config_.retryAfterFeatureDisabledSec);
    }

    auto budgetOk = deps_.budget->isOk();
    if (!budgetOk) {
        PGW_LOG_ERROR(LogCategory::Budget, "budget unreadable, refusing: " +
                                           std::string(budgetOk.error().message()));
        return fail(503, "service unavailable", proxy_reason::kStateUnavailable,
                    config_.retryAfterCircuitOpenSec);
    }
    if (!budgetOk.value()) {
        return fail(503, "budget exceeded", proxy_reason::kBudgetExceeded,
                    config_.retryAfterBudgetExceededSec);
    }

    permit = deps_.breaker->allowRequest();
    if (!permit) {
        return fail(503, "circuit open", proxy_reason::kCircuitOpen,
                    config_.retryAfterCircuitOpenSec);
    }
    return std::nullopt;
}

PhotoProxyHandler::Reply PhotoProxyHandler::fetch(const SignedMediaRequest& media,
                                                  const CircuitPermit& permit,
                                                  const CancellationToken& cancel) {
    MediaLookup lookup{media.resourceId, media.variantRef, maxHeightPx(media.size)};

    auto started = std::chrono::steady_clock::now();
    auto resolved = deps_.provider->resolveMedia(lookup, config_.resolveDeadline, cancel);
    auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - started);

    recordResolution(resolved, permit, elapsed);
    recomputeMode();

    if (!resolved) {
        const auto& error = resolved.error();
        PGW_LOG_WARN(LogCategory::Provider,
                     "resolution failed: " + redactor().redactString(error.message()));
        switch (error.code()) {
            case ErrorCode::UpstreamStatus: {
                const int status = upstreamStatusOf(error);
                if (status == 404) {
                    return fail(404, "not found", proxy_reason::kNotFound);
                }
                if (status == 429) {
                    return fail(503, "rate limited", proxy_reason::kRateLimited,
                                config_.retryAfterRateLimitedSec);
                }
                return fail(502, "upstream error", proxy_reason::kUpstreamError);
            }
            case ErrorCode::UpstreamTimeout:
                return fail(504, "upstream timeout", proxy_reason::kTimeout);
            case ErrorCode::UpstreamMalformed:
            case ErrorCode::PayloadTooLarge:
                return fail(502, "upstream error", proxy_reason::kUpstreamMalformed);
            case ErrorCode::UpstreamTransport:
                return fail(502, "upstream error", proxy_reason::kUpstreamError);
            case ErrorCode::RequestCancelled:
                return fail(503, "request cancelled", proxy_reason::kCancelled);
            default:
                return fail(500, "internal error", proxy_reason::kInternal);
        }
    }

    auto payload = deps_.provider->fetchBinary(resolved.value(), config_.fetchDeadline, cancel);
    if (!payload) {
        const auto& error = payload.error();
        PGW_LOG_WARN(LogCategory::Provider,
                     "binary fetch failed: " + redactor().redactString(error.message()));
        switch (error.code()) {
            case ErrorCode::UpstreamTimeout:
                return fail(504, "upstream timeout", proxy_reason::kTimeout);
            case ErrorCode::PayloadTooLarge:
                return fail(502, "upstream error", proxy_reason::kPayloadTooLarge);
            case ErrorCode::RequestCancelled:
                return fail(503, "request cancelled", proxy_reason::kCancelled);
            case ErrorCode::UpstreamStatus:
            case ErrorCode::UpstreamMalformed:
            case ErrorCode::UpstreamTransport:
                return fail(502, "upstream error", proxy_reason::kUpstreamError);
            default:
                return fail(500, "internal error", proxy_reason::kInternal);
        }
    }
    return success(std::move(payload).value());
}

void PhotoProxyHandler::recordResolution(const GatewayResult<std::string>& result,
                                         const CircuitPermit& permit,
                                         std::chrono::milliseconds elapsed) {
    bool reachedProvider = false;
    bool breakerFailure = false;
    bool sampleLatency = false;

    if (result) {
        reachedProvider = true;
        sampleLatency = true;
        warnOnError(deps_.breaker->recordSuccess(permit), "breaker success bookkeeping");
    } else {
        switch (result.error().code()) {
            case ErrorCode::UpstreamStatus: {
                const int status = upstreamStatusOf(result.error());
                reachedProvider = true;
                sampleLatency = true;
                breakerFailure = status == 429 || status >= 500;
                break;
            }
            case ErrorCode::UpstreamMalformed:
            case ErrorCode::PayloadTooLarge:
                reachedProvider = true;
                sampleLatency = true;
                breakerFailure = true;
                break;
            case ErrorCode::UpstreamTimeout:
                sampleLatency = true;
                breakerFailure = true;
                break;
            case ErrorCode::UpstreamTransport:
                breakerFailure = true;
                break;
            default:
                break;
        }
    }

    if (breakerFailure) {
        warnOnError(deps_.breaker->recordFailure(permit), "breaker failure bookkeeping");
    }
    if (reachedProvider) {
        warnOnError(deps_.budget->recordSpend(config_.costPerCall), "budget bookkeeping");
    }
    if (sampleLatency) {
        deps_.latency->record(elapsed);
        foundation::GatewayMetrics::instance().recordHistogram(
            kLatencyMetric, static_cast<double>(elapsed.count()));
    }
}

void PhotoProxyHandler::recomputeMode() {
    if (deps_.triggers) {
        deps_.mode->recompute(deps_.triggers->sample());
    }
}

PhotoProxyHandler::Reply PhotoProxyHandler::fail(int status, std::string_view message,
                                                 std::string_view reason,
                                                 std::optional<int> retryAfterSec) const {
    return Reply{errorResponse(status, message, reason, retryAfterSec), std::string(reason)};
}

PhotoProxyHandler::Reply PhotoProxyHandler::success(BinaryPayload payload) const {
    HttpResponse response;
    response.status = 200;
    response.setHeader("Content-Type", payload.contentType.empty() ? config_.defaultContentType
                                                                   : payload.contentType);
    response.setHeader("Cache-Control",
                       "public, max-age=" + std::to_string(config_.cacheMaxAgeSec) +
                           ", s-maxage=" + std::to_string(config_.cacheSharedMaxAgeSec) +
                           ", stale-while-revalidate=" +
                           std::to_string(config_.cacheStaleWhileRevalidateSec));
    response.setHeader("X-Content-Type-Options", "nosniff");
    response.setHeader("X-Robots-Tag", "noindex");
    response.body = std::move(payload.body);
    return Reply{std::move(response), std::string(proxy_reason::kOk)};
}

}  // namespace pgw::service
