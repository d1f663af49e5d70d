/// @file photo_proxy_test.cpp
/// @brief Unit tests for PhotoProxyHandler: request validation, signature
///        enforcement, pre-flight refusals, upstream error mapping and
///        breaker/budget bookkeeping.

#include <gtest/gtest.h>

#include <stdexcept>
#include <string>

#include "pgw/foundation/gateway_metrics.hpp"
#include "pgw/service/photo_proxy.hpp"
#include "support/gateway_harness.hpp"

using namespace pgw::service;
using pgw::foundation::CancellationSource;
using pgw::foundation::ErrorCode;
using pgw::foundation::GatewayError;
using pgw::foundation::GatewayMetrics;
using pgw::testing::FakeProviderClient;
using pgw::testing::GatewayHarness;
using pgw::testing::HarnessOptions;
using pgw::testing::reasonOf;
using namespace std::chrono_literals;

namespace {

ServiceTriggers withLatency(bool ok) {
    ServiceTriggers t;
    t.latencyOk = ok;
    return t;
}

FakeProviderClient::FetchResult fetchError(ErrorCode code) {
    return FakeProviderClient::FetchResult::err(GatewayError(code, "fetch failed"));
}

FakeProviderClient::ResolveResult resolveError(ErrorCode code) {
    return FakeProviderClient::ResolveResult::err(GatewayError(code, "resolve failed"));
}

}  // namespace

// ===========================================================================
// Free helpers
// ===========================================================================

TEST(ParseMediaRequestTest, ExtractsComponents) {
    auto request = GatewayHarness::requestFor("/media/place%2F1/ref%201?size=thumbnail&exp=5&sig=ab");
    auto parsed = parseMediaRequest(request);
    ASSERT_TRUE(parsed);
    EXPECT_EQ(parsed.value().resourceId, "place/1");
    EXPECT_EQ(parsed.value().variantRef, "ref 1");
    EXPECT_EQ(parsed.value().size, MediaSize::Thumbnail);
    EXPECT_EQ(parsed.value().exp, "5");
    EXPECT_EQ(parsed.value().sig, "ab");
}

TEST(ParseMediaRequestTest, DefaultsToMediumWithoutSignature) {
    auto parsed = parseMediaRequest(GatewayHarness::requestFor("/media/p/r"));
    ASSERT_TRUE(parsed);
    EXPECT_EQ(parsed.value().size, MediaSize::Medium);
    EXPECT_FALSE(parsed.value().exp.has_value());
    EXPECT_FALSE(parsed.value().sig.has_value());
}

TEST(ParseMediaRequestTest, RejectionsCarryReason) {
    for (const char* target : {"/media/p", "/media/p/r/extra", "/photos/p/r", "/media"}) {
        auto parsed = parseMediaRequest(GatewayHarness::requestFor(target));
        ASSERT_TRUE(parsed.hasError()) << target;
        ASSERT_NE(parsed.error().context<std::string>(), nullptr);
        EXPECT_EQ(*parsed.error().context<std::string>(), proxy_reason::kInvalidPath);
    }
    auto badSize = parseMediaRequest(GatewayHarness::requestFor("/media/p/r?size=huge"));
    ASSERT_TRUE(badSize.hasError());
    EXPECT_EQ(*badSize.error().context<std::string>(), proxy_reason::kInvalidSize);
}

TEST(ErrorResponseTest, JsonBodyAndHeaders) {
    auto response = errorResponse(503, "circuit \"open\"", proxy_reason::kCircuitOpen, 30);
    EXPECT_EQ(response.status, 503);
    EXPECT_EQ(response.body, R"({"error":"circuit \"open\"","reason":"circuit_open"})");
    EXPECT_EQ(response.header("Content-Type"), "application/json");
    EXPECT_EQ(response.header("Cache-Control"), "no-store");
    EXPECT_EQ(response.header("Retry-After"), "30");

    EXPECT_EQ(errorResponse(400, "bad", "invalid_path").header("Retry-After"), std::nullopt);
}

// ===========================================================================
// Handler
// ===========================================================================

class PhotoProxyTest : public ::testing::Test {
protected:
    void SetUp() override { ASSERT_TRUE(h_.seed()); }

    GatewayHarness h_;
};

TEST_F(PhotoProxyTest, ServesSignedRequest) {
    auto response = h_.get(h_.signedRequest("place-1", "photo-1", MediaSize::Full));

    EXPECT_EQ(response.status, 200);
    EXPECT_EQ(response.body, "\x89PIXELS");
    EXPECT_EQ(response.header("Content-Type"), "image/webp");
    EXPECT_EQ(response.header("Cache-Control"),
              "public, max-age=300, s-maxage=900, stale-while-revalidate=60");
    EXPECT_EQ(response.header("X-Content-Type-Options"), "nosniff");
    EXPECT_EQ(response.header("X-Robots-Tag"), "noindex");
    EXPECT_TRUE(response.header("X-Request-Id").has_value());

    auto lookup = h_.provider->lastLookup();
    ASSERT_TRUE(lookup.has_value());
    EXPECT_EQ(lookup->resourceId, "place-1");
    EXPECT_EQ(lookup->variantRef, "photo-1");
    EXPECT_EQ(lookup->maxHeightPx, 1000);
    EXPECT_EQ(h_.provider->lastResolveDeadline(), 10000ms);
    EXPECT_EQ(h_.provider->lastFetchUri(), FakeProviderClient::kDefaultUri);

    EXPECT_DOUBLE_EQ(h_.budget->snapshot().value().spent, 7.0);
    EXPECT_EQ(h_.latency->sampleCount(), 1u);
    EXPECT_EQ(h_.outcomeCount("ok"), 1u);
    EXPECT_EQ(GatewayMetrics::instance().histogramCount("pgw_upstream_latency_ms"), 1u);
}

TEST_F(PhotoProxyTest, UnescapedPlusInPathIsLiteral) {
    auto exp = h_.clock.unixSeconds() + 60;
    auto sig = h_.codec->sign("place+1", "photo+1", MediaSize::Medium, exp);
    auto response = h_.get(GatewayHarness::requestFor(
        "/media/place+1/photo+1?size=medium&exp=" + std::to_string(exp) + "&sig=" + sig));

    ASSERT_EQ(response.status, 200);
    auto lookup = h_.provider->lastLookup();
    ASSERT_TRUE(lookup.has_value());
    EXPECT_EQ(lookup->resourceId, "place+1");
    EXPECT_EQ(lookup->variantRef, "photo+1");
}

TEST_F(PhotoProxyTest, FallsBackToDefaultContentType) {
    h_.provider->setFetchResult(FakeProviderClient::FetchResult::ok(BinaryPayload{"", "raw"}));
    EXPECT_EQ(h_.getPhoto().header("Content-Type"), "image/jpeg");
}

TEST_F(PhotoProxyTest, InvalidRequestsNeverReachProvider) {
    auto badPath = h_.get(GatewayHarness::requestFor("/media/only-one"));
    EXPECT_EQ(badPath.status, 400);
    EXPECT_EQ(reasonOf(badPath), "invalid_path");

    auto badSize = h_.get(GatewayHarness::requestFor("/media/p/r?size=poster"));
    EXPECT_EQ(badSize.status, 400);
    EXPECT_EQ(reasonOf(badSize), "invalid_size");

    EXPECT_EQ(h_.provider->totalCalls(), 0);
}

TEST_F(PhotoProxyTest, MissingSignatureRejected) {
    auto response = h_.get(GatewayHarness::requestFor("/media/p/r?size=medium"));
    EXPECT_EQ(response.status, 403);
    EXPECT_EQ(reasonOf(response), "missing_signature");
    EXPECT_EQ(response.header("Cache-Control"), "no-store");

    auto emptySig = h_.get(GatewayHarness::requestFor("/media/p/r?exp=1&sig="));
    EXPECT_EQ(reasonOf(emptySig), "missing_signature");
    EXPECT_EQ(h_.provider->totalCalls(), 0);
}

TEST_F(PhotoProxyTest, ExpiredSignatureRejected) {
    auto request = h_.signedRequest("p", "r", MediaSize::Medium, 60s);
    h_.clock.advance(61s);
    auto response = h_.get(request);
    EXPECT_EQ(response.status, 403);
    EXPECT_EQ(reasonOf(response), "expired");
    EXPECT_EQ(h_.outcomeCount("expired"), 1u);
}

TEST_F(PhotoProxyTest, TamperedRequestRejected) {
    auto request = h_.signedRequest("p", "r", MediaSize::Thumbnail);
    request.query.replace(request.query.find("thumbnail"), 9, "full");
    auto response = h_.get(request);
    EXPECT_EQ(response.status, 403);
    EXPECT_EQ(reasonOf(response), "invalid_signature");

    auto otherPlace = h_.signedRequest("p", "r");
    otherPlace.path = "/media/q/r";
    EXPECT_EQ(reasonOf(h_.get(otherPlace)), "invalid_signature");
    EXPECT_EQ(h_.provider->totalCalls(), 0);
}

TEST(PhotoProxyUnsignedTest, DevelopmentServesUnsignedRequests) {
    HarnessOptions options;
    options.enforceSignatures = false;
    GatewayHarness h(options);
    ASSERT_TRUE(h.seed());
    EXPECT_EQ(h.get(GatewayHarness::requestFor("/media/p/r")).status, 200);
}

TEST_F(PhotoProxyTest, OperatorDisabledFlagRefuses) {
    ASSERT_TRUE(h_.flags->set(flags::kPhotosEnabled, false, std::string("ops_kill_switch")));
    auto response = h_.getPhoto();
    EXPECT_EQ(response.status, 503);
    EXPECT_EQ(reasonOf(response), "ops_kill_switch");
    EXPECT_EQ(response.header("Retry-After"), "300");

    ASSERT_TRUE(h_.flags->set(flags::kPhotosEnabled, false));
    EXPECT_EQ(reasonOf(h_.getPhoto()), "feature_disabled");
    EXPECT_EQ(h_.provider->totalCalls(), 0);
}

TEST_F(PhotoProxyTest, UnreadableFlagFailsOpen) {
    h_.store->failPrefix("flag:");
    EXPECT_EQ(h_.getPhoto().status, 200);
}

TEST_F(PhotoProxyTest, DegradedModeRefusesWithModeReason) {
    ServiceTriggers overBudget;
    overBudget.budgetOk = false;
    h_.mode->recompute(overBudget);

    auto response = h_.getPhoto();
    EXPECT_EQ(response.status, 503);
    EXPECT_EQ(reasonOf(response), "budget_exceeded");
    EXPECT_EQ(response.header("Retry-After"), "3600");

    ServiceTriggers unhealthy;
    unhealthy.providerHealthy = false;
    h_.mode->recompute(unhealthy);
    response = h_.getPhoto();
    EXPECT_EQ(reasonOf(response), "provider_unhealthy");
    EXPECT_EQ(response.header("Retry-After"), "300");
    EXPECT_EQ(h_.provider->totalCalls(), 0);
}

TEST_F(PhotoProxyTest, WatchProfileDisablesPhotos) {
    h_.mode->recompute(withLatency(false));
    auto response = h_.getPhoto();
    EXPECT_EQ(response.status, 503);
    EXPECT_EQ(reasonOf(response), "service_mode_WATCH_elevated_latency");
    EXPECT_EQ(response.header("Retry-After"), "300");
}

TEST_F(PhotoProxyTest, WatchProfileHeldThroughDwell) {
    h_.mode->recompute(withLatency(false));
    // Latency recovered but the relaxation is still within its dwell.
    h_.mode->recompute(withLatency(true));
    ASSERT_EQ(h_.mode->current().currentMode, ServiceMode::Watch);
    EXPECT_EQ(h_.getPhoto().status, 503);

    h_.clock.advance(60s);
    h_.mode->recompute(withLatency(true));
    ASSERT_EQ(h_.mode->current().currentMode, ServiceMode::Nominal);
    EXPECT_EQ(h_.getPhoto().status, 200);
}

TEST_F(PhotoProxyTest, DegradedModeHeldThroughDwell) {
    ASSERT_TRUE(h_.health->setHealth("places", false));
    h_.mode->recompute(h_.triggers->sample());
    ASSERT_EQ(h_.mode->current().currentMode, ServiceMode::Degraded);

    ASSERT_TRUE(h_.health->setHealth("places", true));
    h_.clock.advance(5s);
    h_.mode->recompute(h_.triggers->sample());
    ASSERT_EQ(h_.mode->current().currentMode, ServiceMode::Degraded);

    auto response = h_.getPhoto();
    EXPECT_EQ(response.status, 503);
    EXPECT_EQ(reasonOf(response), "provider_unhealthy");
    EXPECT_EQ(h_.provider->totalCalls(), 0);

    h_.clock.advance(60s);
    h_.mode->recompute(h_.triggers->sample());
    ASSERT_EQ(h_.mode->current().currentMode, ServiceMode::Nominal);
    EXPECT_EQ(h_.getPhoto().status, 200);
}

TEST_F(PhotoProxyTest, ProfileFlagFromEarlierModeIgnored) {
    // A WATCH profile write that outlived its mode, e.g. a failed NOMINAL write.
    ASSERT_TRUE(h_.flags->set(flags::kPhotosEnabled, false,
                              profileReason(ServiceMode::Watch, "elevated_latency")));
    ASSERT_EQ(h_.mode->current().currentMode, ServiceMode::Nominal);
    EXPECT_EQ(h_.getPhoto().status, 200);
}

TEST_F(PhotoProxyTest, OutageFromOtherTriggersIsNotReDerived) {
    ServiceTriggers bothDown;
    bothDown.circuitBreakerClosed = false;
    bothDown.budgetOk = false;
    h_.mode->recompute(bothDown);
    ASSERT_EQ(h_.mode->current().reason, "circuit_open");

    auto response = h_.getPhoto();
    EXPECT_EQ(response.status, 503);
    EXPECT_EQ(reasonOf(response), "budget_exceeded");
    EXPECT_EQ(h_.provider->totalCalls(), 0);
}

TEST_F(PhotoProxyTest, ForcedModeIsHonoured) {
    h_.mode->forceMode(ServiceMode::Degraded, "ops_maintenance");
    auto response = h_.getPhoto();
    EXPECT_EQ(response.status, 503);
    EXPECT_EQ(reasonOf(response), "ops_maintenance");
}

TEST_F(PhotoProxyTest, OpenCircuitRefusesUntilProbe) {
    ASSERT_TRUE(h_.breaker->forceOpen());
    auto response = h_.getPhoto();
    EXPECT_EQ(response.status, 503);
    EXPECT_EQ(reasonOf(response), "circuit_open");
    EXPECT_EQ(response.header("Retry-After"), "30");
    EXPECT_EQ(h_.provider->totalCalls(), 0);
}

TEST_F(PhotoProxyTest, OutageProfileStillAdmitsProbe) {
    ASSERT_TRUE(h_.breaker->forceOpen());
    ServiceTriggers open;
    open.circuitBreakerClosed = false;
    h_.mode->recompute(open);
    ASSERT_EQ(h_.mode->current().currentMode, ServiceMode::Outage);
    ASSERT_FALSE(h_.flags->get(flags::kPhotosEnabled).value());

    h_.clock.advance(30s);
    auto response = h_.getPhoto();
    EXPECT_EQ(response.status, 200);
    EXPECT_TRUE(h_.breaker->isClosed().value());
    EXPECT_EQ(h_.provider->resolveCalls(), 1);
}

TEST_F(PhotoProxyTest, UnreadableBudgetFailsClosed) {
    h_.store->failPrefix("budget:");
    auto response = h_.getPhoto();
    EXPECT_EQ(response.status, 503);
    EXPECT_EQ(reasonOf(response), "state_unavailable");
    EXPECT_EQ(h_.provider->totalCalls(), 0);
}

TEST_F(PhotoProxyTest, UnreadableCircuitFailsClosed) {
    h_.store->failPrefix("circuit:");
    auto response = h_.getPhoto();
    EXPECT_EQ(response.status, 503);
    EXPECT_EQ(reasonOf(response), "circuit_open");
    EXPECT_EQ(h_.provider->totalCalls(), 0);
}

TEST(PhotoProxyBudgetTest, ExhaustedBudgetRefuses) {
    HarnessOptions options;
    options.withTriggers = false;
    options.budgetLimit = 14;
    GatewayHarness h(options);
    ASSERT_TRUE(h.seed());

    EXPECT_EQ(h.getPhoto().status, 200);
    EXPECT_EQ(h.getPhoto().status, 200);
    auto refused = h.getPhoto();
    EXPECT_EQ(refused.status, 503);
    EXPECT_EQ(reasonOf(refused), "budget_exceeded");
    EXPECT_EQ(refused.header("Retry-After"), "3600");
    EXPECT_EQ(h.provider->resolveCalls(), 2);
}

// ---------------------------------------------------------------------------
// Upstream error mapping
// ---------------------------------------------------------------------------

TEST_F(PhotoProxyTest, UpstreamNotFound) {
    h_.provider->setResolveResult(FakeProviderClient::statusError(404));
    auto response = h_.getPhoto();
    EXPECT_EQ(response.status, 404);
    EXPECT_EQ(reasonOf(response), "not_found");
    EXPECT_EQ(h_.breaker->state().value().consecutiveFailures, 0u);
    EXPECT_DOUBLE_EQ(h_.budget->snapshot().value().spent, 7.0);
    EXPECT_EQ(h_.provider->fetchCalls(), 0);
}

TEST_F(PhotoProxyTest, UpstreamRateLimited) {
    h_.provider->setResolveResult(FakeProviderClient::statusError(429));
    auto response = h_.getPhoto();
    EXPECT_EQ(response.status, 503);
    EXPECT_EQ(reasonOf(response), "upstream_rate_limited");
    EXPECT_EQ(response.header("Retry-After"), "60");
    EXPECT_EQ(h_.breaker->state().value().consecutiveFailures, 1u);
}

TEST_F(PhotoProxyTest, UpstreamServerError) {
    h_.provider->setResolveResult(FakeProviderClient::statusError(500));
    auto response = h_.getPhoto();
    EXPECT_EQ(response.status, 502);
    EXPECT_EQ(reasonOf(response), "upstream_error");
    EXPECT_EQ(h_.breaker->state().value().consecutiveFailures, 1u);
    EXPECT_DOUBLE_EQ(h_.budget->snapshot().value().spent, 7.0);
}

TEST_F(PhotoProxyTest, UpstreamClientErrorIsNotABreakerFailure) {
    h_.provider->setResolveResult(FakeProviderClient::statusError(400));
    EXPECT_EQ(h_.getPhoto().status, 502);
    EXPECT_EQ(h_.breaker->state().value().consecutiveFailures, 0u);
}

TEST_F(PhotoProxyTest, UpstreamTimeout) {
    h_.provider->setResolveResult(FakeProviderClient::timeout());
    auto response = h_.getPhoto();
    EXPECT_EQ(response.status, 504);
    EXPECT_EQ(reasonOf(response), "upstream_timeout");
    EXPECT_EQ(h_.breaker->state().value().consecutiveFailures, 1u);
    EXPECT_DOUBLE_EQ(h_.budget->snapshot().value().spent, 0.0);
    EXPECT_EQ(h_.latency->sampleCount(), 1u);
}

TEST_F(PhotoProxyTest, UpstreamMalformed) {
    h_.provider->setResolveResult(resolveError(ErrorCode::UpstreamMalformed));
    auto response = h_.getPhoto();
    EXPECT_EQ(response.status, 502);
    EXPECT_EQ(reasonOf(response), "upstream_malformed");
    EXPECT_EQ(h_.breaker->state().value().consecutiveFailures, 1u);
    EXPECT_DOUBLE_EQ(h_.budget->snapshot().value().spent, 7.0);
}

TEST_F(PhotoProxyTest, UpstreamTransportFailure) {
    h_.provider->setResolveResult(resolveError(ErrorCode::UpstreamTransport));
    auto response = h_.getPhoto();
    EXPECT_EQ(response.status, 502);
    EXPECT_EQ(reasonOf(response), "upstream_error");
    EXPECT_EQ(h_.breaker->state().value().consecutiveFailures, 1u);
    EXPECT_DOUBLE_EQ(h_.budget->snapshot().value().spent, 0.0);
    EXPECT_EQ(h_.latency->sampleCount(), 0u);
}

TEST_F(PhotoProxyTest, FetchHopErrors) {
    h_.provider->setFetchResult(fetchError(ErrorCode::UpstreamTimeout));
    EXPECT_EQ(h_.getPhoto().status, 504);

    h_.provider->setFetchResult(fetchError(ErrorCode::PayloadTooLarge));
    auto tooLarge = h_.getPhoto();
    EXPECT_EQ(tooLarge.status, 502);
    EXPECT_EQ(reasonOf(tooLarge), "payload_too_large");

    h_.provider->setFetchResult(fetchError(ErrorCode::UpstreamStatus));
    EXPECT_EQ(reasonOf(h_.getPhoto()), "upstream_error");

    // The fetch hop does not feed the breaker.
    EXPECT_EQ(h_.breaker->state().value().consecutiveFailures, 0u);
}

TEST_F(PhotoProxyTest, CancelledBeforeStart) {
    CancellationSource source;
    source.cancel();
    auto response = h_.get(h_.signedRequest("p", "r"), source.token());
    EXPECT_EQ(response.status, 503);
    EXPECT_EQ(reasonOf(response), "cancelled");
    EXPECT_EQ(h_.provider->totalCalls(), 0);
}

TEST_F(PhotoProxyTest, CancelledDuringResolveIsNotCharged) {
    CancellationSource source;
    h_.provider->onResolve([&] { source.cancel(); });
    auto response = h_.get(h_.signedRequest("p", "r"), source.token());
    EXPECT_EQ(response.status, 503);
    EXPECT_EQ(reasonOf(response), "cancelled");
    EXPECT_EQ(h_.breaker->state().value().consecutiveFailures, 0u);
    EXPECT_DOUBLE_EQ(h_.budget->snapshot().value().spent, 0.0);
    EXPECT_EQ(h_.provider->fetchCalls(), 0);
}

TEST_F(PhotoProxyTest, RepeatedFailuresOpenCircuit) {
    h_.provider->setResolveResult(FakeProviderClient::statusError(503));
    for (int i = 0; i < 5; ++i) {
        EXPECT_EQ(h_.getPhoto().status, 502);
    }
    EXPECT_EQ(h_.mode->current().currentMode, ServiceMode::Outage);

    auto refused = h_.getPhoto();
    EXPECT_EQ(refused.status, 503);
    EXPECT_EQ(reasonOf(refused), "circuit_open");
    EXPECT_EQ(h_.provider->resolveCalls(), 5);
}

TEST_F(PhotoProxyTest, UnexpectedExceptionBecomesInternalError) {
    h_.provider->onResolve([] { throw std::runtime_error("key=AIzaSecret exploded"); });
    auto response = h_.getPhoto();
    EXPECT_EQ(response.status, 500);
    EXPECT_EQ(reasonOf(response), "internal");
    EXPECT_EQ(response.body.find("AIza"), std::string::npos);
}

TEST_F(PhotoProxyTest, RequestIdEchoedOnlyWhenSafe) {
    auto request = h_.signedRequest("p", "r");
    request.headers["x-request-id"] = "client-req_42";
    EXPECT_EQ(h_.get(request).header("X-Request-Id"), "client-req_42");

    request.headers["x-request-id"] = "edge.req-1.v2";
    EXPECT_EQ(h_.get(request).header("X-Request-Id"), "edge.req-1.v2");

    request.headers["x-request-id"] = "bad id\r\nInjected: yes";
    auto generated = h_.get(request).header("X-Request-Id");
    ASSERT_TRUE(generated.has_value());
    EXPECT_EQ(generated->size(), 36u);

    auto refused = h_.get(GatewayHarness::requestFor("/media/p"));
    EXPECT_TRUE(refused.header("X-Request-Id").has_value());
}
