/// @file media_server_test.cpp
/// @brief Unit tests for MediaServer routing and a loopback socket round trip.

#include <gtest/gtest.h>

#include <string>

#include "pgw/foundation/gateway_metrics.hpp"
#include "pgw/service/media_server.hpp"
#include "support/gateway_harness.hpp"
#include "support/loopback_http.hpp"

using namespace pgw::service;
using pgw::foundation::CancellationToken;
using pgw::foundation::GatewayMetrics;
using pgw::testing::GatewayHarness;
using pgw::testing::loopbackExchange;
using pgw::testing::reasonOf;

namespace {

HttpRequest makeRequest(std::string method, std::string path) {
    HttpRequest request;
    request.method = std::move(method);
    request.path = std::move(path);
    return request;
}

}  // namespace

class MediaServerTest : public ::testing::Test {
protected:
    void SetUp() override {
        ASSERT_TRUE(h_.seed());
        MediaServerConfig config;
        config.port = 0;
        config.workers = 2;
        config.serviceName = "pgw-test";
        config.readTimeoutMs = 2000;
        server_ = std::make_unique<MediaServer>(config, h_.proxy, h_.mode,
                                                GatewayMetrics::instance());
    }

    void TearDown() override { server_->stop(); }

    HttpResponse get(const std::string& path) {
        return server_->route(makeRequest("GET", path), CancellationToken{});
    }

    GatewayHarness h_;
    std::unique_ptr<MediaServer> server_;
};

TEST(ServiceModeJsonTest, SerializesStateAndTriggers) {
    ServiceModeState state;
    state.currentMode = ServiceMode::Degraded;
    state.reason = "budget_exceeded";
    state.enteredAt = pgw::foundation::fromUnixMillis(1'700'000'000'123);
    state.triggers.budgetOk = false;

    EXPECT_EQ(serviceModeJson(state, true),
              R"({"currentMode":"DEGRADED","reason":"budget_exceeded","enteredAt":1700000000123,)"
              R"("overridden":true,"triggers":{"providerHealthy":true,"budgetOk":false,)"
              R"("latencyOk":true,"circuitBreakerClosed":true}})");
}

TEST_F(MediaServerTest, OnlyGetIsAllowed) {
    auto response = server_->route(makeRequest("POST", "/media/p/r"), CancellationToken{});
    EXPECT_EQ(response.status, 405);
    EXPECT_EQ(response.header("Allow"), "GET");
    EXPECT_EQ(h_.provider->totalCalls(), 0);
}

TEST_F(MediaServerTest, UnknownRouteIs404) {
    auto response = get("/admin");
    EXPECT_EQ(response.status, 404);
    EXPECT_EQ(reasonOf(response), "unknown_route");
}

TEST_F(MediaServerTest, MediaRoutedToProxy) {
    auto request = h_.signedRequest("place-1", "photo-1");
    auto response = server_->route(request, CancellationToken{});
    EXPECT_EQ(response.status, 200);
    EXPECT_EQ(h_.provider->resolveCalls(), 1);
}

TEST_F(MediaServerTest, HealthzReportsService) {
    auto response = get("/healthz");
    EXPECT_EQ(response.status, 200);
    EXPECT_NE(response.body.find(R"("service":"pgw-test")"), std::string::npos);
    EXPECT_NE(response.body.find(R"("mode":"NOMINAL")"), std::string::npos);
    EXPECT_EQ(response.header("Cache-Control"), "no-store");
}

TEST_F(MediaServerTest, ReadyzFollowsReadinessAndMode) {
    EXPECT_EQ(get("/readyz").status, 503);

    server_->setReady(true);
    EXPECT_DOUBLE_EQ(GatewayMetrics::instance().gaugeValue("pgw_ready"), 1.0);
    auto ready = get("/readyz");
    EXPECT_EQ(ready.status, 200);
    EXPECT_NE(ready.body.find(R"("status":"ready")"), std::string::npos);

    h_.mode->forceMode(ServiceMode::Outage, "ops_drill");
    EXPECT_EQ(get("/readyz").status, 503);
    // Liveness is unaffected by the mode.
    EXPECT_EQ(get("/healthz").status, 200);
}

TEST_F(MediaServerTest, MetricsExposeRequestOutcomes) {
    (void)server_->route(h_.signedRequest("p", "r"), CancellationToken{});
    auto response = get("/metrics");
    EXPECT_EQ(response.status, 200);
    EXPECT_EQ(response.header("Content-Type"), "text/plain; version=0.0.4; charset=utf-8");
    EXPECT_NE(response.body.find(R"(pgw_media_requests_total{outcome="ok"} 1)"),
              std::string::npos);
    EXPECT_NE(response.body.find("pgw_upstream_latency_ms_count 1"), std::string::npos);
}

TEST_F(MediaServerTest, ServiceModeEndpoint) {
    h_.mode->forceMode(ServiceMode::Watch, "ops_watch");
    auto response = get("/service-mode");
    EXPECT_EQ(response.status, 200);
    EXPECT_NE(response.body.find(R"("currentMode":"WATCH")"), std::string::npos);
    EXPECT_NE(response.body.find(R"("overridden":true)"), std::string::npos);
}

TEST_F(MediaServerTest, ServesOverLoopbackSocket) {
    ASSERT_TRUE(server_->start());
    EXPECT_TRUE(server_->isRunning());
    ASSERT_NE(server_->boundPort(), 0);

    auto health = loopbackExchange(server_->boundPort(), "GET /healthz HTTP/1.1\r\nHost: x\r\n\r\n");
    EXPECT_EQ(health.rfind("HTTP/1.1 200 OK\r\n", 0), 0u) << health;
    EXPECT_NE(health.find("Connection: close"), std::string::npos);

    auto target = h_.codec->buildSignedPath("place-1", "photo-1", MediaSize::Thumbnail);
    auto media = loopbackExchange(server_->boundPort(), "GET " + target + " HTTP/1.1\r\n\r\n");
    EXPECT_EQ(media.rfind("HTTP/1.1 200 OK\r\n", 0), 0u) << media;
    EXPECT_NE(media.find("\x89PIXELS"), std::string::npos);

    auto garbage = loopbackExchange(server_->boundPort(), "NONSENSE\r\n\r\n");
    EXPECT_EQ(garbage.rfind("HTTP/1.1 400 Bad Request\r\n", 0), 0u) << garbage;

    server_->stop();
    EXPECT_FALSE(server_->isRunning());
}

TEST_F(MediaServerTest, SecondServerOnSamePortFails) {
    ASSERT_TRUE(server_->start());
    MediaServerConfig config;
    config.port = server_->boundPort();
    MediaServer clash(config, h_.proxy, h_.mode, GatewayMetrics::instance());
    auto started = clash.start();
    ASSERT_TRUE(started.hasError());
    EXPECT_EQ(started.error().code(), pgw::foundation::ErrorCode::ListenFailed);
}
