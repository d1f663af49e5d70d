/// @file circuit_breaker_test.cpp
/// @brief Unit tests for the store-backed CircuitBreaker and LatencySampler.

#include <gtest/gtest.h>

#include <memory>

#include "pgw/service/circuit_breaker.hpp"
#include "pgw/service/latency_sampler.hpp"
#include "support/fault_injecting_store.hpp"
#include "support/manual_clock.hpp"

using namespace pgw::service;
using pgw::foundation::ErrorCode;
using pgw::testing::FaultInjectingStore;
using pgw::testing::ManualClock;
using namespace std::chrono_literals;

class CircuitBreakerTest : public ::testing::Test {
protected:
    static CircuitBreakerConfig makeConfig() {
        CircuitBreakerConfig cfg;
        cfg.name = "places";
        cfg.failureThreshold = 5;
        cfg.coolDown = 30s;
        cfg.maxCoolDown = 100s;
        cfg.backoffMultiplier = 2.0;
        return cfg;
    }

    void failTimes(int n) {
        for (int i = 0; i < n; ++i) {
            ASSERT_TRUE(breaker_.recordFailure());
        }
    }

    CircuitStatus status() { return breaker_.state().value().status; }

    std::shared_ptr<FaultInjectingStore> store_ = std::make_shared<FaultInjectingStore>();
    ManualClock clock_;
    CircuitBreaker breaker_{store_, makeConfig(), clock_.fn()};
};

TEST(CircuitStatusTest, ParseAndFormat) {
    EXPECT_EQ(toString(CircuitStatus::HalfOpen), "half_open");
    EXPECT_EQ(parseCircuitStatus("open"), CircuitStatus::Open);
    EXPECT_EQ(parseCircuitStatus("OPEN"), std::nullopt);
}

TEST_F(CircuitBreakerTest, StartsClosed) {
    EXPECT_EQ(status(), CircuitStatus::Closed);
    EXPECT_TRUE(breaker_.isClosed().value());
    EXPECT_TRUE(breaker_.allowRequest());
    EXPECT_EQ(breaker_.rejectedCount(), 0u);
}

TEST_F(CircuitBreakerTest, OpensAtThreshold) {
    failTimes(4);
    EXPECT_EQ(status(), CircuitStatus::Closed);
    EXPECT_EQ(breaker_.state().value().consecutiveFailures, 4u);

    failTimes(1);
    auto state = breaker_.state().value();
    EXPECT_EQ(state.status, CircuitStatus::Open);
    EXPECT_EQ(state.openCount, 1u);
    ASSERT_TRUE(state.openedAt.has_value());
    EXPECT_EQ(*state.nextProbeAt, clock_.now() + 30s);

    EXPECT_FALSE(breaker_.allowRequest());
    EXPECT_EQ(breaker_.rejectedCount(), 1u);
    EXPECT_FALSE(breaker_.isClosed().value());
}

TEST_F(CircuitBreakerTest, SuccessResetsFailureRun) {
    failTimes(4);
    ASSERT_TRUE(breaker_.recordSuccess());
    EXPECT_EQ(breaker_.state().value().consecutiveFailures, 0u);
    failTimes(4);
    EXPECT_EQ(status(), CircuitStatus::Closed);
}

TEST_F(CircuitBreakerTest, SingleProbeAfterCoolDown) {
    failTimes(5);
    clock_.advance(29s);
    EXPECT_FALSE(breaker_.allowRequest());

    clock_.advance(1s);
    EXPECT_TRUE(breaker_.allowRequest());
    EXPECT_EQ(status(), CircuitStatus::HalfOpen);

    // Probe in flight: everyone else is rejected.
    EXPECT_FALSE(breaker_.allowRequest());
    EXPECT_FALSE(breaker_.allowRequest());
}

TEST_F(CircuitBreakerTest, SecondReplicaSeesSameProbeLease) {
    CircuitBreaker replica(store_, makeConfig(), clock_.fn());
    failTimes(5);
    clock_.advance(30s);
    EXPECT_TRUE(breaker_.allowRequest());
    EXPECT_FALSE(replica.allowRequest());
}

TEST_F(CircuitBreakerTest, ProbeSuccessCloses) {
    failTimes(5);
    clock_.advance(30s);
    auto permit = breaker_.allowRequest();
    ASSERT_TRUE(permit);
    EXPECT_NE(permit.lease, 0u);

    auto state = breaker_.recordSuccess(permit);
    ASSERT_TRUE(state);
    EXPECT_EQ(state.value().status, CircuitStatus::Closed);
    EXPECT_EQ(state.value().openCount, 0u);
    EXPECT_FALSE(state.value().nextProbeAt.has_value());
    EXPECT_TRUE(breaker_.allowRequest());
}

TEST_F(CircuitBreakerTest, ProbeFailureReopensWithBackoff) {
    failTimes(5);
    clock_.advance(30s);
    auto permit = breaker_.allowRequest();
    ASSERT_TRUE(permit);
    ASSERT_TRUE(breaker_.recordFailure(permit));

    auto state = breaker_.state().value();
    EXPECT_EQ(state.status, CircuitStatus::Open);
    EXPECT_EQ(state.openCount, 2u);
    EXPECT_EQ(*state.nextProbeAt, clock_.now() + 60s);

    clock_.advance(60s);
    permit = breaker_.allowRequest();
    ASSERT_TRUE(permit);
    ASSERT_TRUE(breaker_.recordFailure(permit));
    // 30 * 2^2 = 120 is capped at maxCoolDown.
    EXPECT_EQ(*breaker_.state().value().nextProbeAt, clock_.now() + 100s);
}

TEST_F(CircuitBreakerTest, ExpiredProbeLeaseIsReissued) {
    failTimes(5);
    clock_.advance(30s);
    ASSERT_TRUE(breaker_.allowRequest());

    // The probe never reported back.
    clock_.advance(30s);
    EXPECT_TRUE(breaker_.allowRequest());
    EXPECT_EQ(status(), CircuitStatus::HalfOpen);
}

TEST_F(CircuitBreakerTest, ClosedAdmissionsDoNotCarryLease) {
    auto permit = breaker_.allowRequest();
    ASSERT_TRUE(permit);
    EXPECT_EQ(permit.lease, 0u);
}

TEST_F(CircuitBreakerTest, EarlierCallsCannotSettleHalfOpen) {
    auto early = breaker_.allowRequest();
    ASSERT_TRUE(early);
    failTimes(5);
    clock_.advance(30s);
    auto trial = breaker_.allowRequest();
    ASSERT_TRUE(trial);

    // Calls admitted while Closed finish after the lease was granted.
    auto afterSuccess = breaker_.recordSuccess(early);
    ASSERT_TRUE(afterSuccess);
    EXPECT_EQ(afterSuccess.value().status, CircuitStatus::HalfOpen);
    auto afterFailure = breaker_.recordFailure(early);
    ASSERT_TRUE(afterFailure);
    EXPECT_EQ(afterFailure.value().status, CircuitStatus::HalfOpen);
    EXPECT_EQ(afterFailure.value().openCount, 1u);
    ASSERT_TRUE(breaker_.recordFailure());
    EXPECT_EQ(status(), CircuitStatus::HalfOpen);

    ASSERT_TRUE(breaker_.recordSuccess(trial));
    EXPECT_EQ(status(), CircuitStatus::Closed);
}

TEST_F(CircuitBreakerTest, ExpiredLeaseHolderCannotSettle) {
    failTimes(5);
    clock_.advance(30s);
    auto first = breaker_.allowRequest();
    ASSERT_TRUE(first);

    clock_.advance(30s);
    auto second = breaker_.allowRequest();
    ASSERT_TRUE(second);
    EXPECT_NE(first.lease, second.lease);

    ASSERT_TRUE(breaker_.recordFailure(first));
    EXPECT_EQ(status(), CircuitStatus::HalfOpen);
    ASSERT_TRUE(breaker_.recordFailure(second));
    EXPECT_EQ(status(), CircuitStatus::Open);
    EXPECT_EQ(breaker_.state().value().openCount, 2u);
}

TEST_F(CircuitBreakerTest, LeaseIdsSurviveClose) {
    failTimes(5);
    clock_.advance(30s);
    auto first = breaker_.allowRequest();
    ASSERT_TRUE(breaker_.recordSuccess(first));
    EXPECT_EQ(status(), CircuitStatus::Closed);

    failTimes(5);
    clock_.advance(30s);
    auto second = breaker_.allowRequest();
    ASSERT_TRUE(second);
    EXPECT_GT(second.lease, first.lease);

    // The first cycle's holder reports late.
    ASSERT_TRUE(breaker_.recordFailure(first));
    EXPECT_EQ(status(), CircuitStatus::HalfOpen);

    CircuitBreaker replica(store_, makeConfig(), clock_.fn());
    ASSERT_TRUE(replica.recordSuccess(second));
    EXPECT_EQ(status(), CircuitStatus::Closed);
}

TEST_F(CircuitBreakerTest, LateSuccessWhileOpenIsIgnored) {
    failTimes(5);
    ASSERT_TRUE(breaker_.recordSuccess());
    EXPECT_EQ(status(), CircuitStatus::Open);
}

TEST_F(CircuitBreakerTest, CoolDownSchedule) {
    EXPECT_EQ(breaker_.coolDownFor(0), 30s);
    EXPECT_EQ(breaker_.coolDownFor(1), 30s);
    EXPECT_EQ(breaker_.coolDownFor(2), 60s);
    EXPECT_EQ(breaker_.coolDownFor(3), 100s);
    EXPECT_EQ(breaker_.coolDownFor(20), 100s);
}

TEST_F(CircuitBreakerTest, ForceOpenAndReset) {
    auto opened = breaker_.forceOpen();
    ASSERT_TRUE(opened);
    EXPECT_EQ(opened.value().status, CircuitStatus::Open);
    EXPECT_FALSE(breaker_.allowRequest());

    ASSERT_TRUE(breaker_.reset());
    EXPECT_EQ(status(), CircuitStatus::Closed);
    EXPECT_TRUE(breaker_.allowRequest());
}

TEST_F(CircuitBreakerTest, StoreFailureRejectsCalls) {
    store_->failPrefix("circuit:");
    EXPECT_FALSE(breaker_.allowRequest());
    EXPECT_EQ(breaker_.isClosed().error().code(), ErrorCode::StoreUnavailable);
    EXPECT_TRUE(breaker_.recordFailure().hasError());
}

TEST_F(CircuitBreakerTest, CorruptRecordRejectsCalls) {
    ASSERT_TRUE(store_->compareAndSet("circuit:places", 0, "{status: exploded}"));
    EXPECT_FALSE(breaker_.allowRequest());
    EXPECT_EQ(breaker_.state().error().code(), ErrorCode::RecordCorrupt);
}

// ===========================================================================
// LatencySampler
// ===========================================================================

class LatencySamplerTest : public ::testing::Test {
protected:
    static LatencySamplerConfig makeConfig() {
        LatencySamplerConfig cfg;
        cfg.capacity = 20;
        cfg.threshold = 2000ms;
        cfg.maxAge = 300s;
        cfg.minSamples = 5;
        return cfg;
    }

    ManualClock clock_;
    LatencySampler sampler_{makeConfig(), clock_.fn()};
};

TEST_F(LatencySamplerTest, EmptyIsOk) {
    EXPECT_FALSE(sampler_.p95().has_value());
    EXPECT_TRUE(sampler_.isOk());
}

TEST_F(LatencySamplerTest, NearestRankP95) {
    for (int i = 1; i <= 20; ++i) {
        sampler_.record(std::chrono::milliseconds(i * 100));
    }
    ASSERT_TRUE(sampler_.p95().has_value());
    EXPECT_EQ(*sampler_.p95(), 1900ms);
    EXPECT_TRUE(sampler_.isOk());
}

TEST_F(LatencySamplerTest, ElevatedAboveThreshold) {
    for (int i = 0; i < 10; ++i) {
        sampler_.record(2500ms);
    }
    EXPECT_FALSE(sampler_.isOk());
}

TEST_F(LatencySamplerTest, TooFewSamplesIsOk) {
    for (int i = 0; i < 4; ++i) {
        sampler_.record(9000ms);
    }
    EXPECT_TRUE(sampler_.isOk());
    sampler_.record(9000ms);
    EXPECT_FALSE(sampler_.isOk());
}

TEST_F(LatencySamplerTest, CapacityEvictsOldest) {
    for (int i = 0; i < 20; ++i) {
        sampler_.record(5000ms);
    }
    for (int i = 0; i < 20; ++i) {
        sampler_.record(100ms);
    }
    EXPECT_EQ(sampler_.sampleCount(), 20u);
    EXPECT_TRUE(sampler_.isOk());
}

TEST_F(LatencySamplerTest, StaleSamplesAgeOut) {
    for (int i = 0; i < 10; ++i) {
        sampler_.record(5000ms);
    }
    EXPECT_FALSE(sampler_.isOk());

    clock_.advance(301s);
    EXPECT_TRUE(sampler_.isOk());
    EXPECT_FALSE(sampler_.p95().has_value());
    EXPECT_EQ(sampler_.sampleCount(), 10u);

    sampler_.clear();
    EXPECT_EQ(sampler_.sampleCount(), 0u);
}
