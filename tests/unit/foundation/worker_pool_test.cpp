/// @file worker_pool_test.cpp
/// @brief Unit tests for WorkerPool and Signal.

#include <gtest/gtest.h>

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <mutex>
#include <stdexcept>
#include <thread>
#include <vector>

#include "pgw/foundation/signal.hpp"
#include "pgw/foundation/worker_pool.hpp"

using namespace pgw::foundation;
using namespace std::chrono_literals;

namespace {

/// Counts down completions and lets the test wait with a timeout.
class Completion {
public:
    explicit Completion(int expected) : remaining_(expected) {}

    void done() {
        std::lock_guard lock(mutex_);
        if (--remaining_ == 0) {
            cv_.notify_all();
        }
    }

    bool waitFor(std::chrono::milliseconds timeout) {
        std::unique_lock lock(mutex_);
        return cv_.wait_for(lock, timeout, [this] { return remaining_ <= 0; });
    }

private:
    std::mutex mutex_;
    std::condition_variable cv_;
    int remaining_;
};

}  // namespace

// ---------------------------------------------------------------------------
// WorkerPool
// ---------------------------------------------------------------------------

TEST(WorkerPoolTest, RunsSubmittedTasks) {
    WorkerPool pool("test_pool", 4);
    ASSERT_TRUE(pool.isRunning());
    EXPECT_EQ(pool.workerCount(), 4u);

    std::atomic<int> sum{0};
    Completion completion(100);
    for (int i = 1; i <= 100; ++i) {
        ASSERT_TRUE(pool.submit([&, i] {
            sum.fetch_add(i);
            completion.done();
        }));
    }
    ASSERT_TRUE(completion.waitFor(5s));
    EXPECT_EQ(sum.load(), 5050);
}

TEST(WorkerPoolTest, ZeroWorkersClampsToOne) {
    WorkerPool pool("tiny_pool", 0);
    EXPECT_EQ(pool.workerCount(), 1u);
}

TEST(WorkerPoolTest, ThrowingTaskIsCountedAndPoolSurvives) {
    WorkerPool pool("throwing_pool", 2);
    Completion completion(2);

    ASSERT_TRUE(pool.submit([&] {
        completion.done();
        throw std::runtime_error("boom");
    }));
    ASSERT_TRUE(pool.submit([&] { completion.done(); }));
    ASSERT_TRUE(completion.waitFor(5s));

    // The failure counter is bumped after the throwing task's done() call.
    auto deadline = std::chrono::steady_clock::now() + 5s;
    while (pool.failedTasks() == 0 && std::chrono::steady_clock::now() < deadline) {
        std::this_thread::sleep_for(5ms);
    }
    EXPECT_EQ(pool.failedTasks(), 1u);
    EXPECT_TRUE(pool.isRunning());
}

TEST(WorkerPoolTest, SubmitAfterShutdownFails) {
    WorkerPool pool("stopped_pool", 1);
    pool.shutdown();
    EXPECT_FALSE(pool.isRunning());

    auto result = pool.submit([] {});
    ASSERT_TRUE(result.hasError());
    EXPECT_EQ(result.error().code(), ErrorCode::JobScheduleFailed);

    pool.shutdown();  // idempotent
}

// ---------------------------------------------------------------------------
// Signal
// ---------------------------------------------------------------------------

TEST(SignalTest, EmitsInConnectionOrder) {
    Signal<int> signal;
    std::vector<int> seen;
    signal.connect([&](int v) { seen.push_back(v * 10); });
    signal.connect([&](int v) { seen.push_back(v * 100); });

    signal.emit(2);
    EXPECT_EQ(seen, (std::vector<int>{20, 200}));
}

TEST(SignalTest, DisconnectStopsDelivery) {
    Signal<> signal;
    int calls = 0;
    auto id = signal.connect([&] { ++calls; });
    signal.emit();
    EXPECT_TRUE(signal.disconnect(id));
    EXPECT_FALSE(signal.disconnect(id));
    signal.emit();
    EXPECT_EQ(calls, 1);
    EXPECT_EQ(signal.slotCount(), 0u);
}

TEST(SignalTest, SlotMayDisconnectItselfWhileFiring) {
    Signal<> signal;
    int calls = 0;
    Signal<>::SlotId id = 0;
    id = signal.connect([&] {
        ++calls;
        signal.disconnect(id);
    });
    signal.emit();
    signal.emit();
    EXPECT_EQ(calls, 1);
}
