/// @file worker_pool.cpp
/// @brief WorkerPool implementation over kcenon thread_system.

#include "pgw/foundation/worker_pool.hpp"

#include "pgw/foundation/gateway_logger.hpp"

#include <kcenon/thread/core/job_builder.h>
#include <kcenon/thread/core/thread_pool.h>
#include <kcenon/thread/core/thread_worker.h>

#include <algorithm>
#include <exception>
#include <vector>

namespace pgw::foundation {

struct WorkerPool::Impl {
    std::string name;
    std::size_t workers{1};
    std::shared_ptr<kcenon::thread::thread_pool> pool;
    std::atomic<bool> running{false};
    std::atomic<uint64_t> nextJobId{1};
    std::shared_ptr<std::atomic<uint64_t>> failed = std::make_shared<std::atomic<uint64_t>>(0);
};

WorkerPool::WorkerPool(std::string name, std::size_t workers)
    : impl_(std::make_unique<Impl>())
{
    impl_->name = std::move(name);
    impl_->workers = std::max<std::size_t>(workers, 1);
    impl_->pool = std::make_shared<kcenon::thread::thread_pool>(impl_->name);

    std::vector<std::unique_ptr<kcenon::thread::thread_worker>> threads;
    threads.reserve(impl_->workers);
    for (std::size_t i = 0; i < impl_->workers; ++i) {
        threads.push_back(std::make_unique<kcenon::thread::thread_worker>());
    }
    impl_->pool->enqueue_batch(std::move(threads));

    auto started = impl_->pool->start();
    if (started.is_err()) {
        PGW_LOG_ERROR(LogCategory::Core, "worker pool '" + impl_->name + "' failed to start");
        return;
    }
    impl_->running.store(true, std::memory_order_release);
}

WorkerPool::~WorkerPool() {
    shutdown();
}

GatewayResult<void> WorkerPool::submit(Task task) {
    if (!impl_->running.load(std::memory_order_acquire)) {
        return GatewayResult<void>::err(
            GatewayError(ErrorCode::JobScheduleFailed, "worker pool is not running"));
    }

    auto id = impl_->nextJobId.fetch_add(1, std::memory_order_relaxed);
    auto job = kcenon::thread::job_builder()
        .name(impl_->name + "_" + std::to_string(id))
        .work([fn = std::move(task), failed = impl_->failed]()
              -> kcenon::common::VoidResult {
            try {
                fn();
            } catch (const std::exception& e) {
                failed->fetch_add(1, std::memory_order_relaxed);
                PGW_LOG_ERROR(LogCategory::Core,
                              std::string("worker task failed: ") + e.what());
            }
            return kcenon::common::VoidResult::ok(std::monostate{});
        })
        .build();

    auto enq = impl_->pool->enqueue(std::move(job));
    if (enq.is_err()) {
        return GatewayResult<void>::err(
            GatewayError(ErrorCode::JobScheduleFailed, "failed to enqueue task"));
    }
    return GatewayResult<void>::ok();
}

void WorkerPool::shutdown() {
    if (!impl_ || !impl_->running.exchange(false, std::memory_order_acq_rel)) {
        return;
    }
    impl_->pool->stop(false);  // drain running jobs
}

bool WorkerPool::isRunning() const noexcept {
    return impl_->running.load(std::memory_order_acquire);
}

std::size_t WorkerPool::workerCount() const noexcept {
    return impl_->workers;
}

uint64_t WorkerPool::failedTasks() const noexcept {
    return impl_->failed->load(std::memory_order_relaxed);
}

}  // namespace pgw::foundation
