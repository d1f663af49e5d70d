#pragma once

/// @file worker_pool.hpp
/// @brief WorkerPool dispatching request handling onto kcenon thread_system.

#include "pgw/foundation/gateway_result.hpp"

#include <atomic>
#include <cstddef>
#include <functional>
#include <memory>
#include <string>

namespace pgw::foundation {

/// Fixed-size worker pool used by the media server to handle accepted
/// connections off the accept loop.
///
/// The pool hides kcenon::thread::thread_pool behind PIMPL. Exceptions
/// thrown by a task are logged and counted; they never take down a worker.
class WorkerPool {
public:
    using Task = std::function<void()>;

    /// @param name     Pool name used for job names and logs.
    /// @param workers  Number of worker threads (at least 1).
    WorkerPool(std::string name, std::size_t workers);
    ~WorkerPool();

    WorkerPool(const WorkerPool&) = delete;
    WorkerPool& operator=(const WorkerPool&) = delete;

    /// Queue @p task for execution.
    /// @return JobScheduleFailed if the pool is stopped or rejects the job.
    GatewayResult<void> submit(Task task);

    /// Stop accepting tasks and join the workers after running jobs finish.
    void shutdown();

    [[nodiscard]] bool isRunning() const noexcept;

    [[nodiscard]] std::size_t workerCount() const noexcept;

    /// Tasks that escaped with an exception since construction.
    [[nodiscard]] uint64_t failedTasks() const noexcept;

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
};

}  // namespace pgw::foundation
