#pragma once

/// @file cancellation.hpp
/// @brief Shared cancellation flag handed to every network hop of a request.

#include <atomic>
#include <memory>

namespace pgw::foundation {

/// Read side of a cancellation flag. A default-constructed token is never
/// cancelled.
class CancellationToken {
public:
    CancellationToken() = default;

    [[nodiscard]] bool isCancelled() const noexcept {
        return flag_ && flag_->load(std::memory_order_acquire);
    }

private:
    friend class CancellationSource;
    explicit CancellationToken(std::shared_ptr<const std::atomic<bool>> flag)
        : flag_(std::move(flag)) {}

    std::shared_ptr<const std::atomic<bool>> flag_;
};

/// Owner of a cancellation flag. Tokens stay valid after the source is gone.
///
/// @code
///   CancellationSource shutdown;
///   handler.handle(request, shutdown.token());
///   shutdown.cancel();   // both upstream hops abort at their next check
/// @endcode
class CancellationSource {
public:
    CancellationSource() : flag_(std::make_shared<std::atomic<bool>>(false)) {}

    void cancel() noexcept { flag_->store(true, std::memory_order_release); }

    [[nodiscard]] bool isCancelled() const noexcept {
        return flag_->load(std::memory_order_acquire);
    }

    [[nodiscard]] CancellationToken token() const {
        return CancellationToken(flag_);
    }

private:
    std::shared_ptr<std::atomic<bool>> flag_;
};

}  // namespace pgw::foundation
