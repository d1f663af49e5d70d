#pragma once

/// @file signal.hpp
/// @brief Thread-safe Signal<Args...> used to publish state changes.

#include <atomic>
#include <cstdint>
#include <functional>
#include <map>
#include <mutex>
#include <shared_mutex>
#include <vector>

namespace pgw::foundation {

/// Publish/subscribe channel.
///
/// Slots are invoked in connection order, outside the internal lock, so a
/// slot may connect or disconnect other slots while the signal is firing.
///
/// @code
///   Signal<const ModeTransition&> onModeChanged;
///   auto id = onModeChanged.connect([](const ModeTransition& t) { ... });
///   onModeChanged.disconnect(id);
/// @endcode
template <typename... Args>
class Signal {
public:
    using Slot = std::function<void(Args...)>;
    using SlotId = uint64_t;

    Signal() = default;
    ~Signal() = default;

    Signal(const Signal&) = delete;
    Signal& operator=(const Signal&) = delete;

    SlotId connect(Slot slot) {
        auto id = nextId_.fetch_add(1, std::memory_order_relaxed);
        std::unique_lock lock(mutex_);
        slots_.emplace(id, std::move(slot));
        return id;
    }

    /// @return false if @p id was not connected.
    bool disconnect(SlotId id) {
        std::unique_lock lock(mutex_);
        return slots_.erase(id) > 0;
    }

    void emit(Args... args) const {
        std::vector<Slot> snapshot;
        {
            std::shared_lock lock(mutex_);
            snapshot.reserve(slots_.size());
            for (const auto& [id, slot] : slots_) {
                snapshot.push_back(slot);
            }
        }
        for (const auto& slot : snapshot) {
            slot(args...);
        }
    }

    [[nodiscard]] std::size_t slotCount() const {
        std::shared_lock lock(mutex_);
        return slots_.size();
    }

private:
    std::map<SlotId, Slot> slots_;
    std::atomic<SlotId> nextId_{1};
    mutable std::shared_mutex mutex_;
};

} // namespace pgw::foundation
