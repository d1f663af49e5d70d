#pragma once

/// @file mock_logger.hpp
/// @brief kcenon ILogger capturing records for assertions.

#include <atomic>
#include <mutex>
#include <string>
#include <vector>

#include <kcenon/common/interfaces/global_logger_registry.h>
#include <kcenon/common/interfaces/logger_interface.h>

namespace pgw::testing {

struct LogRecord {
    kcenon::common::interfaces::log_level level;
    std::string message;
};

class MockLogger : public kcenon::common::interfaces::ILogger {
public:
    using log_level = kcenon::common::interfaces::log_level;

    kcenon::common::VoidResult log(log_level level, const std::string& message) override {
        std::lock_guard lock(mutex_);
        records_.push_back({level, message});
        return kcenon::common::VoidResult::ok(std::monostate{});
    }

    kcenon::common::VoidResult log(
        log_level level, std::string_view message,
        const kcenon::common::interfaces::source_location& /*loc*/) override {
        return log(level, std::string(message));
    }

    kcenon::common::VoidResult log(const kcenon::common::interfaces::log_entry& entry) override {
        return log(entry.level, entry.message);
    }

    bool is_enabled(log_level level) const override {
        return level >= minLevel_.load(std::memory_order_acquire);
    }

    kcenon::common::VoidResult set_level(log_level level) override {
        minLevel_.store(level, std::memory_order_release);
        return kcenon::common::VoidResult::ok(std::monostate{});
    }

    log_level get_level() const override { return minLevel_.load(std::memory_order_acquire); }

    kcenon::common::VoidResult flush() override {
        flushed_.store(true, std::memory_order_release);
        return kcenon::common::VoidResult::ok(std::monostate{});
    }

    std::vector<LogRecord> records() const {
        std::lock_guard lock(mutex_);
        return records_;
    }

    /// True if any record contains @p needle.
    bool contains(std::string_view needle) const {
        std::lock_guard lock(mutex_);
        for (const auto& record : records_) {
            if (record.message.find(needle) != std::string::npos) {
                return true;
            }
        }
        return false;
    }

    bool wasFlushed() const { return flushed_.load(std::memory_order_acquire); }

    void reset() {
        std::lock_guard lock(mutex_);
        records_.clear();
        flushed_.store(false, std::memory_order_relaxed);
    }

private:
    mutable std::mutex mutex_;
    std::vector<LogRecord> records_;
    std::atomic<log_level> minLevel_{log_level::trace};
    std::atomic<bool> flushed_{false};
};

}  // namespace pgw::testing
