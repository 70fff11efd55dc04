#ifndef KVMPP_TESTS_MOCKS_CAPTURING_LOGGER_HPP
#define KVMPP_TESTS_MOCKS_CAPTURING_LOGGER_HPP

#include "kvmpp/log/logger.hpp"

#include <memory>
#include <mutex>
#include <string>
#include <vector>

namespace kvmpp::testing {

// ─────────────────────────────────────────────────────────────────────────────
// CapturingLogger - keeps every record it is given
// ─────────────────────────────────────────────────────────────────────────────
// Installed as the global logger it becomes owned by kvmpp, so tests share
// the record buffer through a shared_ptr.

class CapturingLogger final : public ILogger {
public:
    struct Sink {
        std::mutex mutex;
        std::vector<LogRecord> records;
    };

    explicit CapturingLogger(
        LogLevel min_level = LogLevel::Trace,
        std::shared_ptr<Sink> sink = std::make_shared<Sink>()
    )
        : min_level_(min_level)
        , sink_(std::move(sink))
    {}

    void log(const LogRecord& record) override {
        std::lock_guard<std::mutex> lock(sink_->mutex);
        sink_->records.push_back(record);
    }

    [[nodiscard]] bool should_log(LogLevel level) const noexcept override {
        return is_enabled(level, min_level_);
    }

    [[nodiscard]] std::vector<LogRecord> records() const {
        std::lock_guard<std::mutex> lock(sink_->mutex);
        return sink_->records;
    }

    [[nodiscard]] std::shared_ptr<Sink> sink() const noexcept {
        return sink_;
    }

private:
    LogLevel min_level_;
    std::shared_ptr<Sink> sink_;
};

/// True if any captured message contains `needle`.
inline bool any_record_contains(const std::shared_ptr<CapturingLogger::Sink>& sink, const std::string& needle) {
    std::lock_guard<std::mutex> lock(sink->mutex);
    for (const auto& record : sink->records) {
        if (record.message.find(needle) != std::string::npos) {
            return true;
        }
    }
    return false;
}

// Installs a capturing global logger for the lifetime of the guard.
class ScopedCapture {
public:
    explicit ScopedCapture(LogLevel min_level = LogLevel::Trace)
        : sink_(std::make_shared<CapturingLogger::Sink>())
    {
        set_logger(std::make_unique<CapturingLogger>(min_level, sink_));
    }

    ~ScopedCapture() {
        set_logger(nullptr);
    }

    ScopedCapture(const ScopedCapture&) = delete;
    ScopedCapture& operator=(const ScopedCapture&) = delete;

    [[nodiscard]] const std::shared_ptr<CapturingLogger::Sink>& sink() const noexcept {
        return sink_;
    }

    [[nodiscard]] bool contains(const std::string& needle) const {
        return any_record_contains(sink_, needle);
    }

    [[nodiscard]] std::size_t count(LogLevel level) const {
        std::lock_guard<std::mutex> lock(sink_->mutex);
        std::size_t n = 0;
        for (const auto& record : sink_->records) {
            if (record.level == level) {
                ++n;
            }
        }
        return n;
    }

private:
    std::shared_ptr<CapturingLogger::Sink> sink_;
};

}  // namespace kvmpp::testing

#endif  // KVMPP_TESTS_MOCKS_CAPTURING_LOGGER_HPP
