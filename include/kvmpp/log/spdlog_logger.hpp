#pragma once

#include "kvmpp/log/logger.hpp"

#include <atomic>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include <spdlog/logger.h>
#include <spdlog/spdlog.h>

namespace kvmpp {

// ─────────────────────────────────────────────────────────────────────────────
// SpdlogLoggerConfig
// ─────────────────────────────────────────────────────────────────────────────

struct SpdlogLoggerConfig {
    LogLevel level = LogLevel::Info;

    // Colored stderr sink. stdout is left to command output.
    bool console = true;

    // Optional file sink; appended to unless truncate_file is set.
    std::optional<std::string> file;
    bool truncate_file = false;

    // Records at or above this level are flushed immediately.
    LogLevel flush_level = LogLevel::Warn;

    std::string pattern = "[%Y-%m-%d %H:%M:%S.%e] [%^%l%$] [%s:%#] %v";

    SpdlogLoggerConfig& with_level(LogLevel value) { level = value; return *this; }
    SpdlogLoggerConfig& with_console(bool value) { console = value; return *this; }
    SpdlogLoggerConfig& with_file(std::string path, bool truncate = false) {
        file = std::move(path);
        truncate_file = truncate;
        return *this;
    }
    SpdlogLoggerConfig& with_flush_level(LogLevel value) { flush_level = value; return *this; }
    SpdlogLoggerConfig& with_pattern(std::string value) { pattern = std::move(value); return *this; }
};

// ─────────────────────────────────────────────────────────────────────────────
// SpdlogLogger
// ─────────────────────────────────────────────────────────────────────────────
// ILogger backend over spdlog. Loggers are created outside spdlog's global
// registry under unique names, so several SessionContexts (or tests) can each
// install their own without clashing.

class SpdlogLogger final : public ILogger {
public:
    /// Wrap an existing spdlog logger. Throws std::invalid_argument on null.
    explicit SpdlogLogger(std::shared_ptr<spdlog::logger> logger);

    SpdlogLogger(std::vector<spdlog::sink_ptr> sinks, LogLevel min_level = LogLevel::Info);

    SpdlogLogger(const SpdlogLogger&) = delete;
    SpdlogLogger& operator=(const SpdlogLogger&) = delete;

    void log(const LogRecord& record) override;

    [[nodiscard]] bool should_log(LogLevel level) const noexcept override;

    [[nodiscard]] std::shared_ptr<spdlog::logger> get_spdlog_logger() const noexcept {
        return logger_;
    }

    void set_level(LogLevel level) noexcept;
    [[nodiscard]] LogLevel level() const noexcept { return min_level_.load(); }

    void set_pattern(const std::string& pattern);
    void flush();

    [[nodiscard]] static spdlog::level::level_enum to_spdlog_level(LogLevel level) noexcept;
    [[nodiscard]] static LogLevel from_spdlog_level(spdlog::level::level_enum level) noexcept;

private:
    std::shared_ptr<spdlog::logger> logger_;
    std::atomic<LogLevel> min_level_;
};

// ─────────────────────────────────────────────────────────────────────────────
// Factory Functions
// ─────────────────────────────────────────────────────────────────────────────

/// Throws std::invalid_argument when the config names no sink, and
/// spdlog::spdlog_ex when the log file cannot be opened.
[[nodiscard]] std::unique_ptr<SpdlogLogger> make_spdlog_logger(const SpdlogLoggerConfig& config);

[[nodiscard]] std::unique_ptr<SpdlogLogger> make_spdlog_console_logger(
    LogLevel min_level = LogLevel::Info
);

[[nodiscard]] std::unique_ptr<SpdlogLogger> make_spdlog_file_logger(
    const std::string& filename,
    LogLevel min_level = LogLevel::Info
);

[[nodiscard]] std::unique_ptr<SpdlogLogger> make_spdlog_console_file_logger(
    const std::string& filename,
    LogLevel min_level = LogLevel::Info
);

}  // namespace kvmpp
