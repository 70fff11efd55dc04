#pragma once

#include <chrono>
#include <cstdint>
#include <format>
#include <memory>
#include <optional>
#include <source_location>
#include <string>
#include <string_view>

namespace kvmpp {

// ─────────────────────────────────────────────────────────────────────────────
// Log Levels
// ─────────────────────────────────────────────────────────────────────────────

enum class LogLevel : std::uint8_t {
    Trace = 0,  // Request/response plumbing
    Debug = 1,  // Pool hits, probes, cache decisions
    Info  = 2,  // Logins, logouts, evictions
    Warn  = 3,  // Best-effort failures (logout, stale re-login)
    Error = 4,  // Operation failed
    Fatal = 5,
    Off   = 6
};

[[nodiscard]] constexpr std::string_view to_string(LogLevel level) noexcept {
    switch (level) {
        case LogLevel::Trace: return "TRACE";
        case LogLevel::Debug: return "DEBUG";
        case LogLevel::Info:  return "INFO";
        case LogLevel::Warn:  return "WARN";
        case LogLevel::Error: return "ERROR";
        case LogLevel::Fatal: return "FATAL";
        case LogLevel::Off:   return "OFF";
    }
    return "UNKNOWN";
}

/// True when `level` passes a `threshold` filter. Off never passes.
[[nodiscard]] constexpr bool is_enabled(LogLevel level, LogLevel threshold) noexcept {
    if (level == LogLevel::Off) {
        return false;
    }
    return static_cast<std::uint8_t>(level) >= static_cast<std::uint8_t>(threshold);
}

/// Case-insensitive level name, as given to --log-level or KVMPP_LOG_LEVEL.
/// Accepts the to_string() names plus "warning", "err" and "critical".
[[nodiscard]] std::optional<LogLevel> parse_log_level(std::string_view name) noexcept;

// ─────────────────────────────────────────────────────────────────────────────
// Log Record
// ─────────────────────────────────────────────────────────────────────────────

struct LogRecord {
    LogLevel level;
    std::string message;
    std::chrono::system_clock::time_point timestamp;
    std::source_location location;

    LogRecord(
        LogLevel lvl,
        std::string msg,
        std::source_location loc = std::source_location::current()
    )
        : level(lvl)
        , message(std::move(msg))
        , timestamp(std::chrono::system_clock::now())
        , location(loc)
    {}
};

// ─────────────────────────────────────────────────────────────────────────────
// ILogger Interface
// ─────────────────────────────────────────────────────────────────────────────
// Every kvmpp component logs through this interface. The default instance is
// a NullLogger; applications install a backend (SpdlogLogger, ConsoleLogger)
// with set_logger().
//
// Credentials never reach a logger: passwords and TOTP codes are not passed
// in, and session tokens go through redact() first.

class ILogger {
public:
    virtual ~ILogger() = default;

    virtual void log(const LogRecord& record) = 0;

    [[nodiscard]] virtual bool should_log(LogLevel level) const noexcept = 0;

    void write(LogLevel level, std::string_view msg, std::source_location loc = std::source_location::current()) {
        if (should_log(level)) {
            log(LogRecord(level, std::string(msg), loc));
        }
    }

    void trace(std::string_view msg, std::source_location loc = std::source_location::current()) {
        write(LogLevel::Trace, msg, loc);
    }

    void debug(std::string_view msg, std::source_location loc = std::source_location::current()) {
        write(LogLevel::Debug, msg, loc);
    }

    void info(std::string_view msg, std::source_location loc = std::source_location::current()) {
        write(LogLevel::Info, msg, loc);
    }

    void warn(std::string_view msg, std::source_location loc = std::source_location::current()) {
        write(LogLevel::Warn, msg, loc);
    }

    void error(std::string_view msg, std::source_location loc = std::source_location::current()) {
        write(LogLevel::Error, msg, loc);
    }

    void fatal(std::string_view msg, std::source_location loc = std::source_location::current()) {
        write(LogLevel::Fatal, msg, loc);
    }

    // The message is only formatted once the level passes.
    template<typename... Args>
    void write_fmt(LogLevel level, std::format_string<Args...> fmt, Args&&... args) {
        if (should_log(level)) {
            log(LogRecord(level, std::format(fmt, std::forward<Args>(args)...)));
        }
    }

    template<typename... Args>
    void trace_fmt(std::format_string<Args...> fmt, Args&&... args) {
        write_fmt(LogLevel::Trace, fmt, std::forward<Args>(args)...);
    }

    template<typename... Args>
    void debug_fmt(std::format_string<Args...> fmt, Args&&... args) {
        write_fmt(LogLevel::Debug, fmt, std::forward<Args>(args)...);
    }

    template<typename... Args>
    void info_fmt(std::format_string<Args...> fmt, Args&&... args) {
        write_fmt(LogLevel::Info, fmt, std::forward<Args>(args)...);
    }

    template<typename... Args>
    void warn_fmt(std::format_string<Args...> fmt, Args&&... args) {
        write_fmt(LogLevel::Warn, fmt, std::forward<Args>(args)...);
    }

    template<typename... Args>
    void error_fmt(std::format_string<Args...> fmt, Args&&... args) {
        write_fmt(LogLevel::Error, fmt, std::forward<Args>(args)...);
    }
};

// ─────────────────────────────────────────────────────────────────────────────
// NullLogger
// ─────────────────────────────────────────────────────────────────────────────

class NullLogger final : public ILogger {
public:
    void log(const LogRecord& /*record*/) override {}

    [[nodiscard]] bool should_log(LogLevel /*level*/) const noexcept override {
        return false;
    }
};

// ─────────────────────────────────────────────────────────────────────────────
// ConsoleLogger - stderr, optional ANSI colors
// ─────────────────────────────────────────────────────────────────────────────
// Line layout: "HH:MM:SS.mmm LEVEL file.cpp:123 message".

class ConsoleLogger final : public ILogger {
public:
    explicit ConsoleLogger(LogLevel min_level = LogLevel::Info)
        : min_level_(min_level)
    {}

    void log(const LogRecord& record) override;

    [[nodiscard]] bool should_log(LogLevel level) const noexcept override {
        return is_enabled(level, min_level_);
    }

    void set_level(LogLevel level) noexcept { min_level_ = level; }
    [[nodiscard]] LogLevel level() const noexcept { return min_level_; }

    void set_colors_enabled(bool enabled) noexcept { colors_enabled_ = enabled; }

    /// Renders a record the way log() prints it, without the trailing newline.
    [[nodiscard]] std::string format(const LogRecord& record) const;

private:
    LogLevel min_level_;
    bool colors_enabled_ = true;
};

// ─────────────────────────────────────────────────────────────────────────────
// Redaction
// ─────────────────────────────────────────────────────────────────────────────

/// Mask a credential-like value for logging: keeps the first 4 characters
/// and replaces the rest with "...". Values of 8 characters or less are
/// fully masked.
[[nodiscard]] std::string redact(std::string_view value);

// ─────────────────────────────────────────────────────────────────────────────
// Global Logger Access
// ─────────────────────────────────────────────────────────────────────────────

[[nodiscard]] ILogger& get_logger() noexcept;

// Takes ownership; nullptr restores the NullLogger.
void set_logger(std::unique_ptr<ILogger> logger) noexcept;

#define KVMPP_LOG_AT(level, msg) \
    do { auto& kvmpp_logger_ = ::kvmpp::get_logger(); \
         if (kvmpp_logger_.should_log(level)) kvmpp_logger_.write(level, msg); } while(false)

#define KVMPP_LOG_TRACE(msg) KVMPP_LOG_AT(::kvmpp::LogLevel::Trace, msg)
#define KVMPP_LOG_DEBUG(msg) KVMPP_LOG_AT(::kvmpp::LogLevel::Debug, msg)
#define KVMPP_LOG_INFO(msg)  KVMPP_LOG_AT(::kvmpp::LogLevel::Info, msg)
#define KVMPP_LOG_WARN(msg)  KVMPP_LOG_AT(::kvmpp::LogLevel::Warn, msg)
#define KVMPP_LOG_ERROR(msg) KVMPP_LOG_AT(::kvmpp::LogLevel::Error, msg)

}  // namespace kvmpp
