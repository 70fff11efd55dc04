#include "kvmpp/log/logger.hpp"

#include <algorithm>
#include <cctype>
#include <ctime>
#include <iostream>
#include <mutex>

namespace kvmpp {

namespace {

constexpr std::string_view RESET = "\033[0m";
constexpr std::string_view DIM   = "\033[90m";
constexpr std::string_view BOLD  = "\033[1m";

[[nodiscard]] std::string_view level_color(LogLevel level) noexcept {
    switch (level) {
        case LogLevel::Trace: return "\033[90m";
        case LogLevel::Debug: return "\033[36m";
        case LogLevel::Info:  return "\033[32m";
        case LogLevel::Warn:  return "\033[33m";
        case LogLevel::Error: return "\033[31m";
        case LogLevel::Fatal: return "\033[35m";
        case LogLevel::Off:   break;
    }
    return RESET;
}

// Local wall-clock time with millisecond precision.
[[nodiscard]] std::string clock_time(std::chrono::system_clock::time_point tp) {
    const auto seconds = std::chrono::system_clock::to_time_t(tp);
    const auto millis = std::chrono::duration_cast<std::chrono::milliseconds>(
        tp.time_since_epoch()
    ).count() % 1000;

    std::tm local{};
    localtime_r(&seconds, &local);
    return std::format("{:02}:{:02}:{:02}.{:03}", local.tm_hour, local.tm_min, local.tm_sec, millis);
}

[[nodiscard]] std::string_view basename(std::string_view path) noexcept {
    const auto slash = path.find_last_of('/');
    if (slash == std::string_view::npos) {
        return path;
    }
    return path.substr(slash + 1);
}

}  // namespace

// ─────────────────────────────────────────────────────────────────────────────
// Level Parsing
// ─────────────────────────────────────────────────────────────────────────────

std::optional<LogLevel> parse_log_level(std::string_view name) noexcept {
    std::string lowered(name.size(), '\0');
    std::transform(name.begin(), name.end(), lowered.begin(), [](unsigned char c) {
        return static_cast<char>(std::tolower(c));
    });

    if (lowered == "trace") return LogLevel::Trace;
    if (lowered == "debug") return LogLevel::Debug;
    if (lowered == "info") return LogLevel::Info;
    if (lowered == "warn" || lowered == "warning") return LogLevel::Warn;
    if (lowered == "error" || lowered == "err") return LogLevel::Error;
    if (lowered == "fatal" || lowered == "critical") return LogLevel::Fatal;
    if (lowered == "off") return LogLevel::Off;
    return std::nullopt;
}

// ─────────────────────────────────────────────────────────────────────────────
// ConsoleLogger
// ─────────────────────────────────────────────────────────────────────────────

std::string ConsoleLogger::format(const LogRecord& record) const {
    const auto time = clock_time(record.timestamp);
    const auto file = basename(record.location.file_name());
    const auto line = record.location.line();

    if (colors_enabled_ == false) {
        return std::format("{} {:<5} {}:{} {}",
            time, to_string(record.level), file, line, record.message);
    }
    return std::format("{}{}{} {}{}{:<5}{} {}{}:{}{} {}",
        DIM, time, RESET,
        BOLD, level_color(record.level), to_string(record.level), RESET,
        DIM, file, line, RESET,
        record.message);
}

void ConsoleLogger::log(const LogRecord& record) {
    if (should_log(record.level) == false) {
        return;
    }

    const auto rendered = format(record);

    static std::mutex output_mutex;
    std::lock_guard<std::mutex> lock(output_mutex);
    std::cerr << rendered << '\n';
}

// ─────────────────────────────────────────────────────────────────────────────
// Redaction
// ─────────────────────────────────────────────────────────────────────────────

std::string redact(std::string_view value) {
    constexpr std::size_t visible_prefix = 4;
    constexpr std::size_t min_partial_length = 9;

    if (value.empty()) {
        return "<empty>";
    }
    if (value.size() < min_partial_length) {
        return "***";
    }
    return std::string(value.substr(0, visible_prefix)) + "...";
}

// ─────────────────────────────────────────────────────────────────────────────
// Global Logger
// ─────────────────────────────────────────────────────────────────────────────

namespace {

struct GlobalLogger {
    std::mutex mutex;
    std::unique_ptr<ILogger> instance = std::make_unique<NullLogger>();
};

GlobalLogger& global() {
    static GlobalLogger state;
    return state;
}

}  // namespace

ILogger& get_logger() noexcept {
    auto& state = global();
    std::lock_guard<std::mutex> lock(state.mutex);
    return *state.instance;
}

void set_logger(std::unique_ptr<ILogger> logger) noexcept {
    auto& state = global();
    std::lock_guard<std::mutex> lock(state.mutex);
    if (logger == nullptr) {
        state.instance = std::make_unique<NullLogger>();
        return;
    }
    state.instance = std::move(logger);
}

}  // namespace kvmpp
