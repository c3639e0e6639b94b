#pragma once

#include <chrono>
#include <cstdint>
#include <format>
#include <memory>
#include <optional>
#include <source_location>
#include <string>
#include <string_view>

namespace mcpmux {

// ─────────────────────────────────────────────────────────────────────────────
// Log Levels
// ─────────────────────────────────────────────────────────────────────────────

enum class LogLevel : std::uint8_t {
    Trace = 0,
    Debug = 1,
    Info  = 2,
    Warn  = 3,
    Error = 4,
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

/// Parse "trace", "DEBUG", "warning", ... (case-insensitive)
[[nodiscard]] std::optional<LogLevel> log_level_from_string(std::string_view text) noexcept;

// ─────────────────────────────────────────────────────────────────────────────
// Log Record - Immutable snapshot of a log event
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
// ILogger Interface - Swappable logging backend
// ─────────────────────────────────────────────────────────────────────────────

class ILogger {
public:
    virtual ~ILogger() = default;

    virtual void log(const LogRecord& record) = 0;

    // Check if a level would be logged (for avoiding expensive formatting)
    [[nodiscard]] virtual bool should_log(LogLevel level) const noexcept = 0;

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

private:
    void write(LogLevel level, std::string_view msg, std::source_location loc) {
        if (should_log(level)) {
            log(LogRecord(level, std::string(msg), loc));
        }
    }
};

// ─────────────────────────────────────────────────────────────────────────────
// NullLogger - Discards all logs (zero overhead when disabled)
// ─────────────────────────────────────────────────────────────────────────────

class NullLogger final : public ILogger {
public:
    void log(const LogRecord& /*record*/) override {}

    [[nodiscard]] bool should_log(LogLevel /*level*/) const noexcept override {
        return false;
    }
};

// ─────────────────────────────────────────────────────────────────────────────
// Global Logger Access
// ─────────────────────────────────────────────────────────────────────────────

// Get the global logger instance (defaults to NullLogger)
[[nodiscard]] ILogger& get_logger() noexcept;

// Set a new global logger (takes ownership); nullptr restores the NullLogger
void set_logger(std::unique_ptr<ILogger> logger) noexcept;

// These check should_log() before evaluating arguments, so std::format
// calls inside the macro argument cost nothing when the level is disabled.

#define MCPMUX_LOG_TRACE(msg) \
    do { if (::mcpmux::get_logger().should_log(::mcpmux::LogLevel::Trace)) \
         ::mcpmux::get_logger().trace(msg); } while(false)

#define MCPMUX_LOG_DEBUG(msg) \
    do { if (::mcpmux::get_logger().should_log(::mcpmux::LogLevel::Debug)) \
         ::mcpmux::get_logger().debug(msg); } while(false)

#define MCPMUX_LOG_INFO(msg) \
    do { if (::mcpmux::get_logger().should_log(::mcpmux::LogLevel::Info)) \
         ::mcpmux::get_logger().info(msg); } while(false)

#define MCPMUX_LOG_WARN(msg) \
    do { if (::mcpmux::get_logger().should_log(::mcpmux::LogLevel::Warn)) \
         ::mcpmux::get_logger().warn(msg); } while(false)

#define MCPMUX_LOG_ERROR(msg) \
    do { if (::mcpmux::get_logger().should_log(::mcpmux::LogLevel::Error)) \
         ::mcpmux::get_logger().error(msg); } while(false)

#define MCPMUX_LOG_FATAL(msg) \
    do { if (::mcpmux::get_logger().should_log(::mcpmux::LogLevel::Fatal)) \
         ::mcpmux::get_logger().fatal(msg); } while(false)

}  // namespace mcpmux
