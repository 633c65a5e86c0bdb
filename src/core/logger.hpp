/**
 * @file logger.hpp
 * @brief Diagnostic log shared by the scheduler, the workers and the health monitor.
 *
 * Each record is a single NDJSON line {"level","ts","msg"}. Where the line
 * goes (file, stdout, memory for tests) is decided by the ILogSink the daemon
 * builds from the [telemetry] config table. Lifecycle events for tasks and
 * agents are not logged here; EventRecorder owns those.
 */

#pragma once

#include <atomic>
#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>

namespace agent_dispatch {

// ─────────────────────────────────────────────
// Log Levels
// ─────────────────────────────────────────────

enum class LogLevel : uint8_t {
    Debug,
    Info,
    Warn,
    Error
};

[[nodiscard]] constexpr std::string_view to_string(LogLevel level) noexcept {
    switch (level) {
        case LogLevel::Debug: return "debug";
        case LogLevel::Info:  return "info";
        case LogLevel::Warn:  return "warn";
        case LogLevel::Error: return "error";
    }
    return "unknown";
}

/// Level named by `telemetry.log_level`; "warning" is accepted for Warn.
[[nodiscard]] std::optional<LogLevel> parse_log_level(std::string_view text) noexcept;

/// Escape task ids, agent ids and error messages before they go inside a JSON string.
[[nodiscard]] std::string escape_json(std::string_view text);

// ─────────────────────────────────────────────
// Sinks
// ─────────────────────────────────────────────

/**
 * @brief Destination for complete NDJSON lines.
 *
 * EventRecorder writes through the same interface. The Logger calls write()
 * with its mutex held, so a sink behind a Logger sees one line at a time.
 */
class ILogSink {
public:
    virtual ~ILogSink() = default;

    virtual void write(std::string_view json_line) = 0;
    virtual void flush() = 0;
};

// ─────────────────────────────────────────────
// Logger
// ─────────────────────────────────────────────

/**
 * @brief Leveled front-end over one sink.
 *
 * Records below the current level are dropped before formatting. The level
 * can be lowered at runtime without stopping the task manager.
 */
class Logger {
public:
    explicit Logger(std::unique_ptr<ILogSink> sink, LogLevel min_level = LogLevel::Info);

    void debug(std::string_view message);
    void info(std::string_view message);
    void warn(std::string_view message);
    void error(std::string_view message);

    void log(LogLevel level, std::string_view message);
    /// Called by the coordinator on shutdown so a file sink ends on a full line.
    void flush();

    void set_level(LogLevel level) noexcept;
    [[nodiscard]] LogLevel level() const noexcept;

private:
    std::unique_ptr<ILogSink> sink_;
    std::atomic<LogLevel> min_level_;
    mutable std::mutex mutex_;
};

}  // namespace agent_dispatch
