/**
 * @file logger.hpp
 * @brief NDJSON logging for the runtime, its strategies and the daemon.
 *
 * Every call produces exactly one JSON object on one line, keys sorted:
 *
 *   {"level":"warn","msg":"...","ts":"2024-05-01T12:00:00.123Z"}
 *   {"job":"report-7","level":"error","msg":"...","ts":"..."}
 *
 *   level  debug | info | warn | error
 *   ts     UTC wall clock, ISO 8601 with milliseconds
 *   job    present only for log_job(); the id after sanitize_job_id()
 *   msg    free text; invalid UTF-8 is replaced, never thrown
 *
 * Messages that quote a job id or a failure reason must go through
 * core/sanitize.hpp first. log_job() does that itself for both parts.
 */

#pragma once

#include <atomic>
#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>

namespace jobtier {

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

/// Accepts the `[telemetry] log_level` spellings, including "warning".
[[nodiscard]] std::optional<LogLevel> parse_log_level(std::string_view name) noexcept;

/// One record as written to a sink; `job` is omitted when empty.
[[nodiscard]] std::string format_log_record(LogLevel level, std::string_view ts,
                                            std::string_view job, std::string_view msg);

// ─────────────────────────────────────────────
// ILogSink (Virtual — chosen at startup)
// ─────────────────────────────────────────────

/// Receives finished lines without the trailing newline. Calls are serialized by Logger.
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
 * @brief Front-end shared by the Runtime, the strategies and the Worker.
 *
 * Safe to call from the loop thread and the monitor thread at once. The
 * level check happens before formatting, so filtered calls cost no
 * allocation.
 */
class Logger {
public:
    explicit Logger(std::unique_ptr<ILogSink> sink, LogLevel min_level = LogLevel::Info);

    void debug(std::string_view message);
    void info(std::string_view message);
    void warn(std::string_view message);
    void error(std::string_view message);

    void log(LogLevel level, std::string_view message);

    /// Tags the record with a job id. Id and message are both sanitized here.
    void log_job(LogLevel level, std::string_view job_id, std::string_view message);

    void flush();

    void set_level(LogLevel level) noexcept;
    [[nodiscard]] LogLevel level() const noexcept;

private:
    void emit(LogLevel level, std::string_view job, std::string_view message);

    std::unique_ptr<ILogSink> sink_;
    std::atomic<LogLevel> min_level_;
    std::mutex mutex_;
};

}  // namespace jobtier
