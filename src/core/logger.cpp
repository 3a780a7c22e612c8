/**
 * @file logger.cpp
 * @brief Record formatting, level filtering and sink dispatch.
 */

#include "core/logger.hpp"

#include "core/sanitize.hpp"

#include <nlohmann/json.hpp>

#include <chrono>
#include <ctime>
#include <iomanip>
#include <sstream>

namespace jobtier {

namespace {

std::string iso8601_now() {
    auto now = std::chrono::system_clock::now();
    auto time_t_now = std::chrono::system_clock::to_time_t(now);
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
        now.time_since_epoch()) % 1000;

    std::tm utc{};
    gmtime_r(&time_t_now, &utc);

    std::ostringstream oss;
    oss << std::put_time(&utc, "%FT%T")
        << '.' << std::setfill('0') << std::setw(3) << ms.count() << 'Z';
    return oss.str();
}

}  // anonymous namespace

std::optional<LogLevel> parse_log_level(std::string_view name) noexcept {
    if (name == "debug") return LogLevel::Debug;
    if (name == "info")  return LogLevel::Info;
    if (name == "warn" || name == "warning") return LogLevel::Warn;
    if (name == "error") return LogLevel::Error;
    return std::nullopt;
}

std::string format_log_record(LogLevel level, std::string_view ts,
                              std::string_view job, std::string_view msg) {
    nlohmann::json record = {
        {"level", to_string(level)},
        {"ts", ts},
    };
    if (!job.empty()) record["job"] = job;
    record["msg"] = msg;
    return record.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);
}

Logger::Logger(std::unique_ptr<ILogSink> sink, LogLevel min_level)
    : sink_(std::move(sink)), min_level_(min_level) {}

void Logger::debug(std::string_view message) { log(LogLevel::Debug, message); }
void Logger::info(std::string_view message)  { log(LogLevel::Info, message); }
void Logger::warn(std::string_view message)  { log(LogLevel::Warn, message); }
void Logger::error(std::string_view message) { log(LogLevel::Error, message); }

void Logger::log(LogLevel level, std::string_view message) {
    if (level < min_level_.load(std::memory_order_relaxed)) return;
    emit(level, {}, message);
}

void Logger::log_job(LogLevel level, std::string_view job_id, std::string_view message) {
    if (level < min_level_.load(std::memory_order_relaxed)) return;
    emit(level, sanitize_job_id(job_id), sanitize_error_message(message));
}

void Logger::emit(LogLevel level, std::string_view job, std::string_view message) {
    auto line = format_log_record(level, iso8601_now(), job, message);
    std::lock_guard lock(mutex_);
    sink_->write(line);
}

void Logger::flush() {
    std::lock_guard lock(mutex_);
    sink_->flush();
}

void Logger::set_level(LogLevel level) noexcept {
    min_level_.store(level, std::memory_order_relaxed);
}

LogLevel Logger::level() const noexcept {
    return min_level_.load(std::memory_order_relaxed);
}

}  // namespace jobtier
