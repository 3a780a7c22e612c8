/**
 * @file event_collector.hpp
 * @brief Discrete runtime events, written as NDJSON and fanned out to
 *        subscribers.
 */

#pragma once

#include "core/logger.hpp"
#include "core/types.hpp"

#include <nlohmann/json.hpp>

#include <cstdint>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <string_view>

namespace jobtier {

enum class RuntimeEventType : uint8_t {
    JobDispatched,
    JobCompleted,
    JobFailed,
    JobTimedOut,
    ConcurrencyChanged,
    ShutdownInitiated,
    RuntimeStatus
};

[[nodiscard]] constexpr std::string_view to_string(RuntimeEventType type) noexcept {
    switch (type) {
        case RuntimeEventType::JobDispatched:      return "job_dispatched";
        case RuntimeEventType::JobCompleted:       return "job_completed";
        case RuntimeEventType::JobFailed:          return "job_failed";
        case RuntimeEventType::JobTimedOut:        return "job_timed_out";
        case RuntimeEventType::ConcurrencyChanged: return "concurrency_changed";
        case RuntimeEventType::ShutdownInitiated:  return "shutdown_initiated";
        case RuntimeEventType::RuntimeStatus:      return "runtime_status";
    }
    return "unknown";
}

struct RuntimeEvent {
    RuntimeEventType type{RuntimeEventType::RuntimeStatus};
    Timestamp timestamp;
    nlohmann::json data = nlohmann::json::object();
};

using EventSubscriber = std::function<void(const RuntimeEvent&)>;

/**
 * @brief Collects and logs structured runtime events as NDJSON.
 */
class EventCollector {
public:
    explicit EventCollector(std::unique_ptr<ILogSink> sink);

    size_t subscribe(EventSubscriber subscriber);
    void unsubscribe(size_t token);

    void record_job_dispatched(const JobId& id, std::string_view job_type,
                               ExecutionTier tier, std::string_view strategy);
    void record_job_completed(const JobId& id, std::string_view job_type, Duration duration);
    void record_job_failed(const JobId& id, std::string_view job_type,
                           std::string_view reason, Duration duration);
    void record_job_timed_out(const JobId& id, std::string_view job_type, uint32_t timeout_s,
                              std::string_view enforced_by);
    void record_concurrency_changed(size_t previous, size_t current, std::string_view reason);
    void record_shutdown(std::string_view reason, size_t running);
    void record_status(nlohmann::json payload);

    void flush();

private:
    void emit(RuntimeEventType type, nlohmann::json data);

    std::unique_ptr<ILogSink> sink_;
    std::mutex write_mutex_;
    std::map<size_t, EventSubscriber> subscribers_;
    size_t next_token_{1};
};

}  // namespace jobtier
