/**
 * @file event_collector.cpp
 * @brief EventCollector implementation.
 */

#include "telemetry/event_collector.hpp"

#include "core/sanitize.hpp"

#include <chrono>
#include <vector>

namespace jobtier {

EventCollector::EventCollector(std::unique_ptr<ILogSink> sink)
    : sink_(std::move(sink)) {}

size_t EventCollector::subscribe(EventSubscriber subscriber) {
    std::lock_guard lock(write_mutex_);
    size_t token = next_token_++;
    subscribers_.emplace(token, std::move(subscriber));
    return token;
}

void EventCollector::unsubscribe(size_t token) {
    std::lock_guard lock(write_mutex_);
    subscribers_.erase(token);
}

void EventCollector::record_job_dispatched(const JobId& id, std::string_view job_type,
                                           ExecutionTier tier, std::string_view strategy) {
    emit(RuntimeEventType::JobDispatched, {
        {"job_id", sanitize_job_id(id)},
        {"job_type", std::string{job_type}},
        {"tier", std::string{to_string(tier)}},
        {"strategy", std::string{strategy}},
    });
}

void EventCollector::record_job_completed(const JobId& id, std::string_view job_type,
                                          Duration duration) {
    emit(RuntimeEventType::JobCompleted, {
        {"job_id", sanitize_job_id(id)},
        {"job_type", std::string{job_type}},
        {"duration_us", duration.count()},
    });
}

void EventCollector::record_job_failed(const JobId& id, std::string_view job_type,
                                       std::string_view reason, Duration duration) {
    emit(RuntimeEventType::JobFailed, {
        {"job_id", sanitize_job_id(id)},
        {"job_type", std::string{job_type}},
        {"reason", sanitize_error_message(reason)},
        {"duration_us", duration.count()},
    });
}

void EventCollector::record_job_timed_out(const JobId& id, std::string_view job_type,
                                          uint32_t timeout_s, std::string_view enforced_by) {
    emit(RuntimeEventType::JobTimedOut, {
        {"job_id", sanitize_job_id(id)},
        {"job_type", std::string{job_type}},
        {"timeout_s", timeout_s},
        {"enforced_by", std::string{enforced_by}},
    });
}

void EventCollector::record_concurrency_changed(size_t previous, size_t current,
                                                std::string_view reason) {
    emit(RuntimeEventType::ConcurrencyChanged, {
        {"previous", previous},
        {"current", current},
        {"reason", std::string{reason}},
    });
}

void EventCollector::record_shutdown(std::string_view reason, size_t running) {
    emit(RuntimeEventType::ShutdownInitiated, {
        {"reason", std::string{reason}},
        {"running_jobs", running},
    });
}

void EventCollector::record_status(nlohmann::json payload) {
    emit(RuntimeEventType::RuntimeStatus, std::move(payload));
}

void EventCollector::emit(RuntimeEventType type, nlohmann::json data) {
    RuntimeEvent event{type, std::chrono::system_clock::now(), std::move(data)};

    nlohmann::json line = {
        {"event", std::string{to_string(type)}},
        {"ts_ms", std::chrono::duration_cast<std::chrono::milliseconds>(
                      event.timestamp.time_since_epoch()).count()},
        {"data", event.data},
    };

    std::vector<EventSubscriber> targets;
    {
        std::lock_guard lock(write_mutex_);
        sink_->write(line.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace));
        targets.reserve(subscribers_.size());
        for (const auto& [token, subscriber] : subscribers_) targets.push_back(subscriber);
    }
    // Outside the lock so a subscriber may (un)subscribe
    for (const auto& subscriber : targets) subscriber(event);
}

void EventCollector::flush() {
    std::lock_guard lock(write_mutex_);
    sink_->flush();
}

}  // namespace jobtier
