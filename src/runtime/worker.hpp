/**
 * @file worker.hpp
 * @brief Feeds jobs from an IJobSource into a runtime on a loop timer.
 *
 * Admission-control rejections hand the job back to the source and pause
 * polling for backoff_ms. Jobs refused for validation or security reasons
 * are dropped and logged. When max_jobs dispatches or max_time_s seconds are
 * reached (non-zero), the worker asks the runtime to shut down.
 */

#pragma once

#include "core/concepts.hpp"
#include "core/config.hpp"
#include "core/event_loop.hpp"
#include "core/logger.hpp"
#include "core/result.hpp"
#include "core/sanitize.hpp"
#include "runtime/job_source.hpp"

#include <chrono>
#include <cstdint>
#include <memory>
#include <string>
#include <string_view>

namespace jobtier {

template <JobRuntimeLike RuntimeT>
class Worker {
public:
    Worker(RuntimeT& runtime, IJobSource& source, WorkerConfig config, Logger& logger)
        : runtime_(runtime), source_(source), config_(config), logger_(logger) {}

    ~Worker() { stop(); }

    Worker(const Worker&) = delete;
    Worker& operator=(const Worker&) = delete;

    void start() {
        if (poll_timer_ != kInvalidTimer) return;

        logger_.info("Worker started (poll: " + std::to_string(config_.poll_interval_ms)
                     + " ms, max jobs: " + std::to_string(config_.max_jobs)
                     + ", max time: " + std::to_string(config_.max_time_s) + " s)");

        poll_timer_ = runtime_.loop().add_periodic_timer(
            std::chrono::milliseconds{config_.poll_interval_ms}, [this] { poll_once(); });

        if (config_.max_time_s > 0) {
            time_timer_ = runtime_.loop().add_timer(
                std::chrono::seconds{config_.max_time_s}, [this] {
                    time_timer_ = kInvalidTimer;
                    logger_.info("Worker reached its time limit of "
                                 + std::to_string(config_.max_time_s) + " s");
                    finish("max_time reached");
                });
        }
    }

    void stop() noexcept {
        runtime_.loop().cancel_timer(poll_timer_);
        runtime_.loop().cancel_timer(time_timer_);
        poll_timer_ = kInvalidTimer;
        time_timer_ = kInvalidTimer;
    }

    /// One polling pass: dispatch until the source is empty, admission
    /// control pushes back, or the dispatch budget is spent.
    void poll_once() {
        if (!runtime_.is_accepting()) {
            stop();
            return;
        }
        if (std::chrono::steady_clock::now() < resume_at_) return;

        while (!budget_spent()) {
            auto job = source_.next();
            if (!job) return;

            auto admission = runtime_.check_admission();
            if (!admission.has_value()) {
                source_.release(std::move(job));
                ++rejected_;
                if (admission.error().is(ErrorCode::ShuttingDown)) {
                    stop();
                    return;
                }
                logger_.debug("Admission refused (" + admission.error().message + "), backing off "
                              + std::to_string(config_.backoff_ms) + " ms");
                resume_at_ = std::chrono::steady_clock::now()
                           + std::chrono::milliseconds{config_.backoff_ms};
                return;
            }

            const std::string id = sanitize_job_id(job->id());
            auto dispatched = runtime_.execute_job(std::move(job));
            if (!dispatched.has_value()) {
                ++dropped_;
                logger_.warn("Dropped job " + id + ": "
                             + sanitize_error_message(dispatched.error().message));
                continue;
            }
            ++dispatched_;
        }

        logger_.info("Worker reached its job limit of " + std::to_string(config_.max_jobs));
        finish("max_jobs reached");
    }

    [[nodiscard]] uint64_t dispatched() const noexcept { return dispatched_; }
    [[nodiscard]] uint64_t rejected() const noexcept { return rejected_; }
    [[nodiscard]] uint64_t dropped() const noexcept { return dropped_; }
    [[nodiscard]] bool is_polling() const noexcept { return poll_timer_ != kInvalidTimer; }

private:
    [[nodiscard]] bool budget_spent() const noexcept {
        return config_.max_jobs > 0 && dispatched_ >= config_.max_jobs;
    }

    void finish(std::string_view reason) {
        stop();
        runtime_.shutdown(reason);
    }

    RuntimeT& runtime_;
    IJobSource& source_;
    WorkerConfig config_;
    Logger& logger_;

    TimerId poll_timer_{kInvalidTimer};
    TimerId time_timer_{kInvalidTimer};
    std::chrono::steady_clock::time_point resume_at_{};

    uint64_t dispatched_{0};
    uint64_t rejected_{0};
    uint64_t dropped_{0};
};

}  // namespace jobtier
