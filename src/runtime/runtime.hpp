/**
 * @file runtime.hpp
 * @brief Runtime — the single entry point that admits, dispatches, tracks
 *        and settles jobs.
 *
 * The Runtime owns the event loop and every module that runs on it. All of
 * its mutable state (in-flight map, rate window, concurrency ceiling) is
 * touched only from loop callbacks, so it carries no locks.
 *
 * Template parameter allows injecting MockMonitor for testing.
 */

#pragma once

#include "analysis/job_analyzer.hpp"
#include "analysis/stats_store.hpp"
#include "core/concepts.hpp"
#include "core/config.hpp"
#include "core/event_loop.hpp"
#include "core/logger.hpp"
#include "core/result.hpp"
#include "core/sanitize.hpp"
#include "core/types.hpp"
#include "execution/inline_strategy.hpp"
#include "execution/isolated_strategy.hpp"
#include "execution/strategy.hpp"
#include "execution/strategy_selector.hpp"
#include "job/job.hpp"
#include "resource_monitor/memory_ceiling.hpp"
#include "resource_monitor/monitor.hpp"
#include "runtime/concurrency_governor.hpp"
#include "runtime/rate_limiter.hpp"
#include "telemetry/event_collector.hpp"
#include "telemetry/json_sink.hpp"

#include <nlohmann/json.hpp>

#include <algorithm>
#include <chrono>
#include <cstdint>
#include <cstdio>
#include <future>
#include <memory>
#include <stop_token>
#include <string>
#include <string_view>
#include <unordered_map>

#include <unistd.h>

namespace jobtier {

/**
 * @brief Counters exposed for status reporting and tests.
 */
struct RuntimeStats {
    uint64_t dispatched{0};
    uint64_t processed{0};              ///< Settled as Succeeded
    uint64_t failed{0};
    uint64_t timed_out{0};
    uint64_t rejected_validation{0};    ///< Validation and security refusals
    uint64_t rejected_rate{0};
    uint64_t rejected_concurrency{0};
    size_t running{0};
    size_t concurrency_limit{0};
};

template <ResourceMonitorLike MonitorT = LinuxMonitor>
class Runtime {
public:
    struct Options {
        Config config;
        std::unique_ptr<ILogSink> log_sink;
        LogLevel log_level = LogLevel::Info;
        std::unique_ptr<ILogSink> event_sink;         ///< Null = discard events
        std::shared_ptr<IStatsStore> stats_store;     ///< Null = in-memory store
    };

    explicit Runtime(Options opts);
    ~Runtime();

    // Non-copyable, non-movable
    Runtime(const Runtime&) = delete;
    Runtime& operator=(const Runtime&) = delete;

    // ── Lifecycle ────────────────────────────

    /// Install the periodic memory, health and status timers.
    Result<void> start();

    /// Start if needed and drive the loop until shutdown completes.
    /// A stop request on @p stop initiates a graceful shutdown.
    void run(std::stop_token stop = {});

    /// Stop accepting work and drain in-flight jobs, bounded by
    /// runtime.drain_timeout_ms. Idempotent.
    void shutdown(std::string_view reason);

    // ── Dispatch ─────────────────────────────

    /// Rate and concurrency gates only; records nothing.
    [[nodiscard]] Result<void> check_admission();

    /**
     * @brief Validate, admit, select a strategy and dispatch @p job.
     *
     * Refusals (validation, security, admission control, shutdown) are
     * returned synchronously and the job never runs. Otherwise the outcome,
     * success or failure, arrives through the returned future and then
     * through @p observer.
     */
    Result<std::future<JobOutcome>> execute_job(std::unique_ptr<Job> job,
                                                CompletionHandler observer = {});

    /// Periodic health step: sample the monitor and let the governor adjust.
    void sample_health();

    /// Periodic memory step: shut down if process memory exceeds the ceiling.
    void check_memory();

    // ── Accessors ────────────────────────────
    EventLoop& loop() { return loop_; }
    MonitorT& monitor() { return monitor_; }
    JobAnalyzer& analyzer() { return analyzer_; }
    StrategySelector& selector() { return selector_; }
    InlineStrategy& inline_strategy() { return inline_; }
    IsolatedStrategy& isolated_strategy() { return isolated_; }
    const ConcurrencyGovernor& governor() const { return governor_; }
    Logger& logger() { return logger_; }
    EventCollector& events() { return events_; }
    const Config& config() const { return config_; }

    [[nodiscard]] size_t running_count() const noexcept { return running_.size(); }
    [[nodiscard]] size_t concurrency_limit() const noexcept { return governor_.ceiling(); }
    [[nodiscard]] RuntimeStats stats() const;

    [[nodiscard]] bool is_accepting() const noexcept { return accepting_; }
    [[nodiscard]] bool is_shutting_down() const noexcept { return shutting_down_; }
    [[nodiscard]] bool is_stopped() const noexcept { return stopped_; }

private:
    struct ExecutionRecord {
        std::shared_ptr<Job> job;
        SteadyTime started;
        ExecutionTier tier{ExecutionTier::Pooled};
        std::string strategy;
        TimerId timeout_timer{kInvalidTimer};
    };

    struct Completion {
        std::promise<JobOutcome> promise;
        CompletionHandler observer;
        uint32_t enforced_timeout_s{0};
    };

    void on_settled(JobOutcome outcome, const std::shared_ptr<Completion>& completion);
    void on_runtime_timeout(const JobId& id);
    void emit_status();
    void finish_shutdown(bool forced);
    /// No tracked job and no live isolated child.
    bool drained() const { return running_.empty() && isolated_.active_count() == 0; }

    Config config_;
    Logger logger_;
    EventCollector events_;
    EventLoop loop_;
    MonitorT monitor_;

    JobAnalyzer analyzer_;
    InlineStrategy inline_;
    IsolatedStrategy isolated_;
    StrategySelector selector_;

    ConcurrencyGovernor governor_;
    RateLimiter rate_limiter_;
    std::unordered_map<JobId, ExecutionRecord> running_;

    TimerId memory_timer_{kInvalidTimer};
    TimerId health_timer_{kInvalidTimer};
    TimerId status_timer_{kInvalidTimer};
    TimerId drain_timer_{kInvalidTimer};

    RuntimeStats counters_;
    bool started_{false};
    bool accepting_{true};
    bool shutting_down_{false};
    bool stopped_{false};
};

// ═══════════════════════════════════════════════
// Template Implementation
// ═══════════════════════════════════════════════

template <ResourceMonitorLike MonitorT>
Runtime<MonitorT>::Runtime(Options opts)
    : config_(std::move(opts.config))
    , logger_(std::move(opts.log_sink), opts.log_level)
    , events_(opts.event_sink ? std::move(opts.event_sink) : std::make_unique<NullSink>())
    , monitor_(std::min<uint32_t>(1000, config_.runtime.health_check_interval_ms))
    , analyzer_(std::move(opts.stats_store), config_.analyzer, logger_)
    , inline_(config_.limits, logger_, config_.jobs.isolated_by_default)
    , isolated_(loop_, config_.limits, config_.isolated, logger_,
                config_.jobs.isolated_by_default)
    , selector_(analyzer_, logger_, config_.analyzer.smart_selection)
    , governor_(config_.runtime, config_.limits)
    , rate_limiter_(config_.limits.max_jobs_per_minute) {
    selector_.register_strategy(ExecutionTier::Inline, inline_);
    selector_.register_strategy(ExecutionTier::Pooled, isolated_);
    selector_.register_strategy(ExecutionTier::Isolated, isolated_);
}

template <ResourceMonitorLike MonitorT>
Runtime<MonitorT>::~Runtime() {
    if (isolated_.active_count() > 0) {
        isolated_.terminate_all("runtime destroyed");
    }
    if (!stopped_) monitor_.stop();
    logger_.flush();
    events_.flush();
}

template <ResourceMonitorLike MonitorT>
Result<void> Runtime<MonitorT>::start() {
    if (stopped_) return Error{ErrorCode::ShuttingDown, "Runtime already stopped"};
    if (started_) return Error{"Already running"};
    started_ = true;

    logger_.info("Runtime starting: pid=" + std::to_string(::getpid())
                 + " memory_limit_mb=" + std::to_string(config_.runtime.memory_limit_mb)
                 + " concurrency=" + std::to_string(governor_.ceiling())
                 + " smart_selection=" + (selector_.smart() ? "true" : "false"));

    monitor_.start();

    memory_timer_ = loop_.add_periodic_timer(
        std::chrono::milliseconds{config_.runtime.memory_check_interval_ms},
        [this] { check_memory(); });
    health_timer_ = loop_.add_periodic_timer(
        std::chrono::milliseconds{config_.runtime.health_check_interval_ms},
        [this] { sample_health(); });
    status_timer_ = loop_.add_periodic_timer(
        std::chrono::milliseconds{config_.runtime.status_interval_ms},
        [this] { emit_status(); });

    return Result<void>{};
}

template <ResourceMonitorLike MonitorT>
void Runtime<MonitorT>::run(std::stop_token stop) {
    if (stopped_) return;
    if (!started_) {
        auto res = start();
        if (!res.has_value()) {
            logger_.error("Runtime failed to start: " + res.error().message);
            return;
        }
    }

    // Only post from the requesting thread; the shutdown itself runs on the loop
    std::stop_callback on_stop(stop, [this] {
        loop_.post([this] { shutdown("cancelled"); });
    });

    loop_.run();
}

template <ResourceMonitorLike MonitorT>
Result<void> Runtime<MonitorT>::check_admission() {
    if (!accepting_) {
        return Error{ErrorCode::ShuttingDown, "Runtime is shutting down"};
    }
    if (!rate_limiter_.would_admit(std::chrono::steady_clock::now())) {
        return Error{ErrorCode::RateLimitExceeded,
                     "Rate limit exceeded: maximum "
                     + std::to_string(rate_limiter_.limit()) + " jobs per minute"};
    }
    if (running_.size() >= governor_.ceiling()) {
        return Error{ErrorCode::ConcurrencyLimitExceeded,
                     "Maximum concurrent jobs limit reached ("
                     + std::to_string(governor_.ceiling()) + ")"};
    }
    return Result<void>{};
}

template <ResourceMonitorLike MonitorT>
Result<std::future<JobOutcome>> Runtime<MonitorT>::execute_job(std::unique_ptr<Job> job,
                                                               CompletionHandler observer) {
    if (!accepting_) {
        return Error{ErrorCode::ShuttingDown, "Runtime is shutting down"};
    }
    if (!job) {
        ++counters_.rejected_validation;
        return Error{ErrorCode::Validation, "Job validation failed: no job given"};
    }

    if (auto valid = validate_job(*job, config_.limits); !valid.has_value()) {
        ++counters_.rejected_validation;
        logger_.log_job(LogLevel::Warn, job->id(), "Rejected: " + valid.error().message);
        return valid.error();
    }
    if (running_.contains(job->id())) {
        ++counters_.rejected_validation;
        return Error{ErrorCode::Validation,
                     "Job validation failed: job " + sanitize_job_id(job->id())
                     + " is already running"};
    }

    auto now = std::chrono::steady_clock::now();
    if (!rate_limiter_.would_admit(now)) {
        ++counters_.rejected_rate;
        return Error{ErrorCode::RateLimitExceeded,
                     "Rate limit exceeded: maximum "
                     + std::to_string(rate_limiter_.limit()) + " jobs per minute"};
    }
    if (running_.size() >= governor_.ceiling()) {
        ++counters_.rejected_concurrency;
        return Error{ErrorCode::ConcurrencyLimitExceeded,
                     "Maximum concurrent jobs limit reached ("
                     + std::to_string(governor_.ceiling()) + ")"};
    }

    auto selection = selector_.select(*job);
    if (!selection.has_value()) {
        ++counters_.rejected_validation;
        return selection.error();
    }
    IExecutionStrategy* strategy = selection->strategy;

    if (strategy == &isolated_) {
        if (auto allowed = isolated_.check_source_allowed(*job); !allowed.has_value()) {
            ++counters_.rejected_validation;
            logger_.log_job(LogLevel::Warn, job->id(), "Rejected: " + allowed.error().message);
            return allowed.error();
        }
    }

    std::shared_ptr<Job> shared_job = std::move(job);
    const JobId id = shared_job->id();
    const uint32_t enforced_s = std::min(shared_job->timeout_seconds(),
                                         config_.limits.max_timeout_s);

    ExecutionRecord record;
    record.job = shared_job;
    record.started = now;
    record.tier = selection->tier;
    record.strategy = std::string{strategy->name()};
    record.timeout_timer = loop_.add_timer(std::chrono::seconds{enforced_s},
                                           [this, id] { on_runtime_timeout(id); });
    running_.emplace(id, std::move(record));

    rate_limiter_.record(now);
    ++counters_.dispatched;
    logger_.info("Executing job " + sanitize_job_id(id) + " (type: "
                 + std::string{shared_job->type_name()} + ", tier: "
                 + std::string{to_string(selection->tier)} + ", strategy: "
                 + std::string{strategy->name()} + ")");
    events_.record_job_dispatched(id, shared_job->type_name(), selection->tier,
                                  strategy->name());

    auto completion = std::make_shared<Completion>();
    completion->observer = std::move(observer);
    completion->enforced_timeout_s = enforced_s;
    auto future = completion->promise.get_future();

    auto dispatched = strategy->execute(shared_job, [this, completion](JobOutcome outcome) {
        on_settled(std::move(outcome), completion);
    });
    if (!dispatched.has_value()) {
        if (auto it = running_.find(id); it != running_.end()) {
            loop_.cancel_timer(it->second.timeout_timer);
            running_.erase(it);
        }
        ++counters_.rejected_validation;
        logger_.log_job(LogLevel::Warn, id,
                        "Refused by strategy: " + dispatched.error().message);
        return dispatched.error();
    }

    return std::move(future);
}

template <ResourceMonitorLike MonitorT>
void Runtime<MonitorT>::on_settled(JobOutcome outcome,
                                   const std::shared_ptr<Completion>& completion) {
    if (auto it = running_.find(outcome.job_id); it != running_.end()) {
        loop_.cancel_timer(it->second.timeout_timer);
        running_.erase(it);
    }

    const auto seconds = std::chrono::duration<double>(outcome.duration).count();
    const auto safe_id = sanitize_job_id(outcome.job_id);
    const std::string reason = outcome.error ? outcome.error->message : std::string{};

    switch (outcome.state) {
        case JobState::Succeeded: {
            ++counters_.processed;
            char buf[32];
            std::snprintf(buf, sizeof(buf), "%.2fs", seconds);
            logger_.info("Job " + safe_id + " completed in " + buf);
            events_.record_job_completed(outcome.job_id, outcome.job_type, outcome.duration);
            break;
        }
        case JobState::TimedOut:
            ++counters_.timed_out;
            logger_.log_job(LogLevel::Warn, outcome.job_id, "Timed out: " + reason);
            events_.record_job_timed_out(outcome.job_id, outcome.job_type,
                                         completion->enforced_timeout_s, outcome.strategy);
            break;
        default:
            ++counters_.failed;
            logger_.log_job(LogLevel::Error, outcome.job_id, "Failed: " + reason);
            events_.record_job_failed(outcome.job_id, outcome.job_type, reason,
                                      outcome.duration);
            break;
    }

    analyzer_.record_execution(outcome.job_type, seconds, outcome.succeeded());

    completion->promise.set_value(outcome);
    if (completion->observer) completion->observer(std::move(outcome));

    if (shutting_down_ && drained() && !stopped_) {
        logger_.info("All jobs completed, shutting down");
        finish_shutdown(false);
    }
}

template <ResourceMonitorLike MonitorT>
void Runtime<MonitorT>::on_runtime_timeout(const JobId& id) {
    auto it = running_.find(id);
    if (it == running_.end()) return;

    const auto enforced_s = std::min(it->second.job->timeout_seconds(),
                                     config_.limits.max_timeout_s);
    const std::string type{it->second.job->type_name()};
    running_.erase(it);

    logger_.warn("Job " + sanitize_job_id(id) + " timed out after "
                 + std::to_string(enforced_s) + " seconds");
    events_.record_job_timed_out(id, type, enforced_s, "runtime");

    // A child past its deadline is still being killed; its settlement ends the drain
    if (shutting_down_ && drained() && !stopped_) {
        finish_shutdown(false);
    }
}

template <ResourceMonitorLike MonitorT>
void Runtime<MonitorT>::check_memory() {
    const uint64_t rss = monitor_.process_memory_bytes();
    const uint64_t limit = static_cast<uint64_t>(config_.runtime.memory_limit_mb) * kBytesPerMb;

    if (rss > limit && !shutting_down_) {
        logger_.error("CRITICAL: Memory limit exceeded ("
                      + std::to_string(rss / kBytesPerMb) + " MB > "
                      + std::to_string(config_.runtime.memory_limit_mb)
                      + " MB), initiating graceful shutdown");
        shutdown("memory_limit_exceeded");
    }
}

template <ResourceMonitorLike MonitorT>
void Runtime<MonitorT>::sample_health() {
    auto snap = monitor_.read();
    if (!snap.has_value()) {
        logger_.warn("Health sample unavailable: " + snap.error().message);
        return;
    }

    auto change = governor_.adjust(*snap, running_.size());
    if (!change) return;

    char load[64];
    std::snprintf(load, sizeof(load), "load=%.2f memory=%.0f%%",
                  snap->normalized_load(), snap->memory_fraction() * 100.0);
    const std::string verb = change->current < change->previous ? "Reducing" : "Increasing";
    logger_.info(verb + " concurrency " + std::to_string(change->previous) + " -> "
                 + std::to_string(change->current) + " (" + load + ")");
    events_.record_concurrency_changed(change->previous, change->current, change->reason);
}

template <ResourceMonitorLike MonitorT>
void Runtime<MonitorT>::emit_status() {
    const uint64_t rss = monitor_.process_memory_bytes();
    const auto& selections = selector_.selection_counts();

    char mem[32];
    std::snprintf(mem, sizeof(mem), "%.2f MB",
                  static_cast<double>(rss) / static_cast<double>(kBytesPerMb));
    logger_.info(std::string{"Memory: "} + mem
                 + " | Jobs: " + std::to_string(counters_.processed)
                 + " | Running: " + std::to_string(running_.size())
                 + " | Concurrency: " + std::to_string(governor_.ceiling()));

    events_.record_status({
        {"memory_bytes", rss},
        {"processed", counters_.processed},
        {"failed", counters_.failed},
        {"timed_out", counters_.timed_out},
        {"running", running_.size()},
        {"concurrency_limit", governor_.ceiling()},
        {"selections", {
            {"inline", selections[static_cast<size_t>(ExecutionTier::Inline)]},
            {"pooled", selections[static_cast<size_t>(ExecutionTier::Pooled)]},
            {"isolated", selections[static_cast<size_t>(ExecutionTier::Isolated)]},
        }},
    });
}

template <ResourceMonitorLike MonitorT>
void Runtime<MonitorT>::shutdown(std::string_view reason) {
    if (shutting_down_ || stopped_) return;
    shutting_down_ = true;
    accepting_ = false;

    logger_.info("Graceful shutdown initiated (reason: " + std::string{reason}
                 + ", running jobs: " + std::to_string(running_.size()) + ")");
    events_.record_shutdown(reason, running_.size());

    loop_.cancel_timer(memory_timer_);
    loop_.cancel_timer(health_timer_);
    loop_.cancel_timer(status_timer_);

    if (drained()) {
        finish_shutdown(false);
        return;
    }

    drain_timer_ = loop_.add_timer(
        std::chrono::milliseconds{config_.runtime.drain_timeout_ms}, [this] {
            drain_timer_ = kInvalidTimer;
            logger_.warn("Forced shutdown after "
                         + std::to_string(config_.runtime.drain_timeout_ms) + " ms with "
                         + std::to_string(running_.size()) + " jobs still running");
            finish_shutdown(true);
        });
}

template <ResourceMonitorLike MonitorT>
void Runtime<MonitorT>::finish_shutdown(bool forced) {
    if (stopped_) return;
    stopped_ = true;
    accepting_ = false;

    loop_.cancel_timer(drain_timer_);
    if (isolated_.active_count() > 0) {
        isolated_.terminate_all(forced ? "drain period elapsed" : "runtime stopped");
    }
    running_.clear();

    monitor_.stop();
    logger_.info("Runtime stopped (processed: " + std::to_string(counters_.processed)
                 + ", failed: " + std::to_string(counters_.failed)
                 + ", timed out: " + std::to_string(counters_.timed_out) + ")");
    logger_.flush();
    events_.flush();
    loop_.stop();
}

template <ResourceMonitorLike MonitorT>
RuntimeStats Runtime<MonitorT>::stats() const {
    RuntimeStats s = counters_;
    s.running = running_.size();
    s.concurrency_limit = governor_.ceiling();
    return s;
}

}  // namespace jobtier
