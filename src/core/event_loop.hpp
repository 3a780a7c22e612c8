/**
 * @file event_loop.hpp
 * @brief Single-threaded cooperative event loop built on poll(2).
 *
 * All Runtime bookkeeping happens inside callbacks run by this loop, so
 * the in-flight map, the rate-limit window and the concurrency ceiling
 * never need a lock. The loop suspends only while waiting for a timer or
 * for a watched descriptor to become readable.
 *
 * `post()` is the only member that may be called from another thread; it
 * wakes the loop through a self-pipe.
 */

#pragma once

#include <atomic>
#include <chrono>
#include <cstdint>
#include <functional>
#include <map>
#include <mutex>
#include <optional>
#include <set>
#include <unordered_map>
#include <utility>
#include <vector>

namespace jobtier {

using TimerId = uint64_t;
inline constexpr TimerId kInvalidTimer = 0;

class EventLoop {
public:
    using Callback = std::function<void()>;
    using Clock = std::chrono::steady_clock;

    EventLoop();
    ~EventLoop();

    // Non-copyable, non-movable
    EventLoop(const EventLoop&) = delete;
    EventLoop& operator=(const EventLoop&) = delete;

    // ── Timers ───────────────────────────────

    TimerId add_timer(std::chrono::milliseconds delay, Callback cb);
    TimerId add_periodic_timer(std::chrono::milliseconds interval, Callback cb);

    /// Returns true if the timer was still pending. Safe to call repeatedly.
    bool cancel_timer(TimerId id) noexcept;

    [[nodiscard]] bool is_timer_pending(TimerId id) const noexcept;
    [[nodiscard]] size_t pending_timer_count() const noexcept { return timers_.size(); }

    // ── Descriptors ──────────────────────────

    /// Invoke @p cb whenever @p fd is readable (or hung up). Replaces any
    /// previous watcher on the same descriptor.
    void watch_readable(int fd, Callback cb);
    void unwatch(int fd) noexcept;

    [[nodiscard]] size_t watcher_count() const noexcept { return watchers_.size(); }

    // ── Deferred work ────────────────────────

    /// Run @p cb on the next iteration (loop thread only).
    void defer(Callback cb);

    /// Thread-safe: queue @p cb and wake the loop.
    void post(Callback cb);

    // ── Driving the loop ─────────────────────

    /// Run until stop() is called.
    void run();

    /// One iteration: deferred work, wait (bounded by @p max_wait and the
    /// next timer), ready descriptors, due timers. Returns true if any
    /// callback ran.
    bool run_once(std::optional<std::chrono::milliseconds> max_wait = std::nullopt);

    /// Iterate until @p predicate holds or @p max_duration elapses.
    /// Returns the final value of the predicate.
    bool run_until(const std::function<bool()>& predicate,
                   std::chrono::milliseconds max_duration);

    /// Request run() to return after the current iteration. Thread-safe.
    void stop() noexcept;

    [[nodiscard]] bool is_running() const noexcept { return running_.load(); }

private:
    struct Timer {
        Clock::time_point due;
        std::chrono::milliseconds interval{0};   ///< 0 = one-shot
        Callback callback;
    };

    void wake() noexcept;
    void drain_wake_pipe() noexcept;
    bool run_deferred();
    bool fire_due_timers();

    std::unordered_map<TimerId, Timer> timers_;
    std::set<std::pair<Clock::time_point, TimerId>> timer_queue_;
    TimerId next_timer_id_{1};

    std::map<int, Callback> watchers_;
    std::vector<Callback> deferred_;

    std::mutex posted_mutex_;
    std::vector<Callback> posted_;

    int wake_pipe_[2]{-1, -1};
    std::atomic<bool> running_{false};
    std::atomic<bool> stop_requested_{false};
};

}  // namespace jobtier
