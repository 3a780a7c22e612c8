/**
 * @file event_loop.cpp
 * @brief EventLoop implementation — poll(2) plus an ordered timer queue.
 */

#include "core/event_loop.hpp"

#include <cerrno>
#include <cstring>
#include <fcntl.h>
#include <poll.h>
#include <system_error>
#include <unistd.h>

namespace jobtier {

EventLoop::EventLoop() {
    if (::pipe2(wake_pipe_, O_NONBLOCK | O_CLOEXEC) != 0) {
        throw std::system_error(errno, std::generic_category(), "EventLoop wake pipe");
    }
}

EventLoop::~EventLoop() {
    for (int& fd : wake_pipe_) {
        if (fd >= 0) {
            ::close(fd);
            fd = -1;
        }
    }
}

// ─────────────────────────────────────────────
// Timers
// ─────────────────────────────────────────────

TimerId EventLoop::add_timer(std::chrono::milliseconds delay, Callback cb) {
    TimerId id = next_timer_id_++;
    auto due = Clock::now() + delay;
    timers_.emplace(id, Timer{due, std::chrono::milliseconds{0}, std::move(cb)});
    timer_queue_.emplace(due, id);
    return id;
}

TimerId EventLoop::add_periodic_timer(std::chrono::milliseconds interval, Callback cb) {
    if (interval.count() <= 0) interval = std::chrono::milliseconds{1};
    TimerId id = next_timer_id_++;
    auto due = Clock::now() + interval;
    timers_.emplace(id, Timer{due, interval, std::move(cb)});
    timer_queue_.emplace(due, id);
    return id;
}

bool EventLoop::cancel_timer(TimerId id) noexcept {
    auto it = timers_.find(id);
    if (it == timers_.end()) return false;
    timer_queue_.erase({it->second.due, id});
    timers_.erase(it);
    return true;
}

bool EventLoop::is_timer_pending(TimerId id) const noexcept {
    return timers_.contains(id);
}

bool EventLoop::fire_due_timers() {
    bool fired = false;
    auto now = Clock::now();

    // Only timers due at entry fire in this pass; periodic timers re-armed
    // below are picked up by the next iteration.
    std::vector<TimerId> due_ids;
    for (const auto& [due, id] : timer_queue_) {
        if (due > now) break;
        due_ids.push_back(id);
    }

    for (TimerId id : due_ids) {
        auto it = timers_.find(id);
        if (it == timers_.end()) continue;  // cancelled by an earlier callback

        timer_queue_.erase({it->second.due, id});
        Callback cb = it->second.callback;

        if (it->second.interval.count() > 0) {
            auto next_due = it->second.due + it->second.interval;
            if (next_due <= now) next_due = now + it->second.interval;
            it->second.due = next_due;
            timer_queue_.emplace(next_due, id);
        } else {
            timers_.erase(it);
        }

        cb();
        fired = true;
    }
    return fired;
}

// ─────────────────────────────────────────────
// Descriptors
// ─────────────────────────────────────────────

void EventLoop::watch_readable(int fd, Callback cb) {
    watchers_[fd] = std::move(cb);
}

void EventLoop::unwatch(int fd) noexcept {
    watchers_.erase(fd);
}

// ─────────────────────────────────────────────
// Deferred / posted work
// ─────────────────────────────────────────────

void EventLoop::defer(Callback cb) {
    deferred_.push_back(std::move(cb));
}

void EventLoop::post(Callback cb) {
    {
        std::lock_guard lock(posted_mutex_);
        posted_.push_back(std::move(cb));
    }
    wake();
}

void EventLoop::wake() noexcept {
    const char byte = 1;
    // EAGAIN means the pipe already holds a pending wake-up
    [[maybe_unused]] auto n = ::write(wake_pipe_[1], &byte, 1);
}

void EventLoop::drain_wake_pipe() noexcept {
    char buf[64];
    while (::read(wake_pipe_[0], buf, sizeof(buf)) > 0) {
    }
}

bool EventLoop::run_deferred() {
    {
        std::lock_guard lock(posted_mutex_);
        if (!posted_.empty()) {
            for (auto& cb : posted_) deferred_.push_back(std::move(cb));
            posted_.clear();
        }
    }
    if (deferred_.empty()) return false;

    std::vector<Callback> batch;
    batch.swap(deferred_);
    for (auto& cb : batch) cb();
    return true;
}

// ─────────────────────────────────────────────
// Driving the loop
// ─────────────────────────────────────────────

bool EventLoop::run_once(std::optional<std::chrono::milliseconds> max_wait) {
    bool did_work = run_deferred();

    // Compute poll timeout: 0 if work is already queued, else until the
    // next timer, capped by max_wait. -1 blocks until a descriptor fires.
    int timeout_ms = -1;
    bool has_posted = false;
    {
        std::lock_guard lock(posted_mutex_);
        has_posted = !posted_.empty();
    }
    if (!deferred_.empty() || has_posted || stop_requested_.load()) {
        timeout_ms = 0;
    } else {
        if (!timer_queue_.empty()) {
            auto until = std::chrono::duration_cast<std::chrono::milliseconds>(
                timer_queue_.begin()->first - Clock::now());
            // Round up so a timer is never polled for early
            auto ms = until.count() < 0 ? 0 : until.count() + 1;
            timeout_ms = static_cast<int>(ms);
        }
        if (max_wait) {
            auto cap = static_cast<int>(std::max<int64_t>(0, max_wait->count()));
            timeout_ms = timeout_ms < 0 ? cap : std::min(timeout_ms, cap);
        }
    }

    std::vector<pollfd> pfds;
    pfds.reserve(watchers_.size() + 1);
    pfds.push_back(pollfd{wake_pipe_[0], POLLIN, 0});
    for (const auto& [fd, cb] : watchers_) {
        pfds.push_back(pollfd{fd, POLLIN, 0});
    }

    int ready = ::poll(pfds.data(), pfds.size(), timeout_ms);
    if (ready < 0 && errno != EINTR) {
        throw std::system_error(errno, std::generic_category(), "poll");
    }

    if (ready > 0) {
        if (pfds[0].revents != 0) drain_wake_pipe();

        for (size_t i = 1; i < pfds.size(); ++i) {
            if (pfds[i].revents == 0) continue;
            // An earlier callback may have removed or replaced this watcher
            auto it = watchers_.find(pfds[i].fd);
            if (it == watchers_.end()) continue;
            Callback cb = it->second;
            cb();
            did_work = true;
        }
    }

    did_work = fire_due_timers() || did_work;
    did_work = run_deferred() || did_work;
    return did_work;
}

void EventLoop::run() {
    running_ = true;
    while (!stop_requested_.load()) {
        run_once();
    }
    stop_requested_ = false;
    running_ = false;
}

bool EventLoop::run_until(const std::function<bool()>& predicate,
                          std::chrono::milliseconds max_duration) {
    auto deadline = Clock::now() + max_duration;
    running_ = true;
    while (!predicate()) {
        auto now = Clock::now();
        if (now >= deadline || stop_requested_.load()) break;
        auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(deadline - now);
        run_once(std::min(remaining, std::chrono::milliseconds{50}));
    }
    stop_requested_ = false;
    running_ = false;
    return predicate();
}

void EventLoop::stop() noexcept {
    stop_requested_ = true;
    wake();
}

}  // namespace jobtier
