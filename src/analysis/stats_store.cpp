/**
 * @file stats_store.cpp
 * @brief In-memory statistics store with per-key expiry.
 */

#include "analysis/stats_store.hpp"

namespace jobtier {

InMemoryStatsStore::InMemoryStatsStore()
    : clock_([] { return std::chrono::steady_clock::now(); }) {}

InMemoryStatsStore::InMemoryStatsStore(Clock clock) : clock_(std::move(clock)) {}

std::optional<std::string> InMemoryStatsStore::get(std::string_view key) {
    std::lock_guard lock(mutex_);
    auto it = entries_.find(key);
    if (it == entries_.end()) return std::nullopt;
    if (it->second.expires_at <= clock_()) {
        entries_.erase(it);
        return std::nullopt;
    }
    return it->second.value;
}

void InMemoryStatsStore::put(std::string_view key, std::string value, std::chrono::seconds ttl) {
    std::lock_guard lock(mutex_);
    auto expires = clock_() + ttl;
    auto it = entries_.find(key);
    if (it != entries_.end()) {
        it->second = Entry{std::move(value), expires};
    } else {
        entries_.emplace(std::string{key}, Entry{std::move(value), expires});
    }
}

void InMemoryStatsStore::forget(std::string_view key) {
    std::lock_guard lock(mutex_);
    auto it = entries_.find(key);
    if (it != entries_.end()) entries_.erase(it);
}

size_t InMemoryStatsStore::size() {
    std::lock_guard lock(mutex_);
    purge_expired_locked(clock_());
    return entries_.size();
}

void InMemoryStatsStore::purge_expired_locked(SteadyTime now) {
    for (auto it = entries_.begin(); it != entries_.end();) {
        if (it->second.expires_at <= now) {
            it = entries_.erase(it);
        } else {
            ++it;
        }
    }
}

}  // namespace jobtier
