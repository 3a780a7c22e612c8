/**
 * @file stats_store.hpp
 * @brief Key → string store with per-entry expiry.
 *
 * The analyzer persists per-type statistics through this interface. Updates
 * are get-then-put with no atomic increment; a store shared between
 * processes may lose an update under contention.
 */

#pragma once

#include "core/types.hpp"

#include <chrono>
#include <functional>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>

namespace jobtier {

class IStatsStore {
public:
    virtual ~IStatsStore() = default;

    [[nodiscard]] virtual std::optional<std::string> get(std::string_view key) = 0;
    virtual void put(std::string_view key, std::string value, std::chrono::seconds ttl) = 0;
    virtual void forget(std::string_view key) = 0;
};

/**
 * @brief Mutex-guarded in-process store. Expired entries are dropped on access.
 */
class InMemoryStatsStore : public IStatsStore {
public:
    using Clock = std::function<SteadyTime()>;

    InMemoryStatsStore();
    explicit InMemoryStatsStore(Clock clock);

    [[nodiscard]] std::optional<std::string> get(std::string_view key) override;
    void put(std::string_view key, std::string value, std::chrono::seconds ttl) override;
    void forget(std::string_view key) override;

    /// Live (unexpired) entries.
    [[nodiscard]] size_t size();

private:
    struct Entry {
        std::string value;
        SteadyTime expires_at;
    };

    void purge_expired_locked(SteadyTime now);

    Clock clock_;
    std::mutex mutex_;
    std::map<std::string, Entry, std::less<>> entries_;
};

}  // namespace jobtier
