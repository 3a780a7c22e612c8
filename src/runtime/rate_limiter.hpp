/**
 * @file rate_limiter.hpp
 * @brief Sliding-window dispatch counter.
 *
 * Loop-thread only. Timestamps older than the window are pruned lazily on
 * every query.
 */

#pragma once

#include "core/types.hpp"

#include <chrono>
#include <cstdint>
#include <deque>

namespace jobtier {

class RateLimiter {
public:
    explicit RateLimiter(uint32_t max_per_window,
                         std::chrono::seconds window = std::chrono::seconds{60});

    /// True if one more dispatch at @p now stays within the limit.
    [[nodiscard]] bool would_admit(SteadyTime now);

    void record(SteadyTime now);

    [[nodiscard]] size_t in_window(SteadyTime now);
    [[nodiscard]] uint32_t limit() const noexcept { return max_per_window_; }

private:
    void prune(SteadyTime now);

    uint32_t max_per_window_;
    std::chrono::seconds window_;
    std::deque<SteadyTime> dispatches_;
};

}  // namespace jobtier
