/**
 * @file rate_limiter.cpp
 * @brief Sliding-window dispatch counter with lazy pruning.
 */

#include "runtime/rate_limiter.hpp"

namespace jobtier {

RateLimiter::RateLimiter(uint32_t max_per_window, std::chrono::seconds window)
    : max_per_window_(max_per_window), window_(window) {}

bool RateLimiter::would_admit(SteadyTime now) {
    prune(now);
    return dispatches_.size() < max_per_window_;
}

void RateLimiter::record(SteadyTime now) {
    dispatches_.push_back(now);
}

size_t RateLimiter::in_window(SteadyTime now) {
    prune(now);
    return dispatches_.size();
}

void RateLimiter::prune(SteadyTime now) {
    auto cutoff = now - window_;
    while (!dispatches_.empty() && dispatches_.front() <= cutoff) {
        dispatches_.pop_front();
    }
}

}  // namespace jobtier
