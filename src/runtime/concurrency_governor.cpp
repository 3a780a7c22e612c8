/**
 * @file concurrency_governor.cpp
 * @brief Health assessment and concurrency ceiling adjustment.
 */

#include "runtime/concurrency_governor.hpp"

#include <algorithm>
#include <cmath>

namespace jobtier {

ConcurrencyGovernor::ConcurrencyGovernor(const RuntimeConfig& runtime, const LimitsConfig& limits)
    : max_cpu_load_(runtime.max_cpu_load),
      max_memory_fraction_(runtime.max_memory_fraction),
      shrink_factor_(runtime.shrink_factor),
      grow_step_(std::max<size_t>(1, runtime.grow_step)) {
    cap_ = std::max<size_t>(1, std::min<size_t>(runtime.max_concurrency, limits.max_concurrent_jobs));
    floor_ = std::clamp<size_t>(runtime.min_concurrency, 1, cap_);
    ceiling_ = std::clamp<size_t>(runtime.initial_concurrency, floor_, cap_);
}

HealthAssessment ConcurrencyGovernor::assess(const HealthSnapshot& snapshot) const noexcept {
    HealthAssessment a;
    a.normalized_load = snapshot.normalized_load();
    a.memory_fraction = snapshot.memory_fraction();
    a.stressed = a.normalized_load > max_cpu_load_ || a.memory_fraction > max_memory_fraction_;
    a.healthy = a.normalized_load < max_cpu_load_ / 2.0
             && a.memory_fraction < max_memory_fraction_ / 2.0;
    return a;
}

std::optional<CeilingChange> ConcurrencyGovernor::adjust(const HealthSnapshot& snapshot,
                                                         size_t running) {
    auto health = assess(snapshot);
    size_t previous = ceiling_;

    if (health.stressed) {
        auto shrunk = static_cast<size_t>(std::floor(static_cast<double>(ceiling_) * shrink_factor_));
        ceiling_ = std::max(floor_, shrunk);
        if (ceiling_ != previous) return CeilingChange{previous, ceiling_, "stressed"};
        return std::nullopt;
    }

    if (health.healthy && static_cast<double>(running) >= 0.8 * static_cast<double>(ceiling_)) {
        ceiling_ = std::min(cap_, ceiling_ + grow_step_);
        if (ceiling_ != previous) return CeilingChange{previous, ceiling_, "healthy"};
    }
    return std::nullopt;
}

}  // namespace jobtier
