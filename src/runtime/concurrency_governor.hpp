/**
 * @file concurrency_governor.hpp
 * @brief Health-adaptive concurrency ceiling.
 *
 * Shrink fast, grow slow:
 *   stressed  (load > max_cpu_load or memory > max_memory_fraction)
 *             → ceiling = max(floor, ceiling × shrink_factor)
 *   healthy   (both below half of those) and running ≥ 80 % of ceiling
 *             → ceiling = min(cap, ceiling + grow_step)
 * The ceiling always stays within [floor, cap].
 */

#pragma once

#include "core/config.hpp"
#include "core/types.hpp"

#include <cstddef>
#include <optional>
#include <string_view>

namespace jobtier {

struct HealthAssessment {
    bool stressed{false};
    bool healthy{false};
    double normalized_load{0.0};
    double memory_fraction{0.0};
};

struct CeilingChange {
    size_t previous{0};
    size_t current{0};
    std::string_view reason;        ///< "stressed" or "healthy"
};

class ConcurrencyGovernor {
public:
    /// Cap is the lower of runtime.max_concurrency and limits.max_concurrent_jobs.
    ConcurrencyGovernor(const RuntimeConfig& runtime, const LimitsConfig& limits);

    [[nodiscard]] size_t ceiling() const noexcept { return ceiling_; }
    [[nodiscard]] size_t floor() const noexcept { return floor_; }
    [[nodiscard]] size_t cap() const noexcept { return cap_; }

    [[nodiscard]] HealthAssessment assess(const HealthSnapshot& snapshot) const noexcept;

    /// Apply one health sample. Returns the change, if any.
    std::optional<CeilingChange> adjust(const HealthSnapshot& snapshot, size_t running);

private:
    double max_cpu_load_;
    double max_memory_fraction_;
    double shrink_factor_;
    size_t grow_step_;
    size_t floor_;
    size_t cap_;
    size_t ceiling_;
};

}  // namespace jobtier
