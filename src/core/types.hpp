/**
 * @file types.hpp
 * @brief Fundamental types used throughout jobtier.
 *
 * Defines JobId, ExecutionTier, JobState, HealthSnapshot and other shared
 * vocabulary types. All types are designed for value semantics.
 */

#pragma once

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace jobtier {

// ─────────────────────────────────────────────
// Identity Types
// ─────────────────────────────────────────────

using JobId = std::string;
using Timestamp = std::chrono::system_clock::time_point;
using Duration = std::chrono::microseconds;
using SteadyTime = std::chrono::steady_clock::time_point;

// ─────────────────────────────────────────────
// Execution Tier
// ─────────────────────────────────────────────

/**
 * @brief Execution tier chosen for a job by the analyzer.
 *
 * Inline runs on the loop thread, Pooled is the middle tier (currently served
 * by the isolated strategy), Isolated runs in a dedicated child process.
 */
enum class ExecutionTier : uint8_t {
    Inline,
    Pooled,
    Isolated
};

[[nodiscard]] constexpr std::string_view to_string(ExecutionTier tier) noexcept {
    switch (tier) {
        case ExecutionTier::Inline:   return "inline";
        case ExecutionTier::Pooled:   return "pooled";
        case ExecutionTier::Isolated: return "isolated";
    }
    return "unknown";
}

[[nodiscard]] constexpr std::optional<ExecutionTier> parse_tier(std::string_view name) noexcept {
    if (name == "inline")   return ExecutionTier::Inline;
    if (name == "pooled")   return ExecutionTier::Pooled;
    if (name == "isolated") return ExecutionTier::Isolated;
    return std::nullopt;
}

// ─────────────────────────────────────────────
// Job State
// ─────────────────────────────────────────────

enum class JobState : uint8_t {
    Pending,       ///< Handed to a strategy, nothing done yet
    Validating,    ///< Server-side limit and source checks
    Spawning,      ///< Bundle written, child being started
    Running,       ///< Body executing (inline or in the child)
    Succeeded,     ///< Finished with success
    Failed,        ///< Body raised, child exited non-zero, or spawn failed
    TimedOut       ///< Killed after exceeding its timeout
};

[[nodiscard]] constexpr std::string_view to_string(JobState state) noexcept {
    switch (state) {
        case JobState::Pending:    return "pending";
        case JobState::Validating: return "validating";
        case JobState::Spawning:   return "spawning";
        case JobState::Running:    return "running";
        case JobState::Succeeded:  return "succeeded";
        case JobState::Failed:     return "failed";
        case JobState::TimedOut:   return "timed_out";
    }
    return "unknown";
}

[[nodiscard]] constexpr bool is_terminal(JobState state) noexcept {
    return state == JobState::Succeeded || state == JobState::Failed
        || state == JobState::TimedOut;
}

// ─────────────────────────────────────────────
// Health Snapshot
// ─────────────────────────────────────────────

/**
 * @brief A point-in-time sample of host and process health.
 *
 * Read from Linux pseudo-filesystems (/proc) by the LinuxMonitor.
 */
struct HealthSnapshot {
    Timestamp timestamp;

    double load_average_1m{0.0};        ///< Raw 1-minute load average
    uint32_t cpu_cores{1};

    uint64_t memory_available_bytes{0};
    uint64_t memory_total_bytes{0};

    uint64_t process_rss_bytes{0};      ///< Resident set of this process

    /// Load average normalized by core count (1.0 == every core busy).
    [[nodiscard]] constexpr double normalized_load() const noexcept {
        return cpu_cores == 0 ? load_average_1m
                              : load_average_1m / static_cast<double>(cpu_cores);
    }

    /// System memory in use, as a fraction in [0, 1].
    [[nodiscard]] constexpr double memory_fraction() const noexcept {
        if (memory_total_bytes == 0) return 0.0;
        return static_cast<double>(memory_total_bytes - memory_available_bytes)
               / static_cast<double>(memory_total_bytes);
    }
};

}  // namespace jobtier
