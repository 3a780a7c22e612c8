/**
 * @file concepts.hpp
 * @brief C++20 concept definitions for jobtier's statically dispatched seams.
 *
 * The health monitor is queried from periodic loop timers and the Worker
 * drives whichever runtime it is given, so both are resolved at compile time
 * instead of through virtual dispatch.
 */

#pragma once

#include "core/types.hpp"
#include "core/result.hpp"

#include <concepts>
#include <cstdint>
#include <memory>
#include <string_view>

namespace jobtier {

class Job;
class EventLoop;

// ─────────────────────────────────────────────
// ResourceMonitorLike
// ─────────────────────────────────────────────

/**
 * @concept ResourceMonitorLike
 * @brief Constrains types that can provide health snapshots.
 */
template <typename T>
concept ResourceMonitorLike = requires(T monitor) {
    { monitor.read() } -> std::same_as<Result<HealthSnapshot>>;
    { monitor.process_memory_bytes() } -> std::convertible_to<uint64_t>;
    { monitor.start() } -> std::same_as<void>;
    { monitor.stop() } -> std::same_as<void>;
};

// ─────────────────────────────────────────────
// JobRuntimeLike
// ─────────────────────────────────────────────

/**
 * @concept JobRuntimeLike
 * @brief Constrains types a Worker can feed jobs into.
 */
template <typename T>
concept JobRuntimeLike = requires(T runtime, std::unique_ptr<Job> job, std::string_view reason) {
    { runtime.check_admission() } -> std::same_as<Result<void>>;
    { runtime.execute_job(std::move(job)) };
    { runtime.shutdown(reason) } -> std::same_as<void>;
    { runtime.is_accepting() } -> std::convertible_to<bool>;
    { runtime.loop() } -> std::same_as<EventLoop&>;
};

}  // namespace jobtier
