/**
 * @file job.hpp
 * @brief Job — the unit of work handed to the Runtime.
 *
 * A concrete job derives from Job, names its logical type, implements
 * `execute()` and exposes its plain-data fields through `save_fields()` /
 * `load_fields()` so it can be rebuilt inside an isolated child process.
 */

#pragma once

#include "core/config.hpp"
#include "core/result.hpp"
#include "core/types.hpp"

#include <nlohmann/json.hpp>

#include <cstdint>
#include <filesystem>
#include <optional>
#include <string_view>

namespace jobtier {

inline constexpr int32_t kMinPriority = -100;
inline constexpr int32_t kMaxPriority = 100;

/**
 * @brief Construction-time properties of a job.
 *
 * `isolated` is tri-state: unset lets the analyzer decide.
 */
struct JobOptions {
    JobId id;                                       ///< Empty = generate one
    uint32_t timeout_s = 30;
    uint32_t max_memory_mb = 64;
    std::optional<bool> isolated;
    int32_t priority = 0;                           ///< Higher runs first
    std::optional<double> estimated_duration_s;
};

class Job {
public:
    explicit Job(JobOptions options = {});
    virtual ~Job() = default;

    // A job is executed by at most one strategy at a time
    Job(const Job&) = delete;
    Job& operator=(const Job&) = delete;

    [[nodiscard]] const JobId& id() const noexcept { return options_.id; }
    [[nodiscard]] uint32_t timeout_seconds() const noexcept { return options_.timeout_s; }
    [[nodiscard]] uint32_t max_memory_mb() const noexcept { return options_.max_memory_mb; }
    [[nodiscard]] std::optional<bool> isolation() const noexcept { return options_.isolated; }
    [[nodiscard]] int32_t priority() const noexcept { return options_.priority; }
    [[nodiscard]] std::optional<double> estimated_duration_seconds() const noexcept {
        return options_.estimated_duration_s;
    }
    [[nodiscard]] const JobOptions& options() const noexcept { return options_; }

    /// Logical type name; keys statistics and the registry.
    [[nodiscard]] virtual std::string_view type_name() const noexcept = 0;

    /// Source file that defines the job, if known. Used for static analysis
    /// and the isolated allow-list.
    [[nodiscard]] virtual std::optional<std::filesystem::path> source_path() const {
        return std::nullopt;
    }

    /// The job body. Failures are reported through the Result; exceptions are
    /// caught by the executing strategy.
    virtual Result<void> execute() = 0;

    /// Plain-data fields (object of scalars, arrays, objects, null).
    [[nodiscard]] virtual nlohmann::json save_fields() const { return nlohmann::json::object(); }

    /// Assign fields produced by save_fields() on a fresh instance.
    virtual Result<void> load_fields(const nlohmann::json& fields);

private:
    JobOptions options_;
};

/// Random hex id, unique per process lifetime.
[[nodiscard]] JobId generate_job_id();

/**
 * @brief Check a job against server-side limits.
 *
 * Rules: 1 ≤ timeout ≤ max_timeout_s, 1 ≤ memory ≤ max_memory_mb,
 * kMinPriority ≤ priority ≤ kMaxPriority. The error names the field with
 * both the requested and the allowed values.
 */
Result<void> validate_job(const Job& job, const LimitsConfig& limits);

}  // namespace jobtier
