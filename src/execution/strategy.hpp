/**
 * @file strategy.hpp
 * @brief Execution strategy interface and the outcome it delivers.
 *
 * Strategies use virtual dispatch: the set is fixed at startup and a
 * selector picks one per job. A synchronous error from execute() means the
 * job was refused (validation or security) and the handler is never called.
 * Otherwise the handler is called exactly once, possibly before execute()
 * returns.
 */

#pragma once

#include "core/result.hpp"
#include "core/types.hpp"
#include "job/job.hpp"

#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <string_view>

namespace jobtier {

/**
 * @brief Terminal result of one execution attempt.
 */
struct JobOutcome {
    JobId job_id;
    std::string job_type;
    std::string strategy;
    JobState state{JobState::Pending};
    Duration duration{0};
    std::optional<Error> error;         ///< Sanitized; set unless Succeeded

    [[nodiscard]] bool succeeded() const noexcept { return state == JobState::Succeeded; }
    [[nodiscard]] bool timed_out() const noexcept { return state == JobState::TimedOut; }
};

using CompletionHandler = std::function<void(JobOutcome)>;

// ─────────────────────────────────────────────
// IExecutionStrategy (Virtual — fixed at startup)
// ─────────────────────────────────────────────

class IExecutionStrategy {
public:
    virtual ~IExecutionStrategy() = default;

    [[nodiscard]] virtual bool can_handle(const Job& job) const = 0;

    virtual Result<void> execute(std::shared_ptr<Job> job, CompletionHandler on_settled) = 0;

    [[nodiscard]] virtual std::string_view name() const noexcept = 0;
};

}  // namespace jobtier
