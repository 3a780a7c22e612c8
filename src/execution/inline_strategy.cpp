/**
 * @file inline_strategy.cpp
 * @brief InlineStrategy — scoped memory ceiling, exception capture, timing.
 */

#include "execution/inline_strategy.hpp"

#include "core/sanitize.hpp"
#include "resource_monitor/memory_ceiling.hpp"

#include <algorithm>
#include <chrono>
#include <new>

namespace jobtier {

InlineStrategy::InlineStrategy(const LimitsConfig& limits, Logger& logger,
                               bool isolated_by_default)
    : limits_(limits), logger_(logger), isolated_by_default_(isolated_by_default) {}

bool InlineStrategy::can_handle(const Job& job) const {
    return !job.isolation().value_or(isolated_by_default_);
}

Result<void> InlineStrategy::execute(std::shared_ptr<Job> job, CompletionHandler on_settled) {
    if (!job) {
        return Error{ErrorCode::Validation, "No job given"};
    }

    JobOutcome outcome;
    outcome.job_id = job->id();
    outcome.job_type = std::string{job->type_name()};
    outcome.strategy = std::string{name()};

    uint32_t ceiling_mb = std::min(job->max_memory_mb(), limits_.max_memory_mb);
    auto start = std::chrono::steady_clock::now();
    {
        ScopedMemoryCeiling ceiling(static_cast<uint64_t>(ceiling_mb) * kBytesPerMb);
        if (!ceiling.active()) {
            logger_.debug("Memory ceiling unavailable for inline job "
                          + sanitize_job_id(job->id()));
        }

        try {
            auto result = job->execute();
            if (result) {
                outcome.state = JobState::Succeeded;
            } else {
                outcome.state = JobState::Failed;
                outcome.error = Error{ErrorCode::ExecutionFailure,
                                      sanitize_error_message(result.error().message)};
            }
        } catch (const std::bad_alloc&) {
            outcome.state = JobState::Failed;
            outcome.error = Error{ErrorCode::ExecutionFailure,
                                  "Job exceeded its memory limit of "
                                      + std::to_string(ceiling_mb) + " MB"};
        } catch (const std::exception& e) {
            outcome.state = JobState::Failed;
            outcome.error = Error{ErrorCode::ExecutionFailure, sanitize_error_message(e.what())};
        } catch (...) {
            outcome.state = JobState::Failed;
            outcome.error = Error{ErrorCode::ExecutionFailure, "Job raised a non-standard exception"};
        }
    }
    outcome.duration = std::chrono::duration_cast<Duration>(std::chrono::steady_clock::now() - start);

    auto elapsed_s = std::chrono::duration<double>(outcome.duration).count();
    if (elapsed_s > static_cast<double>(job->timeout_seconds())) {
        ++timeout_violations_;
        logger_.warn("Inline job " + sanitize_job_id(job->id()) + " ran for "
                     + std::to_string(elapsed_s) + "s, exceeding its timeout of "
                     + std::to_string(job->timeout_seconds()) + "s");
    }

    on_settled(std::move(outcome));
    return Result<void>{};
}

}  // namespace jobtier
