/**
 * @file inline_strategy.hpp
 * @brief Runs a job body synchronously on the loop thread.
 *
 * Inline execution cannot be preempted: a job that overruns its timeout is
 * reported with a warning once it returns.
 */

#pragma once

#include "core/config.hpp"
#include "core/logger.hpp"
#include "execution/strategy.hpp"

namespace jobtier {

class InlineStrategy : public IExecutionStrategy {
public:
    InlineStrategy(const LimitsConfig& limits, Logger& logger, bool isolated_by_default = false);

    /// True when the job opts out of isolation, or leaves it unset and
    /// jobs are not isolated by default.
    [[nodiscard]] bool can_handle(const Job& job) const override;

    Result<void> execute(std::shared_ptr<Job> job, CompletionHandler on_settled) override;

    [[nodiscard]] std::string_view name() const noexcept override { return "inline"; }

    [[nodiscard]] uint64_t timeout_violations() const noexcept { return timeout_violations_; }

private:
    const LimitsConfig& limits_;
    Logger& logger_;
    bool isolated_by_default_;
    uint64_t timeout_violations_{0};
};

}  // namespace jobtier
