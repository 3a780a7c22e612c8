/**
 * @file strategy_selector.hpp
 * @brief Binds an execution tier to a registered strategy.
 *
 * Smart mode asks the JobAnalyzer for a tier. Legacy mode picks the first
 * registered strategy whose can_handle() accepts the job.
 */

#pragma once

#include "analysis/job_analyzer.hpp"
#include "core/logger.hpp"
#include "core/result.hpp"
#include "core/types.hpp"
#include "execution/strategy.hpp"

#include <array>
#include <cstdint>
#include <utility>
#include <vector>

namespace jobtier {

struct Selection {
    ExecutionTier tier{ExecutionTier::Pooled};
    IExecutionStrategy* strategy{nullptr};
};

class StrategySelector {
public:
    StrategySelector(JobAnalyzer& analyzer, Logger& logger, bool smart = true);

    /// Non-owning; a later registration for the same tier replaces it.
    void register_strategy(ExecutionTier tier, IExecutionStrategy& strategy);

    [[nodiscard]] Result<Selection> select(const Job& job);

    [[nodiscard]] bool smart() const noexcept { return smart_; }
    [[nodiscard]] bool has_strategy(ExecutionTier tier) const noexcept;

    /// Selections so far, indexed by ExecutionTier.
    [[nodiscard]] const std::array<uint64_t, 3>& selection_counts() const noexcept {
        return counts_;
    }
    [[nodiscard]] uint64_t selection_count(ExecutionTier tier) const noexcept {
        return counts_[static_cast<size_t>(tier)];
    }

private:
    JobAnalyzer& analyzer_;
    Logger& logger_;
    bool smart_;
    std::vector<std::pair<ExecutionTier, IExecutionStrategy*>> strategies_;
    std::array<uint64_t, 3> counts_{};
};

}  // namespace jobtier
