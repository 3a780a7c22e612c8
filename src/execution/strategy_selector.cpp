/**
 * @file strategy_selector.cpp
 * @brief Tier-to-strategy binding in smart and legacy mode.
 */

#include "execution/strategy_selector.hpp"

#include <string>

namespace jobtier {

StrategySelector::StrategySelector(JobAnalyzer& analyzer, Logger& logger, bool smart)
    : analyzer_(analyzer), logger_(logger), smart_(smart) {}

void StrategySelector::register_strategy(ExecutionTier tier, IExecutionStrategy& strategy) {
    for (auto& [t, s] : strategies_) {
        if (t == tier) {
            s = &strategy;
            return;
        }
    }
    strategies_.emplace_back(tier, &strategy);
}

bool StrategySelector::has_strategy(ExecutionTier tier) const noexcept {
    for (const auto& [t, s] : strategies_) {
        if (t == tier) return true;
    }
    return false;
}

Result<Selection> StrategySelector::select(const Job& job) {
    if (!smart_) {
        for (const auto& [tier, strategy] : strategies_) {
            if (strategy->can_handle(job)) {
                counts_[static_cast<size_t>(tier)]++;
                return Selection{tier, strategy};
            }
        }
        return Error{ErrorCode::Validation,
                     "No strategy can handle job type " + std::string{job.type_name()}};
    }

    auto tier = analyzer_.analyze(job);
    for (const auto& [t, strategy] : strategies_) {
        if (t == tier) {
            counts_[static_cast<size_t>(tier)]++;
            logger_.debug("Selected " + std::string{strategy->name()} + " strategy for "
                          + std::string{job.type_name()} + " (tier "
                          + std::string{to_string(tier)} + ")");
            return Selection{tier, strategy};
        }
    }
    return Error{ErrorCode::Generic,
                 "No strategy registered for tier " + std::string{to_string(tier)}};
}

}  // namespace jobtier
