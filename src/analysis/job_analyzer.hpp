/**
 * @file job_analyzer.hpp
 * @brief Five-tier execution-tier classifier with historical learning.
 *
 * Decision precedence (first applicable wins):
 *   1. Explicit hint     — isolation flag, then estimated duration
 *   2. Historical data   — average duration once min_samples runs are recorded
 *   3. Static analysis   — weighted blocking-call signatures in the job source
 *   4. Name heuristics   — curated heavy / light type-name patterns
 *   5. Default           — pooled
 */

#pragma once

#include "analysis/stats_store.hpp"
#include "core/config.hpp"
#include "core/logger.hpp"
#include "core/types.hpp"
#include "job/job.hpp"

#include <cstdint>
#include <filesystem>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace jobtier {

inline constexpr std::string_view kStatsKeyPrefix = "jobtier_job_stats:";

enum class DecisionSource : uint8_t {
    Explicit,
    Historical,
    StaticAnalysis,
    NameHeuristic,
    Default
};

[[nodiscard]] constexpr std::string_view to_string(DecisionSource source) noexcept {
    switch (source) {
        case DecisionSource::Explicit:       return "explicit";
        case DecisionSource::Historical:     return "historical";
        case DecisionSource::StaticAnalysis: return "static_analysis";
        case DecisionSource::NameHeuristic:  return "name_heuristic";
        case DecisionSource::Default:        return "default";
    }
    return "unknown";
}

/**
 * @brief Persisted per-type execution history.
 */
struct JobStatistics {
    uint64_t executions{0};
    double total_duration_s{0.0};
    uint64_t failures{0};
    int64_t last_updated{0};        ///< Unix seconds

    [[nodiscard]] double average_duration_s() const noexcept {
        return executions == 0 ? 0.0 : total_duration_s / static_cast<double>(executions);
    }
    [[nodiscard]] double failure_rate() const noexcept {
        return executions == 0 ? 0.0
                               : static_cast<double>(failures) / static_cast<double>(executions);
    }
};

/**
 * @brief Read-only view returned by JobAnalyzer::get_stats().
 */
struct JobStatsSnapshot {
    std::string job_type;
    uint64_t executions{0};
    double average_duration_s{0.0};
    double failure_rate{0.0};
    ExecutionTier recommended_tier{ExecutionTier::Pooled};
};

struct SourceScan {
    int score{0};
    std::vector<std::string> categories;
};

struct AnalysisDecision {
    ExecutionTier tier{ExecutionTier::Pooled};
    DecisionSource source{DecisionSource::Default};
    std::optional<SourceScan> scan;     ///< Set when static analysis decided
};

class JobAnalyzer {
public:
    JobAnalyzer(std::shared_ptr<IStatsStore> store, AnalyzerConfig config, Logger& logger);

    [[nodiscard]] ExecutionTier analyze(const Job& job);

    /// Same decision as analyze(), with the tier that produced it.
    [[nodiscard]] AnalysisDecision explain(const Job& job);

    void record_execution(std::string_view job_type, double duration_s, bool success);

    /// std::nullopt when nothing has been recorded for @p job_type.
    [[nodiscard]] std::optional<JobStatsSnapshot> get_stats(std::string_view job_type);

    void clear_stats(std::string_view job_type);

    /// Scan a source file (cached per path). std::nullopt if unreadable.
    [[nodiscard]] std::optional<SourceScan> scan_source(const std::filesystem::path& path);

    [[nodiscard]] static SourceScan scan_text(std::string_view source);
    [[nodiscard]] static std::optional<ExecutionTier> classify_by_name(std::string_view type_name);
    [[nodiscard]] static ExecutionTier classify_score(int score) noexcept;
    [[nodiscard]] ExecutionTier classify_duration(double seconds) const noexcept;

    [[nodiscard]] static std::string stats_key(std::string_view job_type);
    [[nodiscard]] const AnalyzerConfig& config() const noexcept { return config_; }

private:
    std::optional<JobStatistics> load_stats(std::string_view job_type);
    std::optional<ExecutionTier> historical_tier(const std::optional<JobStatistics>& stats) const;

    std::shared_ptr<IStatsStore> store_;
    AnalyzerConfig config_;
    Logger& logger_;

    std::mutex scan_mutex_;
    std::unordered_map<std::string, SourceScan> scan_cache_;
};

}  // namespace jobtier
