/**
 * @file config.hpp
 * @brief Runtime configuration with TOML deserialization.
 *
 * The Config struct is a static snapshot: it is read once at startup and never
 * mutated while a Runtime is alive.
 */

#pragma once

#include <cstdint>
#include <filesystem>
#include <string>
#include <vector>

#include "core/result.hpp"

namespace jobtier {

/**
 * @brief Server-side security limits. Jobs cannot exceed these regardless of
 *        what they request.
 */
struct LimitsConfig {
    uint32_t max_timeout_s = 300;
    uint32_t max_memory_mb = 512;
    uint32_t max_concurrent_jobs = 100;
    uint32_t max_jobs_per_minute = 1000;
    std::vector<std::filesystem::path> allowed_job_paths;   ///< Empty = allow all
    bool strict_mode = false;                               ///< Requires allowed_job_paths
};

struct AnalyzerConfig {
    double inline_threshold_s = 1.0;
    double pooled_threshold_s = 30.0;
    uint32_t stats_ttl_s = 86400;
    uint32_t min_samples = 3;
    bool smart_selection = true;
};

struct RuntimeConfig {
    uint32_t memory_limit_mb = 512;
    uint32_t initial_concurrency = 10;
    uint32_t min_concurrency = 3;
    uint32_t max_concurrency = 20;
    uint32_t memory_check_interval_ms = 5000;
    uint32_t health_check_interval_ms = 30000;
    uint32_t status_interval_ms = 10000;
    uint32_t drain_timeout_ms = 30000;
    double max_cpu_load = 0.7;
    double max_memory_fraction = 0.75;
    double shrink_factor = 0.7;
    uint32_t grow_step = 1;
};

struct JobsConfig {
    bool isolated_by_default = false;
};

struct IsolatedConfig {
    std::filesystem::path host_executable = "/proc/self/exe";
    std::filesystem::path temp_dir;                 ///< Empty = system temp
    uint32_t stderr_limit_bytes = 8192;
};

struct WorkerConfig {
    uint32_t poll_interval_ms = 100;
    uint32_t max_jobs = 0;              ///< 0 = unlimited
    uint32_t max_time_s = 0;            ///< 0 = unlimited
    uint32_t backoff_ms = 1000;
};

struct TelemetryConfig {
    std::filesystem::path log_dir = "./logs";
    uint32_t max_file_size_mb = 50;
    uint32_t rotate_count = 5;
    std::string log_level = "info";
};

/**
 * @brief Top-level configuration.
 */
struct Config {
    LimitsConfig limits;
    AnalyzerConfig analyzer;
    RuntimeConfig runtime;
    JobsConfig jobs;
    IsolatedConfig isolated;
    WorkerConfig worker;
    TelemetryConfig telemetry;
};

/**
 * @brief Load configuration from a TOML file.
 */
Result<Config> load_config(const std::filesystem::path& path);

/**
 * @brief Create a default configuration.
 */
Config default_config();

/**
 * @brief Tighter limits suitable for production deployments.
 */
Config production_config();

/**
 * @brief Permissive limits for local development.
 */
Config development_config();

/**
 * @brief Check cross-field consistency; error names every violated rule.
 */
Result<void> validate_config(const Config& config);

}  // namespace jobtier
