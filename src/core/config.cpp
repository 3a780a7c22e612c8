/**
 * @file config.cpp
 * @brief Configuration loading from TOML files using toml++.
 */

#include "core/config.hpp"

#include <toml++/toml.hpp>

namespace jobtier {

namespace {

uint32_t read_u32(const toml::node_view<toml::node>& table, std::string_view key,
                  uint32_t fallback) {
    return static_cast<uint32_t>(table[key].value_or(static_cast<int64_t>(fallback)));
}

}  // anonymous namespace

Result<Config> load_config(const std::filesystem::path& path) {
    if (!std::filesystem::exists(path)) {
        return Error{ErrorCode::Config, "Configuration file not found: " + path.string()};
    }

    try {
        auto tbl = toml::parse_file(path.string());
        Config config;

        // [limits]
        if (auto limits = tbl["limits"]; limits.is_table()) {
            auto& l = config.limits;
            l.max_timeout_s = read_u32(limits, "max_timeout_s", l.max_timeout_s);
            l.max_memory_mb = read_u32(limits, "max_memory_mb", l.max_memory_mb);
            l.max_concurrent_jobs = read_u32(limits, "max_concurrent_jobs", l.max_concurrent_jobs);
            l.max_jobs_per_minute = read_u32(limits, "max_jobs_per_minute", l.max_jobs_per_minute);
            l.strict_mode = limits["strict_mode"].value_or(l.strict_mode);

            if (auto paths = limits["allowed_job_paths"].as_array()) {
                for (const auto& entry : *paths) {
                    if (auto p = entry.value<std::string>()) {
                        l.allowed_job_paths.emplace_back(*p);
                    }
                }
            }
        }

        // [analyzer]
        if (auto analyzer = tbl["analyzer"]; analyzer.is_table()) {
            auto& a = config.analyzer;
            a.inline_threshold_s = analyzer["inline_threshold_s"].value_or(a.inline_threshold_s);
            a.pooled_threshold_s = analyzer["pooled_threshold_s"].value_or(a.pooled_threshold_s);
            a.stats_ttl_s = read_u32(analyzer, "stats_ttl_s", a.stats_ttl_s);
            a.min_samples = read_u32(analyzer, "min_samples", a.min_samples);
            a.smart_selection = analyzer["smart_selection"].value_or(a.smart_selection);
        }

        // [runtime]
        if (auto runtime = tbl["runtime"]; runtime.is_table()) {
            auto& r = config.runtime;
            r.memory_limit_mb = read_u32(runtime, "memory_limit_mb", r.memory_limit_mb);
            r.initial_concurrency = read_u32(runtime, "initial_concurrency", r.initial_concurrency);
            r.min_concurrency = read_u32(runtime, "min_concurrency", r.min_concurrency);
            r.max_concurrency = read_u32(runtime, "max_concurrency", r.max_concurrency);
            r.memory_check_interval_ms =
                read_u32(runtime, "memory_check_interval_ms", r.memory_check_interval_ms);
            r.health_check_interval_ms =
                read_u32(runtime, "health_check_interval_ms", r.health_check_interval_ms);
            r.status_interval_ms = read_u32(runtime, "status_interval_ms", r.status_interval_ms);
            r.drain_timeout_ms = read_u32(runtime, "drain_timeout_ms", r.drain_timeout_ms);
            r.max_cpu_load = runtime["max_cpu_load"].value_or(r.max_cpu_load);
            r.max_memory_fraction = runtime["max_memory_fraction"].value_or(r.max_memory_fraction);
            r.shrink_factor = runtime["shrink_factor"].value_or(r.shrink_factor);
            r.grow_step = read_u32(runtime, "grow_step", r.grow_step);
        }

        // [jobs]
        if (auto jobs = tbl["jobs"]; jobs.is_table()) {
            config.jobs.isolated_by_default =
                jobs["isolated_by_default"].value_or(config.jobs.isolated_by_default);
        }

        // [isolated]
        if (auto isolated = tbl["isolated"]; isolated.is_table()) {
            auto& i = config.isolated;
            i.host_executable = isolated["host_executable"].value_or(i.host_executable.string());
            i.temp_dir = isolated["temp_dir"].value_or(std::string{});
            i.stderr_limit_bytes = read_u32(isolated, "stderr_limit_bytes", i.stderr_limit_bytes);
        }

        // [worker]
        if (auto worker = tbl["worker"]; worker.is_table()) {
            auto& w = config.worker;
            w.poll_interval_ms = read_u32(worker, "poll_interval_ms", w.poll_interval_ms);
            w.max_jobs = read_u32(worker, "max_jobs", w.max_jobs);
            w.max_time_s = read_u32(worker, "max_time_s", w.max_time_s);
            w.backoff_ms = read_u32(worker, "backoff_ms", w.backoff_ms);
        }

        // [telemetry]
        if (auto telemetry = tbl["telemetry"]; telemetry.is_table()) {
            auto& t = config.telemetry;
            t.log_dir = telemetry["log_dir"].value_or(std::string{"./logs"});
            t.max_file_size_mb = read_u32(telemetry, "max_file_size_mb", t.max_file_size_mb);
            t.rotate_count = read_u32(telemetry, "rotate_count", t.rotate_count);
            t.log_level = telemetry["log_level"].value_or(std::string{"info"});
        }

        return config;

    } catch (const toml::parse_error& err) {
        return Error{ErrorCode::Config,
                     std::string{"TOML parse error: "} + std::string{err.description()}};
    }
}

Config default_config() {
    return Config{};
}

Config production_config() {
    Config config;
    config.limits.max_timeout_s = 300;
    config.limits.max_memory_mb = 256;
    config.limits.max_concurrent_jobs = 50;
    config.limits.max_jobs_per_minute = 500;
    config.limits.strict_mode = true;
    // allowed_job_paths must still be filled in by the deployment
    return config;
}

Config development_config() {
    Config config;
    config.limits.max_timeout_s = 600;
    config.limits.max_memory_mb = 1024;
    config.limits.max_concurrent_jobs = 200;
    config.limits.max_jobs_per_minute = 5000;
    config.limits.strict_mode = false;
    config.telemetry.log_level = "debug";
    return config;
}

Result<void> validate_config(const Config& config) {
    std::string errors;
    auto add = [&errors](std::string_view msg) {
        if (!errors.empty()) errors += ", ";
        errors += msg;
    };

    const auto& l = config.limits;
    const auto& r = config.runtime;
    const auto& a = config.analyzer;

    if (l.max_timeout_s == 0) add("limits.max_timeout_s must be positive");
    if (l.max_memory_mb == 0) add("limits.max_memory_mb must be positive");
    if (l.max_concurrent_jobs == 0) add("limits.max_concurrent_jobs must be positive");
    if (l.max_jobs_per_minute == 0) add("limits.max_jobs_per_minute must be positive");
    if (l.strict_mode && l.allowed_job_paths.empty()) {
        add("strict mode requires limits.allowed_job_paths to be configured");
    }

    if (r.min_concurrency == 0) add("runtime.min_concurrency must be positive");
    if (r.min_concurrency > r.max_concurrency) {
        add("runtime.min_concurrency must not exceed runtime.max_concurrency");
    }
    if (r.initial_concurrency < r.min_concurrency || r.initial_concurrency > r.max_concurrency) {
        add("runtime.initial_concurrency must lie within [min_concurrency, max_concurrency]");
    }
    if (r.shrink_factor <= 0.0 || r.shrink_factor >= 1.0) {
        add("runtime.shrink_factor must lie within (0, 1)");
    }
    if (r.memory_limit_mb == 0) add("runtime.memory_limit_mb must be positive");

    if (a.inline_threshold_s < 0.0) add("analyzer.inline_threshold_s must not be negative");
    if (a.inline_threshold_s > a.pooled_threshold_s) {
        add("analyzer.inline_threshold_s must not exceed analyzer.pooled_threshold_s");
    }

    if (!errors.empty()) {
        return Error{ErrorCode::Config, "Invalid configuration: " + errors};
    }
    return Result<void>{};
}

}  // namespace jobtier
