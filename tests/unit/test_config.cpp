/**
 * @file test_config.cpp
 * @brief Unit tests for configuration loading and validation.
 */

#include "core/config.hpp"

#include <gtest/gtest.h>
#include <filesystem>
#include <fstream>

using namespace jobtier;

class ConfigTest : public ::testing::Test {
protected:
    std::filesystem::path temp_dir_;

    void SetUp() override {
        temp_dir_ = std::filesystem::temp_directory_path() / "jobtier_test_config";
        std::filesystem::create_directories(temp_dir_);
    }

    void TearDown() override {
        std::filesystem::remove_all(temp_dir_);
    }

    std::filesystem::path write_toml(const std::string& content) {
        auto path = temp_dir_ / "test.toml";
        std::ofstream ofs(path);
        ofs << content;
        return path;
    }
};

TEST_F(ConfigTest, DefaultConfig) {
    auto config = default_config();
    EXPECT_EQ(config.limits.max_timeout_s, 300u);
    EXPECT_EQ(config.limits.max_memory_mb, 512u);
    EXPECT_EQ(config.limits.max_concurrent_jobs, 100u);
    EXPECT_EQ(config.limits.max_jobs_per_minute, 1000u);
    EXPECT_TRUE(config.limits.allowed_job_paths.empty());
    EXPECT_FALSE(config.limits.strict_mode);
    EXPECT_DOUBLE_EQ(config.analyzer.inline_threshold_s, 1.0);
    EXPECT_DOUBLE_EQ(config.analyzer.pooled_threshold_s, 30.0);
    EXPECT_EQ(config.analyzer.min_samples, 3u);
    EXPECT_TRUE(config.analyzer.smart_selection);
    EXPECT_EQ(config.runtime.initial_concurrency, 10u);
    EXPECT_EQ(config.runtime.min_concurrency, 3u);
    EXPECT_EQ(config.runtime.max_concurrency, 20u);
    EXPECT_FALSE(config.jobs.isolated_by_default);
    EXPECT_TRUE(validate_config(config).has_value());
}

TEST_F(ConfigTest, LoadFullConfig) {
    auto path = write_toml(R"(
        [limits]
        max_timeout_s = 120
        max_memory_mb = 256
        max_concurrent_jobs = 40
        max_jobs_per_minute = 600
        allowed_job_paths = ["/opt/jobs", "/srv/app/jobs"]
        strict_mode = true

        [analyzer]
        inline_threshold_s = 0.5
        pooled_threshold_s = 10.0
        stats_ttl_s = 3600
        min_samples = 5
        smart_selection = false

        [runtime]
        memory_limit_mb = 1024
        initial_concurrency = 8
        min_concurrency = 2
        max_concurrency = 16
        health_check_interval_ms = 1000
        drain_timeout_ms = 5000
        max_cpu_load = 0.9
        shrink_factor = 0.5
        grow_step = 2

        [jobs]
        isolated_by_default = true

        [isolated]
        host_executable = "/usr/local/bin/jobtier"
        temp_dir = "/var/tmp/jobtier"
        stderr_limit_bytes = 4096

        [worker]
        poll_interval_ms = 250
        max_jobs = 500
        max_time_s = 3600
        backoff_ms = 2000

        [telemetry]
        log_dir = "/tmp/jobtier_logs"
        log_level = "debug"
        rotate_count = 3
    )");

    auto result = load_config(path);
    ASSERT_TRUE(result.has_value()) << result.error().message;

    auto& config = *result;
    EXPECT_EQ(config.limits.max_timeout_s, 120u);
    EXPECT_EQ(config.limits.max_memory_mb, 256u);
    EXPECT_EQ(config.limits.max_concurrent_jobs, 40u);
    EXPECT_EQ(config.limits.max_jobs_per_minute, 600u);
    ASSERT_EQ(config.limits.allowed_job_paths.size(), 2u);
    EXPECT_EQ(config.limits.allowed_job_paths[1], std::filesystem::path{"/srv/app/jobs"});
    EXPECT_TRUE(config.limits.strict_mode);

    EXPECT_DOUBLE_EQ(config.analyzer.inline_threshold_s, 0.5);
    EXPECT_DOUBLE_EQ(config.analyzer.pooled_threshold_s, 10.0);
    EXPECT_EQ(config.analyzer.stats_ttl_s, 3600u);
    EXPECT_EQ(config.analyzer.min_samples, 5u);
    EXPECT_FALSE(config.analyzer.smart_selection);

    EXPECT_EQ(config.runtime.memory_limit_mb, 1024u);
    EXPECT_EQ(config.runtime.initial_concurrency, 8u);
    EXPECT_EQ(config.runtime.min_concurrency, 2u);
    EXPECT_EQ(config.runtime.max_concurrency, 16u);
    EXPECT_EQ(config.runtime.health_check_interval_ms, 1000u);
    EXPECT_EQ(config.runtime.drain_timeout_ms, 5000u);
    EXPECT_DOUBLE_EQ(config.runtime.max_cpu_load, 0.9);
    EXPECT_DOUBLE_EQ(config.runtime.shrink_factor, 0.5);
    EXPECT_EQ(config.runtime.grow_step, 2u);

    EXPECT_TRUE(config.jobs.isolated_by_default);
    EXPECT_EQ(config.isolated.host_executable, std::filesystem::path{"/usr/local/bin/jobtier"});
    EXPECT_EQ(config.isolated.temp_dir, std::filesystem::path{"/var/tmp/jobtier"});
    EXPECT_EQ(config.isolated.stderr_limit_bytes, 4096u);

    EXPECT_EQ(config.worker.poll_interval_ms, 250u);
    EXPECT_EQ(config.worker.max_jobs, 500u);
    EXPECT_EQ(config.worker.max_time_s, 3600u);
    EXPECT_EQ(config.worker.backoff_ms, 2000u);

    EXPECT_EQ(config.telemetry.log_dir, std::filesystem::path{"/tmp/jobtier_logs"});
    EXPECT_EQ(config.telemetry.log_level, "debug");
    EXPECT_EQ(config.telemetry.rotate_count, 3u);

    EXPECT_TRUE(validate_config(config).has_value());
}

TEST_F(ConfigTest, PartialConfig) {
    auto path = write_toml(R"(
        [limits]
        max_timeout_s = 60
    )");

    auto result = load_config(path);
    ASSERT_TRUE(result.has_value());

    // Overridden field
    EXPECT_EQ(result->limits.max_timeout_s, 60u);
    // Defaults for everything else
    EXPECT_EQ(result->limits.max_memory_mb, 512u);
    EXPECT_EQ(result->runtime.initial_concurrency, 10u);
    EXPECT_EQ(result->isolated.host_executable, std::filesystem::path{"/proc/self/exe"});
}

TEST_F(ConfigTest, NonexistentFile) {
    auto result = load_config("/nonexistent/path/config.toml");
    ASSERT_FALSE(result.has_value());
    EXPECT_TRUE(result.error().is(ErrorCode::Config));
}

TEST_F(ConfigTest, MalformedToml) {
    auto path = write_toml("this is [[ not valid toml }}}}");
    auto result = load_config(path);
    ASSERT_FALSE(result.has_value());
    EXPECT_TRUE(result.error().is(ErrorCode::Config));
}

TEST_F(ConfigTest, StrictModeRequiresAllowedPaths) {
    auto config = default_config();
    config.limits.strict_mode = true;

    auto result = validate_config(config);
    ASSERT_FALSE(result.has_value());
    EXPECT_TRUE(result.error().is(ErrorCode::Config));
    EXPECT_NE(result.error().message.find("allowed_job_paths"), std::string::npos);

    config.limits.allowed_job_paths.emplace_back("/opt/jobs");
    EXPECT_TRUE(validate_config(config).has_value());
}

TEST_F(ConfigTest, ValidationNamesEveryViolation) {
    auto config = default_config();
    config.runtime.min_concurrency = 30;        // above max_concurrency
    config.runtime.shrink_factor = 1.5;

    auto result = validate_config(config);
    ASSERT_FALSE(result.has_value());
    const auto& msg = result.error().message;
    EXPECT_EQ(msg.rfind("Invalid configuration: ", 0), 0u);
    EXPECT_NE(msg.find("min_concurrency must not exceed"), std::string::npos);
    EXPECT_NE(msg.find("initial_concurrency"), std::string::npos);
    EXPECT_NE(msg.find("shrink_factor"), std::string::npos);
}

TEST_F(ConfigTest, ThresholdOrdering) {
    auto config = default_config();
    config.analyzer.inline_threshold_s = 40.0;
    auto result = validate_config(config);
    ASSERT_FALSE(result.has_value());
    EXPECT_NE(result.error().message.find("inline_threshold_s must not exceed"),
              std::string::npos);
}

TEST_F(ConfigTest, Presets) {
    auto production = production_config();
    EXPECT_TRUE(production.limits.strict_mode);
    EXPECT_EQ(production.limits.max_memory_mb, 256u);
    // Production needs its allow-list filled in before it validates
    EXPECT_FALSE(validate_config(production).has_value());

    auto development = development_config();
    EXPECT_FALSE(development.limits.strict_mode);
    EXPECT_EQ(development.limits.max_timeout_s, 600u);
    EXPECT_EQ(development.telemetry.log_level, "debug");
    EXPECT_TRUE(validate_config(development).has_value());
}

TEST_F(ConfigTest, ShippedDefaultFileMatchesDefaults) {
    auto path = std::filesystem::path{__FILE__}.parent_path().parent_path().parent_path()
              / "config" / "default.toml";
    if (!std::filesystem::exists(path)) GTEST_SKIP() << "config/default.toml not found";

    auto result = load_config(path);
    ASSERT_TRUE(result.has_value()) << result.error().message;
    auto defaults = default_config();
    EXPECT_EQ(result->limits.max_timeout_s, defaults.limits.max_timeout_s);
    EXPECT_EQ(result->runtime.drain_timeout_ms, defaults.runtime.drain_timeout_ms);
    EXPECT_EQ(result->worker.backoff_ms, defaults.worker.backoff_ms);
    EXPECT_TRUE(validate_config(*result).has_value());
}
