/**
 * @file test_job.cpp
 * @brief Unit tests for Job identity, validation and the JobRegistry.
 */

#include "job/job.hpp"
#include "job/job_registry.hpp"
#include "support/test_jobs.hpp"

#include <gtest/gtest.h>
#include <algorithm>
#include <set>

using namespace jobtier;
using jobtier::test::FailJob;
using jobtier::test::SleepJob;
using jobtier::test::SucceedJob;

// ─── Identity ────────────────────────────────

TEST(JobIdTest, GeneratedIdsAreUniqueHex) {
    std::set<JobId> seen;
    for (int i = 0; i < 1000; ++i) {
        auto id = generate_job_id();
        EXPECT_EQ(id.size(), 18u);
        EXPECT_EQ(id.find_first_not_of("0123456789abcdef"), std::string::npos);
        seen.insert(id);
    }
    EXPECT_EQ(seen.size(), 1000u);
}

TEST(JobTest, DefaultOptions) {
    SucceedJob job;
    EXPECT_FALSE(job.id().empty());
    EXPECT_EQ(job.timeout_seconds(), 30u);
    EXPECT_EQ(job.max_memory_mb(), 64u);
    EXPECT_FALSE(job.isolation().has_value());
    EXPECT_EQ(job.priority(), 0);
    EXPECT_FALSE(job.estimated_duration_seconds().has_value());
    EXPECT_FALSE(job.source_path().has_value());
}

TEST(JobTest, ExplicitOptionsKept) {
    SucceedJob job({.id = "job-7", .timeout_s = 5, .max_memory_mb = 16, .isolated = true,
                    .priority = 3, .estimated_duration_s = 0.2});
    EXPECT_EQ(job.id(), "job-7");
    EXPECT_EQ(job.timeout_seconds(), 5u);
    EXPECT_EQ(job.max_memory_mb(), 16u);
    EXPECT_EQ(job.isolation(), std::optional<bool>{true});
    EXPECT_EQ(job.priority(), 3);
    EXPECT_DOUBLE_EQ(*job.estimated_duration_seconds(), 0.2);
}

TEST(JobTest, BaseLoadFieldsAcceptsOnlyEmptyObject) {
    SucceedJob job;
    EXPECT_TRUE(job.load_fields(nlohmann::json::object()).has_value());

    auto rejected = job.load_fields({{"unexpected", 1}});
    ASSERT_FALSE(rejected.has_value());
    EXPECT_TRUE(rejected.error().is(ErrorCode::Validation));
    EXPECT_EQ(rejected.error().message, "SucceedJob does not accept fields");
}

// ─── Validation ──────────────────────────────

TEST(ValidateJobTest, WithinLimits) {
    LimitsConfig limits;
    SucceedJob job({.timeout_s = 300, .max_memory_mb = 512, .priority = -100});
    EXPECT_TRUE(validate_job(job, limits).has_value());
}

TEST(ValidateJobTest, TimeoutAboveMaximum) {
    LimitsConfig limits;
    SucceedJob job({.timeout_s = 400});
    auto result = validate_job(job, limits);
    ASSERT_FALSE(result.has_value());
    EXPECT_TRUE(result.error().is(ErrorCode::Validation));
    EXPECT_EQ(result.error().message,
              "Job validation failed: timeout_s=400 outside allowed range [1, 300]");
}

TEST(ValidateJobTest, ZeroTimeoutRejected) {
    LimitsConfig limits;
    SucceedJob job({.timeout_s = 0});
    auto result = validate_job(job, limits);
    ASSERT_FALSE(result.has_value());
    EXPECT_NE(result.error().message.find("timeout_s=0"), std::string::npos);
}

TEST(ValidateJobTest, ReportsEveryViolation) {
    LimitsConfig limits;
    limits.max_memory_mb = 256;
    SucceedJob job({.timeout_s = 30, .max_memory_mb = 1024, .priority = 150});
    auto result = validate_job(job, limits);
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().message,
              "Job validation failed: max_memory_mb=1024 outside allowed range [1, 256]; "
              "priority=150 outside allowed range [-100, 100]");
}

// ─── Registry ────────────────────────────────

TEST(JobRegistryTest, CreateRegisteredType) {
    JobRegistry registry;
    ASSERT_TRUE(registry.add<SleepJob>("SleepJob").has_value());
    EXPECT_TRUE(registry.contains("SleepJob"));
    EXPECT_EQ(registry.size(), 1u);

    auto job = registry.create("SleepJob", {.id = "abc", .timeout_s = 9});
    ASSERT_TRUE(job.has_value());
    EXPECT_EQ((*job)->type_name(), "SleepJob");
    EXPECT_EQ((*job)->id(), "abc");
    EXPECT_EQ((*job)->timeout_seconds(), 9u);
}

TEST(JobRegistryTest, UnknownType) {
    JobRegistry registry;
    auto job = registry.create("Nope", {});
    ASSERT_FALSE(job.has_value());
    EXPECT_TRUE(job.error().is(ErrorCode::Validation));
    EXPECT_EQ(job.error().message, "Unknown job type 'Nope'");
}

TEST(JobRegistryTest, RejectsDuplicatesAndEmptyNames) {
    JobRegistry registry;
    ASSERT_TRUE(registry.add<FailJob>("FailJob").has_value());
    EXPECT_FALSE(registry.add<FailJob>("FailJob").has_value());
    EXPECT_FALSE(registry.add<FailJob>("").has_value());
    EXPECT_FALSE(registry.add("Empty", JobRegistry::Factory{}).has_value());
    EXPECT_EQ(registry.size(), 1u);
}

TEST(JobRegistryTest, TypeNamesSorted) {
    JobRegistry registry;
    jobtier::test::register_test_jobs(registry);
    auto names = registry.type_names();
    ASSERT_EQ(names.size(), 7u);
    EXPECT_TRUE(std::is_sorted(names.begin(), names.end()));
    EXPECT_EQ(names.front(), "AllocateJob");
}
