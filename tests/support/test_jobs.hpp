/**
 * @file test_jobs.hpp
 * @brief Job types used across the test suite.
 *
 * The same types are registered in jobtier_test_host, so each can run
 * inline in the test process or be rebuilt inside an isolated child.
 */

#pragma once

#include "job/job.hpp"
#include "job/job_registry.hpp"

#include <nlohmann/json.hpp>

#include <filesystem>
#include <optional>
#include <string>

namespace jobtier::test {

/// Always succeeds.
class SucceedJob : public Job {
public:
    explicit SucceedJob(JobOptions options = {}) : Job(std::move(options)) {}
    [[nodiscard]] std::string_view type_name() const noexcept override { return "SucceedJob"; }
    Result<void> execute() override { return Result<void>{}; }
};

/// Fails with a message that carries an absolute path.
class FailJob : public Job {
public:
    static constexpr std::string_view kMessage =
        "Cannot open /var/lib/jobtier/secret.conf: permission denied";

    explicit FailJob(JobOptions options = {}) : Job(std::move(options)) {}
    [[nodiscard]] std::string_view type_name() const noexcept override { return "FailJob"; }
    Result<void> execute() override;
};

/// Throws std::runtime_error.
class ThrowJob : public Job {
public:
    explicit ThrowJob(JobOptions options = {}) : Job(std::move(options)) {}
    [[nodiscard]] std::string_view type_name() const noexcept override { return "ThrowJob"; }
    Result<void> execute() override;
};

/// Sleeps for `seconds`; writes its pid to `pid_file` first when set.
class SleepJob : public Job {
public:
    explicit SleepJob(JobOptions options = {}, double seconds = 0.0, std::string pid_file = {})
        : Job(std::move(options)), seconds_(seconds), pid_file_(std::move(pid_file)) {}

    [[nodiscard]] std::string_view type_name() const noexcept override { return "SleepJob"; }
    Result<void> execute() override;
    [[nodiscard]] nlohmann::json save_fields() const override;
    Result<void> load_fields(const nlohmann::json& fields) override;

private:
    double seconds_;
    std::string pid_file_;
};

/// Writes its identity, limits and `payload` as JSON to `output_path`.
class EchoFieldsJob : public Job {
public:
    explicit EchoFieldsJob(JobOptions options = {}, nlohmann::json payload = nullptr,
                           std::string output_path = {})
        : Job(std::move(options)), payload_(std::move(payload)),
          output_path_(std::move(output_path)) {}

    [[nodiscard]] std::string_view type_name() const noexcept override { return "EchoFieldsJob"; }
    Result<void> execute() override;
    [[nodiscard]] nlohmann::json save_fields() const override;
    Result<void> load_fields(const nlohmann::json& fields) override;

    [[nodiscard]] const nlohmann::json& payload() const noexcept { return payload_; }
    [[nodiscard]] const std::string& output_path() const noexcept { return output_path_; }

private:
    nlohmann::json payload_;
    std::string output_path_;
};

/// Allocates and touches `megabytes` of memory.
class AllocateJob : public Job {
public:
    explicit AllocateJob(JobOptions options = {}, uint32_t megabytes = 0)
        : Job(std::move(options)), megabytes_(megabytes) {}

    [[nodiscard]] std::string_view type_name() const noexcept override { return "AllocateJob"; }
    Result<void> execute() override;
    [[nodiscard]] nlohmann::json save_fields() const override;
    Result<void> load_fields(const nlohmann::json& fields) override;

private:
    uint32_t megabytes_;
};

/// Dies from SIGABRT.
class CrashJob : public Job {
public:
    explicit CrashJob(JobOptions options = {}) : Job(std::move(options)) {}
    [[nodiscard]] std::string_view type_name() const noexcept override { return "CrashJob"; }
    Result<void> execute() override;
};

/// Arbitrary type name and source file, for classification tests. Not registered.
class ProbeJob : public Job {
public:
    explicit ProbeJob(std::string type, JobOptions options = {},
                      std::optional<std::filesystem::path> source = std::nullopt)
        : Job(std::move(options)), type_(std::move(type)), source_(std::move(source)) {}

    [[nodiscard]] std::string_view type_name() const noexcept override { return type_; }
    [[nodiscard]] std::optional<std::filesystem::path> source_path() const override {
        return source_;
    }
    Result<void> execute() override { return Result<void>{}; }

private:
    std::string type_;
    std::optional<std::filesystem::path> source_;
};

/// Register every type above except ProbeJob.
void register_test_jobs(JobRegistry& registry);

}  // namespace jobtier::test
