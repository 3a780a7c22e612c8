/**
 * @file isolated_strategy.hpp
 * @brief Runs a job in a dedicated child process with enforced limits.
 *
 * Per execution:
 *   Pending → Validating → Spawning → Running → {Succeeded | Failed | TimedOut}
 *
 * The job's plain-data fields travel as a JSON bundle in an owner-only
 * temporary file. The child runs `host_executable --run-job-bundle <file>`
 * in its own process group; the whole group is SIGKILLed when the timeout
 * expires. Every terminal state releases the timer, the descriptors and the
 * temporary file exactly once.
 */

#pragma once

#include "core/config.hpp"
#include "core/event_loop.hpp"
#include "core/logger.hpp"
#include "execution/child_process.hpp"
#include "execution/strategy.hpp"

#include <filesystem>
#include <memory>
#include <optional>
#include <string>
#include <unordered_map>

namespace jobtier {

class IsolatedStrategy : public IExecutionStrategy {
public:
    IsolatedStrategy(EventLoop& loop, const LimitsConfig& limits, const IsolatedConfig& config,
                     Logger& logger, bool isolated_by_default = false);

    /// Kills remaining children without invoking their handlers.
    ~IsolatedStrategy() override;

    IsolatedStrategy(const IsolatedStrategy&) = delete;
    IsolatedStrategy& operator=(const IsolatedStrategy&) = delete;

    [[nodiscard]] bool can_handle(const Job& job) const override;

    Result<void> execute(std::shared_ptr<Job> job, CompletionHandler on_settled) override;

    [[nodiscard]] std::string_view name() const noexcept override { return "isolated"; }

    /// SIGKILL every running child and settle it as Failed.
    void terminate_all(std::string_view reason);

    /// SecurityError unless the job's source lies under an allowed prefix.
    [[nodiscard]] Result<void> check_source_allowed(const Job& job) const;

    [[nodiscard]] size_t active_count() const noexcept { return active_.size(); }
    [[nodiscard]] std::optional<JobState> state_of(const JobId& id) const;

    /// Artifact of a running job (tests check its permissions and removal).
    [[nodiscard]] std::optional<std::filesystem::path> artifact_of(const JobId& id) const;

private:
    struct Execution {
        std::shared_ptr<Job> job;
        CompletionHandler on_settled;
        JobState state{JobState::Pending};
        std::unique_ptr<ChildProcess> child;
        std::filesystem::path artifact;
        TimerId timeout_timer{kInvalidTimer};
        TimerId reap_timer{kInvalidTimer};
        std::string stderr_text;
        SteadyTime started;
        uint32_t enforced_timeout_s{0};
        bool killed_for_timeout{false};
        bool settled{false};
    };

    Result<std::filesystem::path> write_artifact(const std::string& contents) const;

    void watch_child(const std::shared_ptr<Execution>& exec);
    void on_output(const std::shared_ptr<Execution>& exec, int fd);
    void on_exit_ready(const std::shared_ptr<Execution>& exec);
    void on_timeout(const std::shared_ptr<Execution>& exec);

    void settle(const std::shared_ptr<Execution>& exec, JobState state, std::optional<Error> error);
    void release_resources(Execution& exec);

    EventLoop& loop_;
    const LimitsConfig& limits_;
    const IsolatedConfig& config_;
    Logger& logger_;
    bool isolated_by_default_;

    std::unordered_map<JobId, std::shared_ptr<Execution>> active_;
};

}  // namespace jobtier
