/**
 * @file isolated_strategy.cpp
 * @brief IsolatedStrategy — bundle, spawn, watch, kill on timeout, clean up.
 */

#include "execution/isolated_strategy.hpp"

#include "core/sanitize.hpp"
#include "job/isolated_host.hpp"
#include "job/job_bundle.hpp"

#include <algorithm>
#include <cerrno>
#include <csignal>
#include <cstring>
#include <fcntl.h>
#include <sys/stat.h>
#include <unistd.h>
#include <vector>

namespace jobtier {

namespace {

constexpr std::chrono::milliseconds kReapPollInterval{20};

bool is_within(const std::filesystem::path& candidate, std::filesystem::path base) {
    if (!base.has_filename() && base.has_parent_path() && base != base.root_path()) {
        base = base.parent_path();
    }
    auto [base_it, cand_it] =
        std::mismatch(base.begin(), base.end(), candidate.begin(), candidate.end());
    return base_it == base.end();
}

}  // anonymous namespace

IsolatedStrategy::IsolatedStrategy(EventLoop& loop, const LimitsConfig& limits,
                                   const IsolatedConfig& config, Logger& logger,
                                   bool isolated_by_default)
    : loop_(loop),
      limits_(limits),
      config_(config),
      logger_(logger),
      isolated_by_default_(isolated_by_default) {}

IsolatedStrategy::~IsolatedStrategy() {
    auto remaining = std::move(active_);
    active_.clear();
    for (auto& [id, exec] : remaining) {
        exec->settled = true;
        release_resources(*exec);
    }
}

bool IsolatedStrategy::can_handle(const Job& job) const {
    auto requested = job.isolation();
    if (requested.has_value()) return *requested;
    return isolated_by_default_;
}

// ─────────────────────────────────────────────
// Validation
// ─────────────────────────────────────────────

Result<void> IsolatedStrategy::check_source_allowed(const Job& job) const {
    if (limits_.allowed_job_paths.empty()) return Result<void>{};

    auto source = job.source_path();
    if (!source) {
        return Error{ErrorCode::Security,
                     "Job source location is unknown; isolated execution is restricted to "
                     "allowed paths"};
    }

    std::error_code ec;
    auto resolved = std::filesystem::weakly_canonical(*source, ec);
    if (ec) {
        return Error{ErrorCode::Security, "Job source location cannot be resolved"};
    }

    for (const auto& allowed : limits_.allowed_job_paths) {
        std::error_code allowed_ec;
        auto base = std::filesystem::weakly_canonical(allowed, allowed_ec);
        if (allowed_ec) continue;
        if (is_within(resolved, base)) return Result<void>{};
    }
    return Error{ErrorCode::Security, "Job source is outside the allowed job paths"};
}

// ─────────────────────────────────────────────
// Dispatch
// ─────────────────────────────────────────────

Result<std::filesystem::path> IsolatedStrategy::write_artifact(const std::string& contents) const {
    std::filesystem::path dir = config_.temp_dir;
    if (dir.empty()) {
        std::error_code ec;
        dir = std::filesystem::temp_directory_path(ec);
        if (ec) return Error{ErrorCode::Io, "No temporary directory available"};
    }

    std::string pattern = (dir / "jobtier_job_XXXXXX").string();
    std::vector<char> name(pattern.begin(), pattern.end());
    name.push_back('\0');

    int fd = ::mkostemp(name.data(), O_CLOEXEC);
    if (fd < 0) {
        return Error{ErrorCode::Io,
                     std::string{"Cannot create job bundle: "} + std::strerror(errno)};
    }
    std::filesystem::path path{name.data()};

    auto fail = [&](const char* what) -> Result<std::filesystem::path> {
        int saved = errno;
        ::close(fd);
        std::error_code ec;
        std::filesystem::remove(path, ec);
        return Error{ErrorCode::Io, std::string{what} + ": " + std::strerror(saved)};
    };

    if (::fchmod(fd, S_IRUSR | S_IWUSR) != 0) return fail("Cannot restrict job bundle");

    size_t written = 0;
    while (written < contents.size()) {
        ssize_t n = ::write(fd, contents.data() + written, contents.size() - written);
        if (n < 0) {
            if (errno == EINTR) continue;
            return fail("Cannot write job bundle");
        }
        written += static_cast<size_t>(n);
    }
    if (::close(fd) != 0) {
        std::error_code ec;
        std::filesystem::remove(path, ec);
        return Error{ErrorCode::Io, "Cannot close job bundle"};
    }
    return path;
}

Result<void> IsolatedStrategy::execute(std::shared_ptr<Job> job, CompletionHandler on_settled) {
    if (!job) {
        return Error{ErrorCode::Validation, "No job given"};
    }
    if (active_.contains(job->id())) {
        return Error{ErrorCode::Validation,
                     "Job " + sanitize_job_id(job->id()) + " is already running"};
    }

    auto exec = std::make_shared<Execution>();
    exec->job = job;
    exec->on_settled = std::move(on_settled);
    exec->started = std::chrono::steady_clock::now();

    // Validating: never trust the caller's checks alone
    exec->state = JobState::Validating;
    if (auto valid = validate_job(*job, limits_); !valid) return valid;
    if (auto allowed = check_source_allowed(*job); !allowed) return allowed;

    auto bundle = make_bundle(*job);
    if (!bundle) return bundle.error();
    auto encoded = encode_bundle(*bundle);
    if (!encoded) return encoded.error();

    exec->enforced_timeout_s = std::min(job->timeout_seconds(), limits_.max_timeout_s);
    active_.emplace(job->id(), exec);

    // Spawning: failures from here on are delivered asynchronously
    exec->state = JobState::Spawning;
    auto artifact = write_artifact(*encoded);
    if (!artifact) {
        settle(exec, JobState::Failed,
               Error{ErrorCode::ExecutionFailure,
                     "Failed to prepare isolated job: "
                         + sanitize_error_message(artifact.error().message)});
        return Result<void>{};
    }
    exec->artifact = *artifact;

    SpawnSpec spec{config_.host_executable,
                   {std::string{kRunBundleFlag}, exec->artifact.string()}};
    auto child = ChildProcess::spawn(spec);
    if (!child) {
        settle(exec, JobState::Failed,
               Error{ErrorCode::ExecutionFailure,
                     "Failed to start isolated job: "
                         + sanitize_error_message(child.error().message)});
        return Result<void>{};
    }
    exec->child = std::move(child).value();

    // Running
    exec->state = JobState::Running;
    watch_child(exec);
    exec->timeout_timer = loop_.add_timer(
        std::chrono::seconds(exec->enforced_timeout_s), [this, exec] { on_timeout(exec); });

    logger_.debug("Spawned isolated job " + sanitize_job_id(job->id()) + " (pid "
                  + std::to_string(exec->child->pid()) + ", timeout "
                  + std::to_string(exec->enforced_timeout_s) + "s)");
    return Result<void>{};
}

void IsolatedStrategy::watch_child(const std::shared_ptr<Execution>& exec) {
    int out = exec->child->stdout_fd();
    int err = exec->child->stderr_fd();
    loop_.watch_readable(out, [this, exec, out] { on_output(exec, out); });
    loop_.watch_readable(err, [this, exec, err] { on_output(exec, err); });

    if (int exit_fd = exec->child->exit_fd(); exit_fd >= 0) {
        loop_.watch_readable(exit_fd, [this, exec] { on_exit_ready(exec); });
    } else {
        exec->reap_timer =
            loop_.add_periodic_timer(kReapPollInterval, [this, exec] { on_exit_ready(exec); });
    }
}

// ─────────────────────────────────────────────
// Child events
// ─────────────────────────────────────────────

void IsolatedStrategy::on_output(const std::shared_ptr<Execution>& exec, int fd) {
    if (exec->settled || !exec->child) return;

    bool is_stderr = fd == exec->child->stderr_fd();
    bool is_stdout = fd == exec->child->stdout_fd();
    if (!is_stderr && !is_stdout) return;

    // Child stdout is drained and discarded
    std::string discard;
    bool open = is_stderr
        ? exec->child->read_available(fd, exec->stderr_text, config_.stderr_limit_bytes)
        : exec->child->read_available(fd, discard, 0);
    if (!open) {
        loop_.unwatch(fd);
        if (is_stderr) exec->child->close_stderr();
        else exec->child->close_stdout();
    }
}

void IsolatedStrategy::on_exit_ready(const std::shared_ptr<Execution>& exec) {
    if (exec->settled || !exec->child) return;

    auto status = exec->child->try_reap();
    if (!status) return;

    if (int err = exec->child->stderr_fd(); err >= 0) {
        exec->child->read_available(err, exec->stderr_text, config_.stderr_limit_bytes);
    }

    if (exec->killed_for_timeout) {
        settle(exec, JobState::TimedOut,
               Error{ErrorCode::TimeoutFailure,
                     "Job timed out and was terminated after "
                         + std::to_string(exec->enforced_timeout_s) + "s"});
        return;
    }
    if (status->success()) {
        settle(exec, JobState::Succeeded, std::nullopt);
        return;
    }

    std::string message;
    if (status->signal != 0) {
        message = "Job was terminated by signal " + std::to_string(status->signal);
    } else {
        message = "Job failed with exit code " + std::to_string(status->code);
    }
    auto detail = sanitize_error_message(exec->stderr_text);
    if (!detail.empty()) message += ": " + detail;
    settle(exec, JobState::Failed,
           Error{ErrorCode::ExecutionFailure, sanitize_error_message(message)});
}

void IsolatedStrategy::on_timeout(const std::shared_ptr<Execution>& exec) {
    exec->timeout_timer = kInvalidTimer;
    if (exec->settled || !exec->child || exec->child->reaped()) return;

    exec->killed_for_timeout = true;
    logger_.warn("Isolated job " + sanitize_job_id(exec->job->id()) + " exceeded "
                 + std::to_string(exec->enforced_timeout_s) + "s; killing process group");
    if (auto killed = exec->child->kill_group(SIGKILL); !killed) {
        logger_.error("Failed to kill isolated job " + sanitize_job_id(exec->job->id()) + ": "
                      + sanitize_error_message(killed.error().message));
    }
    // Exit is reported through the pidfd / reap timer
}

void IsolatedStrategy::terminate_all(std::string_view reason) {
    std::vector<std::shared_ptr<Execution>> running;
    running.reserve(active_.size());
    for (auto& [id, exec] : active_) running.push_back(exec);

    for (auto& exec : running) {
        if (exec->settled) continue;
        if (exec->child) {
            if (auto killed = exec->child->kill_group(SIGKILL); !killed) {
                logger_.error("Failed to kill isolated job " + sanitize_job_id(exec->job->id()));
            }
        }
        settle(exec, JobState::Failed,
               Error{ErrorCode::ExecutionFailure,
                     "Job terminated: " + sanitize_error_message(reason)});
    }
}

// ─────────────────────────────────────────────
// Settlement
// ─────────────────────────────────────────────

void IsolatedStrategy::settle(const std::shared_ptr<Execution>& exec, JobState state,
                              std::optional<Error> error) {
    if (exec->settled) return;
    exec->settled = true;
    exec->state = state;

    release_resources(*exec);
    active_.erase(exec->job->id());

    if (!exec->on_settled) return;

    JobOutcome outcome;
    outcome.job_id = exec->job->id();
    outcome.job_type = std::string{exec->job->type_name()};
    outcome.strategy = std::string{name()};
    outcome.state = state;
    outcome.duration = std::chrono::duration_cast<Duration>(
        std::chrono::steady_clock::now() - exec->started);
    outcome.error = std::move(error);

    auto handler = std::move(exec->on_settled);
    handler(std::move(outcome));
}

void IsolatedStrategy::release_resources(Execution& exec) {
    if (exec.timeout_timer != kInvalidTimer) {
        loop_.cancel_timer(exec.timeout_timer);
        exec.timeout_timer = kInvalidTimer;
    }
    if (exec.reap_timer != kInvalidTimer) {
        loop_.cancel_timer(exec.reap_timer);
        exec.reap_timer = kInvalidTimer;
    }
    if (exec.child) {
        for (int fd : {exec.child->stdout_fd(), exec.child->stderr_fd(), exec.child->exit_fd()}) {
            if (fd >= 0) loop_.unwatch(fd);
        }
        exec.child.reset();
    }
    if (!exec.artifact.empty()) {
        std::error_code ec;
        std::filesystem::remove(exec.artifact, ec);
        if (ec) {
            logger_.warn("Could not remove isolated job bundle for "
                         + sanitize_job_id(exec.job->id()));
        }
        exec.artifact.clear();
    }
}

std::optional<JobState> IsolatedStrategy::state_of(const JobId& id) const {
    auto it = active_.find(id);
    if (it == active_.end()) return std::nullopt;
    return it->second->state;
}

std::optional<std::filesystem::path> IsolatedStrategy::artifact_of(const JobId& id) const {
    auto it = active_.find(id);
    if (it == active_.end() || it->second->artifact.empty()) return std::nullopt;
    return it->second->artifact;
}

}  // namespace jobtier
