/**
 * @file child_process.hpp
 * @brief A forked child in its own process group with non-blocking pipes.
 *
 * Exit is observed through a pidfd when the kernel supports it; otherwise the
 * owner polls try_reap() from a timer. Nothing here blocks the caller except
 * the destructor of a child that was never reaped, which kills the group
 * first so the wait is bounded.
 */

#pragma once

#include "core/result.hpp"

#include <filesystem>
#include <memory>
#include <optional>
#include <string>
#include <sys/types.h>
#include <vector>

namespace jobtier {

struct SpawnSpec {
    std::filesystem::path executable;
    std::vector<std::string> args;      ///< argv[1..]
};

struct ExitStatus {
    int code{-1};       ///< Valid when signal == 0
    int signal{0};      ///< Terminating signal, 0 if exited normally

    [[nodiscard]] bool success() const noexcept { return signal == 0 && code == 0; }
};

class ChildProcess {
    struct SpawnedTag {
        explicit SpawnedTag() = default;
    };

public:
    static Result<std::unique_ptr<ChildProcess>> spawn(const SpawnSpec& spec);

    /// Only spawn() can supply the tag.
    ChildProcess(SpawnedTag, pid_t pid, int stdout_fd, int stderr_fd, int pidfd);
    ~ChildProcess();

    ChildProcess(const ChildProcess&) = delete;
    ChildProcess& operator=(const ChildProcess&) = delete;

    [[nodiscard]] pid_t pid() const noexcept { return pid_; }
    [[nodiscard]] int stdout_fd() const noexcept { return stdout_fd_; }
    [[nodiscard]] int stderr_fd() const noexcept { return stderr_fd_; }
    /// pidfd readable on exit; -1 if unsupported.
    [[nodiscard]] int exit_fd() const noexcept { return pidfd_; }

    [[nodiscard]] bool reaped() const noexcept { return status_.has_value(); }
    [[nodiscard]] const std::optional<ExitStatus>& exit_status() const noexcept { return status_; }

    /// Signal every process in the child's group.
    Result<void> kill_group(int signal);

    /// Non-blocking waitpid. Returns the status once the child has exited.
    std::optional<ExitStatus> try_reap();

    /// Read whatever is available without blocking. Returns false at EOF.
    bool read_available(int fd, std::string& sink, size_t limit);

    void close_stdout() noexcept;
    void close_stderr() noexcept;

private:
    pid_t pid_;
    int stdout_fd_;
    int stderr_fd_;
    int pidfd_;
    std::optional<ExitStatus> status_;
};

}  // namespace jobtier
