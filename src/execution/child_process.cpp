/**
 * @file child_process.cpp
 * @brief fork/exec with process-group isolation and pidfd exit notification.
 */

#include "execution/child_process.hpp"

#include <algorithm>
#include <cerrno>
#include <csignal>
#include <cstring>
#include <fcntl.h>
#include <sys/syscall.h>
#include <sys/wait.h>
#include <unistd.h>

namespace jobtier {

namespace {

void close_fd(int& fd) noexcept {
    if (fd >= 0) {
        ::close(fd);
        fd = -1;
    }
}

int open_pidfd(pid_t pid) noexcept {
#ifdef SYS_pidfd_open
    long fd = ::syscall(SYS_pidfd_open, pid, 0);
    return fd < 0 ? -1 : static_cast<int>(fd);
#else
    (void)pid;
    return -1;
#endif
}

Error errno_error(const char* what) {
    return Error{ErrorCode::Io, std::string{what} + ": " + std::strerror(errno)};
}

ExitStatus decode_wait_status(int status) {
    ExitStatus es;
    if (WIFEXITED(status)) {
        es.code = WEXITSTATUS(status);
    } else if (WIFSIGNALED(status)) {
        es.signal = WTERMSIG(status);
    }
    return es;
}

}  // anonymous namespace

Result<std::unique_ptr<ChildProcess>> ChildProcess::spawn(const SpawnSpec& spec) {
    // Everything the child needs is prepared before fork
    std::string exe = spec.executable.string();
    std::vector<std::string> storage;
    storage.reserve(spec.args.size() + 1);
    storage.push_back(exe);
    for (const auto& a : spec.args) storage.push_back(a);
    std::vector<char*> argv;
    argv.reserve(storage.size() + 1);
    for (auto& s : storage) argv.push_back(s.data());
    argv.push_back(nullptr);

    int devnull = ::open("/dev/null", O_RDONLY | O_CLOEXEC);
    if (devnull < 0) return errno_error("open /dev/null");

    int out[2]{-1, -1};
    int err[2]{-1, -1};
    if (::pipe2(out, O_CLOEXEC) != 0 || ::pipe2(err, O_CLOEXEC) != 0) {
        auto e = errno_error("pipe2");
        close_fd(devnull);
        close_fd(out[0]); close_fd(out[1]);
        close_fd(err[0]); close_fd(err[1]);
        return e;
    }

    pid_t pid = ::fork();
    if (pid < 0) {
        auto e = errno_error("fork");
        close_fd(devnull);
        close_fd(out[0]); close_fd(out[1]);
        close_fd(err[0]); close_fd(err[1]);
        return e;
    }

    if (pid == 0) {
        // Child: async-signal-safe calls only
        ::setpgid(0, 0);
        ::dup2(devnull, STDIN_FILENO);
        ::dup2(out[1], STDOUT_FILENO);
        ::dup2(err[1], STDERR_FILENO);

        sigset_t none;
        sigemptyset(&none);
        ::sigprocmask(SIG_SETMASK, &none, nullptr);
        ::signal(SIGPIPE, SIG_DFL);

        ::execv(argv[0], argv.data());

        static constexpr char kExecFailed[] = "exec failed\n";
        [[maybe_unused]] auto n = ::write(STDERR_FILENO, kExecFailed, sizeof(kExecFailed) - 1);
        ::_exit(127);
    }

    // Parent. Also set the group here so kill_group works before the child runs.
    ::setpgid(pid, pid);
    close_fd(devnull);
    close_fd(out[1]);
    close_fd(err[1]);
    ::fcntl(out[0], F_SETFL, ::fcntl(out[0], F_GETFL) | O_NONBLOCK);
    ::fcntl(err[0], F_SETFL, ::fcntl(err[0], F_GETFL) | O_NONBLOCK);

    return std::make_unique<ChildProcess>(SpawnedTag{}, pid, out[0], err[0], open_pidfd(pid));
}

ChildProcess::ChildProcess(SpawnedTag, pid_t pid, int stdout_fd, int stderr_fd, int pidfd)
    : pid_(pid), stdout_fd_(stdout_fd), stderr_fd_(stderr_fd), pidfd_(pidfd) {}

ChildProcess::~ChildProcess() {
    if (!status_) {
        // SIGKILL cannot be caught, so the wait below is bounded
        ::kill(-pid_, SIGKILL);
        ::kill(pid_, SIGKILL);
        int status = 0;
        while (::waitpid(pid_, &status, 0) < 0 && errno == EINTR) {
        }
    }
    close_fd(stdout_fd_);
    close_fd(stderr_fd_);
    close_fd(pidfd_);
}

Result<void> ChildProcess::kill_group(int signal) {
    if (status_) return Result<void>{};
    if (::kill(-pid_, signal) != 0) {
        // Group may not exist yet if setpgid lost the race; fall back to the pid
        if (errno != ESRCH || ::kill(pid_, signal) != 0) {
            if (errno == ESRCH) return Result<void>{};
            return errno_error("kill");
        }
    }
    return Result<void>{};
}

std::optional<ExitStatus> ChildProcess::try_reap() {
    if (status_) return status_;
    int status = 0;
    pid_t r;
    do {
        r = ::waitpid(pid_, &status, WNOHANG);
    } while (r < 0 && errno == EINTR);

    if (r == pid_) {
        status_ = decode_wait_status(status);
        // Take down anything the job left behind in its group
        ::kill(-pid_, SIGKILL);
    } else if (r < 0 && errno == ECHILD) {
        // Reaped elsewhere; nothing more can be learned
        status_ = ExitStatus{};
    }
    return status_;
}

bool ChildProcess::read_available(int fd, std::string& sink, size_t limit) {
    char buf[4096];
    for (;;) {
        ssize_t n = ::read(fd, buf, sizeof(buf));
        if (n > 0) {
            if (sink.size() < limit) {
                sink.append(buf, std::min(static_cast<size_t>(n), limit - sink.size()));
            }
            continue;
        }
        if (n == 0) return false;
        if (errno == EINTR) continue;
        return errno == EAGAIN || errno == EWOULDBLOCK;
    }
}

void ChildProcess::close_stdout() noexcept { close_fd(stdout_fd_); }
void ChildProcess::close_stderr() noexcept { close_fd(stderr_fd_); }

}  // namespace jobtier
