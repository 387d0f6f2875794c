#include <p4_mcp/core/subprocess.hpp>

#include <algorithm>
#include <cerrno>
#include <csignal>
#include <limits>
#include <optional>
#include <system_error>
#include <thread>

#include <fcntl.h>
#include <poll.h>
#include <sys/types.h>
#include <sys/wait.h>
#include <unistd.h>

namespace p4_mcp {

namespace {

using Clock = std::chrono::steady_clock;

void CloseFd(int& fd) {
    if (fd >= 0) {
        ::close(fd);
        fd = -1;
    }
}

bool SetCloexec(int fd) {
    int flags = ::fcntl(fd, F_GETFD);
    return flags >= 0 && ::fcntl(fd, F_SETFD, flags | FD_CLOEXEC) == 0;
}

std::string ErrnoMessage(int err) {
    return std::system_category().message(err);
}

int DecodeWaitStatus(int status) {
    if (WIFEXITED(status)) {
        return WEXITSTATUS(status);
    }
    if (WIFSIGNALED(status)) {
        return 128 + WTERMSIG(status);
    }
    return 1;
}

int WaitForChild(pid_t pid) {
    int status = 0;
    while (::waitpid(pid, &status, 0) < 0) {
        if (errno != EINTR) {
            return 1;
        }
    }
    return DecodeWaitStatus(status);
}

// Polls for the child's exit until `deadline`. Returns the exit code, or
// nullopt if the child is still running at the deadline.
std::optional<int> WaitForChildUntil(pid_t pid, Clock::time_point deadline) {
    constexpr auto kPollInterval = std::chrono::milliseconds(10);
    for (;;) {
        int status = 0;
        pid_t ret = ::waitpid(pid, &status, WNOHANG);
        if (ret == pid) {
            return DecodeWaitStatus(status);
        }
        if (ret < 0 && errno != EINTR) {
            return 1;
        }
        auto now = Clock::now();
        if (now >= deadline) {
            return std::nullopt;
        }
        std::this_thread::sleep_for(std::min<Clock::duration>(kPollInterval, deadline - now));
    }
}

// Milliseconds left until `deadline`, clamped to what poll() accepts.
int PollTimeoutMs(Clock::time_point deadline) {
    auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(
        deadline - Clock::now()).count();
    if (remaining <= 0) {
        return 0;
    }
    return static_cast<int>(std::min<long long>(
        remaining, std::numeric_limits<int>::max()));
}

// Reads the exec status pipe. Returns 0 if exec succeeded (pipe closed by
// FD_CLOEXEC), otherwise the errno the child reported.
int ReadExecStatus(int fd) {
    int child_errno = 0;
    for (;;) {
        auto n = ::read(fd, &child_errno, sizeof(child_errno));
        if (n < 0 && errno == EINTR) {
            continue;
        }
        if (n == static_cast<ssize_t>(sizeof(child_errno))) {
            return child_errno;
        }
        return 0;
    }
}

} // anonymous namespace

Result<SubprocessResult, std::string> RunSubprocess(
    const std::string& program,
    const std::vector<std::string>& args,
    std::chrono::milliseconds timeout) {
    using R = Result<SubprocessResult, std::string>;

    int stdout_pipe[2] = {-1, -1};
    int stderr_pipe[2] = {-1, -1};
    int exec_pipe[2] = {-1, -1};
    auto close_all = [&] {
        for (int* p : {stdout_pipe, stderr_pipe, exec_pipe}) {
            CloseFd(p[0]);
            CloseFd(p[1]);
        }
    };

    if (::pipe(stdout_pipe) != 0 || ::pipe(stderr_pipe) != 0 ||
        ::pipe(exec_pipe) != 0) {
        auto err = errno;
        close_all();
        return R::Err("pipe() failed: " + ErrnoMessage(err));
    }
    for (int fd : {stdout_pipe[0], stderr_pipe[0], exec_pipe[0], exec_pipe[1]}) {
        if (!SetCloexec(fd)) {
            auto err = errno;
            close_all();
            return R::Err("fcntl() failed: " + ErrnoMessage(err));
        }
    }

    // argv must be built before fork; the child only makes async-signal-safe
    // calls.
    std::vector<char*> argv;
    argv.reserve(args.size() + 2);
    argv.push_back(const_cast<char*>(program.c_str()));
    for (const auto& arg : args) {
        argv.push_back(const_cast<char*>(arg.c_str()));
    }
    argv.push_back(nullptr);

    pid_t pid = ::fork();
    if (pid < 0) {
        auto err = errno;
        close_all();
        return R::Err("fork() failed: " + ErrnoMessage(err));
    }

    if (pid == 0) {
        int devnull = ::open("/dev/null", O_RDONLY);
        if (devnull >= 0) {
            ::dup2(devnull, STDIN_FILENO);
            ::close(devnull);
        }
        ::dup2(stdout_pipe[1], STDOUT_FILENO);
        ::dup2(stderr_pipe[1], STDERR_FILENO);
        ::close(stdout_pipe[1]);
        ::close(stderr_pipe[1]);
        ::execvp(argv[0], argv.data());
        int err = errno;
        auto ignored = ::write(exec_pipe[1], &err, sizeof(err));
        (void)ignored;
        _exit(127);
    }

    CloseFd(stdout_pipe[1]);
    CloseFd(stderr_pipe[1]);
    CloseFd(exec_pipe[1]);

    int exec_errno = ReadExecStatus(exec_pipe[0]);
    CloseFd(exec_pipe[0]);
    if (exec_errno != 0) {
        close_all();
        WaitForChild(pid);
        return R::Err("cannot execute '" + program + "': " +
                      ErrnoMessage(exec_errno));
    }

    SubprocessResult result;
    pollfd fds[2]{};
    fds[0].fd = stdout_pipe[0];
    fds[0].events = POLLIN;
    fds[1].fd = stderr_pipe[0];
    fds[1].events = POLLIN;
    int fds_open = 2;

    const bool unlimited = timeout.count() <= 0;
    // Saturate instead of overflowing the clock for very large timeouts.
    const auto start = Clock::now();
    const auto max_wait = std::chrono::duration_cast<std::chrono::milliseconds>(
        Clock::time_point::max() - start);
    const auto deadline = start + std::min(timeout, max_wait);

    while (fds_open > 0) {
        int wait_ms = -1;
        if (!unlimited) {
            wait_ms = PollTimeoutMs(deadline);
            if (wait_ms == 0) {
                result.timed_out = true;
                break;
            }
        }

        int ret = ::poll(fds, 2, wait_ms);
        if (ret < 0) {
            if (errno == EINTR) {
                continue;
            }
            break;
        }
        if (ret == 0) {
            continue;  // the loop head decides whether the deadline passed
        }

        char chunk[4096];
        for (int i = 0; i < 2; ++i) {
            if (fds[i].fd < 0) {
                continue;
            }
            if ((fds[i].revents & (POLLIN | POLLHUP | POLLERR)) == 0) {
                continue;
            }
            auto n = ::read(fds[i].fd, chunk, sizeof(chunk));
            if (n > 0) {
                (i == 0 ? result.stdout_text : result.stderr_text)
                    .append(chunk, static_cast<size_t>(n));
            } else if (n == 0 || errno != EINTR) {
                CloseFd(fds[i].fd);
                --fds_open;
            }
        }
    }

    CloseFd(fds[0].fd);
    CloseFd(fds[1].fd);
    stdout_pipe[0] = -1;
    stderr_pipe[0] = -1;

    // The child may close its pipes and keep running; the deadline still
    // applies until it exits.
    if (!result.timed_out && !unlimited) {
        if (auto code = WaitForChildUntil(pid, deadline)) {
            result.exit_code = *code;
            return R::Ok(std::move(result));
        }
        result.timed_out = true;
    }

    if (result.timed_out) {
        ::kill(pid, SIGKILL);
    }
    result.exit_code = WaitForChild(pid);
    return R::Ok(std::move(result));
}

} // namespace p4_mcp
