#include "process/subprocess_runner.hpp"

#include <cerrno>
#include <chrono>
#include <cstdint>
#include <cstring>
#include <fcntl.h>
#include <poll.h>
#include <signal.h>
#include <string>
#include <sys/wait.h>
#include <unistd.h>
#include <vector>
#include "core/logging/logger.hpp"

namespace mobilemcp::process {

using core::errors::ErrorCategory;
using core::errors::MobileError;

namespace {

constexpr int kExitCommandNotFound = 127;

void set_nonblocking(const int fd) {
    const int flags = fcntl(fd, F_GETFL, 0);
    if (flags == -1) {
        return;
    }
    static_cast<void>(fcntl(fd, F_SETFL, flags | O_NONBLOCK));
}

void drain_pipe(const int fd, bool& is_open, std::string& out) {
    if (!is_open) {
        return;
    }

    char buffer[4096];
    while (true) {
        const ssize_t n = read(fd, buffer, sizeof(buffer));
        if (n > 0) {
            out.append(buffer, static_cast<std::size_t>(n));
            continue;
        }
        if (n == 0) {
            is_open = false;
            static_cast<void>(close(fd));
            return;
        }
        if (errno == EAGAIN || errno == EWOULDBLOCK || errno == EINTR) {
            return;
        }
        is_open = false;
        static_cast<void>(close(fd));
        return;
    }
}

// Reads the errno the child reports when execvp fails. The write end is
// close-on-exec, so a successful exec yields EOF and returns 0.
int read_exec_errno(const int fd) {
    int child_errno = 0;
    while (true) {
        const ssize_t n = read(fd, &child_errno, sizeof(child_errno));
        if (n == static_cast<ssize_t>(sizeof(child_errno))) {
            return child_errno == 0 ? ENOENT : child_errno;
        }
        if (n < 0 && errno == EINTR) {
            continue;
        }
        return 0;
    }
}

void close_pair(int fds[2]) {
    if (fds[0] >= 0) {
        static_cast<void>(close(fds[0]));
    }
    if (fds[1] >= 0) {
        static_cast<void>(close(fds[1]));
    }
}

}  // namespace

std::string describe(const CommandSpec& spec) {
    std::string text;
    for (const auto& arg : spec.argv) {
        if (!text.empty()) {
            text.push_back(' ');
        }
        text += arg;
    }
    return text;
}

core::errors::Result<CommandOutput> SubprocessRunner::run(const CommandSpec& spec) const {
    if (spec.argv.empty() || spec.argv.front().empty()) {
        return MobileError{ErrorCategory::Internal, "Empty command line.", "empty_command"};
    }

    // argv for execvp must outlive the fork; build it before forking.
    std::vector<char*> exec_argv;
    exec_argv.reserve(spec.argv.size() + 1);
    for (const auto& arg : spec.argv) {
        exec_argv.push_back(const_cast<char*>(arg.c_str()));
    }
    exec_argv.push_back(nullptr);

    int stdout_pipe[2] = {-1, -1};
    int stderr_pipe[2] = {-1, -1};
    if (pipe(stdout_pipe) != 0) {
        return MobileError{ErrorCategory::Internal, "Failed to create process pipes.",
                           "pipe_creation_failed"};
    }
    if (pipe(stderr_pipe) != 0) {
        close_pair(stdout_pipe);
        return MobileError{ErrorCategory::Internal, "Failed to create process pipes.",
                           "pipe_creation_failed"};
    }
    int exec_pipe[2] = {-1, -1};
    if (pipe2(exec_pipe, O_CLOEXEC) != 0) {
        close_pair(stdout_pipe);
        close_pair(stderr_pipe);
        return MobileError{ErrorCategory::Internal, "Failed to create process pipes.",
                           "pipe_creation_failed"};
    }

    MOBILEMCP_LOG_DEBUG("exec: " + describe(spec));
    const auto started = std::chrono::steady_clock::now();
    const pid_t pid = fork();
    if (pid < 0) {
        close_pair(stdout_pipe);
        close_pair(stderr_pipe);
        close_pair(exec_pipe);
        return MobileError{ErrorCategory::Internal, "Failed to fork process.", "fork_failed"};
    }

    if (pid == 0) {
        const int devnull = open("/dev/null", O_RDONLY);
        if (devnull >= 0) {
            static_cast<void>(dup2(devnull, STDIN_FILENO));
            static_cast<void>(close(devnull));
        }
        static_cast<void>(dup2(stdout_pipe[1], STDOUT_FILENO));
        static_cast<void>(dup2(stderr_pipe[1], STDERR_FILENO));
        static_cast<void>(close(stdout_pipe[0]));
        static_cast<void>(close(stdout_pipe[1]));
        static_cast<void>(close(stderr_pipe[0]));
        static_cast<void>(close(stderr_pipe[1]));
        static_cast<void>(close(exec_pipe[0]));
        execvp(exec_argv[0], exec_argv.data());
        const int exec_errno = errno;
        static_cast<void>(write(exec_pipe[1], &exec_errno, sizeof(exec_errno)));
        _exit(kExitCommandNotFound);
    }

    static_cast<void>(close(stdout_pipe[1]));
    static_cast<void>(close(stderr_pipe[1]));
    static_cast<void>(close(exec_pipe[1]));
    stdout_pipe[1] = -1;
    stderr_pipe[1] = -1;

    // 1. Exec failure is reported through its own pipe, never inferred from the exit code
    const int exec_errno = read_exec_errno(exec_pipe[0]);
    static_cast<void>(close(exec_pipe[0]));
    if (exec_errno != 0) {
        close_pair(stdout_pipe);
        close_pair(stderr_pipe);
        int status = 0;
        static_cast<void>(waitpid(pid, &status, 0));
        CommandOutput failed;
        failed.exit_code = kExitCommandNotFound;
        failed.launch_failed = true;
        failed.stderr_text = spec.argv.front() + ": " + std::strerror(exec_errno);
        MOBILEMCP_LOG_DEBUG("exec failed: " + failed.stderr_text);
        return failed;
    }

    // 2. Collect output until the child exits and both pipes reach EOF, or the deadline passes
    set_nonblocking(stdout_pipe[0]);
    set_nonblocking(stderr_pipe[0]);

    CommandOutput capture;
    bool stdout_open = true;
    bool stderr_open = true;
    bool child_exited = false;
    int status = 0;

    while (stdout_open || stderr_open || !child_exited) {
        const auto now = std::chrono::steady_clock::now();
        const auto elapsed =
            std::chrono::duration_cast<std::chrono::milliseconds>(now - started).count();
        if (!capture.timed_out && spec.timeout_ms > 0 &&
            elapsed > static_cast<std::int64_t>(spec.timeout_ms)) {
            capture.timed_out = true;
            if (!child_exited) {
                static_cast<void>(kill(pid, SIGKILL));
            }
        }

        pollfd fds[2];
        nfds_t nfds = 0;
        if (stdout_open) {
            fds[nfds].fd = stdout_pipe[0];
            fds[nfds].events = POLLIN;
            ++nfds;
        }
        if (stderr_open) {
            fds[nfds].fd = stderr_pipe[0];
            fds[nfds].events = POLLIN;
            ++nfds;
        }

        if (nfds > 0) {
            static_cast<void>(poll(fds, nfds, 50));
        } else {
            // Pipes closed (or inherited by a grandchild that exited); only waitpid left.
            static_cast<void>(usleep(10000));
        }

        drain_pipe(stdout_pipe[0], stdout_open, capture.stdout_text);
        drain_pipe(stderr_pipe[0], stderr_open, capture.stderr_text);

        if (!child_exited) {
            const pid_t waited = waitpid(pid, &status, WNOHANG);
            if (waited == pid) {
                child_exited = true;
            }
        }

        // Descendants of the child may hold the pipes open past its exit.
        if (child_exited && capture.timed_out) {
            if (stdout_open) {
                static_cast<void>(close(stdout_pipe[0]));
                stdout_open = false;
            }
            if (stderr_open) {
                static_cast<void>(close(stderr_pipe[0]));
                stderr_open = false;
            }
        }

        if (child_exited && !stdout_open && !stderr_open) {
            break;
        }
    }

    if (!child_exited) {
        static_cast<void>(waitpid(pid, &status, 0));
    }

    if (WIFEXITED(status)) {
        capture.exit_code = WEXITSTATUS(status);
    } else if (WIFSIGNALED(status)) {
        capture.exit_code = 128 + WTERMSIG(status);
    } else {
        capture.exit_code = -1;
    }

    const auto ended = std::chrono::steady_clock::now();
    capture.duration_ms = std::chrono::duration<double, std::milli>(ended - started).count();
    MOBILEMCP_LOG_DEBUG("exit " + std::to_string(capture.exit_code) + " after " +
                        std::to_string(static_cast<long long>(capture.duration_ms)) + " ms");
    return capture;
}

}  // namespace mobilemcp::process
