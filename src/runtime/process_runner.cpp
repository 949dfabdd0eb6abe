#include "runtime/process_runner.hpp"

#include <cerrno>
#include <chrono>
#include <cstddef>
#include <fcntl.h>
#include <poll.h>
#include <signal.h>
#include <sys/wait.h>
#include <unistd.h>
#include <vector>

namespace vidmcp::runtime {

using core::errors::ErrorCategory;
using core::errors::ServerError;

namespace {

void set_nonblocking(const int fd) {
    const int flags = fcntl(fd, F_GETFL, 0);
    if (flags == -1) {
        return;
    }
    static_cast<void>(fcntl(fd, F_SETFL, flags | O_NONBLOCK));
}

void close_pair(int pipe_fds[2]) {
    if (pipe_fds[0] != -1) {
        static_cast<void>(close(pipe_fds[0]));
    }
    if (pipe_fds[1] != -1) {
        static_cast<void>(close(pipe_fds[1]));
    }
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
        if (errno == EINTR) {
            continue;
        }
        if (errno == EAGAIN || errno == EWOULDBLOCK) {
            return;
        }
        is_open = false;
        static_cast<void>(close(fd));
        return;
    }
}

// Hands every complete line after `consumed` to the callback.
void emit_lines(const std::string& text, std::size_t& consumed,
                const LineCallback& on_line) {
    while (true) {
        const std::size_t newline = text.find('\n', consumed);
        if (newline == std::string::npos) {
            return;
        }
        std::string line = text.substr(consumed, newline - consumed);
        if (!line.empty() && line.back() == '\r') {
            line.pop_back();
        }
        consumed = newline + 1;
        if (on_line) {
            on_line(line);
        }
    }
}

}  // namespace

core::errors::Result<ProcessCapture> run_process(const ProcessRequest& request,
                                                 const LineCallback& on_stdout_line,
                                                 const LineCallback& on_stderr_line) {
    if (request.argv.empty() || request.argv.front().empty()) {
        return ServerError{ErrorCategory::Input, "Process argv cannot be empty.",
                           "empty_command"};
    }

    if (request.cancel_token && request.cancel_token->load()) {
        ProcessCapture capture;
        capture.cancelled = true;
        capture.stderr_text = "Process cancelled before start.";
        return capture;
    }

    // Everything the child touches is prepared before fork.
    std::vector<char*> argv;
    argv.reserve(request.argv.size() + 1);
    for (const auto& arg : request.argv) {
        argv.push_back(const_cast<char*>(arg.c_str()));
    }
    argv.push_back(nullptr);
    const std::string cwd = request.working_directory.string();

    int stdout_pipe[2] = {-1, -1};
    int stderr_pipe[2] = {-1, -1};
    // Close-on-exec keeps concurrently spawned children from inheriting each
    // other's pipe ends; dup2 clears the flag on the child's own 1 and 2.
    if (pipe2(stdout_pipe, O_CLOEXEC) != 0 || pipe2(stderr_pipe, O_CLOEXEC) != 0) {
        close_pair(stdout_pipe);
        close_pair(stderr_pipe);
        return ServerError{ErrorCategory::Resource, "Failed to create process pipes.",
                           "pipe_creation_failed"};
    }

    const auto started = std::chrono::steady_clock::now();
    const pid_t pid = fork();
    if (pid < 0) {
        close_pair(stdout_pipe);
        close_pair(stderr_pipe);
        return ServerError{ErrorCategory::Resource, "Failed to fork process.",
                           "fork_failed"};
    }

    if (pid == 0) {
        if (chdir(cwd.c_str()) != 0) {
            _exit(126);
        }
        const int devnull = open("/dev/null", O_RDONLY | O_CLOEXEC);
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
        execvp(argv[0], argv.data());
        _exit(127);
    }

    static_cast<void>(close(stdout_pipe[1]));
    static_cast<void>(close(stderr_pipe[1]));
    set_nonblocking(stdout_pipe[0]);
    set_nonblocking(stderr_pipe[0]);

    ProcessCapture capture;
    bool stdout_open = true;
    bool stderr_open = true;
    bool child_exited = false;
    int status = 0;
    std::size_t stdout_consumed = 0;
    std::size_t stderr_consumed = 0;

    while (stdout_open || stderr_open || !child_exited) {
        if (request.cancel_token && request.cancel_token->load() && !child_exited &&
            !capture.cancelled) {
            capture.cancelled = true;
            static_cast<void>(kill(pid, SIGKILL));
        }

        const auto now = std::chrono::steady_clock::now();
        const auto elapsed =
            std::chrono::duration_cast<std::chrono::milliseconds>(now - started).count();
        if (!capture.timed_out && request.timeout_ms > 0 &&
            elapsed > static_cast<std::int64_t>(request.timeout_ms) && !child_exited) {
            capture.timed_out = true;
            static_cast<void>(kill(pid, SIGKILL));
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
        }

        drain_pipe(stdout_pipe[0], stdout_open, capture.stdout_text);
        drain_pipe(stderr_pipe[0], stderr_open, capture.stderr_text);
        emit_lines(capture.stdout_text, stdout_consumed, on_stdout_line);
        emit_lines(capture.stderr_text, stderr_consumed, on_stderr_line);

        if (!child_exited) {
            const pid_t waited = waitpid(pid, &status, WNOHANG);
            if (waited == pid) {
                child_exited = true;
            } else if (nfds == 0) {
                // Pipes closed but the child lingers; avoid spinning.
                static_cast<void>(poll(nullptr, 0, 10));
            }
        }

        if (child_exited && !stdout_open && !stderr_open) {
            break;
        }
    }

    if (!child_exited) {
        static_cast<void>(waitpid(pid, &status, 0));
    }

    // A final line without a trailing newline.
    if (stdout_consumed < capture.stdout_text.size() && on_stdout_line) {
        on_stdout_line(capture.stdout_text.substr(stdout_consumed));
    }
    if (stderr_consumed < capture.stderr_text.size() && on_stderr_line) {
        on_stderr_line(capture.stderr_text.substr(stderr_consumed));
    }

    if (WIFEXITED(status)) {
        capture.exit_code = WEXITSTATUS(status);
    } else if (WIFSIGNALED(status)) {
        capture.exit_code = 128 + WTERMSIG(status);
    } else {
        capture.exit_code = -1;
    }

    const auto ended = std::chrono::steady_clock::now();
    capture.duration_ms =
        std::chrono::duration<double, std::milli>(ended - started).count();
    return capture;
}

}  // namespace vidmcp::runtime
