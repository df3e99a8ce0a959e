#include "host/script_runner.hpp"

#include <cerrno>
#include <chrono>
#include <fcntl.h>
#include <poll.h>
#include <signal.h>
#include <sys/socket.h>
#include <sys/wait.h>
#include <unistd.h>

namespace hostbridge::host {

using core::errors::BridgeError;
using core::errors::ErrorKind;

namespace {

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

void close_pair(int (&fds)[2]) {
    for (int& fd : fds) {
        if (fd >= 0) {
            static_cast<void>(close(fd));
            fd = -1;
        }
    }
}

// Writes as much of the pending input as the child accepts without blocking.
// A socket end is used so a child that exits early raises EPIPE, not SIGPIPE.
void feed_stdin(int& fd, const std::string& text, std::size_t& offset) {
    if (fd < 0) {
        return;
    }
    while (offset < text.size()) {
        const ssize_t n = send(fd, text.data() + offset, text.size() - offset, MSG_NOSIGNAL);
        if (n > 0) {
            offset += static_cast<std::size_t>(n);
            continue;
        }
        if (n < 0 && (errno == EAGAIN || errno == EWOULDBLOCK || errno == EINTR)) {
            return;
        }
        break;
    }
    static_cast<void>(close(fd));
    fd = -1;
}

}  // namespace

core::errors::Result<ScriptOutcome> run_script(const ScriptRequest& request) {
    if (request.cancel_token && request.cancel_token->load()) {
        ScriptOutcome outcome;
        outcome.cancelled = true;
        outcome.stderr_text = "Script cancelled before start.";
        return outcome;
    }

    int stdout_pipe[2] = {-1, -1};
    int stderr_pipe[2] = {-1, -1};
    int stdin_pair[2] = {-1, -1};
    const bool feeds_stdin = !request.stdin_text.empty();
    if (pipe2(stdout_pipe, O_CLOEXEC) != 0 || pipe2(stderr_pipe, O_CLOEXEC) != 0 ||
        (feeds_stdin && socketpair(AF_UNIX, SOCK_STREAM | SOCK_CLOEXEC, 0, stdin_pair) != 0)) {
        close_pair(stdout_pipe);
        close_pair(stderr_pipe);
        close_pair(stdin_pair);
        return BridgeError{ErrorKind::Internal, "Failed to create process pipes.",
                           "pipe_creation_failed"};
    }

    const auto started = std::chrono::steady_clock::now();
    const pid_t pid = fork();
    if (pid < 0) {
        close_pair(stdout_pipe);
        close_pair(stderr_pipe);
        close_pair(stdin_pair);
        return BridgeError{ErrorKind::Internal, "Failed to fork process.", "fork_failed"};
    }

    if (pid == 0) {
        static_cast<void>(setpgid(0, 0));
        if (chdir(request.working_directory.c_str()) != 0) {
            _exit(126);
        }
        if (feeds_stdin) {
            static_cast<void>(dup2(stdin_pair[1], STDIN_FILENO));
        }
        static_cast<void>(dup2(stdout_pipe[1], STDOUT_FILENO));
        static_cast<void>(dup2(stderr_pipe[1], STDERR_FILENO));
        execl("/bin/sh", "sh", "-c", request.code.c_str(), static_cast<char*>(nullptr));
        _exit(127);
    }

    static_cast<void>(setpgid(pid, pid));
    static_cast<void>(close(stdout_pipe[1]));
    static_cast<void>(close(stderr_pipe[1]));
    set_nonblocking(stdout_pipe[0]);
    set_nonblocking(stderr_pipe[0]);
    int stdin_fd = stdin_pair[0];
    std::size_t stdin_offset = 0;
    if (feeds_stdin) {
        static_cast<void>(close(stdin_pair[1]));
        set_nonblocking(stdin_fd);
    }

    ScriptOutcome outcome;
    bool stdout_open = true;
    bool stderr_open = true;
    bool child_exited = false;
    bool killed = false;
    int status = 0;

    while (stdout_open || stderr_open || !child_exited) {
        if (!killed && !child_exited && request.cancel_token && request.cancel_token->load()) {
            outcome.cancelled = true;
            killed = true;
            static_cast<void>(kill(-pid, SIGKILL));
        }

        const auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
                                 std::chrono::steady_clock::now() - started)
                                 .count();
        if (!killed && request.timeout_ms > 0 &&
            elapsed > static_cast<std::int64_t>(request.timeout_ms)) {
            // Also reaps grandchildren still holding the pipes after the shell exited.
            outcome.timed_out = !child_exited;
            killed = true;
            static_cast<void>(kill(-pid, SIGKILL));
        }

        feed_stdin(stdin_fd, request.stdin_text, stdin_offset);

        pollfd fds[3];
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
        if (stdin_fd >= 0) {
            fds[nfds].fd = stdin_fd;
            fds[nfds].events = POLLOUT;
            ++nfds;
        }

        if (nfds > 0) {
            static_cast<void>(poll(fds, nfds, 50));
        } else {
            static_cast<void>(poll(nullptr, 0, 10));
        }

        drain_pipe(stdout_pipe[0], stdout_open, outcome.stdout_text);
        drain_pipe(stderr_pipe[0], stderr_open, outcome.stderr_text);

        if (!child_exited) {
            const pid_t waited = waitpid(pid, &status, WNOHANG);
            if (waited == pid) {
                child_exited = true;
            }
        }
    }

    if (stdin_fd >= 0) {
        static_cast<void>(close(stdin_fd));
    }

    if (WIFEXITED(status)) {
        outcome.exit_code = WEXITSTATUS(status);
    } else if (WIFSIGNALED(status)) {
        outcome.exit_code = 128 + WTERMSIG(status);
    } else {
        outcome.exit_code = -1;
    }

    outcome.duration_ms = std::chrono::duration<double, std::milli>(
                              std::chrono::steady_clock::now() - started)
                              .count();
    return outcome;
}

}  // namespace hostbridge::host
