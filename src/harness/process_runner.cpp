#include "harness/process_runner.hpp"

#include <algorithm>
#include <cerrno>
#include <chrono>
#include <fcntl.h>
#include <poll.h>
#include <signal.h>
#include <sys/wait.h>
#include <unistd.h>

extern char** environ;

namespace protoforge::harness {

using core::errors::ErrorCategory;
using core::errors::ForgeError;

namespace {

void set_nonblocking(const int fd) {
    const int flags = fcntl(fd, F_GETFL, 0);
    if (flags == -1) {
        return;
    }
    static_cast<void>(fcntl(fd, F_SETFL, flags | O_NONBLOCK));
}

void close_pipe(int (&fds)[2]) {
    for (int& fd : fds) {
        if (fd >= 0) {
            static_cast<void>(close(fd));
            fd = -1;
        }
    }
}

void drain_pipe(const int fd, bool& is_open, std::string& out,
                const std::size_t max_bytes, bool& truncated) {
    if (!is_open) {
        return;
    }

    char buffer[4096];
    while (true) {
        const ssize_t n = read(fd, buffer, sizeof(buffer));
        if (n > 0) {
            const auto count = static_cast<std::size_t>(n);
            if (out.size() < max_bytes) {
                out.append(buffer, std::min(count, max_bytes - out.size()));
            }
            if (out.size() >= max_bytes) {
                truncated = true;
            }
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

void kill_group(const pid_t pid) {
    if (kill(-pid, SIGKILL) != 0) {
        static_cast<void>(kill(pid, SIGKILL));
    }
}

}  // namespace

std::vector<std::string> merge_environment(
    const std::map<std::string, std::string>& overrides) {
    std::vector<std::string> merged;
    for (char** entry = environ; entry != nullptr && *entry != nullptr; ++entry) {
        const std::string variable(*entry);
        const auto eq = variable.find('=');
        if (eq != std::string::npos && overrides.count(variable.substr(0, eq)) > 0) {
            continue;
        }
        merged.push_back(variable);
    }
    for (const auto& entry : overrides) {
        merged.push_back(entry.first + "=" + entry.second);
    }
    return merged;
}

std::string shell_escape_single_quotes(const std::string& value) {
    std::string escaped;
    escaped.reserve(value.size() + 16);
    for (const char c : value) {
        if (c == '\'') {
            escaped += "'\\''";
        } else {
            escaped.push_back(c);
        }
    }
    return escaped;
}

core::errors::Result<ProcessCapture> run_process(const ProcessRequest& request) {
    const auto& cancel_token = request.cancel_token;
    if (cancel_token && cancel_token->load()) {
        ProcessCapture capture;
        capture.cancelled = true;
        capture.stderr_text = "Command cancelled before start.";
        return capture;
    }

    int stdout_pipe[2] = {-1, -1};
    int stderr_pipe[2] = {-1, -1};
    if (pipe(stdout_pipe) != 0) {
        return ForgeError{ErrorCategory::Execution, "Failed to create process pipes.",
                          "pipe_creation_failed"};
    }
    if (pipe(stderr_pipe) != 0) {
        close_pipe(stdout_pipe);
        return ForgeError{ErrorCategory::Execution, "Failed to create process pipes.",
                          "pipe_creation_failed"};
    }

    // Built before fork: the child only calls async-signal-safe functions.
    std::vector<std::string> env_strings = merge_environment(request.environment);
    std::vector<char*> envp;
    envp.reserve(env_strings.size() + 1);
    for (auto& variable : env_strings) {
        envp.push_back(variable.data());
    }
    envp.push_back(nullptr);
    const std::string working_directory = request.working_directory.string();

    const auto started = std::chrono::steady_clock::now();
    const pid_t pid = fork();
    if (pid < 0) {
        close_pipe(stdout_pipe);
        close_pipe(stderr_pipe);
        return ForgeError{ErrorCategory::Execution, "Failed to fork process.",
                          "fork_failed"};
    }

    if (pid == 0) {
        // Own process group: a terminal interrupt aimed at us does not reach
        // the child, and a timeout can take down everything it spawned.
        static_cast<void>(setpgid(0, 0));
        if (chdir(working_directory.c_str()) != 0) {
            _exit(126);
        }
        const int devnull = open("/dev/null", O_RDONLY);
        if (devnull >= 0) {
            static_cast<void>(dup2(devnull, STDIN_FILENO));
            static_cast<void>(close(devnull));
        }
        static_cast<void>(dup2(stdout_pipe[1], STDOUT_FILENO));
        static_cast<void>(dup2(stderr_pipe[1], STDERR_FILENO));
        close_pipe(stdout_pipe);
        close_pipe(stderr_pipe);
        char* const argv[] = {const_cast<char*>("sh"), const_cast<char*>("-c"),
                              const_cast<char*>(request.command.c_str()), nullptr};
        execve("/bin/sh", argv, envp.data());
        _exit(127);
    }

    static_cast<void>(setpgid(pid, pid));
    static_cast<void>(close(stdout_pipe[1]));
    static_cast<void>(close(stderr_pipe[1]));
    set_nonblocking(stdout_pipe[0]);
    set_nonblocking(stderr_pipe[0]);

    ProcessCapture capture;
    bool stdout_open = true;
    bool stderr_open = true;
    bool child_exited = false;
    bool killed = false;
    int status = 0;

    while (stdout_open || stderr_open || !child_exited) {
        if (!killed && !child_exited && cancel_token && cancel_token->load()) {
            capture.cancelled = true;
            killed = true;
            kill_group(pid);
        }

        const auto now = std::chrono::steady_clock::now();
        const auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
                                 now - started)
                                 .count();
        if (!killed && request.timeout_ms > 0 &&
            elapsed > static_cast<std::int64_t>(request.timeout_ms)) {
            capture.timed_out = true;
            killed = true;
            kill_group(pid);
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
            static_cast<void>(poll(nullptr, 0, 10));
        }

        drain_pipe(stdout_pipe[0], stdout_open, capture.stdout_text,
                   request.max_output_bytes, capture.output_truncated);
        drain_pipe(stderr_pipe[0], stderr_open, capture.stderr_text,
                   request.max_output_bytes, capture.output_truncated);

        if (!child_exited) {
            const pid_t waited = waitpid(pid, &status, WNOHANG);
            if (waited == pid) {
                child_exited = true;
                // Background grandchildren may still hold the pipes open.
                if (killed) {
                    kill_group(pid);
                }
            }
        }

        if (child_exited && !stdout_open && !stderr_open) {
            break;
        }
        if (child_exited && killed) {
            // A killed group will not produce more output worth waiting for.
            drain_pipe(stdout_pipe[0], stdout_open, capture.stdout_text,
                       request.max_output_bytes, capture.output_truncated);
            drain_pipe(stderr_pipe[0], stderr_open, capture.stderr_text,
                       request.max_output_bytes, capture.output_truncated);
            if (stdout_open) {
                static_cast<void>(close(stdout_pipe[0]));
                stdout_open = false;
            }
            if (stderr_open) {
                static_cast<void>(close(stderr_pipe[0]));
                stderr_open = false;
            }
            break;
        }
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

}  // namespace protoforge::harness
