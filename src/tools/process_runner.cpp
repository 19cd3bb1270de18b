#include "tools/process_runner.hpp"

#include <cerrno>
#include <chrono>
#include <cstdlib>
#include <fcntl.h>
#include <poll.h>
#include <signal.h>
#include <sstream>
#include <sys/wait.h>
#include <unistd.h>

namespace runvault::tools {

using core::errors::ErrorCategory;
using core::errors::StoreError;

namespace {

void set_nonblocking(const int fd) {
    const int flags = fcntl(fd, F_GETFL, 0);
    if (flags == -1) {
        return;
    }
    static_cast<void>(fcntl(fd, F_SETFL, flags | O_NONBLOCK));
}

void close_pair(int fds[2]) {
    for (int i = 0; i < 2; ++i) {
        if (fds[i] >= 0) {
            static_cast<void>(close(fds[i]));
            fds[i] = -1;
        }
    }
}

void drain_pipe(const int fd, bool& is_open, std::string& out) {
    if (!is_open) {
        return;
    }

    char buffer[8192];
    while (true) {
        const ssize_t n = read(fd, buffer, sizeof(buffer));
        if (n > 0) {
            out.append(buffer, static_cast<std::size_t>(n));
            continue;
        }
        if (n < 0 && errno == EINTR) {
            continue;
        }
        if (n < 0 && (errno == EAGAIN || errno == EWOULDBLOCK)) {
            return;
        }
        is_open = false;
        static_cast<void>(close(fd));
        return;
    }
}

}  // namespace

std::optional<std::filesystem::path> find_in_path(const std::string& program) {
    if (program.empty()) {
        return std::nullopt;
    }
    if (program.find('/') != std::string::npos) {
        if (access(program.c_str(), X_OK) == 0) {
            return std::filesystem::path(program);
        }
        return std::nullopt;
    }

    const char* path_env = std::getenv("PATH");
    if (path_env == nullptr) {
        return std::nullopt;
    }
    std::istringstream in(path_env);
    std::string dir;
    while (std::getline(in, dir, ':')) {
        if (dir.empty()) {
            dir = ".";
        }
        const std::filesystem::path candidate = std::filesystem::path(dir) / program;
        std::error_code ec;
        if (std::filesystem::is_regular_file(candidate, ec) && !ec &&
            access(candidate.c_str(), X_OK) == 0) {
            return candidate;
        }
    }
    return std::nullopt;
}

core::errors::Result<ProcessCapture> run_process(const ProcessRequest& request) {
    if (request.argv.empty() || request.argv.front().empty()) {
        return StoreError{ErrorCategory::Input, "Process argv cannot be empty.",
                          "empty_command"};
    }

    std::vector<char*> argv;
    argv.reserve(request.argv.size() + 1);
    for (const auto& arg : request.argv) {
        argv.push_back(const_cast<char*>(arg.c_str()));
    }
    argv.push_back(nullptr);

    int stdout_pipe[2] = {-1, -1};
    int stderr_pipe[2] = {-1, -1};
    // Close-on-exec so children forked by other threads never inherit these ends.
    if (pipe2(stdout_pipe, O_CLOEXEC) != 0) {
        return StoreError{ErrorCategory::Internal, "Failed to create process pipes.",
                          "pipe_creation_failed"};
    }
    if (pipe2(stderr_pipe, O_CLOEXEC) != 0) {
        close_pair(stdout_pipe);
        return StoreError{ErrorCategory::Internal, "Failed to create process pipes.",
                          "pipe_creation_failed"};
    }

    const auto started = std::chrono::steady_clock::now();
    const pid_t pid = fork();
    if (pid < 0) {
        close_pair(stdout_pipe);
        close_pair(stderr_pipe);
        return StoreError{ErrorCategory::Internal, "Failed to fork process.", "fork_failed"};
    }

    if (pid == 0) {
        if (chdir(request.working_directory.c_str()) != 0) {
            _exit(126);
        }
        static_cast<void>(dup2(stdout_pipe[1], STDOUT_FILENO));
        static_cast<void>(dup2(stderr_pipe[1], STDERR_FILENO));
        close_pair(stdout_pipe);
        close_pair(stderr_pipe);
        const int devnull = open("/dev/null", O_RDONLY);
        if (devnull >= 0) {
            static_cast<void>(dup2(devnull, STDIN_FILENO));
            static_cast<void>(close(devnull));
        }
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

    while (stdout_open || stderr_open || !child_exited) {
        const auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
                                 std::chrono::steady_clock::now() - started)
                                 .count();
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
            fds[nfds].revents = 0;
            ++nfds;
        }
        if (stderr_open) {
            fds[nfds].fd = stderr_pipe[0];
            fds[nfds].events = POLLIN;
            fds[nfds].revents = 0;
            ++nfds;
        }
        if (nfds > 0) {
            static_cast<void>(poll(fds, nfds, 50));
        }

        drain_pipe(stdout_pipe[0], stdout_open, capture.stdout_text);
        drain_pipe(stderr_pipe[0], stderr_open, capture.stderr_text);

        if (!child_exited) {
            const pid_t waited = waitpid(pid, &status, WNOHANG);
            if (waited == pid) {
                child_exited = true;
            } else if (nfds == 0) {
                static_cast<void>(usleep(10000));
            }
        }
    }

    if (WIFEXITED(status)) {
        capture.exit_code = WEXITSTATUS(status);
    } else if (WIFSIGNALED(status)) {
        capture.exit_code = 128 + WTERMSIG(status);
    }

    capture.duration_ms = std::chrono::duration<double, std::milli>(
                              std::chrono::steady_clock::now() - started)
                              .count();
    return capture;
}

}  // namespace runvault::tools
