#include "process/process_runner.hpp"

#include <cerrno>
#include <cstdint>
#include <cstring>
#include <fcntl.h>
#include <poll.h>
#include <signal.h>
#include <sys/wait.h>
#include <system_error>
#include <unistd.h>
#include "core/logging/logger.hpp"

extern char** environ;

namespace tollgate::process {

namespace {

void set_nonblocking(const int fd) {
    const int flags = fcntl(fd, F_GETFL, 0);
    if (flags == -1) {
        return;
    }
    static_cast<void>(fcntl(fd, F_SETFL, flags | O_NONBLOCK));
}

void close_pipe(int fds[2]) {
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

int decode_status(const int status) {
    if (WIFEXITED(status)) {
        return WEXITSTATUS(status);
    }
    if (WIFSIGNALED(status)) {
        return 128 + WTERMSIG(status);
    }
    return -1;
}

bool starts_with(const std::string& value, const std::string& prefix) {
    return value.compare(0, prefix.size(), prefix) == 0;
}

}  // namespace

std::vector<std::string> activated_environment(const std::filesystem::path& workdir) {
    std::vector<std::string> env;
    for (char** entry = environ; entry != nullptr && *entry != nullptr; ++entry) {
        env.emplace_back(*entry);
    }

    std::error_code ec;
    for (const char* venv_dir : {".venv", "venv"}) {
        const auto venv_bin = workdir / venv_dir / "bin";
        if (!std::filesystem::is_directory(venv_bin, ec) || ec) {
            continue;
        }

        std::string path_value;
        std::vector<std::string> kept;
        for (auto& item : env) {
            if (starts_with(item, "PATH=")) {
                path_value = item.substr(5);
            } else if (!starts_with(item, "VIRTUAL_ENV=") &&
                       !starts_with(item, "PYTHONHOME=")) {
                kept.push_back(std::move(item));
            }
        }
        const auto venv_root = std::filesystem::absolute(workdir / venv_dir, ec);
        kept.push_back("PATH=" + venv_bin.string() + ":" + path_value);
        kept.push_back("VIRTUAL_ENV=" + (ec ? (workdir / venv_dir) : venv_root).string());
        LOG_DEBUG("Activated virtualenv at " + venv_bin.string());
        return kept;
    }
    return env;
}

core::errors::Result<ProcessCapture> PosixProcessRunner::run(const ProcessRequest& request) {
    if (request.argv.empty() || request.argv.front().empty()) {
        return core::errors::ToolError{core::errors::ErrorCategory::Input,
                                       "No program given to execute.", "empty_argv"};
    }
    if (request.cancel_token && request.cancel_token->load()) {
        ProcessCapture capture;
        capture.cancelled = true;
        capture.stderr_text = "Command cancelled before start.";
        return capture;
    }

    // Everything the child touches is prepared before fork.
    std::vector<char*> argv;
    argv.reserve(request.argv.size() + 1);
    for (const auto& arg : request.argv) {
        argv.push_back(const_cast<char*>(arg.c_str()));
    }
    argv.push_back(nullptr);

    std::vector<char*> envp;
    envp.reserve(request.environment.size() + 1);
    for (const auto& entry : request.environment) {
        envp.push_back(const_cast<char*>(entry.c_str()));
    }
    envp.push_back(nullptr);
    const bool replace_env = !request.environment.empty();
    const std::string cwd = request.working_directory.string();

    int stdout_pipe[2] = {-1, -1};
    int stderr_pipe[2] = {-1, -1};
    if (pipe(stdout_pipe) != 0 || pipe(stderr_pipe) != 0) {
        const int err = errno;
        close_pipe(stdout_pipe);
        close_pipe(stderr_pipe);
        return core::errors::ToolError{
            core::errors::ErrorCategory::IOError,
            std::string("Failed to create process pipes: ") + std::strerror(err),
            "pipe_creation_failed"};
    }

    const auto started = std::chrono::steady_clock::now();
    const pid_t pid = fork();
    if (pid < 0) {
        const int err = errno;
        close_pipe(stdout_pipe);
        close_pipe(stderr_pipe);
        return core::errors::ToolError{
            core::errors::ErrorCategory::IOError,
            std::string("Failed to fork process: ") + std::strerror(err),
            "fork_failed"};
    }

    if (pid == 0) {
        static_cast<void>(setpgid(0, 0));
        if (chdir(cwd.c_str()) != 0) {
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
        if (replace_env) {
            environ = envp.data();
        }
        execvp(argv[0], argv.data());
        _exit(127);
    }

    // Both sides set the group so a kill right after fork cannot miss it.
    static_cast<void>(setpgid(pid, pid));
    static_cast<void>(close(stdout_pipe[1]));
    static_cast<void>(close(stderr_pipe[1]));
    set_nonblocking(stdout_pipe[0]);
    set_nonblocking(stderr_pipe[0]);

    ProcessCapture capture;
    bool stdout_open = true;
    bool stderr_open = true;
    bool child_exited = false;
    int status = 0;
    const auto timeout_ms = request.timeout.count();

    while (stdout_open || stderr_open || !child_exited) {
        if (request.cancel_token && request.cancel_token->load()) {
            capture.cancelled = true;
        }
        const auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
                                 std::chrono::steady_clock::now() - started)
                                 .count();
        if (timeout_ms > 0 && elapsed > static_cast<std::int64_t>(timeout_ms)) {
            capture.timed_out = true;
        }
        if (capture.cancelled || capture.timed_out) {
            static_cast<void>(kill(-pid, SIGKILL));
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
            static_cast<void>(usleep(10 * 1000));
        }

        drain_pipe(stdout_pipe[0], stdout_open, capture.stdout_text);
        drain_pipe(stderr_pipe[0], stderr_open, capture.stderr_text);

        if (!child_exited) {
            const pid_t waited = waitpid(pid, &status, WNOHANG);
            if (waited == pid) {
                child_exited = true;
            }
        }
    }

    if (!child_exited) {
        while (waitpid(pid, &status, 0) < 0 && errno == EINTR) {
        }
    }
    capture.exit_code = decode_status(status);

    const auto ended = std::chrono::steady_clock::now();
    capture.duration_ms =
        std::chrono::duration<double, std::milli>(ended - started).count();
    return capture;
}

}  // namespace tollgate::process
