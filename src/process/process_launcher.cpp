#include "process/process_launcher.hpp"

#include <cerrno>
#include <chrono>
#include <cstring>
#include <fcntl.h>
#include <poll.h>
#include <sys/wait.h>
#include <unistd.h>

extern char** environ;

namespace inobridge::process {

using core::errors::BridgeError;
using core::errors::ErrorCategory;

namespace {

// Tells the parent why the child never reached the toolchain binary.
struct ChildFailure {
    int stage = 0;  // 1 = chdir, 2 = exec
    int error_number = 0;
};

void set_nonblocking(const int fd) {
    const int flags = fcntl(fd, F_GETFL, 0);
    if (flags == -1) {
        return;
    }
    static_cast<void>(fcntl(fd, F_SETFL, flags | O_NONBLOCK));
}

void close_pair(int fds[2]) {
    if (fds[0] >= 0) {
        static_cast<void>(close(fds[0]));
    }
    if (fds[1] >= 0) {
        static_cast<void>(close(fds[1]));
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

std::vector<std::string> flatten_environment(const environment::EnvironmentMap& env) {
    std::vector<std::string> flat;
    flat.reserve(env.size());
    for (const auto& [name, value] : env) {
        flat.push_back(name + "=" + value);
    }
    return flat;
}

}  // namespace

core::errors::Result<ProcessCapture> PosixProcessLauncher::launch(
    const std::vector<std::string>& argv,
    const environment::EnvironmentMap& environment,
    const std::filesystem::path& working_directory) const {
    if (argv.empty() || argv.front().empty()) {
        return BridgeError{ErrorCategory::Launch, "Empty argument vector.",
                           "empty_argv"};
    }

    // Everything the child touches is prepared before fork.
    std::vector<char*> child_argv;
    child_argv.reserve(argv.size() + 1);
    for (const auto& arg : argv) {
        child_argv.push_back(const_cast<char*>(arg.c_str()));
    }
    child_argv.push_back(nullptr);

    const auto flat_env = flatten_environment(environment);
    std::vector<char*> child_env;
    child_env.reserve(flat_env.size() + 1);
    for (const auto& entry : flat_env) {
        child_env.push_back(const_cast<char*>(entry.c_str()));
    }
    child_env.push_back(nullptr);

    int stdout_pipe[2] = {-1, -1};
    int stderr_pipe[2] = {-1, -1};
    int status_pipe[2] = {-1, -1};
    if (pipe(stdout_pipe) != 0 || pipe(stderr_pipe) != 0 ||
        pipe2(status_pipe, O_CLOEXEC) != 0) {
        close_pair(stdout_pipe);
        close_pair(stderr_pipe);
        close_pair(status_pipe);
        return BridgeError{ErrorCategory::Internal,
                           "Failed to create process pipes.",
                           "pipe_creation_failed"};
    }

    const auto started = std::chrono::steady_clock::now();
    const pid_t pid = fork();
    if (pid < 0) {
        close_pair(stdout_pipe);
        close_pair(stderr_pipe);
        close_pair(status_pipe);
        return BridgeError{ErrorCategory::Internal, "Failed to fork process.",
                           "fork_failed"};
    }

    if (pid == 0) {
        ChildFailure failure;
        if (!working_directory.empty() && chdir(working_directory.c_str()) != 0) {
            failure.stage = 1;
            failure.error_number = errno;
            static_cast<void>(write(status_pipe[1], &failure, sizeof(failure)));
            _exit(126);
        }
        static_cast<void>(dup2(stdout_pipe[1], STDOUT_FILENO));
        static_cast<void>(dup2(stderr_pipe[1], STDERR_FILENO));
        static_cast<void>(close(stdout_pipe[0]));
        static_cast<void>(close(stdout_pipe[1]));
        static_cast<void>(close(stderr_pipe[0]));
        static_cast<void>(close(stderr_pipe[1]));
        static_cast<void>(close(status_pipe[0]));

        // execvp resolves argv[0] against PATH from environ.
        environ = child_env.data();
        execvp(child_argv[0], child_argv.data());

        failure.stage = 2;
        failure.error_number = errno;
        static_cast<void>(write(status_pipe[1], &failure, sizeof(failure)));
        _exit(127);
    }

    static_cast<void>(close(stdout_pipe[1]));
    static_cast<void>(close(stderr_pipe[1]));
    static_cast<void>(close(status_pipe[1]));

    // The status pipe closes on a successful exec; any payload means failure.
    ChildFailure failure;
    ssize_t status_bytes = 0;
    do {
        status_bytes = read(status_pipe[0], &failure, sizeof(failure));
    } while (status_bytes < 0 && errno == EINTR);
    static_cast<void>(close(status_pipe[0]));

    if (status_bytes == static_cast<ssize_t>(sizeof(failure))) {
        static_cast<void>(close(stdout_pipe[0]));
        static_cast<void>(close(stderr_pipe[0]));
        int ignored = 0;
        static_cast<void>(waitpid(pid, &ignored, 0));
        if (failure.stage == 1) {
            return BridgeError{ErrorCategory::Launch,
                               "Cannot enter working directory " +
                                   working_directory.string() + ": " +
                                   std::strerror(failure.error_number),
                               "chdir_failed"};
        }
        return BridgeError{ErrorCategory::Launch,
                           "Cannot execute " + argv.front() + ": " +
                               std::strerror(failure.error_number),
                           "launch_failed",
                           "Check that the toolchain binary is installed and on PATH."};
    }

    set_nonblocking(stdout_pipe[0]);
    set_nonblocking(stderr_pipe[0]);

    ProcessCapture capture;
    bool stdout_open = true;
    bool stderr_open = true;

    // No timeout: the engine blocks until the toolchain exits.
    while (stdout_open || stderr_open) {
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
        static_cast<void>(poll(fds, nfds, 100));

        drain_pipe(stdout_pipe[0], stdout_open, capture.stdout_text);
        drain_pipe(stderr_pipe[0], stderr_open, capture.stderr_text);
    }

    int status = 0;
    pid_t waited = 0;
    do {
        waited = waitpid(pid, &status, 0);
    } while (waited < 0 && errno == EINTR);

    if (waited < 0) {
        capture.exit_code = -1;
    } else if (WIFEXITED(status)) {
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

}  // namespace inobridge::process
