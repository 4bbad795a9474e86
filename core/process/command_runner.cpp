#include "command_runner.hpp"

#include <algorithm>
#include <chrono>
#include <cstring>
#include <thread>

#include <errno.h>
#include <fcntl.h>
#include <poll.h>
#include <signal.h>
#include <sys/wait.h>
#include <unistd.h>

#include "logging/logger.hpp"

namespace warden {
namespace process {

namespace {

void close_fd(int &fd) {
    if (fd >= 0) {
        close(fd);
        fd = -1;
    }
}

int remaining_ms(std::chrono::steady_clock::time_point deadline) {
    auto left = std::chrono::duration_cast<std::chrono::milliseconds>(deadline - std::chrono::steady_clock::now());
    return left.count() > 0 ? static_cast<int>(left.count()) : 0;
}

// Drain whatever is readable on fd into out. Returns false once EOF is reached.
bool drain(int fd, std::string &out) {
    char buf[4096];
    while (true) {
        ssize_t n = read(fd, buf, sizeof(buf));
        if (n > 0) {
            out.append(buf, static_cast<size_t>(n));
            continue;
        }
        if (n == 0) {
            return false;  // EOF
        }
        if (errno == EINTR) {
            continue;
        }
        // EAGAIN: nothing more for now; anything else is treated as EOF
        return errno == EAGAIN || errno == EWOULDBLOCK;
    }
}

}  // namespace

CommandResult CommandRunner::run(const std::vector<std::string> &argv, int timeout_ms) {
    CommandResult result;

    if (argv.empty() || argv[0].empty()) {
        result.error = "Empty command";
        return result;
    }

    int stdout_pipe[2] = {-1, -1};
    int stderr_pipe[2] = {-1, -1};
    int exec_pipe[2] = {-1, -1};  // Reports exec failure (errno) back to the parent

    if (pipe(stdout_pipe) < 0) {
        result.error = "Failed to create stdout pipe: " + std::string(strerror(errno));
        return result;
    }
    if (pipe(stderr_pipe) < 0) {
        result.error = "Failed to create stderr pipe: " + std::string(strerror(errno));
        close_fd(stdout_pipe[0]);
        close_fd(stdout_pipe[1]);
        return result;
    }
    if (pipe2(exec_pipe, O_CLOEXEC) < 0) {
        result.error = "Failed to create exec pipe: " + std::string(strerror(errno));
        close_fd(stdout_pipe[0]);
        close_fd(stdout_pipe[1]);
        close_fd(stderr_pipe[0]);
        close_fd(stderr_pipe[1]);
        return result;
    }

    // Construct argv before forking; only async-signal-safe calls after fork
    std::vector<char *> c_argv;
    c_argv.reserve(argv.size() + 1);
    for (const auto &arg : argv) {
        c_argv.push_back(const_cast<char *>(arg.c_str()));
    }
    c_argv.push_back(nullptr);

    pid_t pid = fork();
    if (pid < 0) {
        result.error = "Fork failed: " + std::string(strerror(errno));
        close_fd(stdout_pipe[0]);
        close_fd(stdout_pipe[1]);
        close_fd(stderr_pipe[0]);
        close_fd(stderr_pipe[1]);
        close_fd(exec_pipe[0]);
        close_fd(exec_pipe[1]);
        return result;
    }

    if (pid == 0) {
        // Child process
        int devnull = open("/dev/null", O_RDONLY);
        if (devnull >= 0) {
            dup2(devnull, STDIN_FILENO);
            close(devnull);
        }
        dup2(stdout_pipe[1], STDOUT_FILENO);
        dup2(stderr_pipe[1], STDERR_FILENO);
        close(stdout_pipe[0]);
        close(stdout_pipe[1]);
        close(stderr_pipe[0]);
        close(stderr_pipe[1]);
        close(exec_pipe[0]);

        execvp(c_argv[0], c_argv.data());

        // If we get here, exec failed
        int err = errno;
        ssize_t ignored = write(exec_pipe[1], &err, sizeof(err));
        (void)ignored;
        _exit(127);
    }

    // Parent process
    close_fd(stdout_pipe[1]);
    close_fd(stderr_pipe[1]);
    close_fd(exec_pipe[1]);

    int exec_errno = 0;
    ssize_t n;
    do {
        n = read(exec_pipe[0], &exec_errno, sizeof(exec_errno));
    } while (n < 0 && errno == EINTR);
    close_fd(exec_pipe[0]);

    if (n == static_cast<ssize_t>(sizeof(exec_errno))) {
        result.error = "exec failed for " + argv[0] + ": " + std::string(strerror(exec_errno));
        close_fd(stdout_pipe[0]);
        close_fd(stderr_pipe[0]);
        int status = 0;
        wait_for_exit(pid, 1000, status);
        return result;
    }

    result.started = true;

    fcntl(stdout_pipe[0], F_SETFL, fcntl(stdout_pipe[0], F_GETFL) | O_NONBLOCK);
    fcntl(stderr_pipe[0], F_SETFL, fcntl(stderr_pipe[0], F_GETFL) | O_NONBLOCK);

    const auto deadline = std::chrono::steady_clock::now() + std::chrono::milliseconds(timeout_ms);
    int out_fd = stdout_pipe[0];
    int err_fd = stderr_pipe[0];

    while (out_fd >= 0 || err_fd >= 0) {
        int wait_ms = remaining_ms(deadline);
        if (wait_ms <= 0) {
            result.timed_out = true;
            break;
        }

        struct pollfd pfds[2];
        nfds_t count = 0;
        if (out_fd >= 0) {
            pfds[count].fd = out_fd;
            pfds[count].events = POLLIN;
            pfds[count].revents = 0;
            ++count;
        }
        if (err_fd >= 0) {
            pfds[count].fd = err_fd;
            pfds[count].events = POLLIN;
            pfds[count].revents = 0;
            ++count;
        }

        int ready = poll(pfds, count, wait_ms);
        if (ready < 0) {
            if (errno == EINTR) {
                continue;
            }
            result.error = "poll failed: " + std::string(strerror(errno));
            result.timed_out = true;  // Treat as a failed run; the child is killed below
            break;
        }
        if (ready == 0) {
            continue;  // Deadline re-checked at the top
        }

        for (nfds_t i = 0; i < count; ++i) {
            if (pfds[i].revents == 0) {
                continue;
            }
            if (pfds[i].fd == out_fd) {
                if (!drain(out_fd, result.stdout_data)) {
                    close_fd(out_fd);
                }
            } else if (pfds[i].fd == err_fd) {
                if (!drain(err_fd, result.stderr_data)) {
                    close_fd(err_fd);
                }
            }
        }
    }

    close_fd(out_fd);
    close_fd(err_fd);

    int status = 0;
    if (!result.timed_out) {
        // Pipes closed; the child is exiting. Wait for whatever budget is left.
        if (!wait_for_exit(pid, std::max(remaining_ms(deadline), 1), status)) {
            result.timed_out = true;
        }
    }

    if (result.timed_out) {
        LOG_WARN("[Command] '" << argv[0] << "' exceeded " << timeout_ms << "ms - forcing termination");
        force_terminate(pid);
        wait_for_exit(pid, 500, status);
        if (result.error.empty()) {
            result.error = "Command timed out after " + std::to_string(timeout_ms) + "ms";
        }
        return result;
    }

    if (WIFEXITED(status)) {
        result.exit_code = WEXITSTATUS(status);
    } else if (WIFSIGNALED(status)) {
        result.exit_code = 128 + WTERMSIG(status);
    }

    return result;
}

bool CommandRunner::wait_for_exit(pid_t pid, int timeout_ms, int &status) {
    auto start = std::chrono::steady_clock::now();
    while (true) {
        pid_t result = waitpid(pid, &status, WNOHANG);
        if (result == pid) {
            return true;
        }
        if (result == -1) {
            if (errno == EINTR) {
                // Interrupted by signal, retry
                continue;
            }
            // ECHILD: already reaped
            return errno == ECHILD;
        }

        auto elapsed = std::chrono::steady_clock::now() - start;
        if (std::chrono::duration_cast<std::chrono::milliseconds>(elapsed).count() >= timeout_ms) {
            return false;
        }

        std::this_thread::sleep_for(std::chrono::milliseconds(5));
    }
}

void CommandRunner::force_terminate(pid_t pid) {
    if (pid > 0) {
        kill(pid, SIGKILL);
    }
}

}  // namespace process
}  // namespace warden
