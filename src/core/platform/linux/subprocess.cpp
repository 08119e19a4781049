#include "platform/linux/subprocess.hpp"

#include <cerrno>
#include <csignal>
#include <cstring>
#include <fcntl.h>
#include <poll.h>
#include <sys/wait.h>
#include <unistd.h>

namespace platform {

namespace {

std::string errno_message(const char* what) {
    return std::string(what) + " failed: " + std::strerror(errno);
}

int wait_child(pid_t pid) {
    int status = 0;
    while (::waitpid(pid, &status, 0) < 0) {
        if (errno == EINTR) continue;
        return -1;
    }
    if (WIFEXITED(status)) return WEXITSTATUS(status);
    if (WIFSIGNALED(status)) return 128 + WTERMSIG(status);
    return -1;
}

} // namespace

std::expected<ProcessResult, std::string>
run_process(const std::vector<std::string>& argv, std::chrono::milliseconds timeout,
            const std::string* input) {
    if (argv.empty()) {
        return std::unexpected("empty command");
    }

    int out_pipe[2];
    if (::pipe2(out_pipe, O_CLOEXEC) < 0) {
        return std::unexpected(errno_message("pipe()"));
    }

    int in_pipe[2] = {-1, -1};
    if (input && ::pipe2(in_pipe, O_CLOEXEC) < 0) {
        ::close(out_pipe[0]);
        ::close(out_pipe[1]);
        return std::unexpected(errno_message("pipe()"));
    }

    std::vector<char*> args;
    args.reserve(argv.size() + 1);
    for (const auto& a : argv) args.push_back(const_cast<char*>(a.c_str()));
    args.push_back(nullptr);

    pid_t pid = ::fork();
    if (pid < 0) {
        ::close(out_pipe[0]);
        ::close(out_pipe[1]);
        if (input) {
            ::close(in_pipe[0]);
            ::close(in_pipe[1]);
        }
        return std::unexpected(errno_message("fork()"));
    }

    if (pid == 0) {
        // Child: stdout to pipe, stderr and (maybe) stdin to /dev/null
        int devnull = ::open("/dev/null", O_RDWR);
        if (input) {
            ::dup2(in_pipe[0], STDIN_FILENO);
        } else if (devnull >= 0) {
            ::dup2(devnull, STDIN_FILENO);
        }
        ::dup2(out_pipe[1], STDOUT_FILENO);
        if (devnull >= 0) ::dup2(devnull, STDERR_FILENO);
        ::execvp(args[0], args.data());
        ::_exit(127);
    }

    ::close(out_pipe[1]);

    // stdin is fed from the same poll loop so a child that never reads it
    // still hits the deadline.
    int in_fd = -1;
    size_t total_written = 0;
    if (input) {
        ::close(in_pipe[0]);
        in_fd = in_pipe[1];
        ::fcntl(in_fd, F_SETFL, ::fcntl(in_fd, F_GETFL) | O_NONBLOCK);
        if (input->empty()) {
            ::close(in_fd);
            in_fd = -1;
        }
    }

    auto close_input = [&in_fd]() {
        if (in_fd >= 0) ::close(in_fd);
        in_fd = -1;
    };

    auto abort_child = [&](std::string msg) -> std::expected<ProcessResult, std::string> {
        ::kill(pid, SIGKILL);
        wait_child(pid);
        close_input();
        ::close(out_pipe[0]);
        return std::unexpected(std::move(msg));
    };

    ProcessResult result;
    auto deadline = std::chrono::steady_clock::now() + timeout;

    while (true) {
        int wait_ms = -1;
        if (timeout.count() > 0) {
            auto left = std::chrono::duration_cast<std::chrono::milliseconds>(
                deadline - std::chrono::steady_clock::now());
            wait_ms = left.count() > 0 ? static_cast<int>(left.count()) : 0;
        }

        // A negative fd is ignored by poll()
        pollfd fds[2] = {
            {.fd = out_pipe[0], .events = POLLIN, .revents = 0},
            {.fd = in_fd, .events = POLLOUT, .revents = 0},
        };

        int ret = ::poll(fds, 2, wait_ms);
        if (ret < 0) {
            if (errno == EINTR) continue;
            return abort_child(errno_message("poll()"));
        }
        if (ret == 0) {
            return abort_child(argv[0] + " timed out after " + std::to_string(timeout.count()) +
                               "ms");
        }

        if (in_fd >= 0 && fds[1].revents != 0) {
            if (fds[1].revents & POLLOUT) {
                ssize_t n = ::write(in_fd, input->data() + total_written,
                                    input->size() - total_written);
                if (n >= 0) {
                    total_written += static_cast<size_t>(n);
                    if (total_written == input->size()) close_input();
                } else if (errno != EINTR && errno != EAGAIN) {
                    close_input(); // EPIPE: child stopped reading, its exit code tells the rest
                }
            } else {
                close_input();
            }
        }

        if (fds[0].revents == 0) continue;

        char buf[4096];
        ssize_t n = ::read(out_pipe[0], buf, sizeof(buf));
        if (n < 0) {
            if (errno == EINTR) continue;
            return abort_child(errno_message("read()"));
        }
        if (n == 0) break;
        result.out.append(buf, static_cast<size_t>(n));
    }

    close_input();
    ::close(out_pipe[0]);

    result.exit_code = wait_child(pid);
    if (result.exit_code < 0) {
        return std::unexpected(errno_message("waitpid()"));
    }
    return result;
}

} // namespace platform
