#include "agentrelay/session/process.hpp"

#include <algorithm>
#include <array>
#include <cerrno>
#include <chrono>
#include <sstream>

#include <fcntl.h>
#include <poll.h>
#include <signal.h>
#include <sys/wait.h>
#include <unistd.h>

namespace agentrelay::session {

namespace {

void close_fd(int& fd) {
    if (fd >= 0) {
        close(fd);
        fd = -1;
    }
}

}  // namespace

ProcessResult run_process(const std::vector<std::string>& argv,
                          int timeout_ms,
                          const std::string& input)
{
    ProcessResult result;

    if (argv.empty()) {
        result.spawn_failed = true;
        result.stderr_output = "Empty command";
        return result;
    }

    int stdin_pipe[2] = {-1, -1};
    int stdout_pipe[2] = {-1, -1};
    int stderr_pipe[2] = {-1, -1};

    if (pipe(stdin_pipe) != 0 || pipe(stdout_pipe) != 0 || pipe(stderr_pipe) != 0) {
        for (int* p : {stdin_pipe, stdout_pipe, stderr_pipe}) {
            close_fd(p[0]);
            close_fd(p[1]);
        }
        result.spawn_failed = true;
        result.stderr_output = "Failed to create pipes";
        return result;
    }

    std::vector<char*> args;
    args.reserve(argv.size() + 1);
    for (const auto& a : argv) {
        args.push_back(const_cast<char*>(a.c_str()));
    }
    args.push_back(nullptr);

    pid_t pid = fork();

    if (pid < 0) {
        for (int* p : {stdin_pipe, stdout_pipe, stderr_pipe}) {
            close_fd(p[0]);
            close_fd(p[1]);
        }
        result.spawn_failed = true;
        result.stderr_output = "Failed to fork";
        return result;
    }

    if (pid == 0) {
        // Child process
        dup2(stdin_pipe[0], STDIN_FILENO);
        dup2(stdout_pipe[1], STDOUT_FILENO);
        dup2(stderr_pipe[1], STDERR_FILENO);

        close(stdin_pipe[0]); close(stdin_pipe[1]);
        close(stdout_pipe[0]); close(stdout_pipe[1]);
        close(stderr_pipe[0]); close(stderr_pipe[1]);

        execvp(args[0], args.data());
        _exit(127);
    }

    // Parent process
    close_fd(stdin_pipe[0]);
    close_fd(stdout_pipe[1]);
    close_fd(stderr_pipe[1]);

    int in_fd = stdin_pipe[1];
    int out_fd = stdout_pipe[0];
    int err_fd = stderr_pipe[0];

    if (input.empty()) {
        close_fd(in_fd);
    } else {
        fcntl(in_fd, F_SETFL, fcntl(in_fd, F_GETFL) | O_NONBLOCK);
    }
    signal(SIGPIPE, SIG_IGN);

    std::ostringstream stdout_ss, stderr_ss;
    std::array<char, 4096> buffer;
    size_t written = 0;
    auto start = std::chrono::steady_clock::now();

    while (out_fd >= 0 || err_fd >= 0) {
        auto elapsed = std::chrono::steady_clock::now() - start;
        int remaining_ms = timeout_ms -
            static_cast<int>(std::chrono::duration_cast<std::chrono::milliseconds>(elapsed).count());

        if (remaining_ms <= 0) {
            kill(pid, SIGKILL);
            result.timed_out = true;
            break;
        }

        struct pollfd fds[3];
        nfds_t count = 0;
        int out_idx = -1, err_idx = -1, in_idx = -1;
        if (out_fd >= 0) { fds[count] = {out_fd, POLLIN, 0}; out_idx = static_cast<int>(count++); }
        if (err_fd >= 0) { fds[count] = {err_fd, POLLIN, 0}; err_idx = static_cast<int>(count++); }
        if (in_fd >= 0) { fds[count] = {in_fd, POLLOUT, 0}; in_idx = static_cast<int>(count++); }

        int ret = poll(fds, count, std::min(remaining_ms, 100));
        if (ret < 0) {
            if (errno == EINTR) {
                continue;
            }
            kill(pid, SIGKILL);
            break;
        }
        if (ret == 0) {
            continue;
        }

        if (in_idx >= 0 && (fds[in_idx].revents & (POLLOUT | POLLERR | POLLHUP))) {
            if (fds[in_idx].revents & POLLOUT) {
                ssize_t n = write(in_fd, input.data() + written, input.size() - written);
                if (n > 0) {
                    written += static_cast<size_t>(n);
                }
                if (n < 0 && errno != EAGAIN) {
                    close_fd(in_fd);
                }
            } else {
                close_fd(in_fd);
            }
            if (written >= input.size()) {
                close_fd(in_fd);
            }
        }

        auto drain = [&](int idx, int& fd, std::ostringstream& ss) {
            if (idx < 0 || !(fds[idx].revents & (POLLIN | POLLHUP | POLLERR))) {
                return;
            }
            ssize_t n = read(fd, buffer.data(), buffer.size());
            if (n > 0) {
                ss.write(buffer.data(), n);
            } else if (n == 0 || errno != EINTR) {
                close_fd(fd);
            }
        };
        drain(out_idx, out_fd, stdout_ss);
        drain(err_idx, err_fd, stderr_ss);
    }

    close_fd(in_fd);
    close_fd(out_fd);
    close_fd(err_fd);

    int status = 0;
    if (waitpid(pid, &status, 0) == pid && !result.timed_out) {
        if (WIFEXITED(status)) {
            result.exit_code = WEXITSTATUS(status);
        }
    }

    result.stdout_output = stdout_ss.str();
    result.stderr_output = stderr_ss.str();
    if (result.exit_code == 127 && result.stdout_output.empty() && result.stderr_output.empty()) {
        result.spawn_failed = true;
        result.stderr_output = "Failed to execute " + argv[0];
    }
    return result;
}

}  // namespace agentrelay::session
