#include "mender/process_collaborator.hpp"

#include <cerrno>
#include <csignal>
#include <mutex>
#include <vector>

#include <fcntl.h>
#include <poll.h>
#include <sys/types.h>
#include <sys/wait.h>
#include <unistd.h>

namespace mender {

namespace {

void set_nonblocking(int fd) {
    const int flags = fcntl(fd, F_GETFL, 0);
    if (flags == -1) {
        return;
    }
    (void)fcntl(fd, F_SETFL, flags | O_NONBLOCK);
}

void close_fd(int& fd) {
    if (fd >= 0) {
        close(fd);
        fd = -1;
    }
}

// A child that exits without reading stdin must not kill us with SIGPIPE
void ignore_sigpipe() {
    static std::once_flag once;
    std::call_once(once, []() { std::signal(SIGPIPE, SIG_IGN); });
}

void close_pipes(int* in_pipe, int* out_pipe, int* err_pipe) {
    close_fd(in_pipe[0]);
    close_fd(in_pipe[1]);
    close_fd(out_pipe[0]);
    close_fd(out_pipe[1]);
    close_fd(err_pipe[0]);
    close_fd(err_pipe[1]);
}

void read_into(int& fd, std::string& out, size_t& total_bytes, size_t max_total_bytes,
               bool& limit_hit) {
    char buf[4096];
    while (true) {
        const ssize_t n = read(fd, buf, sizeof(buf));
        if (n > 0) {
            const size_t count = static_cast<size_t>(n);
            const size_t remaining = max_total_bytes - total_bytes;
            const size_t to_append = count <= remaining ? count : remaining;
            out.append(buf, to_append);
            total_bytes += to_append;
            if (to_append < count) {
                limit_hit = true;
                return;
            }
            continue;
        }
        if (n < 0 && (errno == EAGAIN || errno == EWOULDBLOCK)) {
            return;
        }
        if (n < 0 && errno == EINTR) {
            continue;
        }
        close_fd(fd);
        return;
    }
}

void write_some(int& fd, const std::string& data, size_t& written) {
    while (written < data.size()) {
        const ssize_t n = write(fd, data.data() + written, data.size() - written);
        if (n > 0) {
            written += static_cast<size_t>(n);
            continue;
        }
        if (n < 0 && (errno == EAGAIN || errno == EWOULDBLOCK)) {
            return;
        }
        if (n < 0 && errno == EINTR) {
            continue;
        }
        // EPIPE: the child stopped reading
        break;
    }
    close_fd(fd);
}

} // namespace

ProcessResult run_process(const std::string& command, const std::string& stdin_data,
                          std::chrono::milliseconds timeout, size_t max_output_bytes) {
    ignore_sigpipe();

    int in_pipe[2] = {-1, -1};
    int out_pipe[2] = {-1, -1};
    int err_pipe[2] = {-1, -1};
    ProcessResult result;

    // Close-on-exec so concurrent spawns do not inherit each other's pipes
    if (pipe2(in_pipe, O_CLOEXEC) != 0 || pipe2(out_pipe, O_CLOEXEC) != 0 ||
        pipe2(err_pipe, O_CLOEXEC) != 0) {
        close_pipes(in_pipe, out_pipe, err_pipe);
        result.exit_code = 127;
        result.spawn_failed = true;
        return result;
    }

    // Prepared before fork: the child only calls async-signal-safe functions
    std::vector<char*> argv;
    argv.push_back(const_cast<char*>("/bin/sh"));
    argv.push_back(const_cast<char*>("-c"));
    argv.push_back(const_cast<char*>(command.c_str()));
    argv.push_back(nullptr);

    const pid_t pid = fork();
    if (pid < 0) {
        close_pipes(in_pipe, out_pipe, err_pipe);
        result.exit_code = 127;
        result.spawn_failed = true;
        return result;
    }

    if (pid == 0) {
        (void)dup2(in_pipe[0], STDIN_FILENO);
        (void)dup2(out_pipe[1], STDOUT_FILENO);
        (void)dup2(err_pipe[1], STDERR_FILENO);

        close(in_pipe[0]);
        close(in_pipe[1]);
        close(out_pipe[0]);
        close(out_pipe[1]);
        close(err_pipe[0]);
        close(err_pipe[1]);

        execv("/bin/sh", argv.data());
        _exit(127);
    }

    close_fd(in_pipe[0]);
    close_fd(out_pipe[1]);
    close_fd(err_pipe[1]);

    int in_fd = in_pipe[1];
    int out_fd = out_pipe[0];
    int err_fd = err_pipe[0];
    set_nonblocking(in_fd);
    set_nonblocking(out_fd);
    set_nonblocking(err_fd);

    size_t written = 0;
    if (stdin_data.empty()) {
        close_fd(in_fd);
    }

    bool limit_hit = false;
    size_t total_bytes = 0;
    const bool has_deadline = timeout.count() > 0;
    const auto start = std::chrono::steady_clock::now();

    while (out_fd >= 0 || err_fd >= 0) {
        const auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
            std::chrono::steady_clock::now() - start);
        if (has_deadline && elapsed >= timeout) {
            result.timed_out = true;
            break;
        }

        struct pollfd fds[3];
        nfds_t nfds = 0;
        if (out_fd >= 0) fds[nfds++] = {out_fd, POLLIN, 0};
        if (err_fd >= 0) fds[nfds++] = {err_fd, POLLIN, 0};
        if (in_fd >= 0) fds[nfds++] = {in_fd, POLLOUT, 0};

        const auto remaining_ms = has_deadline ? (timeout - elapsed).count() : 50;
        const int poll_ms = remaining_ms < 50 ? static_cast<int>(remaining_ms) : 50;
        (void)poll(fds, nfds, poll_ms);

        if (in_fd >= 0) {
            write_some(in_fd, stdin_data, written);
        }
        if (out_fd >= 0) {
            read_into(out_fd, result.out, total_bytes, max_output_bytes, limit_hit);
        }
        if (!limit_hit && err_fd >= 0) {
            read_into(err_fd, result.err, total_bytes, max_output_bytes, limit_hit);
        }

        if (limit_hit) {
            result.output_limit_exceeded = true;
            break;
        }
    }

    close_fd(in_fd);
    close_fd(out_fd);
    close_fd(err_fd);

    // The child may close its output and keep running; the deadline still holds
    int status = 0;
    pid_t waited = 0;
    bool killed = false;
    while (true) {
        if (!killed && (result.timed_out || result.output_limit_exceeded)) {
            (void)kill(pid, SIGKILL);
            killed = true;
        }
        waited = waitpid(pid, &status, killed ? 0 : WNOHANG);
        if (waited < 0 && errno == EINTR) {
            continue;
        }
        if (waited != 0) {
            break;
        }
        const auto elapsed = std::chrono::steady_clock::now() - start;
        if (has_deadline && elapsed >= timeout) {
            result.timed_out = true;
            continue;
        }
        (void)poll(nullptr, 0, 10);
    }

    if (waited < 0) {
        result.exit_code = 127;
        return result;
    }
    if (WIFEXITED(status)) {
        result.exit_code = WEXITSTATUS(status);
    } else {
        result.exit_code = 128;
    }
    return result;
}

} // namespace mender
