#include "process.hpp"
#include "platform.hpp"

#include <unistd.h>
#include <sys/wait.h>
#include <signal.h>
#include <fcntl.h>
#include <poll.h>
#include <cerrno>
#include <chrono>

namespace platform {

// ── ProcessHandle ────────────────────────────────────────────

ProcessHandle::ProcessHandle() = default;

ProcessHandle::~ProcessHandle() {
    close_pipes();
    if (pid_ > 0 && !reaped_) {
        terminate();
    }
}

ProcessHandle::ProcessHandle(ProcessHandle&& other) noexcept
    : pid_(other.pid_), out_fd_(other.out_fd_), err_fd_(other.err_fd_),
      reaped_(other.reaped_), exit_code_(other.exit_code_) {
    other.pid_ = -1;
    other.out_fd_ = -1;
    other.err_fd_ = -1;
}

ProcessHandle& ProcessHandle::operator=(ProcessHandle&& other) noexcept {
    if (this != &other) {
        close_pipes();
        pid_ = other.pid_;
        out_fd_ = other.out_fd_;
        err_fd_ = other.err_fd_;
        reaped_ = other.reaped_;
        exit_code_ = other.exit_code_;
        other.pid_ = -1;
        other.out_fd_ = -1;
        other.err_fd_ = -1;
    }
    return *this;
}

bool ProcessHandle::valid() const {
    return pid_ > 0;
}

int ProcessHandle::wait() {
    if (pid_ <= 0) return -1;
    if (reaped_) return exit_code_;

    int status = 0;
    pid_t ret;
    do {
        ret = waitpid(pid_, &status, 0);
    } while (ret < 0 && errno == EINTR);

    reaped_ = true;
    exit_code_ = (ret == pid_ && WIFEXITED(status)) ? WEXITSTATUS(status) : -1;
    return exit_code_;
}

void ProcessHandle::terminate() {
    if (pid_ <= 0 || reaped_) return;
    kill(pid_, SIGTERM);
    // Wait up to 2s for graceful exit
    for (int i = 0; i < 20; i++) {
        int status;
        if (waitpid(pid_, &status, WNOHANG) == pid_) {
            reaped_ = true;
            exit_code_ = -1;
            return;
        }
        sleep_ms(100);
    }
    kill(pid_, SIGKILL);
    waitpid(pid_, nullptr, 0);
    reaped_ = true;
    exit_code_ = -1;
}

void ProcessHandle::close_pipes() {
    if (out_fd_ >= 0) { close(out_fd_); out_fd_ = -1; }
    if (err_fd_ >= 0) { close(err_fd_); err_fd_ = -1; }
}

// ── spawn ────────────────────────────────────────────────────

ProcessHandle spawn_captured(const std::string& program,
                             const std::vector<std::string>& args) {
    ProcessHandle handle;

    int out_pipe[2];
    int err_pipe[2];
    if (pipe(out_pipe) != 0) return handle;
    if (pipe(err_pipe) != 0) {
        close(out_pipe[0]);
        close(out_pipe[1]);
        return handle;
    }

    // Build argv before fork so the child only calls async-signal-safe functions
    std::vector<const char*> argv;
    argv.push_back(program.c_str());
    for (const auto& a : args) argv.push_back(a.c_str());
    argv.push_back(nullptr);

    pid_t pid = fork();
    if (pid < 0) {
        close(out_pipe[0]); close(out_pipe[1]);
        close(err_pipe[0]); close(err_pipe[1]);
        return handle;
    }

    if (pid == 0) {
        // Child process
        int devnull = open("/dev/null", O_RDONLY);
        if (devnull >= 0) {
            dup2(devnull, STDIN_FILENO);
            close(devnull);
        }
        dup2(out_pipe[1], STDOUT_FILENO);
        dup2(err_pipe[1], STDERR_FILENO);
        close(out_pipe[0]); close(out_pipe[1]);
        close(err_pipe[0]); close(err_pipe[1]);

        execvp(program.c_str(), const_cast<char* const*>(argv.data()));
        _exit(127);  // exec failed
    }

    // Parent
    close(out_pipe[1]);
    close(err_pipe[1]);
    handle.pid_ = pid;
    handle.out_fd_ = out_pipe[0];
    handle.err_fd_ = err_pipe[0];
    return handle;
}

CommandResult run_captured(const std::string& program,
                           const std::vector<std::string>& args,
                           int timeout_ms) {
    CommandResult result;

    ProcessHandle proc = spawn_captured(program, args);
    if (!proc.valid()) {
        result.exit_code = -1;
        result.stderr_data = "failed to spawn " + program;
        return result;
    }

    using clock = std::chrono::steady_clock;
    auto deadline = clock::now() + std::chrono::milliseconds(timeout_ms);

    int fds[2] = { proc.stdout_fd(), proc.stderr_fd() };
    std::string* sinks[2] = { &result.stdout_data, &result.stderr_data };
    bool open_fd[2] = { true, true };
    char buf[4096];

    while (open_fd[0] || open_fd[1]) {
        int wait_ms = -1;
        if (timeout_ms > 0) {
            auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(
                deadline - clock::now()).count();
            if (remaining <= 0) {
                result.timed_out = true;
                break;
            }
            wait_ms = static_cast<int>(remaining);
        }

        struct pollfd pfds[2];
        nfds_t n = 0;
        int slot_of[2];
        for (int i = 0; i < 2; ++i) {
            if (!open_fd[i]) continue;
            pfds[n].fd = fds[i];
            pfds[n].events = POLLIN;
            pfds[n].revents = 0;
            slot_of[n] = i;
            ++n;
        }

        int rc = poll(pfds, n, wait_ms);
        if (rc < 0) {
            if (errno == EINTR) continue;
            break;
        }
        if (rc == 0) continue;  // deadline re-checked at loop top

        for (nfds_t k = 0; k < n; ++k) {
            if (!(pfds[k].revents & (POLLIN | POLLHUP | POLLERR))) continue;
            int i = slot_of[k];
            ssize_t got = read(fds[i], buf, sizeof(buf));
            if (got > 0) {
                sinks[i]->append(buf, static_cast<size_t>(got));
            } else if (got == 0 || errno != EINTR) {
                open_fd[i] = false;
            }
        }
    }

    proc.close_pipes();
    if (result.timed_out) {
        proc.terminate();
        result.exit_code = -1;
    } else {
        result.exit_code = proc.wait();
    }
    return result;
}

} // namespace platform
