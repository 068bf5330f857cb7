#pragma once

#include <string>
#include <vector>
#include <core/types.hpp>

namespace platform {

// Handle to a spawned child process with its stdout/stderr pipes.
class ProcessHandle {
public:
    ProcessHandle();
    ~ProcessHandle();

    ProcessHandle(ProcessHandle&& other) noexcept;
    ProcessHandle& operator=(ProcessHandle&& other) noexcept;
    ProcessHandle(const ProcessHandle&) = delete;
    ProcessHandle& operator=(const ProcessHandle&) = delete;

    // True if the process handle is valid (was successfully spawned).
    bool valid() const;

    // Wait for the process to exit. Returns exit code, -1 if killed by a signal.
    int wait();

    // Terminate the process (SIGTERM, then SIGKILL after 2s).
    void terminate();

    int native_handle() const { return pid_; }
    int stdout_fd() const { return out_fd_; }
    int stderr_fd() const { return err_fd_; }

    // Close the read ends of both pipes.
    void close_pipes();

private:
    int pid_ = -1;
    int out_fd_ = -1;
    int err_fd_ = -1;
    bool reaped_ = false;
    int exit_code_ = -1;

    friend ProcessHandle spawn_captured(const std::string& program,
                                        const std::vector<std::string>& args);
};

// Spawn a child process with stdin closed and stdout/stderr piped back.
ProcessHandle spawn_captured(const std::string& program,
                             const std::vector<std::string>& args);

// Run a program to completion, capturing its output.
// timeout_ms <= 0 waits indefinitely; on timeout the child is terminated
// and the result has timed_out set.
CommandResult run_captured(const std::string& program,
                           const std::vector<std::string>& args,
                           int timeout_ms);

} // namespace platform
