#pragma once

#include <string>
#include <vector>

namespace platform {

// Handle to a spawned child process with its stdout and stderr piped back.
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

    // True if the process is still running. Reaps it if it has exited.
    bool running();

    // Wait for the process to exit. Returns exit code, 128+signal if it was
    // killed, or -1 on timeout. timeout_ms = -1 means indefinite wait.
    int wait(int timeout_ms = -1);

    // SIGTERM, then SIGKILL after the grace period. Reaps the child.
    void terminate();

    // Send SIGTERM without waiting. Safe to call while another thread reads.
    void signal_terminate();

    // Read ends of the child's stdout/stderr pipes, -1 once closed.
    int stdout_fd() const { return out_fd_; }
    int stderr_fd() const { return err_fd_; }
    void close_pipes();

    int native_handle() const { return pid_; }

private:
    int pid_ = -1;
    int out_fd_ = -1;
    int err_fd_ = -1;
    bool reaped_ = false;
    int exit_code_ = -1;

    void record_status(int status);
    void release();

    friend ProcessHandle spawn(const std::string& program,
                               const std::vector<std::string>& args);
};

// Spawn a child process with stdin closed and stdout/stderr captured.
// Returns an invalid handle if the pipes could not be created or fork failed.
// A program that cannot be exec'd exits with status 127.
ProcessHandle spawn(const std::string& program,
                    const std::vector<std::string>& args);

// Read from fd into out until EOF. Returns false on a read error.
bool drain_fd(int fd, std::string& out);

} // namespace platform
