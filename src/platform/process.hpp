#pragma once

#include <string>
#include <vector>
#include <core/types.hpp>

namespace platform {

// Handle to a spawned child whose stdout and stderr are pipes.
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

    // True if the process is still running. Reaps it once it has exited.
    bool running();

    // Wait for the process to exit. Returns exit code, or -1 on timeout.
    // timeout_ms = -1 means indefinite wait. A signal death reports 128+signo.
    int wait(int timeout_ms = -1);

    // SIGTERM to the child's process group, then SIGKILL if the child is
    // still alive after grace_ms. Remaining group members are killed. Always reaps.
    void terminate(int grace_ms);

    // Read ends of the child's stdout / stderr pipes (-1 once closed).
    int stdout_fd() const { return out_fd_; }
    int stderr_fd() const { return err_fd_; }
    void close_stdout();
    void close_stderr();

    int native_handle() const { return pid_; }

private:
    void record_status(int status);

    int pid_ = -1;
    int out_fd_ = -1;
    int err_fd_ = -1;
    bool reaped_ = false;
    int exit_code_ = -1;

    friend Result<ProcessHandle> spawn_piped(const std::string& program,
                                             const std::vector<std::string>& args);
};

// Spawn `program` (PATH lookup, no shell) in a new process group, with stdin
// on /dev/null and stdout / stderr on pipes. Exec failure is reported as SpawnError through a
// close-on-exec status pipe, so a missing binary never looks like a run.
Result<ProcessHandle> spawn_piped(const std::string& program,
                                  const std::vector<std::string>& args);

} // namespace platform
