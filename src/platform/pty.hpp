#pragma once

#include <string>
#include <core/types.hpp>

namespace platform {

// A child process attached to a pseudo terminal.
class PtyProcess {
public:
    PtyProcess() = default;
    ~PtyProcess();

    PtyProcess(const PtyProcess&) = delete;
    PtyProcess& operator=(const PtyProcess&) = delete;

    // forkpty + `bash -c <command_line>` with the given viewport and
    // TERM=xterm-256color. `cwd` empty keeps our working directory.
    Result<void> spawn(const std::string& command_line, const std::string& cwd,
                       int cols, int rows);

    // Write all bytes to the master side. False if the terminal is gone.
    bool write(const std::string& data);

    // Wait up to timeout_ms for output. Returns the bytes read; empty on
    // timeout. Sets `eof` once the slave side is closed.
    std::string read(int timeout_ms, bool& eof);

    // True while the child has not been reaped.
    bool alive();

    void send_signal(int sig);

    // Wait up to timeout_ms for the child to exit; true once reaped.
    bool wait_exit(int timeout_ms);

    // Close the master descriptor. Safe to call more than once.
    void close_master();

    int master_fd() const { return master_fd_; }
    int pid() const { return pid_; }

private:
    int master_fd_ = -1;
    int pid_ = -1;
    bool reaped_ = false;
};

} // namespace platform
