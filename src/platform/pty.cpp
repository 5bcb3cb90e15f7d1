#include "pty.hpp"
#include "platform.hpp"
#include <fmt/format.h>

#include <pty.h>
#include <unistd.h>
#include <sys/ioctl.h>
#include <sys/wait.h>
#include <signal.h>
#include <termios.h>
#include <poll.h>
#include <cerrno>
#include <cstdlib>
#include <cstring>
#include <vector>

namespace platform {

PtyProcess::~PtyProcess() {
    if (pid_ > 0 && !reaped_) {
        kill(-pid_, SIGKILL);
        waitpid(pid_, nullptr, 0);
        reaped_ = true;
    }
    close_master();
}

Result<void> PtyProcess::spawn(const std::string& command_line, const std::string& cwd,
                               int cols, int rows) {
    if (pid_ > 0) {
        return Result<void>::Err(ErrorCode::SpawnError, "PTY already spawned");
    }

    struct winsize ws;
    std::memset(&ws, 0, sizeof(ws));
    ws.ws_col = static_cast<unsigned short>(cols);
    ws.ws_row = static_cast<unsigned short>(rows);

    std::vector<const char*> argv = {"bash", "-c", command_line.c_str(), nullptr};

    int master = -1;
    pid_t pid = forkpty(&master, nullptr, nullptr, &ws);
    if (pid < 0) {
        return Result<void>::Err(ErrorCode::SpawnError,
            fmt::format("forkpty failed: {}", std::strerror(errno)));
    }

    if (pid == 0) {
        // Child: the slave side is already stdin/stdout/stderr
        if (!cwd.empty() && chdir(cwd.c_str()) != 0) {
            const char msg[] = "rally: cannot enter working directory\n";
            ssize_t n = ::write(STDERR_FILENO, msg, sizeof(msg) - 1);
            (void)n;
            _exit(126);
        }
        setenv("TERM", PTY_TERM, 1);
        signal(SIGINT, SIG_DFL);
        signal(SIGPIPE, SIG_DFL);
        execvp("bash", const_cast<char* const*>(argv.data()));
        _exit(127);
    }

    master_fd_ = master;
    pid_ = pid;
    reaped_ = false;
    return Result<void>::Ok();
}

bool PtyProcess::write(const std::string& data) {
    if (master_fd_ < 0) return false;
    const char* p = data.data();
    size_t left = data.size();
    while (left > 0) {
        ssize_t w = ::write(master_fd_, p, left);
        if (w < 0) {
            if (errno == EINTR) continue;
            if (errno == EAGAIN) { sleep_ms(1); continue; }
            return false;
        }
        p += w;
        left -= static_cast<size_t>(w);
    }
    return true;
}

std::string PtyProcess::read(int timeout_ms, bool& eof) {
    eof = false;
    if (master_fd_ < 0) {
        eof = true;
        return "";
    }

    struct pollfd pfd = {master_fd_, POLLIN, 0};
    int pr = poll(&pfd, 1, timeout_ms);
    if (pr <= 0) return "";

    char buf[PTY_READ_BUF_SIZE];
    ssize_t n = ::read(master_fd_, buf, sizeof(buf));
    if (n > 0) return std::string(buf, static_cast<size_t>(n));

    // Linux reports EIO on the master once every slave descriptor is closed
    if (n == 0 || (errno != EINTR && errno != EAGAIN)) eof = true;
    return "";
}

bool PtyProcess::alive() {
    if (pid_ <= 0 || reaped_) return false;
    int status;
    pid_t ret = waitpid(pid_, &status, WNOHANG);
    if (ret == pid_ || (ret < 0 && errno == ECHILD)) {
        reaped_ = true;
        return false;
    }
    return true;
}

void PtyProcess::send_signal(int sig) {
    // forkpty makes the child a session leader; signal its whole group
    if (pid_ > 0 && !reaped_) kill(-pid_, sig);
}

bool PtyProcess::wait_exit(int timeout_ms) {
    int elapsed = 0;
    while (alive()) {
        if (elapsed >= timeout_ms) return false;
        sleep_ms(20);
        elapsed += 20;
    }
    return true;
}

void PtyProcess::close_master() {
    if (master_fd_ >= 0) {
        close(master_fd_);
        master_fd_ = -1;
    }
}

} // namespace platform
