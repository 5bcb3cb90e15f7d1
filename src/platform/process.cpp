#include "process.hpp"
#include "platform.hpp"
#include <fmt/format.h>

#include <unistd.h>
#include <sys/wait.h>
#include <signal.h>
#include <fcntl.h>
#include <cerrno>
#include <cstring>

namespace platform {

// ── ProcessHandle ────────────────────────────────────────────

ProcessHandle::ProcessHandle() = default;

ProcessHandle::~ProcessHandle() {
    close_stdout();
    close_stderr();
    // A handle dropped mid-run must not leave an orphan behind
    if (pid_ > 0 && !reaped_) terminate(0);
}

ProcessHandle::ProcessHandle(ProcessHandle&& other) noexcept {
    pid_ = other.pid_;
    out_fd_ = other.out_fd_;
    err_fd_ = other.err_fd_;
    reaped_ = other.reaped_;
    exit_code_ = other.exit_code_;
    other.pid_ = -1;
    other.out_fd_ = -1;
    other.err_fd_ = -1;
}

ProcessHandle& ProcessHandle::operator=(ProcessHandle&& other) noexcept {
    if (this != &other) {
        close_stdout();
        close_stderr();
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

void ProcessHandle::record_status(int status) {
    reaped_ = true;
    if (WIFEXITED(status)) {
        exit_code_ = WEXITSTATUS(status);
    } else if (WIFSIGNALED(status)) {
        exit_code_ = 128 + WTERMSIG(status);
    } else {
        exit_code_ = -1;
    }
}

bool ProcessHandle::running() {
    if (pid_ <= 0 || reaped_) return false;
    int status;
    pid_t ret = waitpid(pid_, &status, WNOHANG);
    if (ret == pid_) {
        record_status(status);
        return false;
    }
    return ret == 0;  // 0 means still running
}

int ProcessHandle::wait(int timeout_ms) {
    if (pid_ <= 0) return -1;
    if (reaped_) return exit_code_;
    if (timeout_ms < 0) {
        int status;
        pid_t ret;
        do {
            ret = waitpid(pid_, &status, 0);
        } while (ret < 0 && errno == EINTR);
        if (ret == pid_) record_status(status);
        return exit_code_;
    }
    // Poll with timeout
    int elapsed = 0;
    while (true) {
        int status;
        pid_t ret = waitpid(pid_, &status, WNOHANG);
        if (ret == pid_) {
            record_status(status);
            return exit_code_;
        }
        if (ret < 0 && errno != EINTR) return -1;
        if (elapsed >= timeout_ms) break;
        sleep_ms(50);
        elapsed += 50;
    }
    return -1;  // timed out
}

void ProcessHandle::terminate(int grace_ms) {
    if (pid_ <= 0 || reaped_) return;
    // The child leads its own process group; signal the whole group so
    // wrappers (npx -> node -> assistant) do not leave descendants behind.
    kill(-pid_, SIGTERM);
    if (wait(grace_ms) < 0 && !reaped_) {
        kill(-pid_, SIGKILL);
        wait(-1);
    }
    // Descendants that outlived the leader
    kill(-pid_, SIGKILL);
}

void ProcessHandle::close_stdout() {
    if (out_fd_ >= 0) {
        close(out_fd_);
        out_fd_ = -1;
    }
}

void ProcessHandle::close_stderr() {
    if (err_fd_ >= 0) {
        close(err_fd_);
        err_fd_ = -1;
    }
}

// ── spawn ────────────────────────────────────────────────────

static void close_pair(int fds[2]) {
    if (fds[0] >= 0) close(fds[0]);
    if (fds[1] >= 0) close(fds[1]);
}

Result<ProcessHandle> spawn_piped(const std::string& program,
                                  const std::vector<std::string>& args) {
    int out_pipe[2] = {-1, -1};
    int err_pipe[2] = {-1, -1};
    int status_pipe[2] = {-1, -1};

    if (pipe2(out_pipe, O_CLOEXEC) != 0 ||
        pipe2(err_pipe, O_CLOEXEC) != 0 ||
        pipe2(status_pipe, O_CLOEXEC) != 0) {
        int err = errno;
        close_pair(out_pipe);
        close_pair(err_pipe);
        close_pair(status_pipe);
        return Result<ProcessHandle>::Err(ErrorCode::SpawnError,
            fmt::format("pipe failed: {}", std::strerror(err)));
    }

    // Build argv before forking; the child only calls async-signal-safe functions
    std::vector<const char*> argv;
    argv.push_back(program.c_str());
    for (const auto& a : args) argv.push_back(a.c_str());
    argv.push_back(nullptr);

    pid_t pid = fork();
    if (pid < 0) {
        int err = errno;
        close_pair(out_pipe);
        close_pair(err_pipe);
        close_pair(status_pipe);
        return Result<ProcessHandle>::Err(ErrorCode::SpawnError,
            fmt::format("fork failed: {}", std::strerror(err)));
    }

    if (pid == 0) {
        // Child process. dup2 clears O_CLOEXEC on the new descriptors.
        dup2(out_pipe[1], STDOUT_FILENO);
        dup2(err_pipe[1], STDERR_FILENO);

        // Own process group so terminate() reaches grandchildren. A
        // background group must not read the terminal, so stdin is /dev/null.
        setpgid(0, 0);
        int devnull = open("/dev/null", O_RDONLY);
        if (devnull >= 0) {
            dup2(devnull, STDIN_FILENO);
            close(devnull);
        }

        signal(SIGINT, SIG_DFL);
        signal(SIGPIPE, SIG_DFL);

        execvp(program.c_str(), const_cast<char* const*>(argv.data()));

        int err = errno;
        ssize_t n = write(status_pipe[1], &err, sizeof(err));
        (void)n;
        _exit(127);  // exec failed
    }

    // Parent
    close(out_pipe[1]);
    close(err_pipe[1]);
    close(status_pipe[1]);

    ProcessHandle handle;
    handle.pid_ = pid;
    handle.out_fd_ = out_pipe[0];
    handle.err_fd_ = err_pipe[0];

    // EOF on the status pipe means exec succeeded
    int child_errno = 0;
    ssize_t n;
    do {
        n = read(status_pipe[0], &child_errno, sizeof(child_errno));
    } while (n < 0 && errno == EINTR);
    close(status_pipe[0]);

    if (n > 0) {
        handle.wait(-1);
        return Result<ProcessHandle>::Err(ErrorCode::SpawnError,
            fmt::format("Failed to start {}: {}", program, std::strerror(child_errno)));
    }

    return Result<ProcessHandle>::Ok(std::move(handle));
}

} // namespace platform
