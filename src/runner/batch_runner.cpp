#include "batch_runner.hpp"
#include <core/debug_log.hpp>
#include <platform/process.hpp>
#include <platform/terminal.hpp>
#include <fmt/format.h>
#include <chrono>
#include <regex>

#include <unistd.h>
#include <poll.h>
#include <cerrno>

std::optional<std::string> extract_session_id(const std::string& text) {
    static const std::regex re("session id:[ \\t]*([a-f0-9-]+)", std::regex::icase);
    std::smatch m;
    if (std::regex_search(text, m, re)) {
        return m[1].str();
    }
    return std::nullopt;
}

BatchRunner::BatchRunner(BatchOptions opts) : opts_(opts) {}

// Write a chunk through to one of our own descriptors, ignoring short writes
// to a closed terminal.
static void tee(int fd, const char* data, size_t len) {
    while (len > 0) {
        ssize_t w = write(fd, data, len);
        if (w < 0) {
            if (errno == EINTR) continue;
            return;
        }
        data += w;
        len -= static_cast<size_t>(w);
    }
}

// Read whatever is available on `fd`. Returns false on EOF or error.
static bool drain(int fd, std::string& into, int echo_fd) {
    char buf[PIPE_READ_BUF_SIZE];
    ssize_t n;
    do {
        n = read(fd, buf, sizeof(buf));
    } while (n < 0 && errno == EINTR);
    if (n <= 0) return false;
    into.append(buf, static_cast<size_t>(n));
    if (echo_fd >= 0) tee(echo_fd, buf, static_cast<size_t>(n));
    return true;
}

Result<BatchResult> BatchRunner::run(const std::string& program,
                                     const std::vector<std::string>& args) const {
    rally_log(fmt::format("batch: spawn {} ({} args)", program, args.size()));

    auto spawned = platform::spawn_piped(program, args);
    if (spawned.is_err()) {
        rally_log("batch: " + spawned.error);
        return Result<BatchResult>::Err(spawned);
    }
    platform::ProcessHandle proc = std::move(spawned.value);

    BatchResult result;
    auto start = std::chrono::steady_clock::now();
    auto deadline = start + std::chrono::milliseconds(opts_.timeout_ms);

    bool timed_out = false;
    bool was_interrupted = false;

    while (proc.stdout_fd() >= 0 || proc.stderr_fd() >= 0) {
        if (platform::interrupted()) { was_interrupted = true; break; }
        if (std::chrono::steady_clock::now() >= deadline) { timed_out = true; break; }

        struct pollfd fds[2];
        fds[0] = {proc.stdout_fd(), POLLIN, 0};
        fds[1] = {proc.stderr_fd(), POLLIN, 0};
        int pr = poll(fds, 2, 100);
        if (pr < 0) {
            if (errno == EINTR) continue;
            break;
        }
        if (pr == 0) continue;

        if (fds[0].revents & (POLLIN | POLLHUP | POLLERR)) {
            if (!drain(proc.stdout_fd(), result.output, opts_.echo ? STDOUT_FILENO : -1))
                proc.close_stdout();
        }
        if (fds[1].revents & (POLLIN | POLLHUP | POLLERR)) {
            if (!drain(proc.stderr_fd(), result.error_output, opts_.echo ? STDERR_FILENO : -1))
                proc.close_stderr();
        }
    }

    // Both pipes closed; the child may still be running (e.g. it closed its
    // descriptors early or left a grandchild holding them).
    while (!timed_out && !was_interrupted && proc.running()) {
        if (platform::interrupted()) { was_interrupted = true; break; }
        if (std::chrono::steady_clock::now() >= deadline) { timed_out = true; break; }
        platform::sleep_ms(50);
    }

    if (timed_out || was_interrupted) {
        rally_log(fmt::format("batch: {} after {} ms, terminating pid {}",
                              timed_out ? "timeout" : "interrupt",
                              std::chrono::duration_cast<std::chrono::milliseconds>(
                                  std::chrono::steady_clock::now() - start).count(),
                              proc.native_handle()));
        proc.terminate(opts_.grace_ms);

        std::string partial = result.output;
        if (!result.error_output.empty()) {
            if (!partial.empty() && partial.back() != '\n') partial += '\n';
            partial += result.error_output;
        }

        if (was_interrupted) {
            return Result<BatchResult>::Err(ErrorCode::Interrupted,
                "Interrupted; assistant process terminated");
        }
        return Result<BatchResult>::Err(ErrorCode::Timeout,
            fmt::format("Timed out after {} ms. Partial output:\n{}", opts_.timeout_ms, partial));
    }

    result.exit_code = proc.wait(-1);
    result.session_id = extract_session_id(result.output);
    if (!result.session_id) result.session_id = extract_session_id(result.error_output);

    rally_log(fmt::format("batch: exit={} stdout={}B stderr={}B session={}",
                          result.exit_code, result.output.size(), result.error_output.size(),
                          result.session_id.value_or("-")));
    return Result<BatchResult>::Ok(result);
}
