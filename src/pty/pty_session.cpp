#include "pty_session.hpp"
#include <util/string_utils.hpp>
#include <platform/platform.hpp>
#include <core/debug_log.hpp>
#include <fmt/format.h>
#include <signal.h>

const char* pty_state_name(PtyState state) {
    switch (state) {
        case PtyState::Created:    return "created";
        case PtyState::Spawning:   return "spawning";
        case PtyState::Ready:      return "ready";
        case PtyState::Sending:    return "sending";
        case PtyState::Collecting: return "collecting";
        case PtyState::Terminated: return "terminated";
    }
    return "created";
}

PtySession::PtySession(PtySessionOptions opts) : opts_(std::move(opts)) {}

PtySession::~PtySession() {
    kill();
}

void PtySession::reader_loop() {
    while (!stop_.load()) {
        bool eof = false;
        std::string chunk = proc_->read(100, eof);
        if (!chunk.empty()) buffer_.append(chunk);
        if (eof) {
            eof_.store(true);
            break;
        }
    }
}

void PtySession::stop_reader() {
    stop_.store(true);
    if (reader_.joinable()) reader_.join();
}

void PtySession::drain_after_exit() {
    int waited = 0;
    while (!eof_.load() && waited < opts_.kill_wait_ms) {
        platform::sleep_ms(10);
        waited += 10;
    }
}

bool PtySession::is_alive() {
    if (!proc_ || state_ == PtyState::Terminated) return false;
    if (eof_.load()) return false;
    return proc_->alive();
}

Result<void> PtySession::spawn() {
    if (state_ != PtyState::Created) {
        return Result<void>::Err(ErrorCode::SpawnError,
            fmt::format("Cannot spawn from state {}", pty_state_name(state_)));
    }
    state_ = PtyState::Spawning;
    rally_log(fmt::format("pty: spawn {}x{} cwd='{}' cmd={}",
                          opts_.cols, opts_.rows, opts_.working_dir, opts_.command_line));

    proc_ = std::make_unique<platform::PtyProcess>();
    auto r = proc_->spawn(opts_.command_line, opts_.working_dir, opts_.cols, opts_.rows);
    if (r.is_err()) {
        state_ = PtyState::Terminated;
        proc_.reset();
        return r;
    }

    reader_ = std::thread(&PtySession::reader_loop, this);

    platform::sleep_ms(opts_.spawn_grace_ms);
    if (!is_alive()) {
        drain_after_exit();
        std::string early = StringUtils::trim(StringUtils::strip_ansi(buffer_.snapshot()));
        kill();
        std::string msg = "Assistant process exited during startup";
        if (!early.empty()) msg += ": " + early;
        return Result<void>::Err(ErrorCode::SpawnError, msg);
    }

    state_ = PtyState::Ready;
    rally_log(fmt::format("pty: ready pid={}", proc_->pid()));
    return Result<void>::Ok();
}

Result<void> PtySession::send(const std::string& prompt) {
    if (state_ != PtyState::Ready) {
        return Result<void>::Err(ErrorCode::SpawnError,
            fmt::format("Cannot send from state {}", pty_state_name(state_)));
    }
    if (!is_alive()) {
        return Result<void>::Err(ErrorCode::SpawnError, "Assistant process is not running");
    }

    state_ = PtyState::Sending;
    buffer_.clear();

    auto fail = [this](const char* what) {
        kill();
        return Result<void>::Err(ErrorCode::SpawnError,
            fmt::format("Write to assistant terminal failed ({})", what));
    };

    if (!proc_->write(std::string(1, KEY_ESC))) return fail("escape");
    platform::sleep_ms(opts_.key_delay_ms);
    if (!proc_->write(std::string(1, KEY_CTRL_U))) return fail("line clear");
    platform::sleep_ms(opts_.key_delay_ms);

    // Typed one code point at a time; pasting a whole line trips the TUI's
    // bracketed-paste handling
    auto chars = StringUtils::utf8_chars(prompt);
    for (size_t i = 0; i < chars.size(); ++i) {
        if (!proc_->write(chars[i])) return fail("prompt");
        if (i + 1 < chars.size()) platform::sleep_ms(opts_.char_delay_ms);
    }
    platform::sleep_ms(opts_.key_delay_ms);
    if (!proc_->write(std::string(1, KEY_CR))) return fail("submit");

    rally_log(fmt::format("pty: sent {} chars", chars.size()));
    state_ = PtyState::Collecting;
    return Result<void>::Ok();
}

CollectResult PtySession::collect(const CollectOptions& opts) {
    if (state_ != PtyState::Ready && state_ != PtyState::Collecting) {
        CollectResult empty;
        empty.reason = CollectStop::ProcessExited;
        empty.text = StringUtils::strip_ansi(buffer_.snapshot());
        return empty;
    }
    state_ = PtyState::Collecting;
    auto result = collect_output(buffer_, [this] { return is_alive(); }, opts);
    if (result.reason == CollectStop::ProcessExited) {
        drain_after_exit();
        result.text = StringUtils::strip_ansi(buffer_.snapshot());
    }
    state_ = PtyState::Ready;
    return result;
}

void PtySession::kill() {
    if (state_ == PtyState::Terminated && !proc_) return;

    if (proc_) {
        if (proc_->alive()) {
            proc_->write(std::string(1, KEY_CTRL_C));
            platform::sleep_ms(opts_.kill_wait_ms);
        }
        if (proc_->alive()) {
            proc_->send_signal(SIGTERM);
            if (!proc_->wait_exit(opts_.kill_wait_ms)) {
                proc_->send_signal(SIGKILL);
                proc_->wait_exit(opts_.kill_wait_ms);
            }
        }
        stop_reader();
        proc_->close_master();
        rally_log(fmt::format("pty: terminated pid={}", proc_->pid()));
        proc_.reset();
    } else {
        stop_reader();
    }
    state_ = PtyState::Terminated;
}
