#pragma once

#include <string>
#include <thread>
#include <atomic>
#include <memory>
#include <core/types.hpp>
#include <platform/pty.hpp>
#include "output_collector.hpp"

enum class PtyState { Created, Spawning, Ready, Sending, Collecting, Terminated };

const char* pty_state_name(PtyState state);

struct PtySessionOptions {
    std::string command_line;           // run through `bash -c`
    std::string working_dir;            // empty: inherit
    int cols = PTY_COLS;
    int rows = PTY_ROWS;
    int spawn_grace_ms = PTY_SPAWN_GRACE_MS;
    int key_delay_ms = PTY_KEY_DELAY_MS;
    int char_delay_ms = PTY_CHAR_DELAY_MS;
    int kill_wait_ms = PTY_KILL_WAIT_MS;
};

// Drives an interactive assistant CLI through a pseudo terminal.
//
// A reader thread copies everything the child writes into an OutputBuffer.
// The reply to a prompt is whatever arrives after send() until the output
// goes quiet (see collect_output). One session serves one conversation and
// is not reused after kill().
class PtySession {
public:
    explicit PtySession(PtySessionOptions opts);
    ~PtySession();

    PtySession(const PtySession&) = delete;
    PtySession& operator=(const PtySession&) = delete;

    // Created -> Ready. SpawnError if forkpty fails or the child is gone
    // after the grace window.
    Result<void> spawn();

    // Ready -> Sending -> Collecting. Clears the buffer, then types the
    // prompt the way a user would: ESC, Ctrl-U, one code point at a time, CR.
    Result<void> send(const std::string& prompt);

    // Collecting (or Ready, for startup output) -> Ready. Waits for the
    // reply; see collect_output.
    CollectResult collect(const CollectOptions& opts);

    // Any state -> Terminated. Ctrl-C, SIGTERM, SIGKILL, reap. Idempotent.
    void kill();

    bool is_alive();
    PtyState state() const { return state_; }
    std::string raw_output() const { return buffer_.snapshot(); }

private:
    void reader_loop();
    void stop_reader();
    // After the child exits, give the reader up to kill_wait_ms to pick up
    // what is still queued on the master side.
    void drain_after_exit();

    PtySessionOptions opts_;
    PtyState state_ = PtyState::Created;
    std::unique_ptr<platform::PtyProcess> proc_;
    OutputBuffer buffer_;
    std::thread reader_;
    std::atomic<bool> stop_{false};
    std::atomic<bool> eof_{false};
};
