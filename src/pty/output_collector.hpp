#pragma once

#include <string>
#include <mutex>
#include <atomic>
#include <functional>
#include <core/types.hpp>

// Output accumulated from a PTY. One producer (the reader thread) appends;
// the collector polls size() without taking the lock.
class OutputBuffer {
public:
    void append(const std::string& data);
    void clear();
    std::string snapshot() const;
    size_t size() const { return size_.load(); }

private:
    mutable std::mutex mu_;
    std::string data_;
    std::atomic<size_t> size_{0};
};

struct CollectOptions {
    int idle_ms = DEFAULT_IDLE_TIMEOUT_MS;   // unchanged this long => done
    int poll_ms = DEFAULT_POLL_INTERVAL_MS;
    int max_ms = DEFAULT_RUN_TIMEOUT_MS;     // absolute ceiling from collection start
};

enum class CollectStop { Idle, MaxTime, ProcessExited, Interrupted };

struct CollectResult {
    std::string text;         // control sequences stripped, LF line endings
    CollectStop reason = CollectStop::Idle;
    int elapsed_ms = 0;
};

// Poll `buffer` until its length has not changed for idle_ms of wall-clock
// time, max_ms has passed, or `alive` reports the process gone. Never
// returns early on idle: a completion is only declared once the full idle
// window has been observed. Timeouts are outcomes, not errors.
CollectResult collect_output(const OutputBuffer& buffer,
                             const std::function<bool()>& alive,
                             const CollectOptions& opts);

const char* collect_stop_name(CollectStop reason);
