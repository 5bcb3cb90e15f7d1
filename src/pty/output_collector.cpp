#include "output_collector.hpp"
#include <util/string_utils.hpp>
#include <platform/platform.hpp>
#include <platform/terminal.hpp>
#include <core/debug_log.hpp>
#include <fmt/format.h>
#include <algorithm>
#include <chrono>

void OutputBuffer::append(const std::string& data) {
    std::lock_guard<std::mutex> lock(mu_);
    data_ += data;
    size_.store(data_.size());
}

void OutputBuffer::clear() {
    std::lock_guard<std::mutex> lock(mu_);
    data_.clear();
    size_.store(0);
}

std::string OutputBuffer::snapshot() const {
    std::lock_guard<std::mutex> lock(mu_);
    return data_;
}

const char* collect_stop_name(CollectStop reason) {
    switch (reason) {
        case CollectStop::Idle:          return "idle";
        case CollectStop::MaxTime:       return "max-time";
        case CollectStop::ProcessExited: return "process-exited";
        case CollectStop::Interrupted:   return "interrupted";
    }
    return "idle";
}

CollectResult collect_output(const OutputBuffer& buffer,
                             const std::function<bool()>& alive,
                             const CollectOptions& opts) {
    using clock = std::chrono::steady_clock;
    auto ms_since = [](clock::time_point t) {
        return static_cast<int>(std::chrono::duration_cast<std::chrono::milliseconds>(
            clock::now() - t).count());
    };

    auto start = clock::now();
    auto last_change = start;
    size_t last_size = buffer.size();
    int poll_ms = std::max(1, opts.poll_ms);

    CollectResult result;
    while (true) {
        size_t size = buffer.size();
        if (size != last_size) {
            last_size = size;
            last_change = clock::now();
        }

        if (platform::interrupted()) {
            result.reason = CollectStop::Interrupted;
            break;
        }
        if (alive && !alive()) {
            result.reason = CollectStop::ProcessExited;
            break;
        }
        if (ms_since(last_change) >= opts.idle_ms) {
            result.reason = CollectStop::Idle;
            break;
        }
        int elapsed = ms_since(start);
        if (elapsed >= opts.max_ms) {
            result.reason = CollectStop::MaxTime;
            break;
        }

        platform::sleep_ms(std::min(poll_ms, opts.max_ms - elapsed));
    }

    result.elapsed_ms = ms_since(start);
    result.text = StringUtils::strip_ansi(buffer.snapshot());
    rally_log(fmt::format("collect: stop={} after {} ms, {} raw bytes",
                          collect_stop_name(result.reason), result.elapsed_ms, last_size));
    return result;
}
