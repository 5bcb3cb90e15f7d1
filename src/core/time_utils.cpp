#include "time_utils.hpp"
#include <fmt/format.h>
#include <ctime>
#include <sstream>
#include <iomanip>

static bool parse_iso(const char* s, struct tm* out) {
    *out = {};
    std::istringstream ss(s);
    ss >> std::get_time(out, "%Y-%m-%dT%H:%M:%S");
    out->tm_isdst = -1;
    return !ss.fail();
}

std::string format_duration(const std::string& start_time, const std::string& end_time) {
    if (start_time.empty()) return "-";

    struct tm start_tm = {};
    if (!parse_iso(start_time.c_str(), &start_tm)) {
        return "?";
    }
    std::time_t start_t = mktime(&start_tm);

    std::time_t end_t;
    if (!end_time.empty()) {
        struct tm end_tm = {};
        if (!parse_iso(end_time.c_str(), &end_tm)) {
            return "?";
        }
        end_t = mktime(&end_tm);
    } else {
        end_t = std::time(nullptr);
    }

    int seconds = static_cast<int>(std::difftime(end_t, start_t));
    int hours = seconds / 3600;
    int mins = (seconds % 3600) / 60;
    int secs = seconds % 60;

    if (hours > 0) {
        return fmt::format("{}h{}m", hours, mins);
    } else if (mins > 0) {
        return fmt::format("{}m{}s", mins, secs);
    } else {
        return fmt::format("{}s", secs);
    }
}

static std::string format_local(std::time_t t, const char* pattern) {
    struct tm tm_buf;
    localtime_r(&t, &tm_buf);
    char buf[64];
    size_t n = std::strftime(buf, sizeof(buf), pattern, &tm_buf);
    return std::string(buf, n);
}

std::string format_log_datetime(std::time_t t) {
    return format_local(t, "%Y-%m-%d %H:%M:%S %Z");
}

std::string format_file_stamp(std::time_t t) {
    return format_local(t, "%Y%m%d_%H%M%S");
}
