#pragma once

#include <string>
#include <ctime>

// Format the duration between two ISO timestamps (YYYY-MM-DDTHH:MM:SS).
// If end_time is empty, uses current time (for "still running" durations).
// Returns human-readable string like "2h35m", "14m22s", "8s", or "-" if start is empty.
std::string format_duration(const std::string& start_time, const std::string& end_time = "");

// "YYYY-MM-DD HH:MM:SS <zone>" in the local timezone (honours TZ, including DST).
std::string format_log_datetime(std::time_t t);

// "YYYYMMDD_HHMMSS" in the local timezone, for log file names.
std::string format_file_stamp(std::time_t t);
