#pragma once

#include <string>
#include <ctime>

// Generate an ISO 8601 timestamp (YYYY-MM-DDTHH:MM:SS) for the current local time.
std::string now_iso();

// Same format for an arbitrary time.
std::string iso_time(std::time_t t);

// Parse an ISO 8601 timestamp to time_t. Returns 0 on failure.
std::time_t parse_iso_time(const std::string& iso);

// Safe integer parse: returns fallback on failure (no exceptions).
int safe_stoi(const std::string& s, int fallback = 0);

// Lowercase hex MD5 digest of the given bytes.
std::string md5_hex(const std::string& input);

// Compare dotted version strings numerically ("22.1" vs "22.0.3").
// Missing components count as 0. Returns -1, 0 or 1.
int compare_versions(const std::string& version, const std::string& minimum);

// Random RFC 4122 version 4 UUID.
std::string generate_uuid();

// Trim leading and trailing whitespace in-place.
inline void trim(std::string& s) {
    auto start = s.find_first_not_of(" \t\r\n");
    if (start == std::string::npos) { s.clear(); return; }
    s.erase(0, start);
    s.erase(s.find_last_not_of(" \t\r\n") + 1);
}
