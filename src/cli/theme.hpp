#pragma once

#include <string>
#include <fmt/format.h>

// Status lines go to stderr; stdout carries assistant output and the
// structured result only.
namespace theme {

namespace color {
    const std::string BLUE      = "\033[38;2;62;120;178m";
    const std::string BROWN     = "\033[38;2;128;99;58m";
    const std::string RED       = "\033[91m";
    const std::string GREEN     = "\033[92m";
    const std::string YELLOW    = "\033[93m";
    const std::string BOLD      = "\033[1m";
    const std::string DIM       = "\033[2m";
    const std::string RESET     = "\033[0m";
}

// Off when stderr is not a terminal (set once in main).
inline bool& enabled() {
    static bool on = true;
    return on;
}

inline std::string paint(const std::string& code, const std::string& s) {
    return enabled() ? code + s + color::RESET : s;
}

// Shorthand wrappers
inline std::string brown(const std::string& s)  { return paint(color::BROWN, s); }
inline std::string bold(const std::string& s)   { return paint(color::BOLD, s); }
inline std::string dim(const std::string& s)    { return paint(color::DIM, s); }

// Section header with a blank line on either side
inline std::string section(const std::string& title) {
    return "\n" + paint(color::BROWN + color::BOLD, "  " + title) + "\n\n";
}

// ── Status indicators ───────────────────────────────────

inline std::string ok(const std::string& msg) {
    return paint(color::GREEN, "    + ") + msg + "\n";
}

inline std::string fail(const std::string& msg) {
    return paint(color::RED, "    x ") + msg + "\n";
}

inline std::string warn(const std::string& msg) {
    return paint(color::YELLOW, "    ! ") + msg + "\n";
}

inline std::string info(const std::string& msg) {
    return paint(color::BLUE, "    ~ ") + msg + "\n";
}

// Key-value row for usage and status panels
inline std::string kv(const std::string& key, const std::string& value) {
    return paint(color::DIM, fmt::format("    {:<22}", key)) + value + "\n";
}

} // namespace theme
