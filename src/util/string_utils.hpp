#pragma once

#include <string>
#include <vector>

namespace StringUtils {
std::vector<std::string> split(const std::string& str, char delimiter);
std::string trim(const std::string& str);
std::string to_lower(const std::string& str);

// Replace every occurrence of `from` (non-empty) with `to`.
std::string replace_all(std::string str, const std::string& from, const std::string& to);

// Remove terminal control and formatting sequences (CSI, OSC, two/three byte
// ESC sequences, stray C0 controls). Newlines and tabs survive; CRLF becomes LF
// and a lone CR is dropped.
std::string strip_ansi(const std::string& str);

// POSIX single-quote an argument for a `sh -c` command line.
std::string shell_quote(const std::string& arg);

// Split UTF-8 text into code points (invalid bytes come out one at a time).
std::vector<std::string> utf8_chars(const std::string& str);
}
