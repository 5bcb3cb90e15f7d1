#include "string_utils.hpp"
#include <algorithm>
#include <cctype>
#include <sstream>

namespace StringUtils {

std::vector<std::string> split(const std::string& str, char delimiter) {
    std::vector<std::string> parts;
    std::istringstream ss(str);
    std::string item;
    while (std::getline(ss, item, delimiter)) {
        parts.push_back(item);
    }
    return parts;
}

std::string trim(const std::string& str) {
    auto start = str.find_first_not_of(" \t\r\n");
    if (start == std::string::npos) return "";
    auto end = str.find_last_not_of(" \t\r\n");
    return str.substr(start, end - start + 1);
}

std::string to_lower(const std::string& str) {
    std::string out = str;
    std::transform(out.begin(), out.end(), out.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return out;
}

std::string replace_all(std::string str, const std::string& from, const std::string& to) {
    if (from.empty()) return str;
    size_t pos = 0;
    while ((pos = str.find(from, pos)) != std::string::npos) {
        str.replace(pos, from.size(), to);
        pos += to.size();
    }
    return str;
}

std::string strip_ansi(const std::string& str) {
    std::string out;
    out.reserve(str.size());
    const size_t n = str.size();
    size_t i = 0;

    while (i < n) {
        unsigned char c = static_cast<unsigned char>(str[i]);

        if (c == 0x1b) {
            if (i + 1 >= n) break;
            char kind = str[i + 1];
            if (kind == '[') {
                // CSI: parameters/intermediates then a final byte in 0x40-0x7E
                i += 2;
                while (i < n) {
                    unsigned char b = static_cast<unsigned char>(str[i++]);
                    if (b >= 0x40 && b <= 0x7e) break;
                }
            } else if (kind == ']' || kind == 'P' || kind == '_' || kind == '^') {
                // OSC / DCS / APC / PM: terminated by BEL or ST (ESC \)
                i += 2;
                while (i < n) {
                    if (str[i] == '\x07') { i++; break; }
                    if (str[i] == '\x1b' && i + 1 < n && str[i + 1] == '\\') { i += 2; break; }
                    i++;
                }
            } else if (kind == '(' || kind == ')' || kind == '*' || kind == '+' || kind == '#') {
                i += 3;  // charset designation: ESC ( B
            } else {
                i += 2;  // ESC =, ESC >, ESC 7, ...
            }
            continue;
        }

        if (c == '\r') {
            if (i + 1 < n && str[i + 1] == '\n') {
                out += '\n';
                i += 2;
            } else {
                i++;
            }
            continue;
        }

        if ((c < 0x20 && c != '\n' && c != '\t') || c == 0x7f) {
            i++;
            continue;
        }

        out += static_cast<char>(c);
        i++;
    }
    return out;
}

std::string shell_quote(const std::string& arg) {
    if (!arg.empty() &&
        std::all_of(arg.begin(), arg.end(), [](unsigned char c) {
            return std::isalnum(c) || c == '-' || c == '_' || c == '.' ||
                   c == '/' || c == '@' || c == ':' || c == '=' || c == ',';
        })) {
        return arg;
    }
    return "'" + replace_all(arg, "'", "'\\''") + "'";
}

std::vector<std::string> utf8_chars(const std::string& str) {
    std::vector<std::string> chars;
    size_t i = 0;
    while (i < str.size()) {
        unsigned char c = static_cast<unsigned char>(str[i]);
        size_t len = 1;
        if      ((c & 0xE0) == 0xC0) len = 2;
        else if ((c & 0xF0) == 0xE0) len = 3;
        else if ((c & 0xF8) == 0xF0) len = 4;

        if (i + len > str.size()) len = 1;
        for (size_t k = 1; k < len; k++) {
            if ((static_cast<unsigned char>(str[i + k]) & 0xC0) != 0x80) {
                len = 1;
                break;
            }
        }
        chars.push_back(str.substr(i, len));
        i += len;
    }
    return chars;
}

}
