#include "utils.hpp"
#include "types.hpp"
#include <openssl/evp.h>
#include <algorithm>
#include <chrono>
#include <cstdio>
#include <random>
#include <sstream>
#include <iomanip>
#include <vector>

const char* error_code_name(ErrorCode code) {
    switch (code) {
        case ErrorCode::None:                    return "None";
        case ErrorCode::SpawnError:              return "SpawnError";
        case ErrorCode::Timeout:                 return "Timeout";
        case ErrorCode::InvalidMode:             return "InvalidMode";
        case ErrorCode::InvalidReasoningEffort:  return "InvalidReasoningEffort";
        case ErrorCode::IncompatibleOption:      return "IncompatibleOption";
        case ErrorCode::MissingWorkingDirectory: return "MissingWorkingDirectory";
        case ErrorCode::MissingArgument:         return "MissingArgument";
        case ErrorCode::InvalidArgument:         return "InvalidArgument";
        case ErrorCode::NotFound:                return "NotFound";
        case ErrorCode::MalformedHeader:         return "MalformedHeader";
        case ErrorCode::NoPendingRequest:        return "NoPendingRequest";
        case ErrorCode::TemplateMissing:         return "TemplateMissing";
        case ErrorCode::IoError:                 return "IoError";
        case ErrorCode::Interrupted:             return "Interrupted";
    }
    return "Unknown";
}

std::string now_iso() {
    return iso_time(std::chrono::system_clock::to_time_t(std::chrono::system_clock::now()));
}

std::string iso_time(std::time_t t) {
    struct tm tm_buf;
    localtime_r(&t, &tm_buf);
    char buf[32];
    std::strftime(buf, sizeof(buf), "%Y-%m-%dT%H:%M:%S", &tm_buf);
    return std::string(buf);
}

std::time_t parse_iso_time(const std::string& iso) {
    struct tm tm_buf = {};
    if (sscanf(iso.c_str(), "%d-%d-%dT%d:%d:%d",
               &tm_buf.tm_year, &tm_buf.tm_mon, &tm_buf.tm_mday,
               &tm_buf.tm_hour, &tm_buf.tm_min, &tm_buf.tm_sec) == 6) {
        tm_buf.tm_year -= 1900;
        tm_buf.tm_mon -= 1;
        tm_buf.tm_isdst = -1;
        return mktime(&tm_buf);
    }
    return 0;
}

int safe_stoi(const std::string& s, int fallback) {
    try {
        return std::stoi(s);
    } catch (const std::exception&) {
        return fallback;
    }
}

std::string md5_hex(const std::string& input) {
    unsigned char digest[EVP_MAX_MD_SIZE];
    unsigned int len = 0;
    if (EVP_Digest(input.data(), input.size(), digest, &len, EVP_md5(), nullptr) != 1) {
        return "";
    }

    static const char HEX[] = "0123456789abcdef";
    std::string out;
    out.reserve(len * 2);
    for (unsigned int i = 0; i < len; i++) {
        out += HEX[digest[i] >> 4];
        out += HEX[digest[i] & 0x0F];
    }
    return out;
}

static std::vector<int> version_parts(const std::string& v) {
    std::vector<int> parts;
    std::istringstream ss(v);
    std::string item;
    while (std::getline(ss, item, '.')) {
        parts.push_back(safe_stoi(item, 0));
    }
    return parts;
}

int compare_versions(const std::string& version, const std::string& minimum) {
    auto v = version_parts(version);
    auto m = version_parts(minimum);
    size_t n = std::max(v.size(), m.size());
    for (size_t i = 0; i < n; i++) {
        int a = i < v.size() ? v[i] : 0;
        int b = i < m.size() ? m[i] : 0;
        if (a > b) return 1;
        if (a < b) return -1;
    }
    return 0;
}

std::string generate_uuid() {
    static std::random_device rd;
    static std::mt19937_64 gen(rd());
    static std::uniform_int_distribution<uint64_t> dist;

    uint64_t ab = dist(gen);
    uint64_t cd = dist(gen);

    ab = (ab & 0xFFFFFFFFFFFF0FFFULL) | 0x0000000000004000ULL;  // version 4
    cd = (cd & 0x3FFFFFFFFFFFFFFFULL) | 0x8000000000000000ULL;  // RFC 4122 variant

    std::ostringstream ss;
    ss << std::hex << std::setfill('0');
    ss << std::setw(8) << (ab >> 32) << "-";
    ss << std::setw(4) << ((ab >> 16) & 0xFFFF) << "-";
    ss << std::setw(4) << (ab & 0xFFFF) << "-";
    ss << std::setw(4) << (cd >> 48) << "-";
    ss << std::setw(12) << (cd & 0x0000FFFFFFFFFFFFULL);
    return ss.str();
}
