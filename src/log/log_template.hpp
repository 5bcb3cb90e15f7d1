#pragma once

#include <string>
#include <vector>
#include <optional>
#include <filesystem>
#include <core/types.hpp>

namespace fs = std::filesystem;

// Fixed markers shared by the template and the log parser.
namespace markers {
constexpr const char* LOG_HEADER      = "# Assistant Discussion Log";
constexpr const char* REQUEST_PREFIX  = "## Requester \xe2\x86\x92 Assistant (";
constexpr const char* RESPONSE_PREFIX = "## Assistant \xe2\x86\x92 Requester (";
constexpr const char* CONCLUSION      = "## Conclusion";

constexpr const char* FIELD_DATE     = "**Date**:";
constexpr const char* FIELD_TOPIC    = "**Topic**:";
constexpr const char* FIELD_PURPOSE  = "**Purpose**:";
constexpr const char* FIELD_SESSION  = "**Session**:";
constexpr const char* FIELD_WORKDIR  = "**Working directory**:";
constexpr const char* FIELD_SANDBOX  = "**Sandbox**:";
constexpr const char* FIELD_REFPATHS = "**Reference paths**:";
} // namespace markers

// Values substituted for placeholders the caller does not supply.
namespace placeholders {
constexpr const char* PURPOSE     = "(fill in for this request)";
constexpr const char* SESSION_ID  = "(filled in after the first run)";
constexpr const char* NO_WORKDIR  = "none";
constexpr const char* NO_REFPATHS = "  - none";
constexpr const char* QUESTION    = "(write the request here)";
constexpr const char* ANSWER      = "(assistant reply)";
constexpr const char* SUMMARY     = "(key points of the reply)";
constexpr const char* NEXT_ACTION = "none";
} // namespace placeholders

// Header marker line for a turn, e.g. "## Requester → Assistant (3)".
std::string request_marker(int rally);
std::string response_marker(int rally);

// Built-in template written by `rally setup`.
const char* default_log_template();

struct TemplateValues {
    std::string datetime;
    std::string topic;
    std::string purpose;
    std::optional<std::string> working_dir;
    Isolation isolation = Isolation::ReadOnly;
    std::vector<std::string> reference_paths;
};

// Replace every {{PLACEHOLDER}} in `tmpl`. {{TOPIC}} may appear any number
// of times; the others are replaced wherever they occur as well.
std::string render_template(const std::string& tmpl, const TemplateValues& values);

// Read a template file. TemplateMissing if it does not exist.
Result<std::string> load_template(const fs::path& path);

// Write the built-in template to `path` unless a file is already there.
// Returns true if a file was written.
Result<bool> install_default_template(const fs::path& path);
