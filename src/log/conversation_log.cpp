#include "conversation_log.hpp"
#include <core/time_utils.hpp>
#include <core/utils.hpp>
#include <core/debug_log.hpp>
#include <util/string_utils.hpp>
#include <fmt/format.h>
#include <algorithm>
#include <cctype>
#include <fstream>
#include <sstream>

// ── Line helpers ─────────────────────────────────────────────

static std::string rtrim(const std::string& s) {
    auto end = s.find_last_not_of(" \t\r\n");
    return end == std::string::npos ? "" : s.substr(0, end + 1);
}

static bool starts_with(const std::string& s, const std::string& prefix) {
    return s.compare(0, prefix.size(), prefix) == 0;
}

// Split into lines; a trailing newline does not produce an empty last line.
static std::vector<std::string> split_lines(const std::string& content) {
    std::vector<std::string> lines;
    size_t start = 0;
    while (start < content.size()) {
        size_t nl = content.find('\n', start);
        if (nl == std::string::npos) {
            lines.push_back(content.substr(start));
            break;
        }
        lines.push_back(content.substr(start, nl - start));
        start = nl + 1;
    }
    return lines;
}

static std::string join_lines(const std::vector<std::string>& lines) {
    std::string out;
    for (const auto& l : lines) {
        out += l;
        out += '\n';
    }
    return out;
}

// ── Markers ──────────────────────────────────────────────────

static std::optional<int> parse_index(const std::string& line, const std::string& prefix) {
    if (!starts_with(line, prefix)) return std::nullopt;
    if (line.size() < prefix.size() + 2 || line.back() != ')') return std::nullopt;
    std::string digits = line.substr(prefix.size(), line.size() - prefix.size() - 1);
    if (digits.empty() || digits.size() > 9) return std::nullopt;
    for (char c : digits) {
        if (!std::isdigit(static_cast<unsigned char>(c))) return std::nullopt;
    }
    return std::stoi(digits);
}

std::optional<TurnMarker> parse_turn_marker(const std::string& raw) {
    std::string line = rtrim(raw);
    if (auto n = parse_index(line, markers::REQUEST_PREFIX)) {
        return TurnMarker{TurnRole::Requester, *n};
    }
    if (auto n = parse_index(line, markers::RESPONSE_PREFIX)) {
        return TurnMarker{TurnRole::Assistant, *n};
    }
    return std::nullopt;
}

bool is_conclusion_marker(const std::string& line) {
    return rtrim(line) == markers::CONCLUSION;
}

static bool is_section_boundary(const std::string& line) {
    return parse_turn_marker(line).has_value() || is_conclusion_marker(line);
}

bool has_log_header(const std::string& content) {
    for (const auto& line : split_lines(content)) {
        if (rtrim(line) == markers::LOG_HEADER) return true;
    }
    return false;
}

// Index of the first whole-line marker with this role and rally, or -1.
static int find_marker(const std::vector<std::string>& lines, TurnRole role, int rally) {
    for (size_t i = 0; i < lines.size(); ++i) {
        auto m = parse_turn_marker(lines[i]);
        if (m && m->role == role && m->index == rally) return static_cast<int>(i);
    }
    return -1;
}

// First section boundary after `from`, or lines.size().
static size_t next_boundary(const std::vector<std::string>& lines, size_t from) {
    for (size_t i = from; i < lines.size(); ++i) {
        if (is_section_boundary(lines[i])) return i;
    }
    return lines.size();
}

// ── Parsing ──────────────────────────────────────────────────

int current_rally_number(const std::string& content) {
    int max_n = 0;
    for (const auto& line : split_lines(content)) {
        auto m = parse_turn_marker(line);
        if (m && m->index > max_n) max_n = m->index;
    }
    return max_n;
}

std::vector<Turn> parse_turns(const std::string& content) {
    auto lines = split_lines(content);
    std::vector<Turn> turns;

    for (size_t i = 0; i < lines.size(); ++i) {
        auto m = parse_turn_marker(lines[i]);
        if (!m) continue;

        size_t end = next_boundary(lines, i + 1);
        std::string body;
        for (size_t j = i + 1; j < end; ++j) {
            body += lines[j];
            body += '\n';
        }

        Turn t;
        t.index = m->index;
        t.role = m->role;
        t.body = StringUtils::trim(body);
        turns.push_back(t);
        i = end - 1;
    }
    return turns;
}

bool has_pending_request(const std::string& content) {
    auto turns = parse_turns(content);
    for (const auto& t : turns) {
        if (t.role != TurnRole::Requester) continue;
        bool answered = std::any_of(turns.begin(), turns.end(), [&](const Turn& o) {
            return o.role == TurnRole::Assistant && o.index == t.index;
        });
        if (!answered) return true;
    }
    return false;
}

static std::string strip_comments(std::string s) {
    size_t open;
    while ((open = s.find("<!--")) != std::string::npos) {
        size_t close = s.find("-->", open + 4);
        if (close == std::string::npos) {
            s.erase(open);
            break;
        }
        s.erase(open, close + 3 - open);
    }
    return s;
}

// Offset just past `label` when the line is a metadata item ("- **Label**: ..."),
// npos otherwise. Labels inside a field value do not count.
static size_t label_end(const std::string& line, const char* label) {
    size_t pos = line.find_first_not_of(" \t");
    if (pos == std::string::npos) return std::string::npos;
    if (line.compare(pos, 2, "- ") == 0 || line.compare(pos, 2, "* ") == 0) {
        pos = line.find_first_not_of(" \t", pos + 2);
        if (pos == std::string::npos) return std::string::npos;
    }
    std::string l(label);
    if (line.compare(pos, l.size(), l) != 0) return std::string::npos;
    return pos + l.size();
}

// Value after `label` on this line, if the line carries that label.
static std::optional<std::string> field_value(const std::string& line, const char* label) {
    auto end = label_end(line, label);
    if (end == std::string::npos) return std::nullopt;
    return StringUtils::trim(strip_comments(line.substr(end)));
}

LogMetadata read_metadata(const std::string& content) {
    LogMetadata meta;
    auto lines = split_lines(content);

    bool seen_date = false, seen_topic = false, seen_purpose = false;
    bool seen_session = false, seen_workdir = false, seen_sandbox = false;
    bool in_refpaths = false;

    for (const auto& raw : lines) {
        if (is_section_boundary(raw)) break;
        std::string line = rtrim(raw);

        if (in_refpaths) {
            std::string item = StringUtils::trim(line);
            if (starts_with(item, "- ") && item.find("**") == std::string::npos) {
                std::string path = StringUtils::trim(strip_comments(item.substr(2)));
                if (!path.empty() && path != "none") meta.reference_paths.push_back(path);
                continue;
            }
            in_refpaths = false;
        }

        std::optional<std::string> v;
        if (!seen_date && (v = field_value(line, markers::FIELD_DATE))) {
            meta.datetime = *v; seen_date = true;
        } else if (!seen_topic && (v = field_value(line, markers::FIELD_TOPIC))) {
            meta.topic = *v; seen_topic = true;
        } else if (!seen_purpose && (v = field_value(line, markers::FIELD_PURPOSE))) {
            meta.purpose = *v; seen_purpose = true;
        } else if (!seen_session && (v = field_value(line, markers::FIELD_SESSION))) {
            meta.session_id = *v; seen_session = true;
        } else if (!seen_workdir && (v = field_value(line, markers::FIELD_WORKDIR))) {
            meta.working_dir = *v; seen_workdir = true;
        } else if (!seen_sandbox && (v = field_value(line, markers::FIELD_SANDBOX))) {
            // First token only
            std::istringstream ss(*v);
            ss >> meta.isolation;
            seen_sandbox = true;
        } else if ((v = field_value(line, markers::FIELD_REFPATHS))) {
            in_refpaths = true;
            if (!v->empty() && *v != "none") meta.reference_paths.push_back(*v);
        }
    }
    return meta;
}

// ── Mutation ─────────────────────────────────────────────────

std::string sanitize_body(const std::string& text) {
    std::string clean = StringUtils::strip_ansi(text);
    std::vector<std::string> lines = split_lines(clean);

    std::string out;
    for (auto& line : lines) {
        line = rtrim(line);
        bool marker_like = is_section_boundary(line) || line == markers::LOG_HEADER ||
                           (!line.empty() && line[0] == '\\' && is_section_boundary(line.substr(1)));
        if (marker_like) line = "\\" + line;
        out += line;
        out += '\n';
    }
    return StringUtils::trim(out);
}

std::string apply_session_id(const std::string& content, const std::string& session_id) {
    if (session_id.empty()) return content;

    auto lines = split_lines(content);
    for (auto& line : lines) {
        if (is_section_boundary(line)) break;
        auto end = label_end(line, markers::FIELD_SESSION);
        if (end == std::string::npos) continue;
        line = line.substr(0, end) + " " + session_id;
        break;
    }
    return join_lines(lines);
}

// Replace lines [begin, end) with a blank line, the body, and (unless the
// section runs to end of file) a blank separator line.
static void set_section_body(std::vector<std::string>& lines, size_t begin, size_t end,
                             const std::string& body) {
    std::vector<std::string> block;
    block.push_back("");
    for (const auto& l : split_lines(body)) block.push_back(l);
    if (end < lines.size()) block.push_back("");

    lines.erase(lines.begin() + static_cast<long>(begin), lines.begin() + static_cast<long>(end));
    lines.insert(lines.begin() + static_cast<long>(begin), block.begin(), block.end());
}

// Insert a new "marker + body" section at `at`, keeping one blank line on
// either side of it.
static void insert_section(std::vector<std::string>& lines, size_t at,
                           const std::string& marker, const std::string& body) {
    std::vector<std::string> block;
    if (at > 0 && !rtrim(lines[at - 1]).empty()) block.push_back("");
    block.push_back(marker);
    block.push_back("");
    for (const auto& l : split_lines(body)) block.push_back(l);
    if (at < lines.size()) block.push_back("");

    lines.insert(lines.begin() + static_cast<long>(at), block.begin(), block.end());
}

Result<std::string> apply_response(const std::string& content,
                                   const std::string& response,
                                   const std::string& session_id,
                                   int rally) {
    auto lines = split_lines(apply_session_id(content, session_id));
    std::string body = sanitize_body(response);

    int existing = find_marker(lines, TurnRole::Assistant, rally);
    if (existing >= 0) {
        size_t begin = static_cast<size_t>(existing) + 1;
        set_section_body(lines, begin, next_boundary(lines, begin), body);
        return Result<std::string>::Ok(join_lines(lines));
    }

    int request = find_marker(lines, TurnRole::Requester, rally);
    if (request < 0) {
        return Result<std::string>::Err(ErrorCode::NoPendingRequest,
            fmt::format("Log has no \"{}\" section to answer", request_marker(rally)));
    }

    size_t at = next_boundary(lines, static_cast<size_t>(request) + 1);
    insert_section(lines, at, response_marker(rally), body);
    return Result<std::string>::Ok(join_lines(lines));
}

std::string apply_request(const std::string& content, const std::string& prompt, int rally) {
    auto lines = split_lines(content);
    if (find_marker(lines, TurnRole::Requester, rally) >= 0) return content;

    size_t at = lines.size();
    for (size_t i = 0; i < lines.size(); ++i) {
        if (is_conclusion_marker(lines[i])) { at = i; break; }
    }
    insert_section(lines, at, request_marker(rally), sanitize_body(prompt));
    return join_lines(lines);
}

// ── File naming ──────────────────────────────────────────────

std::string topic_slug(const std::string& topic) {
    std::string ascii;
    bool in_space = false;
    for (char c : StringUtils::to_lower(topic)) {
        unsigned char uc = static_cast<unsigned char>(c);
        if (uc < 0x80 && std::isspace(uc)) {
            if (!in_space) ascii += '-';
            in_space = true;
            continue;
        }
        in_space = false;
        if ((c >= 'a' && c <= 'z') || (c >= '0' && c <= '9') || c == '-') ascii += c;
    }
    if (ascii.size() > 30) ascii.resize(30);

    std::string hash = md5_hex(topic).substr(0, 8);
    return ascii.empty() ? hash : ascii + "_" + hash;
}

std::string log_file_name(const std::string& topic, std::time_t now) {
    return fmt::format("{}_discussion_{}.md", format_file_stamp(now), topic_slug(topic));
}

// ── File operations ──────────────────────────────────────────

static Result<void> write_file(const fs::path& path, const std::string& content) {
    std::ofstream out(path, std::ios::binary | std::ios::trunc);
    if (!out) {
        return Result<void>::Err(ErrorCode::IoError, "Cannot write " + path.string());
    }
    out << content;
    out.close();
    if (!out) {
        return Result<void>::Err(ErrorCode::IoError, "Failed writing " + path.string());
    }
    return Result<void>::Ok();
}

Result<fs::path> create_log(const fs::path& logs_dir, const fs::path& template_path,
                            const LogCreateOptions& opts, std::time_t now) {
    auto tmpl = load_template(template_path);
    if (tmpl.is_err()) return Result<fs::path>::Err(tmpl);

    std::error_code ec;
    fs::create_directories(logs_dir, ec);
    if (ec) {
        return Result<fs::path>::Err(ErrorCode::IoError,
            fmt::format("Failed to create {}: {}", logs_dir.string(), ec.message()));
    }

    TemplateValues values;
    values.datetime = format_log_datetime(now);
    values.topic = opts.topic.empty() ? "discussion" : opts.topic;
    values.purpose = opts.purpose;
    values.working_dir = opts.working_dir;
    values.isolation = opts.isolation;
    values.reference_paths = opts.reference_paths;
    std::string content = render_template(tmpl.value, values);

    std::string name = log_file_name(values.topic, now);
    std::string stem = name.substr(0, name.size() - 3);  // drop ".md"
    fs::path path = logs_dir / name;
    for (int n = 2; fs::exists(path); ++n) {
        path = logs_dir / fmt::format("{}_{}.md", stem, n);
    }

    auto w = write_file(path, content);
    if (w.is_err()) return Result<fs::path>::Err(w);

    rally_log("log: created " + path.string());
    return Result<fs::path>::Ok(path);
}

Result<std::string> read_log(const fs::path& path) {
    if (path.empty()) {
        return Result<std::string>::Err(ErrorCode::MissingArgument,
            "--log is required. Create the log with `rally init-log` first");
    }
    if (!fs::exists(path)) {
        return Result<std::string>::Err(ErrorCode::NotFound,
            fmt::format("Log file not found: {}", path.string()));
    }
    std::ifstream in(path, std::ios::binary);
    if (!in) {
        return Result<std::string>::Err(ErrorCode::IoError, "Cannot read " + path.string());
    }
    std::stringstream ss;
    ss << in.rdbuf();
    return Result<std::string>::Ok(ss.str());
}

Result<std::string> validate_log(const fs::path& path) {
    auto content = read_log(path);
    if (content.is_err()) return content;

    if (!has_log_header(content.value)) {
        return Result<std::string>::Err(ErrorCode::MalformedHeader,
            fmt::format("Log file missing header \"{}\". Use the log template", markers::LOG_HEADER));
    }

    auto turns = parse_turns(content.value);
    bool has_request = std::any_of(turns.begin(), turns.end(), [](const Turn& t) {
        return t.role == TurnRole::Requester;
    });
    if (!has_request) {
        return Result<std::string>::Err(ErrorCode::NoPendingRequest,
            fmt::format("Log file missing \"{}N)\" section. Write the request first",
                        markers::REQUEST_PREFIX));
    }
    return content;
}

Result<void> append_response(const fs::path& path, const std::string& response,
                             const std::string& session_id, int rally) {
    auto content = read_log(path);
    if (content.is_err()) return Result<void>::Err(content);

    auto updated = apply_response(content.value, response, session_id, rally);
    if (updated.is_err()) return Result<void>::Err(updated);
    if (updated.value == content.value) return Result<void>::Ok();

    rally_log(fmt::format("log: response for rally {} -> {}", rally, path.string()));
    return write_file(path, updated.value);
}

Result<void> insert_request(const fs::path& path, const std::string& prompt, int rally) {
    auto content = read_log(path);
    if (content.is_err()) return Result<void>::Err(content);

    std::string updated = apply_request(content.value, prompt, rally);
    if (updated == content.value) return Result<void>::Ok();

    rally_log(fmt::format("log: request for rally {} -> {}", rally, path.string()));
    return write_file(path, updated);
}
