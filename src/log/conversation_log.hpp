#pragma once

#include <string>
#include <vector>
#include <optional>
#include <ctime>
#include <filesystem>
#include <core/types.hpp>
#include "log_template.hpp"

namespace fs = std::filesystem;

// ── Pure operations on log text ──────────────────────────────
//
// Only whole-line markers count: a marker quoted in the middle of a line,
// indented, or escaped with a backslash is body text.

struct TurnMarker {
    TurnRole role;
    int index;
};

// Parse one line as a turn marker. Trailing whitespace / CR is tolerated.
std::optional<TurnMarker> parse_turn_marker(const std::string& line);
bool is_conclusion_marker(const std::string& line);
bool has_log_header(const std::string& content);

// Highest turn index across both roles; 0 if there are none.
int current_rally_number(const std::string& content);

// Turns in file order, bodies trimmed.
std::vector<Turn> parse_turns(const std::string& content);

// True if some requester turn has no assistant turn with the same index.
bool has_pending_request(const std::string& content);

// Labelled header fields. HTML comments are dropped, missing fields stay empty.
// Only the part of the file before the first turn marker is consulted.
LogMetadata read_metadata(const std::string& content);

// Reply text as stored: control sequences stripped, LF line endings,
// trailing whitespace trimmed, marker-looking lines escaped with '\'.
std::string sanitize_body(const std::string& text);

// Content with the assistant section of `rally` set to `response`.
// NoPendingRequest if neither that section nor its requester section exists.
Result<std::string> apply_response(const std::string& content,
                                   const std::string& response,
                                   const std::string& session_id,
                                   int rally);

// Content with a requester section for `rally` inserted before the
// conclusion (or at the end). Unchanged if that section already exists.
std::string apply_request(const std::string& content, const std::string& prompt, int rally);

// Session line rewritten to `session_id` (no-op for an empty id).
std::string apply_session_id(const std::string& content, const std::string& session_id);

// ── File naming ──────────────────────────────────────────────

// "<ascii>_<md5[0:8]>" or just the hash when the topic has no ASCII part.
std::string topic_slug(const std::string& topic);

// "YYYYMMDD_HHMMSS_discussion_<slug>.md"
std::string log_file_name(const std::string& topic, std::time_t now);

// ── File operations ──────────────────────────────────────────

struct LogCreateOptions {
    std::string topic = "discussion";
    std::string purpose;
    std::optional<std::string> working_dir;
    Isolation isolation = Isolation::ReadOnly;
    std::vector<std::string> reference_paths;
};

// Render the template into a new file under `logs_dir`. An existing file is
// never overwritten; a _N counter is appended to the name instead.
Result<fs::path> create_log(const fs::path& logs_dir, const fs::path& template_path,
                            const LogCreateOptions& opts, std::time_t now);

// NotFound if the file is missing (or was archived away).
Result<std::string> read_log(const fs::path& path);

// Gate for every run. Returns the content on success.
//   NotFound         missing file
//   MalformedHeader  header marker absent
//   NoPendingRequest no requester section
Result<std::string> validate_log(const fs::path& path);

Result<void> append_response(const fs::path& path, const std::string& response,
                             const std::string& session_id, int rally);

Result<void> insert_request(const fs::path& path, const std::string& prompt, int rally);
