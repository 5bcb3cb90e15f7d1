#pragma once

#include <string>
#include <optional>
#include <vector>
#include <functional>
#include <cstdint>
#include "constants.hpp"

// Failure classes surfaced by rally. The CLI maps them to exit codes.
enum class ErrorCode {
    None,
    SpawnError,
    Timeout,
    InvalidMode,
    InvalidReasoningEffort,
    IncompatibleOption,
    MissingWorkingDirectory,
    MissingArgument,
    InvalidArgument,
    NotFound,
    MalformedHeader,
    NoPendingRequest,
    TemplateMissing,
    IoError,
    Interrupted,
};

const char* error_code_name(ErrorCode code);

// Result type for operations that can fail
template <typename T>
struct Result {
    bool success;
    T value;
    std::string error;
    ErrorCode code = ErrorCode::None;

    static Result<T> Ok(T val) {
        return {true, std::move(val), "", ErrorCode::None};
    }

    static Result<T> Err(ErrorCode code, const std::string& err) {
        return {false, T{}, err, code};
    }

    // Re-wrap another result's failure.
    template <typename U>
    static Result<T> Err(const Result<U>& other) {
        return {false, T{}, other.error, other.code};
    }

    bool is_ok() const { return success; }
    bool is_err() const { return !success; }
};

// Specialization for void
template <>
struct Result<void> {
    bool success;
    std::string error;
    ErrorCode code = ErrorCode::None;

    static Result<void> Ok() {
        return {true, "", ErrorCode::None};
    }

    static Result<void> Err(ErrorCode code, const std::string& err) {
        return {false, err, code};
    }

    template <typename U>
    static Result<void> Err(const Result<U>& other) {
        return {false, other.error, other.code};
    }

    bool is_ok() const { return success; }
    bool is_err() const { return !success; }
};

// ── Invocation ──────────────────────────────────────────────

enum class Mode { Question, Review, Modify };

enum class Isolation { ReadOnly, WorkspaceWrite };

enum class ReasoningEffort { Low, Medium, High };

// One call to the assistant CLI. Built per invocation, never persisted.
struct Invocation {
    Mode mode = Mode::Question;
    Isolation isolation = Isolation::ReadOnly;
    std::optional<std::string> working_dir;
    std::string prompt;
    std::optional<ReasoningEffort> reasoning_effort;
    bool search_enabled = false;
    int timeout_ms = DEFAULT_RUN_TIMEOUT_MS;
};

// Batch process outcome
struct BatchResult {
    int exit_code = 0;
    std::optional<std::string> session_id;  // "session id: <uuid>" in output
    std::string output;                     // captured stdout
    std::string error_output;               // captured stderr
};

// ── Conversation log ────────────────────────────────────────

enum class TurnRole { Requester, Assistant };

struct Turn {
    int index = 0;
    TurnRole role = TurnRole::Requester;
    std::string body;
};

// Labelled header fields of a conversation log. Missing fields stay empty.
struct LogMetadata {
    std::string datetime;
    std::string topic;
    std::string purpose;
    std::string session_id;
    std::string working_dir;                // raw value, may be a sentinel
    std::string isolation;                  // raw value, not yet whitelisted
    std::vector<std::string> reference_paths;
};

// ── Configuration structures ────────────────────────────────

struct AssistantConfig {
    std::string runner = DEFAULT_RUNNER;     // package runner on PATH
    std::string package = DEFAULT_PACKAGE;   // assistant CLI package
};

struct TimeoutConfig {
    int run_ms = DEFAULT_RUN_TIMEOUT_MS;
    int idle_ms = DEFAULT_IDLE_TIMEOUT_MS;
    int poll_ms = DEFAULT_POLL_INTERVAL_MS;
    int kill_grace_ms = KILL_GRACE_MS;
};

struct PtyConfig {
    int cols = PTY_COLS;
    int rows = PTY_ROWS;
    int startup_wait_ms = PTY_STARTUP_WAIT_MS;
    int spawn_grace_ms = PTY_SPAWN_GRACE_MS;
};

struct PreflightConfig {
    std::string min_node = MIN_NODE_VERSION;
    int cache_ttl_hours = PREFLIGHT_CACHE_TTL_HOURS;
};

// Status callback for long-running operations
using StatusCallback = std::function<void(const std::string&)>;
