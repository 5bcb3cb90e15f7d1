#pragma once

#include <string>
#include <vector>
#include <optional>
#include <filesystem>
#include <core/config.hpp>
#include <core/command_builder.hpp>
#include <core/types.hpp>

namespace fs = std::filesystem;

// One `run` request, already typed by the CLI layer.
struct RunRequest {
    Mode mode = Mode::Question;
    std::optional<std::string> working_dir;
    fs::path log_path;
    std::string prompt;
    std::optional<ReasoningEffort> reasoning_effort;
    bool search = false;
    bool update_log = false;
    std::optional<int> timeout_ms;        // overrides timeouts.run_ms
};

struct ResumeRequest {
    fs::path log_path;
    std::string prompt;
    std::optional<ReasoningEffort> reasoning_effort;
    std::optional<int> timeout_ms;
};

struct RunOutcome {
    int exit_code = 0;
    std::optional<std::string> session_id;
    std::string output;
    int rally = 0;
    bool log_updated = false;
    std::vector<std::string> warnings;
};

// Everything needed to continue a conversation, derived from log text alone.
struct ResumePlan {
    CommandLine command;
    int next_rally = 1;
    std::optional<std::string> working_dir;
    Isolation isolation = Isolation::ReadOnly;
    std::string prompt;                   // the wrapped prompt sent to the CLI
    std::vector<std::string> warnings;
};

// Header facts reported by `get-session`.
struct SessionInfo {
    std::string session_id;
    std::string working_dir;
    std::string isolation;
    int rally = 0;
    bool pending = false;
};

// Working directory recorded in a log, or nullopt for the "none" sentinel,
// an unfilled placeholder, or a missing field.
std::optional<std::string> log_working_dir(const LogMetadata& meta);

// "Read the discussion log at <path> and resume the discussion. Additional
// request: <prompt>" on a single line, with '/' path separators.
std::string resume_prompt(const fs::path& log_path, const std::string& prompt);

// Pure: rebuild the continuation invocation from log content.
ResumePlan plan_resume(const std::string& content, const fs::path& log_path,
                       const std::string& prompt,
                       const std::optional<ReasoningEffort>& effort,
                       const AssistantConfig& cli);

// Drives the assistant for one turn and writes the result back into the log.
class RallyService {
public:
    explicit RallyService(Config config, StatusCallback status = nullptr);

    // Validate everything, then run once (batch, or PTY with search).
    Result<RunOutcome> run(const RunRequest& req);

    // Continue from the log alone; the turn is always written back.
    Result<RunOutcome> resume(const ResumeRequest& req);

    Result<SessionInfo> get_session(const fs::path& log_path) const;

    const Config& config() const { return config_; }

private:
    Result<RunOutcome> run_batch(const Invocation& inv, const RunRequest& req, int rally);
    Result<RunOutcome> run_with_pty(const Invocation& inv, const RunRequest& req, int rally);
    void status(const std::string& msg) const;

    Config config_;
    StatusCallback status_;
};
