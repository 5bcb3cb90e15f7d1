#pragma once

#include <string>
#include <vector>
#include <optional>
#include <core/types.hpp>
#include <core/command_builder.hpp>

struct BatchOptions {
    int timeout_ms = DEFAULT_RUN_TIMEOUT_MS;
    int grace_ms = KILL_GRACE_MS;      // SIGTERM -> SIGKILL
    bool echo = true;                  // tee child output to our stdout/stderr
};

// Runs the assistant CLI to completion as a plain child process.
//
// stdout and stderr are read through pipes, written through to the caller's
// terminal as they arrive, and kept. On exit the first "session id: <id>"
// line (stdout first, then stderr) becomes BatchResult::session_id.
//
// Failures:
//   SpawnError   exec failed (missing binary, permissions)
//   Timeout      wall clock exceeded; child was terminated, partial output
//                is part of the message
//   Interrupted  SIGINT while waiting; child was terminated
class BatchRunner {
public:
    explicit BatchRunner(BatchOptions opts = BatchOptions());

    Result<BatchResult> run(const std::string& program,
                            const std::vector<std::string>& args) const;

    Result<BatchResult> run(const CommandLine& cmd) const {
        return run(cmd.program, cmd.args);
    }

    const BatchOptions& options() const { return opts_; }

private:
    BatchOptions opts_;
};

// First `session id: <hex-and-dashes>` (case-insensitive) in `text`.
std::optional<std::string> extract_session_id(const std::string& text);
