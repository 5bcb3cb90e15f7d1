#pragma once

#include <string>
#include <vector>
#include <optional>
#include "types.hpp"

// Program plus argument vector, passed to exec without a shell.
struct CommandLine {
    std::string program;
    std::vector<std::string> args;
};

// Batch invocation of the assistant CLI:
//   <runner> --yes <package> exec --full-auto [-c model_reasoning_effort="<e>"]
//            --sandbox <isolation> --skip-git-repo-check [--cd <dir>] <prompt>
// The CLI is positional-sensitive: the order above is fixed and the prompt
// is always last. The isolation is taken from `inv` as-is.
CommandLine build_exec_command(const Invocation& inv, const AssistantConfig& cli);

// Validating front end: checks the mode policy and the effort string first.
Result<CommandLine> build_command(Mode mode,
                                  const std::optional<std::string>& working_dir,
                                  const std::string& prompt,
                                  const std::optional<std::string>& reasoning_effort,
                                  const AssistantConfig& cli);

// Interactive (PTY) launch line. Always full-auto + read-only.
struct PtyLaunchOptions {
    bool search = true;
    std::optional<ReasoningEffort> reasoning_effort;
};

// The PTY launcher takes a shell line rather than an argv, so every
// argument is single-quoted where needed.
std::string build_pty_command(const PtyLaunchOptions& opts, const AssistantConfig& cli);

// `-c` override value, e.g. model_reasoning_effort="high".
std::string reasoning_effort_override(ReasoningEffort effort);
