#pragma once

#include <string>
#include "types.hpp"

// What a mode is allowed to do.
struct ModePolicy {
    Isolation isolation;
    bool requires_working_dir;
    bool allows_search;
};

// question -> read-only, review -> read-only + cd, modify -> workspace-write + cd, no search.
ModePolicy policy_for(Mode mode);

// "question" | "review" | "modify", otherwise InvalidMode.
Result<Mode> parse_mode(const std::string& text);

// "low" | "medium" | "high", otherwise InvalidReasoningEffort.
Result<ReasoningEffort> parse_reasoning_effort(const std::string& text);

const char* mode_name(Mode mode);
const char* isolation_name(Isolation isolation);
const char* reasoning_effort_name(ReasoningEffort effort);

// Check an invocation against its mode's policy and pin its isolation level.
// IncompatibleOption (modify + search) is reported before MissingWorkingDirectory.
Result<void> apply_mode_policy(Invocation& inv);

// Isolation read back from a log. Anything outside {read-only, workspace-write}
// falls back to read-only and fills `warning`; an empty value falls back silently.
Isolation whitelist_isolation(const std::string& raw, std::string* warning = nullptr);
