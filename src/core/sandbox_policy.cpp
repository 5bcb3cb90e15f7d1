#include "sandbox_policy.hpp"
#include <fmt/format.h>

ModePolicy policy_for(Mode mode) {
    switch (mode) {
        case Mode::Question: return {Isolation::ReadOnly, false, true};
        case Mode::Review:   return {Isolation::ReadOnly, true, true};
        case Mode::Modify:   return {Isolation::WorkspaceWrite, true, false};
    }
    return {Isolation::ReadOnly, false, true};
}

Result<Mode> parse_mode(const std::string& text) {
    if (text == "question") return Result<Mode>::Ok(Mode::Question);
    if (text == "review")   return Result<Mode>::Ok(Mode::Review);
    if (text == "modify")   return Result<Mode>::Ok(Mode::Modify);
    return Result<Mode>::Err(ErrorCode::InvalidMode,
        fmt::format("Unknown mode: {}. Valid modes: question, review, modify", text));
}

Result<ReasoningEffort> parse_reasoning_effort(const std::string& text) {
    if (text == "low")    return Result<ReasoningEffort>::Ok(ReasoningEffort::Low);
    if (text == "medium") return Result<ReasoningEffort>::Ok(ReasoningEffort::Medium);
    if (text == "high")   return Result<ReasoningEffort>::Ok(ReasoningEffort::High);
    return Result<ReasoningEffort>::Err(ErrorCode::InvalidReasoningEffort,
        fmt::format("Invalid reasoning effort \"{}\". Valid values: low, medium, high", text));
}

const char* mode_name(Mode mode) {
    switch (mode) {
        case Mode::Question: return "question";
        case Mode::Review:   return "review";
        case Mode::Modify:   return "modify";
    }
    return "question";
}

const char* isolation_name(Isolation isolation) {
    return isolation == Isolation::WorkspaceWrite ? "workspace-write" : "read-only";
}

const char* reasoning_effort_name(ReasoningEffort effort) {
    switch (effort) {
        case ReasoningEffort::Low:    return "low";
        case ReasoningEffort::Medium: return "medium";
        case ReasoningEffort::High:   return "high";
    }
    return "medium";
}

Result<void> apply_mode_policy(Invocation& inv) {
    ModePolicy policy = policy_for(inv.mode);

    if (inv.search_enabled && !policy.allows_search) {
        return Result<void>::Err(ErrorCode::IncompatibleOption,
            fmt::format("--search cannot be used with --mode {} (search sessions are read-only)",
                        mode_name(inv.mode)));
    }

    bool has_dir = inv.working_dir.has_value() && !inv.working_dir->empty();
    if (policy.requires_working_dir && !has_dir) {
        return Result<void>::Err(ErrorCode::MissingWorkingDirectory,
            fmt::format("--cd is required for {} mode", mode_name(inv.mode)));
    }
    if (!has_dir) inv.working_dir.reset();

    inv.isolation = policy.isolation;
    return Result<void>::Ok();
}

Isolation whitelist_isolation(const std::string& raw, std::string* warning) {
    if (raw == "workspace-write") return Isolation::WorkspaceWrite;
    if (raw == "read-only" || raw.empty()) return Isolation::ReadOnly;

    if (warning) {
        *warning = fmt::format("Invalid sandbox value \"{}\" in log, using \"read-only\"", raw);
    }
    return Isolation::ReadOnly;
}
