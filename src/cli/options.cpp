#include "options.hpp"
#include <core/sandbox_policy.hpp>
#include <platform/platform.hpp>
#include <util/string_utils.hpp>
#include <fmt/format.h>

std::optional<std::string> ParsedArgs::get(const std::string& key) const {
    auto it = options.find(key);
    if (it == options.end()) return std::nullopt;
    return it->second;
}

std::string ParsedArgs::joined_positional() const {
    std::string out;
    for (const auto& p : positional) {
        if (!out.empty()) out += ' ';
        out += p;
    }
    return out;
}

static bool starts_with_dashes(const std::string& s) {
    return s.size() > 2 && s[0] == '-' && s[1] == '-';
}

Result<ParsedArgs> parse_args(const std::vector<std::string>& args,
                              const std::set<std::string>& options,
                              const std::set<std::string>& flags) {
    ParsedArgs parsed;
    bool only_positional = false;

    for (size_t i = 0; i < args.size(); ++i) {
        const std::string& arg = args[i];

        if (only_positional || !starts_with_dashes(arg)) {
            if (arg == "--" && !only_positional) {
                only_positional = true;
                continue;
            }
            parsed.positional.push_back(arg);
            continue;
        }

        std::string key = arg.substr(2);
        std::optional<std::string> inline_value;
        auto eq = key.find('=');
        if (eq != std::string::npos) {
            inline_value = key.substr(eq + 1);
            key = key.substr(0, eq);
        }

        if (flags.count(key)) {
            std::string value = inline_value.value_or("");
            // --search true / --search false
            if (!inline_value && i + 1 < args.size() &&
                (args[i + 1] == "true" || args[i + 1] == "false")) {
                value = args[++i];
            }
            if (value == "false") {
                parsed.flags.erase(key);
            } else if (value.empty() || value == "true") {
                parsed.flags.insert(key);
            } else {
                return Result<ParsedArgs>::Err(ErrorCode::InvalidArgument,
                    fmt::format("--{} takes no value (got \"{}\")", key, value));
            }
            continue;
        }

        if (!options.count(key)) {
            return Result<ParsedArgs>::Err(ErrorCode::InvalidArgument,
                fmt::format("Unknown option --{}", key));
        }

        if (inline_value) {
            parsed.options[key] = *inline_value;
        } else if (i + 1 < args.size() && !starts_with_dashes(args[i + 1])) {
            parsed.options[key] = args[++i];
        } else {
            return Result<ParsedArgs>::Err(ErrorCode::MissingArgument,
                fmt::format("--{} requires a value", key));
        }
    }
    return Result<ParsedArgs>::Ok(parsed);
}

Result<int> parse_positive_int(const std::string& name, const std::string& value) {
    bool digits = !value.empty() && value.size() <= 9 &&
                  value.find_first_not_of("0123456789") == std::string::npos;
    int n = digits ? std::stoi(value) : 0;
    if (n <= 0) {
        return Result<int>::Err(ErrorCode::InvalidArgument,
            fmt::format("--{} must be a positive integer (got \"{}\")", name, value));
    }
    return Result<int>::Ok(n);
}

static Result<std::optional<ReasoningEffort>> effort_option(const ParsedArgs& p) {
    auto raw = p.get("reasoning-effort");
    if (!raw) return Result<std::optional<ReasoningEffort>>::Ok(std::nullopt);
    auto effort = parse_reasoning_effort(*raw);
    if (effort.is_err()) return Result<std::optional<ReasoningEffort>>::Err(effort);
    return Result<std::optional<ReasoningEffort>>::Ok(effort.value);
}

static Result<std::optional<int>> timeout_option(const ParsedArgs& p) {
    auto raw = p.get("timeout");
    if (!raw) return Result<std::optional<int>>::Ok(std::nullopt);
    auto n = parse_positive_int("timeout", *raw);
    if (n.is_err()) return Result<std::optional<int>>::Err(n);
    return Result<std::optional<int>>::Ok(n.value);
}

static Result<fs::path> required_log(const ParsedArgs& p) {
    auto log = p.get("log");
    if (!log || log->empty()) {
        return Result<fs::path>::Err(ErrorCode::MissingArgument,
            "--log is required. Create the log with `rally init-log` first");
    }
    return Result<fs::path>::Ok(platform::expand_home(*log));
}

static LocationOptions location_from(const ParsedArgs& p) {
    LocationOptions loc;
    if (auto d = p.get("logs-dir")) loc.logs_dir = platform::expand_home(*d);
    if (auto t = p.get("template")) loc.template_path = platform::expand_home(*t);
    return loc;
}

Result<LocationOptions> parse_location(const std::vector<std::string>& args) {
    auto p = parse_args(args, {"logs-dir", "template"}, {});
    if (p.is_err()) return Result<LocationOptions>::Err(p);
    return Result<LocationOptions>::Ok(location_from(p.value));
}

Result<InitLogCommand> parse_init_log(const std::vector<std::string>& args) {
    auto p = parse_args(args, {"topic", "purpose", "cd", "sandbox", "ref", "logs-dir", "template"}, {});
    if (p.is_err()) return Result<InitLogCommand>::Err(p);
    const ParsedArgs& a = p.value;

    InitLogCommand cmd;
    cmd.location = location_from(a);
    cmd.log.topic = a.get("topic").value_or("discussion");
    cmd.log.purpose = a.get("purpose").value_or("");
    if (auto cd = a.get("cd")) {
        if (!cd->empty()) cmd.log.working_dir = *cd;
    }

    if (auto sandbox = a.get("sandbox")) {
        if (*sandbox == "workspace-write") {
            cmd.log.isolation = Isolation::WorkspaceWrite;
        } else if (*sandbox == "read-only") {
            cmd.log.isolation = Isolation::ReadOnly;
        } else {
            return Result<InitLogCommand>::Err(ErrorCode::InvalidArgument,
                fmt::format("Invalid --sandbox \"{}\". Valid values: read-only, workspace-write",
                            *sandbox));
        }
    }

    // Comma separated
    if (auto refs = a.get("ref")) {
        for (const auto& r : StringUtils::split(*refs, ',')) {
            std::string path = StringUtils::trim(r);
            if (!path.empty()) cmd.log.reference_paths.push_back(path);
        }
    }
    return Result<InitLogCommand>::Ok(cmd);
}

Result<RunRequest> parse_run(const std::vector<std::string>& args) {
    auto p = parse_args(args, {"mode", "cd", "log", "reasoning-effort", "timeout"},
                        {"search", "update-log"});
    if (p.is_err()) return Result<RunRequest>::Err(p);
    const ParsedArgs& a = p.value;

    RunRequest req;
    auto mode = a.get("mode");
    if (!mode) {
        return Result<RunRequest>::Err(ErrorCode::MissingArgument,
            "--mode is required. Valid modes: question, review, modify");
    }
    auto parsed_mode = parse_mode(*mode);
    if (parsed_mode.is_err()) return Result<RunRequest>::Err(parsed_mode);
    req.mode = parsed_mode.value;

    req.prompt = a.joined_positional();
    if (StringUtils::trim(req.prompt).empty()) {
        return Result<RunRequest>::Err(ErrorCode::MissingArgument,
            "A prompt is required as a positional argument");
    }

    auto effort = effort_option(a);
    if (effort.is_err()) return Result<RunRequest>::Err(effort);
    req.reasoning_effort = effort.value;

    auto timeout = timeout_option(a);
    if (timeout.is_err()) return Result<RunRequest>::Err(timeout);
    req.timeout_ms = timeout.value;

    if (auto cd = a.get("cd")) req.working_dir = *cd;
    req.search = a.has_flag("search");
    req.update_log = a.has_flag("update-log");

    auto log = required_log(a);
    if (log.is_err()) return Result<RunRequest>::Err(log);
    req.log_path = log.value;
    return Result<RunRequest>::Ok(req);
}

Result<ResumeRequest> parse_continue(const std::vector<std::string>& args) {
    // --update-log is accepted for compatibility; continue always writes back
    auto p = parse_args(args, {"log", "reasoning-effort", "timeout"}, {"update-log"});
    if (p.is_err()) return Result<ResumeRequest>::Err(p);
    const ParsedArgs& a = p.value;

    ResumeRequest req;
    auto log = required_log(a);
    if (log.is_err()) return Result<ResumeRequest>::Err(log);
    req.log_path = log.value;

    req.prompt = a.joined_positional();
    if (StringUtils::trim(req.prompt).empty()) {
        return Result<ResumeRequest>::Err(ErrorCode::MissingArgument,
            "A prompt is required as a positional argument");
    }

    auto effort = effort_option(a);
    if (effort.is_err()) return Result<ResumeRequest>::Err(effort);
    req.reasoning_effort = effort.value;

    auto timeout = timeout_option(a);
    if (timeout.is_err()) return Result<ResumeRequest>::Err(timeout);
    req.timeout_ms = timeout.value;
    return Result<ResumeRequest>::Ok(req);
}

Result<fs::path> parse_get_session(const std::vector<std::string>& args) {
    auto p = parse_args(args, {"log"}, {});
    if (p.is_err()) return Result<fs::path>::Err(p);
    return required_log(p.value);
}
