#include "rally_service.hpp"
#include <core/sandbox_policy.hpp>
#include <core/utils.hpp>
#include <core/debug_log.hpp>
#include <log/conversation_log.hpp>
#include <log/log_template.hpp>
#include <runner/batch_runner.hpp>
#include <pty/pty_session.hpp>
#include <platform/platform.hpp>
#include <util/string_utils.hpp>
#include <fmt/format.h>
#include <cctype>

std::optional<std::string> log_working_dir(const LogMetadata& meta) {
    const std::string& dir = meta.working_dir;
    if (dir.empty() || dir == placeholders::NO_WORKDIR || dir == placeholders::PURPOSE ||
        dir == "{{WORKDIR}}") {
        return std::nullopt;
    }
    return dir;
}

std::string resume_prompt(const fs::path& log_path, const std::string& prompt) {
    std::string path = StringUtils::replace_all(log_path.string(), "\\", "/");
    std::string request = StringUtils::replace_all(StringUtils::trim(prompt), "\r\n", " ");
    request = StringUtils::replace_all(request, "\n", " ");
    return fmt::format("Read the discussion log at {} and resume the discussion. "
                       "Additional request: {}", path, request);
}

ResumePlan plan_resume(const std::string& content, const fs::path& log_path,
                       const std::string& prompt,
                       const std::optional<ReasoningEffort>& effort,
                       const AssistantConfig& cli) {
    ResumePlan plan;
    LogMetadata meta = read_metadata(content);

    plan.working_dir = log_working_dir(meta);

    std::string warning;
    plan.isolation = whitelist_isolation(meta.isolation, &warning);
    if (!warning.empty()) plan.warnings.push_back(warning);

    plan.next_rally = current_rally_number(content) + 1;
    plan.prompt = resume_prompt(log_path, prompt);

    Invocation inv;
    inv.isolation = plan.isolation;
    inv.working_dir = plan.working_dir;
    inv.prompt = plan.prompt;
    inv.reasoning_effort = effort;
    plan.command = build_exec_command(inv, cli);
    return plan;
}

// ── RallyService ─────────────────────────────────────────────

RallyService::RallyService(Config config, StatusCallback status)
    : config_(std::move(config)), status_(std::move(status)) {}

void RallyService::status(const std::string& msg) const {
    rally_log("status: " + msg);
    if (status_) status_(msg);
}

Result<RunOutcome> RallyService::run(const RunRequest& req) {
    if (StringUtils::trim(req.prompt).empty()) {
        return Result<RunOutcome>::Err(ErrorCode::MissingArgument,
            "A prompt is required as a positional argument");
    }

    Invocation inv;
    inv.mode = req.mode;
    inv.working_dir = req.working_dir;
    inv.prompt = req.prompt;
    inv.reasoning_effort = req.reasoning_effort;
    inv.search_enabled = req.search;
    inv.timeout_ms = req.timeout_ms.value_or(config_.timeouts().run_ms);

    auto policy = apply_mode_policy(inv);
    if (policy.is_err()) return Result<RunOutcome>::Err(policy);

    // Nothing is spawned until the log has passed validation
    auto content = validate_log(req.log_path);
    if (content.is_err()) return Result<RunOutcome>::Err(content);

    int rally = current_rally_number(content.value);
    rally_log(fmt::format("run: mode={} search={} rally={} log={}",
                          mode_name(inv.mode), inv.search_enabled, rally, req.log_path.string()));

    if (inv.search_enabled) return run_with_pty(inv, req, rally);
    return run_batch(inv, req, rally);
}

Result<RunOutcome> RallyService::run_batch(const Invocation& inv, const RunRequest& req, int rally) {
    BatchOptions opts;
    opts.timeout_ms = inv.timeout_ms;
    opts.grace_ms = config_.timeouts().kill_grace_ms;
    BatchRunner runner(opts);

    status(fmt::format("Running assistant ({}, {})", mode_name(inv.mode), isolation_name(inv.isolation)));
    auto result = runner.run(build_exec_command(inv, config_.assistant()));
    if (result.is_err()) return Result<RunOutcome>::Err(result);

    RunOutcome outcome;
    outcome.exit_code = result.value.exit_code;
    outcome.session_id = result.value.session_id;
    outcome.output = result.value.output;
    outcome.rally = rally;

    if (req.update_log && !StringUtils::trim(outcome.output).empty()) {
        auto w = append_response(req.log_path, outcome.output,
                                 outcome.session_id.value_or(""), rally);
        if (w.is_err()) return Result<RunOutcome>::Err(w);
        outcome.log_updated = true;
        status("Log updated: " + req.log_path.string());
    }
    return Result<RunOutcome>::Ok(outcome);
}

Result<RunOutcome> RallyService::run_with_pty(const Invocation& inv, const RunRequest& req, int rally) {
    std::string session_id = generate_uuid();

    PtyLaunchOptions launch;
    launch.search = true;
    launch.reasoning_effort = inv.reasoning_effort;

    PtySessionOptions opts;
    opts.command_line = build_pty_command(launch, config_.assistant());
    if (inv.mode == Mode::Review && inv.working_dir) opts.working_dir = *inv.working_dir;
    opts.cols = config_.pty().cols;
    opts.rows = config_.pty().rows;
    opts.spawn_grace_ms = config_.pty().spawn_grace_ms;

    PtySession pty(opts);

    status("Starting PTY session with web search");
    if (inv.reasoning_effort) {
        status(fmt::format("Reasoning effort: {}", reasoning_effort_name(*inv.reasoning_effort)));
    }
    auto spawned = pty.spawn();
    if (spawned.is_err()) return Result<RunOutcome>::Err(spawned);
    status("PTY session started: " + session_id);

    status("Waiting for the assistant to initialize");
    platform::sleep_ms(config_.pty().startup_wait_ms);

    auto sent = pty.send(inv.prompt);
    if (sent.is_err()) return Result<RunOutcome>::Err(sent);
    platform::sleep_ms(PTY_SUBMIT_SETTLE_MS);

    CollectOptions collect;
    collect.idle_ms = config_.timeouts().idle_ms;
    collect.poll_ms = config_.timeouts().poll_ms;
    collect.max_ms = inv.timeout_ms;
    CollectResult reply = pty.collect(collect);
    pty.kill();
    status("PTY session ended: " + session_id);

    if (reply.reason == CollectStop::Interrupted) {
        return Result<RunOutcome>::Err(ErrorCode::Interrupted,
            "Interrupted; assistant session terminated");
    }

    RunOutcome outcome;
    outcome.exit_code = EXIT_OK;
    outcome.session_id = session_id;
    outcome.output = reply.text;
    outcome.rally = rally;
    if (reply.reason == CollectStop::MaxTime) {
        outcome.warnings.push_back(fmt::format(
            "Reply collection stopped at the {} ms limit; the reply may be incomplete",
            collect.max_ms));
    }

    if (req.update_log && !StringUtils::trim(outcome.output).empty()) {
        auto w = append_response(req.log_path, outcome.output, session_id, rally);
        if (w.is_err()) return Result<RunOutcome>::Err(w);
        outcome.log_updated = true;
        status("Log updated: " + req.log_path.string());
    }
    return Result<RunOutcome>::Ok(outcome);
}

Result<RunOutcome> RallyService::resume(const ResumeRequest& req) {
    if (StringUtils::trim(req.prompt).empty()) {
        return Result<RunOutcome>::Err(ErrorCode::MissingArgument,
            "A prompt is required as a positional argument");
    }

    // Same gate as run: never spawn against a file that is not a discussion log
    auto content = validate_log(req.log_path);
    if (content.is_err()) return Result<RunOutcome>::Err(content);

    ResumePlan plan = plan_resume(content.value, req.log_path, req.prompt,
                                  req.reasoning_effort, config_.assistant());

    RunOutcome outcome;
    outcome.warnings = plan.warnings;
    outcome.rally = plan.next_rally;
    for (const auto& w : plan.warnings) status("Warning: " + w);

    BatchOptions opts;
    opts.timeout_ms = req.timeout_ms.value_or(config_.timeouts().run_ms);
    opts.grace_ms = config_.timeouts().kill_grace_ms;
    BatchRunner runner(opts);

    status(fmt::format("Resuming discussion at rally {}", plan.next_rally));
    auto result = runner.run(plan.command);
    if (result.is_err()) return Result<RunOutcome>::Err(result);

    outcome.exit_code = result.value.exit_code;
    outcome.session_id = result.value.session_id;
    outcome.output = result.value.output;

    if (!StringUtils::trim(outcome.output).empty()) {
        auto r = insert_request(req.log_path, req.prompt, plan.next_rally);
        if (r.is_err()) return Result<RunOutcome>::Err(r);
        auto w = append_response(req.log_path, outcome.output,
                                 outcome.session_id.value_or(""), plan.next_rally);
        if (w.is_err()) return Result<RunOutcome>::Err(w);
        outcome.log_updated = true;
        status("Log updated: " + req.log_path.string());
    }
    return Result<RunOutcome>::Ok(outcome);
}

static bool is_session_token(const std::string& s) {
    if (s.empty()) return false;
    for (char c : s) {
        if (!std::isxdigit(static_cast<unsigned char>(c)) && c != '-') return false;
    }
    return true;
}

Result<SessionInfo> RallyService::get_session(const fs::path& log_path) const {
    auto content = read_log(log_path);
    if (content.is_err()) return Result<SessionInfo>::Err(content);

    LogMetadata meta = read_metadata(content.value);
    std::string token = StringUtils::split(meta.session_id + " ", ' ').front();
    if (!is_session_token(token)) {
        return Result<SessionInfo>::Err(ErrorCode::NotFound, "No session found in log");
    }

    SessionInfo info;
    info.session_id = token;
    info.working_dir = meta.working_dir;
    info.isolation = meta.isolation;
    info.rally = current_rally_number(content.value);
    info.pending = has_pending_request(content.value);
    return Result<SessionInfo>::Ok(info);
}
