#include "command_builder.hpp"
#include "sandbox_policy.hpp"
#include <util/string_utils.hpp>
#include <fmt/format.h>

std::string reasoning_effort_override(ReasoningEffort effort) {
    return fmt::format("model_reasoning_effort=\"{}\"", reasoning_effort_name(effort));
}

CommandLine build_exec_command(const Invocation& inv, const AssistantConfig& cli) {
    CommandLine cmd;
    cmd.program = cli.runner;

    // --yes keeps the package runner from prompting on first install
    cmd.args = {"--yes", cli.package, "exec", "--full-auto"};

    if (inv.reasoning_effort) {
        cmd.args.push_back("-c");
        cmd.args.push_back(reasoning_effort_override(*inv.reasoning_effort));
    }

    cmd.args.push_back("--sandbox");
    cmd.args.push_back(isolation_name(inv.isolation));
    cmd.args.push_back("--skip-git-repo-check");

    if (inv.working_dir && !inv.working_dir->empty()) {
        cmd.args.push_back("--cd");
        cmd.args.push_back(*inv.working_dir);
    }

    cmd.args.push_back(inv.prompt);
    return cmd;
}

Result<CommandLine> build_command(Mode mode,
                                  const std::optional<std::string>& working_dir,
                                  const std::string& prompt,
                                  const std::optional<std::string>& reasoning_effort,
                                  const AssistantConfig& cli) {
    Invocation inv;
    inv.mode = mode;
    inv.working_dir = working_dir;
    inv.prompt = prompt;

    if (reasoning_effort) {
        auto effort = parse_reasoning_effort(*reasoning_effort);
        if (effort.is_err()) return Result<CommandLine>::Err(effort);
        inv.reasoning_effort = effort.value;
    }

    auto policy = apply_mode_policy(inv);
    if (policy.is_err()) return Result<CommandLine>::Err(policy);

    return Result<CommandLine>::Ok(build_exec_command(inv, cli));
}

std::string build_pty_command(const PtyLaunchOptions& opts, const AssistantConfig& cli) {
    // --skip-git-repo-check is rejected by the interactive CLI, so it is not passed here
    std::vector<std::string> parts = {cli.runner, "--yes", cli.package};
    if (opts.search) parts.push_back("--search");
    parts.push_back("--full-auto");
    parts.push_back("--sandbox");
    parts.push_back(isolation_name(Isolation::ReadOnly));
    if (opts.reasoning_effort) {
        parts.push_back("-c");
        parts.push_back(reasoning_effort_override(*opts.reasoning_effort));
    }

    std::string line;
    for (const auto& p : parts) {
        if (!line.empty()) line += ' ';
        line += StringUtils::shell_quote(p);
    }
    return line;
}
