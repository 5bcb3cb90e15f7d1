#include <gtest/gtest.h>
#include <core/command_builder.hpp>

static AssistantConfig default_cli() {
    return AssistantConfig();
}

static std::vector<std::string> args_of(const Result<CommandLine>& r) {
    EXPECT_TRUE(r.is_ok()) << r.error;
    return r.value.args;
}

// ── build_command ───────────────────────────────────────────

TEST(CommandBuilder, QuestionMinimal) {
    auto r = build_command(Mode::Question, std::nullopt, "hello", std::nullopt, default_cli());
    ASSERT_TRUE(r.is_ok());
    EXPECT_EQ(r.value.program, "npx");
    std::vector<std::string> expected = {
        "--yes", "@openai/codex", "exec", "--full-auto",
        "--sandbox", "read-only", "--skip-git-repo-check", "hello"};
    EXPECT_EQ(r.value.args, expected);
}

TEST(CommandBuilder, ReviewWithEffortAndDirectory) {
    auto args = args_of(build_command(Mode::Review, std::string("/work/src"), "check this",
                                      std::string("high"), default_cli()));
    std::vector<std::string> expected = {
        "--yes", "@openai/codex", "exec", "--full-auto",
        "-c", "model_reasoning_effort=\"high\"",
        "--sandbox", "read-only", "--skip-git-repo-check",
        "--cd", "/work/src", "check this"};
    EXPECT_EQ(args, expected);
}

TEST(CommandBuilder, ModifyIsWorkspaceWrite) {
    auto args = args_of(build_command(Mode::Modify, std::string("/work"), "fix it",
                                      std::nullopt, default_cli()));
    ASSERT_GE(args.size(), 6u);
    EXPECT_EQ(args[4], "--sandbox");
    EXPECT_EQ(args[5], "workspace-write");
}

TEST(CommandBuilder, PromptIsAlwaysLast) {
    std::string prompt = "--cd /etc is not an option here";
    auto args = args_of(build_command(Mode::Question, std::nullopt, prompt,
                                      std::string("low"), default_cli()));
    ASSERT_FALSE(args.empty());
    EXPECT_EQ(args.back(), prompt);
}

TEST(CommandBuilder, RejectsBadEffort) {
    auto r = build_command(Mode::Question, std::nullopt, "x", std::string("max"), default_cli());
    ASSERT_TRUE(r.is_err());
    EXPECT_EQ(r.code, ErrorCode::InvalidReasoningEffort);
}

TEST(CommandBuilder, ReviewNeedsDirectory) {
    auto r = build_command(Mode::Review, std::nullopt, "x", std::nullopt, default_cli());
    ASSERT_TRUE(r.is_err());
    EXPECT_EQ(r.code, ErrorCode::MissingWorkingDirectory);
}

TEST(CommandBuilder, CustomRunnerAndPackage) {
    AssistantConfig cli;
    cli.runner = "bunx";
    cli.package = "assistant-cli@1.2";
    auto r = build_command(Mode::Question, std::nullopt, "x", std::nullopt, cli);
    ASSERT_TRUE(r.is_ok());
    EXPECT_EQ(r.value.program, "bunx");
    EXPECT_EQ(r.value.args[1], "assistant-cli@1.2");
}

// ── build_exec_command ──────────────────────────────────────

TEST(CommandBuilder, ExecCommandUsesInvocationIsolationAsIs) {
    Invocation inv;
    inv.isolation = Isolation::WorkspaceWrite;
    inv.working_dir = "";
    inv.prompt = "p";
    auto cmd = build_exec_command(inv, default_cli());
    std::vector<std::string> expected = {
        "--yes", "@openai/codex", "exec", "--full-auto",
        "--sandbox", "workspace-write", "--skip-git-repo-check", "p"};
    EXPECT_EQ(cmd.args, expected);
}

// ── build_pty_command ───────────────────────────────────────

TEST(CommandBuilder, PtyCommandWithSearch) {
    PtyLaunchOptions opts;
    EXPECT_EQ(build_pty_command(opts, default_cli()),
              "npx --yes @openai/codex --search --full-auto --sandbox read-only");
}

TEST(CommandBuilder, PtyCommandQuotesEffortOverride) {
    PtyLaunchOptions opts;
    opts.search = false;
    opts.reasoning_effort = ReasoningEffort::Medium;
    EXPECT_EQ(build_pty_command(opts, default_cli()),
              "npx --yes @openai/codex --full-auto --sandbox read-only "
              "-c 'model_reasoning_effort=\"medium\"'");
}

TEST(CommandBuilder, ReasoningEffortOverride) {
    EXPECT_EQ(reasoning_effort_override(ReasoningEffort::Low), "model_reasoning_effort=\"low\"");
}
