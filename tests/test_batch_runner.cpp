#include <gtest/gtest.h>
#include <runner/batch_runner.hpp>
#include <chrono>
#include <filesystem>
#include <fstream>
#include <thread>
#include <signal.h>
#include <unistd.h>

namespace fs = std::filesystem;

static BatchOptions quiet(int timeout_ms = 10000) {
    BatchOptions opts;
    opts.timeout_ms = timeout_ms;
    opts.grace_ms = 200;
    opts.echo = false;
    return opts;
}

static Result<BatchResult> sh(const std::string& script, BatchOptions opts = quiet()) {
    return BatchRunner(opts).run("/bin/sh", {"-c", script});
}

// Running and not a zombie waiting for its new parent to reap it.
static bool process_alive(pid_t pid) {
    if (kill(pid, 0) != 0) return false;
    std::ifstream stat("/proc/" + std::to_string(pid) + "/stat");
    std::string line;
    if (!std::getline(stat, line)) return false;
    auto paren = line.rfind(')');
    return paren == std::string::npos || paren + 2 >= line.size() || line[paren + 2] != 'Z';
}

// ── extract_session_id ──────────────────────────────────────

TEST(BatchRunner, ExtractSessionId) {
    EXPECT_EQ(extract_session_id("model: x\nsession id: 0199a4f2-7c1e-7d30\n").value_or(""),
              "0199a4f2-7c1e-7d30");
    EXPECT_EQ(extract_session_id("SESSION ID:\tabcd-12").value_or(""), "abcd-12");
    EXPECT_FALSE(extract_session_id("no id here").has_value());
    EXPECT_FALSE(extract_session_id("session id: zzz").has_value());
}

TEST(BatchRunner, FirstSessionIdWins) {
    EXPECT_EQ(extract_session_id("session id: aaaa\nsession id: bbbb").value_or(""), "aaaa");
}

// ── run ─────────────────────────────────────────────────────

TEST(BatchRunner, CapturesOutputAndExitCode) {
    auto r = sh("echo hello; echo 'session id: 0a1b-2c3d'; echo oops 1>&2; exit 3");
    ASSERT_TRUE(r.is_ok()) << r.error;
    EXPECT_EQ(r.value.exit_code, 3);
    EXPECT_EQ(r.value.output, "hello\nsession id: 0a1b-2c3d\n");
    EXPECT_EQ(r.value.error_output, "oops\n");
    EXPECT_EQ(r.value.session_id.value_or(""), "0a1b-2c3d");
}

TEST(BatchRunner, SessionIdFromStderr) {
    auto r = sh("echo reply; echo 'session id: feed-beef' 1>&2");
    ASSERT_TRUE(r.is_ok()) << r.error;
    EXPECT_EQ(r.value.exit_code, 0);
    EXPECT_EQ(r.value.session_id.value_or(""), "feed-beef");
}

TEST(BatchRunner, StdoutSessionIdPreferred) {
    auto r = sh("echo 'session id: 1111' 1>&2; echo 'session id: 2222'");
    ASSERT_TRUE(r.is_ok()) << r.error;
    EXPECT_EQ(r.value.session_id.value_or(""), "2222");
}

TEST(BatchRunner, NoSessionId) {
    auto r = sh("echo plain");
    ASSERT_TRUE(r.is_ok());
    EXPECT_FALSE(r.value.session_id.has_value());
}

TEST(BatchRunner, LargeOutputDoesNotBlock) {
    auto r = sh("head -c 300000 /dev/zero | tr '\\000' x; head -c 100000 /dev/zero | tr '\\000' y 1>&2");
    ASSERT_TRUE(r.is_ok()) << r.error;
    EXPECT_EQ(r.value.output.size(), 300000u);
    EXPECT_EQ(r.value.error_output.size(), 100000u);
}

TEST(BatchRunner, ArgumentsAreNotShellExpanded) {
    auto r = BatchRunner(quiet()).run("/bin/echo", {"$HOME", "a b", "--cd"});
    ASSERT_TRUE(r.is_ok()) << r.error;
    EXPECT_EQ(r.value.output, "$HOME a b --cd\n");
}

TEST(BatchRunner, SignalDeathReportsExitCode) {
    auto r = sh("kill -9 $$");
    ASSERT_TRUE(r.is_ok()) << r.error;
    EXPECT_EQ(r.value.exit_code, 128 + 9);
}

TEST(BatchRunner, MissingBinaryIsSpawnError) {
    auto r = BatchRunner(quiet()).run("rally-test-no-such-binary", {"--version"});
    ASSERT_TRUE(r.is_err());
    EXPECT_EQ(r.code, ErrorCode::SpawnError);
    EXPECT_NE(r.error.find("rally-test-no-such-binary"), std::string::npos);
}

TEST(BatchRunner, TimeoutTerminatesWithPartialOutput) {
    auto start = std::chrono::steady_clock::now();
    auto r = sh("echo partial; exec sleep 10", quiet(300));
    auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - start).count();

    ASSERT_TRUE(r.is_err());
    EXPECT_EQ(r.code, ErrorCode::Timeout);
    EXPECT_NE(r.error.find("300 ms"), std::string::npos);
    EXPECT_NE(r.error.find("partial"), std::string::npos);
    EXPECT_LT(elapsed, 5000);
}

TEST(BatchRunner, ChildIgnoringTermIsKilled) {
    auto start = std::chrono::steady_clock::now();
    auto r = sh("trap '' TERM; echo stubborn; while :; do sleep 1; done", quiet(300));
    auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - start).count();

    ASSERT_TRUE(r.is_err());
    EXPECT_EQ(r.code, ErrorCode::Timeout);
    EXPECT_LT(elapsed, 5000);
}

TEST(BatchRunner, TimeoutKillsGrandchildren) {
    fs::path pidfile = fs::temp_directory_path() /
                       ("rally_grandchild_" + std::to_string(getpid()));
    fs::remove(pidfile);

    auto r = sh("sleep 30 & echo $! > '" + pidfile.string() + "'; wait", quiet(500));
    ASSERT_TRUE(r.is_err());
    EXPECT_EQ(r.code, ErrorCode::Timeout);

    std::ifstream in(pidfile);
    pid_t grandchild = 0;
    in >> grandchild;
    ASSERT_GT(grandchild, 0);

    bool alive = true;
    for (int i = 0; i < 50 && alive; ++i) {
        alive = process_alive(grandchild);
        if (alive) std::this_thread::sleep_for(std::chrono::milliseconds(20));
    }
    EXPECT_FALSE(alive);
    if (alive) kill(grandchild, SIGKILL);
    fs::remove(pidfile);
}

TEST(BatchRunner, ChildDoesNotReadTerminal) {
    auto r = sh("cat; echo done");
    ASSERT_TRUE(r.is_ok()) << r.error;
    EXPECT_EQ(r.value.output, "done\n");
}
