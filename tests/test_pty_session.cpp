#include <gtest/gtest.h>
#include <pty/pty_session.hpp>
#include <filesystem>
#include <chrono>

namespace fs = std::filesystem;

static PtySessionOptions quick(const std::string& command_line) {
    PtySessionOptions opts;
    opts.command_line = command_line;
    opts.spawn_grace_ms = 300;
    opts.key_delay_ms = 5;
    opts.char_delay_ms = 1;
    opts.kill_wait_ms = 200;
    return opts;
}

static CollectOptions short_collect() {
    CollectOptions opts;
    opts.idle_ms = 400;
    opts.poll_ms = 20;
    opts.max_ms = 5000;
    return opts;
}

TEST(PtySession, EchoRoundTrip) {
    PtySession pty(quick("cat"));
    ASSERT_TRUE(pty.spawn().is_ok());
    EXPECT_EQ(pty.state(), PtyState::Ready);
    EXPECT_TRUE(pty.is_alive());

    ASSERT_TRUE(pty.send("hello pty").is_ok());
    EXPECT_EQ(pty.state(), PtyState::Collecting);
    auto r = pty.collect(short_collect());
    EXPECT_EQ(pty.state(), PtyState::Ready);
    EXPECT_EQ(r.reason, CollectStop::Idle);
    EXPECT_NE(r.text.find("hello pty"), std::string::npos);

    pty.kill();
    EXPECT_EQ(pty.state(), PtyState::Terminated);
    EXPECT_FALSE(pty.is_alive());
}

TEST(PtySession, SendClearsPreviousOutput) {
    PtySession pty(quick("echo banner; cat"));
    ASSERT_TRUE(pty.spawn().is_ok());
    EXPECT_NE(pty.collect(short_collect()).text.find("banner"), std::string::npos);

    ASSERT_TRUE(pty.send("second").is_ok());
    auto r = pty.collect(short_collect());
    EXPECT_EQ(r.text.find("banner"), std::string::npos);
    EXPECT_NE(r.text.find("second"), std::string::npos);
}

TEST(PtySession, TerminalEnvironment) {
    PtySession pty(quick("echo \"term=$TERM cols=$(tput cols 2>/dev/null || stty size)\"; cat"));
    ASSERT_TRUE(pty.spawn().is_ok());
    std::string out = pty.collect(short_collect()).text;
    EXPECT_NE(out.find("term=xterm-256color"), std::string::npos);
    EXPECT_NE(out.find("120"), std::string::npos);
}

TEST(PtySession, WorkingDirectory) {
    fs::path dir = fs::canonical(fs::temp_directory_path());
    auto opts = quick("pwd -P; cat");
    opts.working_dir = dir.string();
    PtySession pty(opts);
    ASSERT_TRUE(pty.spawn().is_ok());
    EXPECT_NE(pty.collect(short_collect()).text.find(dir.string()), std::string::npos);
}

TEST(PtySession, EarlyExitIsSpawnError) {
    PtySession pty(quick("echo cannot start; exit 1"));
    auto r = pty.spawn();
    ASSERT_TRUE(r.is_err());
    EXPECT_EQ(r.code, ErrorCode::SpawnError);
    EXPECT_NE(r.error.find("exited during startup"), std::string::npos);
    EXPECT_NE(r.error.find("cannot start"), std::string::npos);
    EXPECT_EQ(pty.state(), PtyState::Terminated);
}

TEST(PtySession, ExitWhileCollectingStopsCollection) {
    PtySession pty(quick("read line; echo got:$line; exit 0"));
    ASSERT_TRUE(pty.spawn().is_ok());
    ASSERT_TRUE(pty.send("bye").is_ok());

    CollectOptions opts = short_collect();
    opts.idle_ms = 3000;
    auto r = pty.collect(opts);
    EXPECT_EQ(r.reason, CollectStop::ProcessExited);
    EXPECT_LT(r.elapsed_ms, 3000);
    EXPECT_NE(r.text.find("got:bye"), std::string::npos);
}

TEST(PtySession, SendWhileReplyPendingFails) {
    PtySession pty(quick("cat"));
    ASSERT_TRUE(pty.spawn().is_ok());
    ASSERT_TRUE(pty.send("first").is_ok());
    EXPECT_TRUE(pty.send("second").is_err());
    EXPECT_EQ(pty.state(), PtyState::Collecting);

    pty.collect(short_collect());
    EXPECT_TRUE(pty.send("third").is_ok());
}

TEST(PtySession, SendBeforeSpawnFails) {
    PtySession pty(quick("cat"));
    EXPECT_TRUE(pty.send("x").is_err());
}

TEST(PtySession, KillIsIdempotent) {
    PtySession pty(quick("cat"));
    ASSERT_TRUE(pty.spawn().is_ok());
    pty.kill();
    pty.kill();
    EXPECT_EQ(pty.state(), PtyState::Terminated);
    EXPECT_TRUE(pty.spawn().is_err());
}

TEST(PtySession, ChildIgnoringInterruptIsKilled) {
    PtySession pty(quick("trap '' INT TERM; while :; do sleep 1; done"));
    ASSERT_TRUE(pty.spawn().is_ok());
    auto start = std::chrono::steady_clock::now();
    pty.kill();
    auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - start).count();
    EXPECT_FALSE(pty.is_alive());
    EXPECT_LT(elapsed, 3000);
}
