#include <gtest/gtest.h>
#include <log/conversation_log.hpp>
#include <log/log_template.hpp>
#include <core/utils.hpp>
#include <util/string_utils.hpp>
#include <filesystem>
#include <fstream>
#include <sstream>
#include <cstdlib>
#include <unistd.h>

namespace fs = std::filesystem;

static const std::time_t T0 = 1709622489;  // 2024-03-05 07:08:09 UTC

static std::string read_file(const fs::path& p) {
    std::ifstream in(p, std::ios::binary);
    std::stringstream ss;
    ss << in.rdbuf();
    return ss.str();
}

static void write_file(const fs::path& p, const std::string& content) {
    std::ofstream out(p, std::ios::binary);
    out << content;
}

// Rendered default template with fixed values.
static std::string sample_log() {
    TemplateValues v;
    v.datetime = "2024-03-05 07:08:09 UTC";
    v.topic = "caching";
    v.purpose = "pick a design";
    return render_template(default_log_template(), v);
}

class ConversationLogTest : public ::testing::Test {
protected:
    void SetUp() override {
        const char* tz = std::getenv("TZ");
        had_tz_ = tz != nullptr;
        if (tz) saved_tz_ = tz;
        setenv("TZ", "UTC", 1);
        tzset();

        dir_ = fs::temp_directory_path() / ("rally_log_test_" + std::to_string(getpid()));
        fs::remove_all(dir_);
        fs::create_directories(dir_);
        template_ = dir_ / "_TEMPLATE.md";
        ASSERT_TRUE(install_default_template(template_).is_ok());
    }

    void TearDown() override {
        fs::remove_all(dir_);
        if (had_tz_) setenv("TZ", saved_tz_.c_str(), 1);
        else unsetenv("TZ");
        tzset();
    }

    fs::path dir_;
    fs::path template_;
    std::string saved_tz_;
    bool had_tz_ = false;
};

// ── Template ────────────────────────────────────────────────

TEST_F(ConversationLogTest, InstallTemplateOnlyOnce) {
    write_file(template_, "custom");
    auto r = install_default_template(template_);
    ASSERT_TRUE(r.is_ok());
    EXPECT_FALSE(r.value);
    EXPECT_EQ(read_file(template_), "custom");
}

TEST(LogTemplate, RenderFillsEveryPlaceholder) {
    TemplateValues v;
    v.datetime = "D";
    v.topic = "T";
    v.working_dir = "/repo";
    v.isolation = Isolation::WorkspaceWrite;
    v.reference_paths = {"a.cpp", " ", "b.md"};
    std::string out = render_template("{{TOPIC}} {{TOPIC}}\n{{WORKDIR}} {{SANDBOX}}\n{{REFPATHS}}\n"
                                      "{{PURPOSE}}|{{SESSION_ID}}", v);
    EXPECT_EQ(out, "T T\n/repo workspace-write\n  - a.cpp\n  - b.md\n"
                   "(fill in for this request)|(filled in after the first run)");
}

TEST(LogTemplate, DefaultTemplateHasNoLeftoverPlaceholders) {
    std::string out = sample_log();
    EXPECT_EQ(out.find("{{"), std::string::npos);
    EXPECT_NE(out.find("- **Working directory**: none"), std::string::npos);
    EXPECT_NE(out.find("  - none"), std::string::npos);
}

TEST(LogTemplate, Markers) {
    EXPECT_EQ(request_marker(3), "## Requester \xe2\x86\x92 Assistant (3)");
    EXPECT_EQ(response_marker(12), "## Assistant \xe2\x86\x92 Requester (12)");
}

// ── Creation ────────────────────────────────────────────────

TEST_F(ConversationLogTest, FileName) {
    EXPECT_EQ(log_file_name("hello", T0), "20240305_070809_discussion_hello_5d41402a.md");
}

TEST_F(ConversationLogTest, CreateRendersTemplate) {
    LogCreateOptions opts;
    opts.topic = "hello";
    opts.purpose = "try it";
    opts.working_dir = "/repo";
    opts.reference_paths = {"src/main.cpp"};

    auto r = create_log(dir_, template_, opts, T0);
    ASSERT_TRUE(r.is_ok()) << r.error;
    EXPECT_EQ(r.value.filename(), "20240305_070809_discussion_hello_5d41402a.md");

    std::string content = read_file(r.value);
    EXPECT_TRUE(has_log_header(content));
    EXPECT_NE(content.find("- **Date**: 2024-03-05 07:08:09 UTC"), std::string::npos);
    EXPECT_NE(content.find("- **Topic**: hello"), std::string::npos);
    EXPECT_NE(content.find("- **Purpose**: try it"), std::string::npos);
    EXPECT_NE(content.find("- **Working directory**: /repo"), std::string::npos);
    EXPECT_NE(content.find("  - src/main.cpp"), std::string::npos);
    EXPECT_EQ(current_rally_number(content), 1);
}

TEST_F(ConversationLogTest, CreateNeverOverwrites) {
    LogCreateOptions opts;
    opts.topic = "hello";
    auto first = create_log(dir_, template_, opts, T0);
    ASSERT_TRUE(first.is_ok());
    write_file(first.value, "edited by hand");

    auto second = create_log(dir_, template_, opts, T0);
    auto third = create_log(dir_, template_, opts, T0);
    ASSERT_TRUE(second.is_ok());
    ASSERT_TRUE(third.is_ok());
    EXPECT_EQ(second.value.filename(), "20240305_070809_discussion_hello_5d41402a_2.md");
    EXPECT_EQ(third.value.filename(), "20240305_070809_discussion_hello_5d41402a_3.md");
    EXPECT_EQ(read_file(first.value), "edited by hand");
}

TEST_F(ConversationLogTest, CreateNeedsTemplate) {
    auto r = create_log(dir_, dir_ / "missing.md", LogCreateOptions(), T0);
    ASSERT_TRUE(r.is_err());
    EXPECT_EQ(r.code, ErrorCode::TemplateMissing);
}

TEST(ConversationLog, TopicSlug) {
    EXPECT_EQ(topic_slug("hello"), "hello_5d41402a");
    EXPECT_EQ(topic_slug("Rust  Features!"),
              "rust-features_" + md5_hex("Rust  Features!").substr(0, 8));

    std::string cjk = "\xe6\x97\xa5\xe6\x9c\xac";
    EXPECT_EQ(topic_slug(cjk), md5_hex(cjk).substr(0, 8));

    std::string long_topic(45, 'a');
    EXPECT_EQ(topic_slug(long_topic), std::string(30, 'a') + "_" + md5_hex(long_topic).substr(0, 8));
}

// ── Validation ──────────────────────────────────────────────

TEST_F(ConversationLogTest, ValidateMissingFile) {
    auto r = validate_log(dir_ / "nope.md");
    ASSERT_TRUE(r.is_err());
    EXPECT_EQ(r.code, ErrorCode::NotFound);
}

TEST_F(ConversationLogTest, ValidateMissingHeader) {
    fs::path p = dir_ / "no_header.md";
    write_file(p, request_marker(1) + "\n\nquestion\n");
    auto r = validate_log(p);
    ASSERT_TRUE(r.is_err());
    EXPECT_EQ(r.code, ErrorCode::MalformedHeader);
}

TEST_F(ConversationLogTest, ValidateMissingRequest) {
    fs::path p = dir_ / "no_request.md";
    write_file(p, "# Assistant Discussion Log\n\nnotes only\n");
    auto r = validate_log(p);
    ASSERT_TRUE(r.is_err());
    EXPECT_EQ(r.code, ErrorCode::NoPendingRequest);
}

TEST_F(ConversationLogTest, ValidateTemplateLog) {
    fs::path p = dir_ / "ok.md";
    write_file(p, sample_log());
    auto r = validate_log(p);
    ASSERT_TRUE(r.is_ok()) << r.error;
    EXPECT_EQ(r.value, sample_log());
}

TEST(ConversationLog, ReadLogNeedsPath) {
    auto r = read_log(fs::path());
    ASSERT_TRUE(r.is_err());
    EXPECT_EQ(r.code, ErrorCode::MissingArgument);
}

// ── Parsing ─────────────────────────────────────────────────

TEST(ConversationLog, MarkerMustBeWholeLine) {
    EXPECT_TRUE(parse_turn_marker(request_marker(2)).has_value());
    EXPECT_TRUE(parse_turn_marker(request_marker(2) + "  \r").has_value());
    EXPECT_FALSE(parse_turn_marker(" " + request_marker(2)).has_value());
    EXPECT_FALSE(parse_turn_marker("see " + request_marker(2)).has_value());
    EXPECT_FALSE(parse_turn_marker("\\" + request_marker(2)).has_value());
    EXPECT_FALSE(parse_turn_marker("## Requester \xe2\x86\x92 Assistant (x)").has_value());
    EXPECT_FALSE(parse_turn_marker("## Requester \xe2\x86\x92 Assistant ()").has_value());

    auto m = parse_turn_marker(response_marker(4));
    ASSERT_TRUE(m.has_value());
    EXPECT_EQ(m->role, TurnRole::Assistant);
    EXPECT_EQ(m->index, 4);
}

TEST(ConversationLog, RallyNumberIsHighestIndex) {
    std::string content = "# Assistant Discussion Log\n\n" +
        request_marker(1) + "\n\nq\n\n" + response_marker(1) + "\n\na\n\n" +
        request_marker(3) + "\n\nq3\n\n" +
        "quoted " + request_marker(9) + " inline\n";
    EXPECT_EQ(current_rally_number(content), 3);
    EXPECT_EQ(current_rally_number("# Assistant Discussion Log\n"), 0);
}

TEST(ConversationLog, ParseTurns) {
    auto turns = parse_turns(sample_log());
    ASSERT_EQ(turns.size(), 2u);
    EXPECT_EQ(turns[0].role, TurnRole::Requester);
    EXPECT_EQ(turns[0].index, 1);
    EXPECT_EQ(turns[0].body, placeholders::QUESTION);
    EXPECT_EQ(turns[1].role, TurnRole::Assistant);
    EXPECT_EQ(turns[1].body, placeholders::ANSWER);
}

TEST(ConversationLog, PendingRequest) {
    std::string content = sample_log();
    EXPECT_FALSE(has_pending_request(content));
    EXPECT_TRUE(has_pending_request(apply_request(content, "again", 2)));
}

TEST(ConversationLog, ReadMetadata) {
    std::string content =
        "# Assistant Discussion Log\n\n"
        "- **Date**: 2024-03-05 07:08:09 UTC\n"
        "- **Topic**: caching\n"
        "- **Purpose**: compare designs\n"
        "- **Session**: 0a1b-2c3d\n"
        "- **Working directory**: /repo/src <!-- comment -->\n"
        "- **Sandbox**: workspace-write (writes allowed)\n"
        "- **Reference paths**:\n"
        "  - src/a.cpp\n"
        "  - docs/b.md\n\n"
        "---\n\n" +
        request_marker(1) + "\n\n"
        "- **Session**: ffff\n"
        "- **Sandbox**: danger-full-access\n";

    LogMetadata meta = read_metadata(content);
    EXPECT_EQ(meta.datetime, "2024-03-05 07:08:09 UTC");
    EXPECT_EQ(meta.topic, "caching");
    EXPECT_EQ(meta.purpose, "compare designs");
    EXPECT_EQ(meta.session_id, "0a1b-2c3d");
    EXPECT_EQ(meta.working_dir, "/repo/src");
    EXPECT_EQ(meta.isolation, "workspace-write");
    std::vector<std::string> refs = {"src/a.cpp", "docs/b.md"};
    EXPECT_EQ(meta.reference_paths, refs);
}

TEST(ConversationLog, ReadMetadataFromTemplate) {
    LogMetadata meta = read_metadata(sample_log());
    EXPECT_EQ(meta.working_dir, "none");
    EXPECT_EQ(meta.isolation, "read-only");
    EXPECT_EQ(meta.session_id, placeholders::SESSION_ID);
    EXPECT_TRUE(meta.reference_paths.empty());
}

TEST(ConversationLog, MissingFieldsStayEmpty) {
    LogMetadata meta = read_metadata("# Assistant Discussion Log\n\n" + request_marker(1) + "\n");
    EXPECT_EQ(meta.session_id, "");
    EXPECT_EQ(meta.working_dir, "");
    EXPECT_EQ(meta.isolation, "");
}

// ── Mutation ────────────────────────────────────────────────

TEST(ConversationLog, SessionIdOnlyInHeader) {
    std::string content = sample_log() + "\n- **Session**: body text\n";
    std::string updated = apply_session_id(content, "abc-123");
    EXPECT_NE(updated.find("- **Session**: abc-123\n"), std::string::npos);
    EXPECT_NE(updated.find("- **Session**: body text\n"), std::string::npos);
    EXPECT_EQ(apply_session_id(content, ""), content);
}

TEST(ConversationLog, LabelInsideFieldValueIgnored) {
    std::string content =
        "# Assistant Discussion Log\n\n"
        "- **Topic**: what does **Session**: mean\n"
        "- **Purpose**: see **Working directory**: docs\n"
        "- **Session**: {{SESSION_ID}}\n"
        "- **Working directory**: /repo\n\n"
        "---\n\n" +
        request_marker(1) + "\n";

    std::string updated = apply_session_id(content, "abc-123");
    EXPECT_NE(updated.find("- **Topic**: what does **Session**: mean\n"), std::string::npos);
    EXPECT_NE(updated.find("- **Session**: abc-123\n"), std::string::npos);

    LogMetadata meta = read_metadata(updated);
    EXPECT_EQ(meta.topic, "what does **Session**: mean");
    EXPECT_EQ(meta.purpose, "see **Working directory**: docs");
    EXPECT_EQ(meta.session_id, "abc-123");
    EXPECT_EQ(meta.working_dir, "/repo");
}

TEST(ConversationLog, ResponseReplacesPlaceholder) {
    std::string content = sample_log();
    auto r = apply_response(content, "Answer line\n", "abc-123", 1);
    ASSERT_TRUE(r.is_ok()) << r.error;

    std::string expected = StringUtils::replace_all(content, placeholders::ANSWER, "Answer line");
    expected = StringUtils::replace_all(expected, placeholders::SESSION_ID, "abc-123");
    EXPECT_EQ(r.value, expected);
}

TEST(ConversationLog, ResponseIsIdempotent) {
    auto once = apply_response(sample_log(), "The reply\n\nwith two paragraphs", "abc-123", 1);
    ASSERT_TRUE(once.is_ok());
    auto twice = apply_response(once.value, "The reply\n\nwith two paragraphs", "abc-123", 1);
    ASSERT_TRUE(twice.is_ok());
    EXPECT_EQ(once.value, twice.value);
}

TEST(ConversationLog, ResponseInsertedAfterRequestAtEnd) {
    std::string content = "# Assistant Discussion Log\n\n" + request_marker(1) + "\n\nQ\n";
    auto r = apply_response(content, "A", "", 1);
    ASSERT_TRUE(r.is_ok()) << r.error;
    EXPECT_EQ(r.value, content + "\n" + response_marker(1) + "\n\nA\n");

    auto again = apply_response(r.value, "A", "", 1);
    ASSERT_TRUE(again.is_ok());
    EXPECT_EQ(again.value, r.value);
}

TEST(ConversationLog, ResponseNeedsRequestSection) {
    auto r = apply_response(sample_log(), "A", "", 2);
    ASSERT_TRUE(r.is_err());
    EXPECT_EQ(r.code, ErrorCode::NoPendingRequest);
}

TEST(ConversationLog, RequestThenResponseBeforeConclusion) {
    auto first = apply_response(sample_log(), "First", "", 1);
    ASSERT_TRUE(first.is_ok());
    std::string with_request = apply_request(first.value, "Follow up", 2);
    auto second = apply_response(with_request, "Second", "", 2);
    ASSERT_TRUE(second.is_ok()) << second.error;

    std::string expected_tail =
        response_marker(1) + "\n\nFirst\n\n" +
        request_marker(2) + "\n\nFollow up\n\n" +
        response_marker(2) + "\n\nSecond\n\n" +
        "## Conclusion\n";
    EXPECT_NE(second.value.find(expected_tail), std::string::npos);
    EXPECT_EQ(current_rally_number(second.value), 2);
    EXPECT_FALSE(has_pending_request(second.value));
}

TEST(ConversationLog, RequestIsIdempotent) {
    std::string once = apply_request(sample_log(), "Follow up", 2);
    EXPECT_EQ(apply_request(once, "Something else", 2), once);
}

TEST(ConversationLog, RequestAppendedWithoutConclusion) {
    std::string content = "# Assistant Discussion Log\n\n" + request_marker(1) + "\n\nQ\n\n" +
                          response_marker(1) + "\n\nA\n";
    EXPECT_EQ(apply_request(content, "Next", 2),
              content + "\n" + request_marker(2) + "\n\nNext\n");
}

TEST(ConversationLog, MarkersInReplyAreEscaped) {
    std::string reply = "Intro\n## Conclusion\n" + request_marker(7) + "\n\\## Conclusion\n";
    auto r = apply_response(sample_log(), reply, "", 1);
    ASSERT_TRUE(r.is_ok());

    EXPECT_EQ(current_rally_number(r.value), 1);
    auto turns = parse_turns(r.value);
    ASSERT_EQ(turns.size(), 2u);
    EXPECT_EQ(turns[1].body, "Intro\n\\## Conclusion\n\\" + request_marker(7) + "\n\\\\## Conclusion");
}

TEST(ConversationLog, SanitizeStripsTerminalNoise) {
    EXPECT_EQ(sanitize_body("\x1b[1mbold\x1b[0m   \r\nnext\t \r\n\n"), "bold\nnext");
}

// ── File operations ─────────────────────────────────────────

TEST_F(ConversationLogTest, AppendAndInsertOnDisk) {
    auto created = create_log(dir_, template_, LogCreateOptions(), T0);
    ASSERT_TRUE(created.is_ok()) << created.error;
    const fs::path& p = created.value;

    ASSERT_TRUE(append_response(p, "first answer", "0a1b-2c3d", 1).is_ok());
    ASSERT_TRUE(insert_request(p, "second question", 2).is_ok());
    ASSERT_TRUE(append_response(p, "second answer", "", 2).is_ok());

    std::string content = read_file(p);
    EXPECT_EQ(read_metadata(content).session_id, "0a1b-2c3d");
    auto turns = parse_turns(content);
    ASSERT_EQ(turns.size(), 4u);
    EXPECT_EQ(turns[1].body, "first answer");
    EXPECT_EQ(turns[2].body, "second question");
    EXPECT_EQ(turns[3].body, "second answer");
}

TEST_F(ConversationLogTest, AppendWithoutRequestLeavesFileAlone) {
    fs::path p = dir_ / "log.md";
    write_file(p, sample_log());
    auto r = append_response(p, "orphan", "", 5);
    ASSERT_TRUE(r.is_err());
    EXPECT_EQ(r.code, ErrorCode::NoPendingRequest);
    EXPECT_EQ(read_file(p), sample_log());
}
