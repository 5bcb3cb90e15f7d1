#include <gtest/gtest.h>
#include <util/string_utils.hpp>

using namespace StringUtils;

TEST(StringUtils, SplitKeepsEmptyFields) {
    auto parts = split("a,,b", ',');
    ASSERT_EQ(parts.size(), 3u);
    EXPECT_EQ(parts[1], "");
    EXPECT_EQ(parts[2], "b");
}

TEST(StringUtils, Trim) {
    EXPECT_EQ(trim("  hi there \r\n"), "hi there");
    EXPECT_EQ(trim(" \t\n"), "");
}

TEST(StringUtils, ReplaceAll) {
    EXPECT_EQ(replace_all("{{T}} and {{T}}", "{{T}}", "x"), "x and x");
    EXPECT_EQ(replace_all("aaa", "a", "aa"), "aaaaaa");
    EXPECT_EQ(replace_all("abc", "", "z"), "abc");
}

// ── strip_ansi ──────────────────────────────────────────────

TEST(StringUtils, StripColourCodes) {
    EXPECT_EQ(strip_ansi("\x1b[1;32mok\x1b[0m done"), "ok done");
}

TEST(StringUtils, StripCursorAndPrivateModes) {
    EXPECT_EQ(strip_ansi("\x1b[?25l\x1b[2J\x1b[Hhello\x1b[?2004h"), "hello");
}

TEST(StringUtils, StripOscTitle) {
    EXPECT_EQ(strip_ansi("\x1b]0;window title\x07text"), "text");
    EXPECT_EQ(strip_ansi("\x1b]8;;http://x\x1b\\link"), "link");
}

TEST(StringUtils, StripCharsetAndKeypad) {
    EXPECT_EQ(strip_ansi("\x1b(Babc\x1b=\x1b>"), "abc");
}

TEST(StringUtils, LineEndingsNormalized) {
    EXPECT_EQ(strip_ansi("one\r\ntwo\rthree\n"), "one\ntwothree\n");
}

TEST(StringUtils, ControlCharsDropped) {
    EXPECT_EQ(strip_ansi("a\x07" "b\x08" "c\td"), "abc\td");
}

TEST(StringUtils, Utf8Survives) {
    EXPECT_EQ(strip_ansi("\x1b[33mcaf\xc3\xa9\x1b[0m"), "caf\xc3\xa9");
}

// ── shell_quote ─────────────────────────────────────────────

TEST(StringUtils, ShellQuotePlainWordUnchanged) {
    EXPECT_EQ(shell_quote("@openai/codex"), "@openai/codex");
    EXPECT_EQ(shell_quote("--full-auto"), "--full-auto");
}

TEST(StringUtils, ShellQuoteSpacesAndQuotes) {
    EXPECT_EQ(shell_quote("a b"), "'a b'");
    EXPECT_EQ(shell_quote("it's"), "'it'\\''s'");
    EXPECT_EQ(shell_quote(""), "''");
}

// ── utf8_chars ──────────────────────────────────────────────

TEST(StringUtils, Utf8CharsSplitsCodePoints) {
    auto chars = utf8_chars("a\xc3\xa9\xe2\x86\x92\xf0\x9f\x98\x80");
    ASSERT_EQ(chars.size(), 4u);
    EXPECT_EQ(chars[0], "a");
    EXPECT_EQ(chars[1], "\xc3\xa9");
    EXPECT_EQ(chars[2], "\xe2\x86\x92");
    EXPECT_EQ(chars[3], "\xf0\x9f\x98\x80");
}

TEST(StringUtils, Utf8CharsInvalidBytesOneAtATime) {
    auto chars = utf8_chars("\xc3" "a");
    ASSERT_EQ(chars.size(), 2u);
    EXPECT_EQ(chars[0], "\xc3");
    EXPECT_EQ(chars[1], "a");
}
