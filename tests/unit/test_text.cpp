#include <gtest/gtest.h>
#include "../../src/utils/text/string_utils.hpp"

using namespace Trawl::Utils::Text;

TEST(TextTest, TrimAndLower) {
    EXPECT_EQ(trim("  \t hello \r\n"), "hello");
    EXPECT_EQ(trim(" \n\t "), "");
    EXPECT_EQ(to_lower("HeLLo Ünï"), "hello Ünï");
}

TEST(TextTest, PrefixSuffix) {
    EXPECT_TRUE(starts_with("https://a", "https"));
    EXPECT_FALSE(starts_with("http", "https"));
    EXPECT_TRUE(ends_with("photo.png", ".png"));
    EXPECT_FALSE(ends_with("png", ".png"));
}

TEST(TextTest, CollapseWhitespace) {
    EXPECT_EQ(collapse_whitespace("  a \n\t b   c  "), "a b c");
    EXPECT_EQ(collapse_whitespace(""), "");
    EXPECT_EQ(collapse_whitespace("你好  世界"), "你好 世界");
}

TEST(TextTest, CollapseBlankLines) {
    EXPECT_EQ(collapse_blank_lines("a\n\n\n\nb"), "a\n\nb");
    EXPECT_EQ(collapse_blank_lines("a\nb\n\nc"), "a\nb\n\nc");
    EXPECT_EQ(collapse_blank_lines(collapse_blank_lines("x\n\n\n\n\ny")), "x\n\ny");
}

TEST(TextTest, Split) {
    auto parts = split("a,b,,c", ',');
    ASSERT_EQ(parts.size(), 4u);
    EXPECT_EQ(parts[2], "");
    EXPECT_EQ(parts[3], "c");
}

TEST(TextTest, TokenizeIsLowercaseWhitespaceSplit) {
    auto tokens = tokenize("The  Quick\tbrown\nFOX, jumps!");
    std::vector<std::string> expected = {"the", "quick", "brown", "fox,", "jumps!"};
    EXPECT_EQ(tokens, expected);
    EXPECT_TRUE(tokenize("   ").empty());
}

TEST(TextTest, TruncateUtf8KeepsCodepointsWhole) {
    EXPECT_EQ(truncate_utf8("hello", 10), "hello");
    EXPECT_EQ(truncate_utf8("hello", 3), "hel");
    // "é" is two bytes; cutting inside it backs off to the previous boundary.
    EXPECT_EQ(truncate_utf8("caf\xC3\xA9", 4), "caf");
    EXPECT_EQ(truncate_utf8("\xE4\xBD\xA0\xE5\xA5\xBD", 4), "\xE4\xBD\xA0");
}

TEST(TextTest, SanitizeUtf8ReplacesInvalidBytes) {
    EXPECT_EQ(sanitize_utf8("plain ascii"), "plain ascii");
    EXPECT_EQ(sanitize_utf8("caf\xC3\xA9 \xE4\xBD\xA0"), "caf\xC3\xA9 \xE4\xBD\xA0");
    // Latin-1 "é" on its own is not UTF-8.
    EXPECT_EQ(sanitize_utf8("caf\xE9!"), "caf\xEF\xBF\xBD!");
    // Overlong encoding, surrogate and a sequence cut off at the end.
    EXPECT_EQ(sanitize_utf8("\xC0\xAF"), "\xEF\xBF\xBD\xEF\xBF\xBD");
    EXPECT_EQ(sanitize_utf8("\xED\xA0\x80"), "\xEF\xBF\xBD\xEF\xBF\xBD\xEF\xBF\xBD");
    EXPECT_EQ(sanitize_utf8("ok\xE4\xBD"), "ok\xEF\xBF\xBD\xEF\xBF\xBD");
}
