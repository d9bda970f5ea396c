// Unit tests for common/text_common.h
// Tests: trimming, whitespace collapse, line splitting, digest arithmetic

#include <gtest/gtest.h>

#include <cstdint>
#include <limits>
#include <string>
#include <vector>

#include "text_common.h"

namespace {

// =============================================================================
// trim / collapse / split
// =============================================================================

TEST(TextCommonTest, TrimViewStripsAsciiWhitespace) {
    EXPECT_EQ(trim_view("  \t a b \r"), "a b");
    EXPECT_EQ(trim_view("\n\v\f"), "");
    EXPECT_EQ(trim_view("x"), "x");
}

TEST(TextCommonTest, TrimSpacesInPlace) {
    std::string s = "  int x;  ";
    trim_spaces(s);
    EXPECT_EQ(s, "int x;");

    std::string blank = " \t ";
    trim_spaces(blank);
    EXPECT_TRUE(blank.empty());
}

TEST(TextCommonTest, CollapseSpacesRuns) {
    EXPECT_EQ(collapse_spaces("a \t\t b"), "a b");
    EXPECT_EQ(collapse_spaces("a\t=\t\tb;"), "a = b;");
    EXPECT_EQ(collapse_spaces("ab"), "ab");
}

TEST(TextCommonTest, SplitLinesKeepsTrailingEmptyLine) {
    const std::vector<std::string> expect = {"a", "b", ""};
    EXPECT_EQ(split_lines("a\nb\n"), expect);
}

TEST(TextCommonTest, SplitLinesEmptyText) {
    const std::vector<std::string> expect = {""};
    EXPECT_EQ(split_lines(""), expect);
}

TEST(TextCommonTest, CharClasses) {
    EXPECT_TRUE(is_ident_start('_'));
    EXPECT_TRUE(is_ident_start('Z'));
    EXPECT_FALSE(is_ident_start('7'));
    EXPECT_TRUE(is_word_char('7'));
    EXPECT_FALSE(is_word_char('-'));
}

// =============================================================================
// digest
// =============================================================================

TEST(DigestTest, MultiplyAddBy31) {
    EXPECT_EQ(hash_fingerprint(""), 0);
    EXPECT_EQ(hash_fingerprint("a"), 97);
    EXPECT_EQ(hash_fingerprint("ab"), 97 * 31 + 98);
    EXPECT_EQ(hash_fingerprint("abc"), 96354);
}

TEST(DigestTest, WrapsAroundAt32Bits) {
    // classic h*31+c overflow case landing exactly on INT32_MIN
    EXPECT_EQ(hash_fingerprint("polygenelubricants"), std::numeric_limits<std::int32_t>::min());
}

TEST(DigestTest, AddsCodePointsNotBytes) {
    EXPECT_EQ(hash_fingerprint("\xC3\xA9"), 233);          // U+00E9
    EXPECT_EQ(format_digest(hash_fingerprint("\xC3\xA9")), "e9");
    EXPECT_EQ(hash_fingerprint("\xE2\x82\xAC"), 0x20AC);    // U+20AC
    EXPECT_EQ(hash_fingerprint("\xF0\x9F\x98\x80"), 0x1F600);
    EXPECT_EQ(hash_fingerprint("a\xC3\xA9"), 97 * 31 + 233);
}

TEST(DigestTest, InvalidUtf8CountsAsSpace) {
    EXPECT_EQ(hash_fingerprint("\xFF"), hash_fingerprint(" "));
    EXPECT_EQ(hash_fingerprint("\xC3"), hash_fingerprint(" "));           // truncated
    EXPECT_EQ(hash_fingerprint("\xC3(x"), hash_fingerprint(" (x"));        // bad continuation
}

TEST(DecodeUtf8Test, AdvancesBySequenceLength) {
    const std::string s = "a\xC3\xA9\xE2\x82\xAC";
    const unsigned char* d = (const unsigned char*)s.data();
    std::size_t i = 0;
    std::uint32_t cp = 0;

    ASSERT_TRUE(decode_utf8_cp(d, s.size(), i, cp));
    EXPECT_EQ(cp, 0x61u);
    EXPECT_EQ(i, 1u);
    ASSERT_TRUE(decode_utf8_cp(d, s.size(), i, cp));
    EXPECT_EQ(cp, 0xE9u);
    EXPECT_EQ(i, 3u);
    ASSERT_TRUE(decode_utf8_cp(d, s.size(), i, cp));
    EXPECT_EQ(cp, 0x20ACu);
    EXPECT_EQ(i, 6u);
    EXPECT_FALSE(decode_utf8_cp(d, s.size(), i, cp));
}

TEST(DigestTest, Deterministic) {
    const std::string fp = "IF_STMT {\nFUNC_CALL;\n}";
    EXPECT_EQ(hash_fingerprint(fp), hash_fingerprint(fp));
    EXPECT_NE(hash_fingerprint(fp), hash_fingerprint(fp + " "));
}

TEST(DigestTest, FormatSignedHex) {
    EXPECT_EQ(format_digest(0), "0");
    EXPECT_EQ(format_digest(255), "ff");
    EXPECT_EQ(format_digest(-31), "-1f");
    EXPECT_EQ(format_digest(std::numeric_limits<std::int32_t>::max()), "7fffffff");
    EXPECT_EQ(format_digest(std::numeric_limits<std::int32_t>::min()), "-80000000");
}

} // namespace
