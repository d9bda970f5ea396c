// Unit tests for detector/shingle_index.h

#include <gtest/gtest.h>

#include <string>
#include <vector>

#include "code_normalizer.h"
#include "shingle_index.h"
#include "structure_fingerprint.h"

namespace {

using Lines = std::vector<std::string>;

TEST(ShingleIndexTest, FewerThanKLinesIsEmpty) {
    EXPECT_TRUE(build_shingle_index({}).empty());
    EXPECT_TRUE(build_shingle_index(Lines{"a;", "b;"}).empty());
}

TEST(ShingleIndexTest, ExactlyKLinesGivesOneWindow) {
    const Lines lines = {"int VAR_1;", "VAR_1 = 1;", "return VAR_1;"};
    const ShingleIndex idx = build_shingle_index(lines);

    ASSERT_EQ(idx.distinct(), 1u);
    const Digest d = idx.order[0];
    EXPECT_EQ(d, hash_fingerprint(structure_fingerprint(window_text(lines, 0))));

    const std::vector<int>* pos = idx.find(d);
    ASSERT_NE(pos, nullptr);
    EXPECT_EQ(*pos, (std::vector<int>{0}));
}

TEST(ShingleIndexTest, WindowTextJoinsWithNewline) {
    const Lines lines = {"a", "b", "c", "d"};
    EXPECT_EQ(window_text(lines, 0), "a\nb\nc");
    EXPECT_EQ(window_text(lines, 1), "b\nc\nd");
}

TEST(ShingleIndexTest, RepeatedWindowsShareOneDigest) {
    const Lines lines(5, "x;");
    const ShingleIndex idx = build_shingle_index(lines);

    ASSERT_EQ(idx.distinct(), 1u);
    EXPECT_EQ(*idx.find(idx.order[0]), (std::vector<int>{0, 1, 2}));
}

TEST(ShingleIndexTest, OneEntryPerWindowStart) {
    const Lines lines = {"a;", "if (x) {", "y = 1;", "}", "return y;"};
    const ShingleIndex idx = build_shingle_index(lines);

    std::size_t total = 0;
    for (Digest d : idx.order) total += idx.find(d)->size();
    EXPECT_EQ(total, lines.size() - SHINGLE_K + 1);
}

TEST(ShingleIndexTest, MissingDigestNotFound) {
    ShingleIndex idx;
    idx.add(42, 0);
    EXPECT_EQ(idx.find(7), nullptr);
    EXPECT_NE(idx.find(42), nullptr);
}

TEST(ShingleIndexTest, ConsistentRenamingKeepsDigestSequence) {
    const std::string original =
        "int total = 0;\n"
        "for (int i = 0; i < n; i++) {\n"
        "    total = total + values[i];\n"
        "}\n"
        "return total;\n";
    const std::string renamed =
        "int sum = 0;\n"
        "for (int k = 0; k < count; k++) {\n"
        "    sum = sum + arr[k];\n"
        "}\n"
        "return sum;\n";

    const ShingleIndex a = build_shingle_index(normalize_code(original));
    const ShingleIndex b = build_shingle_index(normalize_code(renamed));

    ASSERT_FALSE(a.empty());
    EXPECT_EQ(a.order, b.order);
    for (Digest d : a.order) {
        EXPECT_EQ(*a.find(d), *b.find(d));
    }
}

} // namespace
