// Unit tests for detector/similarity.h

#include <gtest/gtest.h>

#include <utility>
#include <vector>

#include "similarity.h"

namespace {

ShingleIndex make_index(const std::vector<std::pair<Digest, int>>& entries) {
    ShingleIndex idx;
    for (const auto& [d, pos] : entries) idx.add(d, pos);
    return idx;
}

TEST(JaccardShinglesTest, EmptyUnionScoresZero) {
    const SimilarityOutcome r = jaccard_shingles(ShingleIndex{}, ShingleIndex{});
    EXPECT_EQ(r.similarity, 0.0);
    EXPECT_EQ(r.union_size, 0);
    EXPECT_TRUE(r.matched.empty());
}

TEST(JaccardShinglesTest, OneSideEmptyScoresZero) {
    const ShingleIndex a = make_index({{1, 0}, {2, 1}});
    const SimilarityOutcome r = jaccard_shingles(a, ShingleIndex{});
    EXPECT_EQ(r.similarity, 0.0);
    EXPECT_EQ(r.union_size, 2);
}

TEST(JaccardShinglesTest, PartialOverlap) {
    const ShingleIndex a = make_index({{1, 0}, {2, 1}, {3, 2}});
    const ShingleIndex b = make_index({{2, 0}, {3, 1}, {4, 2}, {2, 4}});

    const SimilarityOutcome r = jaccard_shingles(a, b);
    EXPECT_EQ(r.intersection, 2);
    EXPECT_EQ(r.union_size, 4);
    EXPECT_DOUBLE_EQ(r.similarity, 0.5);

    ASSERT_EQ(r.matched.size(), 2u);
    EXPECT_EQ(r.matched[0].digest, 2);
    EXPECT_EQ(r.matched[0].positions1, (std::vector<int>{1}));
    EXPECT_EQ(r.matched[0].positions2, (std::vector<int>{0, 4}));
    EXPECT_EQ(r.matched[1].digest, 3);
}

TEST(JaccardShinglesTest, InternalRepeatsCountOnce) {
    const ShingleIndex a = make_index({{7, 0}, {7, 1}, {7, 2}});
    const ShingleIndex b = make_index({{7, 0}});

    const SimilarityOutcome r = jaccard_shingles(a, b);
    EXPECT_EQ(r.intersection, 1);
    EXPECT_EQ(r.union_size, 1);
    EXPECT_DOUBLE_EQ(r.similarity, 1.0);
    EXPECT_EQ(r.matched[0].positions1, (std::vector<int>{0, 1, 2}));
}

TEST(JaccardShinglesTest, Symmetric) {
    const ShingleIndex a = make_index({{1, 0}, {2, 1}, {5, 2}});
    const ShingleIndex b = make_index({{2, 0}, {9, 1}});

    EXPECT_DOUBLE_EQ(jaccard_shingles(a, b).similarity, jaccard_shingles(b, a).similarity);
}

TEST(JaccardShinglesTest, DisjointScoresZero) {
    const ShingleIndex a = make_index({{1, 0}});
    const ShingleIndex b = make_index({{2, 0}});
    const SimilarityOutcome r = jaccard_shingles(a, b);
    EXPECT_EQ(r.similarity, 0.0);
    EXPECT_EQ(r.union_size, 2);
}

} // namespace
