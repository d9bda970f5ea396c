#pragma once
#include <vector>

#include "shingle_index.h"

struct MatchedShingle {
    Digest digest;
    std::vector<int> positions1; // window starts in document A
    std::vector<int> positions2; // window starts in document B
};

struct SimilarityOutcome {
    double similarity = 0.0;
    int    intersection = 0; // distinct digests present in both
    int    union_size   = 0; // distinct digests present in either
    std::vector<MatchedShingle> matched; // in document A first-seen order
};

// Jaccard over the sets of distinct digests; 0 when the union is empty.
SimilarityOutcome jaccard_shingles(const ShingleIndex& a, const ShingleIndex& b);
