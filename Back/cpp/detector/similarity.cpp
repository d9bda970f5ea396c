#include "similarity.h"

SimilarityOutcome jaccard_shingles(const ShingleIndex& a, const ShingleIndex& b) {
    SimilarityOutcome r;

    for (Digest d : a.order) {
        const std::vector<int>* pb = b.find(d);
        if (!pb) continue;

        ++r.intersection;
        r.matched.push_back(MatchedShingle{d, *a.find(d), *pb});
    }

    // |A ∪ B| = |A| + |B| - |A ∩ B|
    r.union_size = (int)a.distinct() + (int)b.distinct() - r.intersection;
    r.similarity = (r.union_size > 0)
        ? (double)r.intersection / (double)r.union_size
        : 0.0;
    return r;
}
