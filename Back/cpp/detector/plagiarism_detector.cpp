#include "plagiarism_detector.h"

#include <chrono>
#include <cstdint>
#include <string>
#include <utility>
#include <vector>

#include "code_normalizer.h"
#include "shingle_index.h"
#include "similarity.h"

namespace {

static inline std::uint64_t now_us() {
    using namespace std::chrono;
    return (std::uint64_t)duration_cast<microseconds>(steady_clock::now().time_since_epoch()).count();
}

static inline int windows_of(const std::vector<std::string>& lines) {
    const int n = (int)lines.size();
    return n < SHINGLE_K ? 0 : n - SHINGLE_K + 1;
}

} // namespace

DetectResult detect_plagiarism(
    const std::string& source_a,
    const std::string& source_b,
    double /*threshold*/,
    DetectStats* stats
) {
    const bool perf = stats && stats->perf_stats;
    std::uint64_t t0 = perf ? now_us() : 0;

    // separate passes: identifier tables never leak between documents
    const std::vector<std::string> lines_a = normalize_code(source_a);
    const std::vector<std::string> lines_b = normalize_code(source_b);

    std::uint64_t t1 = perf ? now_us() : 0;

    const ShingleIndex idx_a = build_shingle_index(lines_a);
    const ShingleIndex idx_b = build_shingle_index(lines_b);

    std::uint64_t t2 = perf ? now_us() : 0;

    SimilarityOutcome sim = jaccard_shingles(idx_a, idx_b);

    std::uint64_t t3 = perf ? now_us() : 0;

    std::vector<Segment> raw = expand_matches(sim.matched, lines_a);
    const int raw_count = (int)raw.size();

    DetectResult res;
    res.similarity_score = sim.similarity;
    res.matched_segments = merge_segments(std::move(raw));

    if (stats) {
        stats->lines_a = (int)lines_a.size();
        stats->lines_b = (int)lines_b.size();
        stats->windows_a = windows_of(lines_a);
        stats->windows_b = windows_of(lines_b);
        stats->shingles_a = (int)idx_a.distinct();
        stats->shingles_b = (int)idx_b.distinct();
        stats->intersection = sim.intersection;
        stats->union_size = sim.union_size;
        stats->raw_segments = raw_count;
        stats->merged_segments = (int)res.matched_segments.size();

        stats->matched_digests.clear();
        stats->matched_digests.reserve(sim.matched.size());
        for (const auto& m : sim.matched) stats->matched_digests.push_back(m.digest);

        if (perf) {
            const std::uint64_t t4 = now_us();
            stats->t_norm_us     = t1 - t0;
            stats->t_index_us    = t2 - t1;
            stats->t_score_us    = t3 - t2;
            stats->t_segments_us = t4 - t3;
        }
    }
    return res;
}
