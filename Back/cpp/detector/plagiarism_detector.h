#pragma once
#include <cstdint>
#include <string>
#include <vector>

#include "match_segments.h"

struct DetectResult {
    double similarity_score = 0.0;         // [0, 1]
    std::vector<Segment> matched_segments; // ascending file1_start
};

struct DetectStats {
    int lines_a = 0;
    int lines_b = 0;

    int windows_a = 0;
    int windows_b = 0;

    int shingles_a = 0; // distinct digests
    int shingles_b = 0;

    int intersection = 0;
    int union_size   = 0;

    int raw_segments    = 0;
    int merged_segments = 0;

    std::vector<Digest> matched_digests; // document A first-seen order

    // optional perf timings (us), filled when perf_stats != 0
    int perf_stats = 0;
    std::uint64_t t_norm_us     = 0;
    std::uint64_t t_index_us    = 0;
    std::uint64_t t_score_us    = 0;
    std::uint64_t t_segments_us = 0;
};

// Compares one pair of documents. `threshold` is accepted for the caller's
// display-side flagging (score >= threshold) and is not applied here.
// Segment indices refer to normalized lines, not raw lines.
DetectResult detect_plagiarism(
    const std::string& source_a,
    const std::string& source_b,
    double threshold,
    DetectStats* stats = nullptr
);
