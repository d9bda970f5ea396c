#pragma once
#include <string>
#include <vector>

#include "similarity.h"

// Line ranges (inclusive) into the *normalized* line sequences.
struct Segment {
    int file1_start = 0;
    int file1_end   = 0;
    int file2_start = 0;
    int file2_end   = 0;
    std::vector<std::string> lines; // normalized lines of document A
};

// One raw segment per (p1, p2) in positions1 x positions2 of every match.
std::vector<Segment> expand_matches(
    const std::vector<MatchedShingle>& matched,
    const std::vector<std::string>& lines_a
);

// Stable-sorts by file1_start and greedily merges segments that overlap or
// touch in document A. Document B bounds only widen (min start, max end), so
// they may cover lines that are not contiguous matches in B. Merged `lines`
// is a deduplicated union in first-appearance order, not source order.
std::vector<Segment> merge_segments(std::vector<Segment> segs);

std::vector<Segment> build_segments(
    const std::vector<MatchedShingle>& matched,
    const std::vector<std::string>& lines_a
);
