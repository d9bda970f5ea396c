#include "match_segments.h"

#include <algorithm>
#include <string>
#include <unordered_set>
#include <utility>
#include <vector>

namespace {

// acc := distinct(acc ++ more), first appearance wins
void union_lines(std::vector<std::string>& acc, const std::vector<std::string>& more) {
    std::unordered_set<std::string> seen;
    seen.reserve(acc.size() + more.size());

    std::vector<std::string> dedup;
    dedup.reserve(acc.size() + more.size());
    for (const auto& s : acc) {
        if (seen.insert(s).second) dedup.push_back(s);
    }
    for (const auto& s : more) {
        if (seen.insert(s).second) dedup.push_back(s);
    }
    acc = std::move(dedup);
}

} // namespace

std::vector<Segment> expand_matches(
    const std::vector<MatchedShingle>& matched,
    const std::vector<std::string>& lines_a
) {
    std::size_t total = 0;
    for (const auto& m : matched) total += m.positions1.size() * m.positions2.size();

    std::vector<Segment> segs;
    segs.reserve(total);

    for (const auto& m : matched) {
        for (int p1 : m.positions1) {
            const auto first = lines_a.begin() + p1;
            const auto last  = lines_a.begin() + std::min<std::size_t>(lines_a.size(), (std::size_t)(p1 + SHINGLE_K));

            for (int p2 : m.positions2) {
                Segment s;
                s.file1_start = p1;
                s.file1_end   = p1 + SHINGLE_K - 1;
                s.file2_start = p2;
                s.file2_end   = p2 + SHINGLE_K - 1;
                s.lines.assign(first, last);
                segs.push_back(std::move(s));
            }
        }
    }
    return segs;
}

std::vector<Segment> merge_segments(std::vector<Segment> segs) {
    if (segs.size() <= 1) return segs;

    std::stable_sort(segs.begin(), segs.end(),
                     [](const Segment& a, const Segment& b) {
                         return a.file1_start < b.file1_start;
                     });

    std::vector<Segment> out;
    Segment cur = std::move(segs[0]);

    for (std::size_t i = 1; i < segs.size(); ++i) {
        Segment& nx = segs[i];

        if (nx.file1_start <= cur.file1_end + 1) {
            cur.file1_end   = std::max(cur.file1_end, nx.file1_end);
            cur.file2_start = std::min(cur.file2_start, nx.file2_start);
            cur.file2_end   = std::max(cur.file2_end, nx.file2_end);
            union_lines(cur.lines, nx.lines);
        } else {
            out.push_back(std::move(cur));
            cur = std::move(nx);
        }
    }
    out.push_back(std::move(cur));
    return out;
}

std::vector<Segment> build_segments(
    const std::vector<MatchedShingle>& matched,
    const std::vector<std::string>& lines_a
) {
    return merge_segments(expand_matches(matched, lines_a));
}
