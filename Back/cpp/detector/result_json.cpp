#include "result_json.h"

#include <utility>

#include "text_common.h"

using json = nlohmann::json;

json segment_to_json(const Segment& s) {
    return {
        {"file1_start", s.file1_start},
        {"file1_end", s.file1_end},
        {"file2_start", s.file2_start},
        {"file2_end", s.file2_end},
        {"lines", s.lines}
    };
}

json segments_to_json(const std::vector<Segment>& segs, std::size_t max_segments) {
    std::size_t n = segs.size();
    if (max_segments > 0 && max_segments < n) n = max_segments;

    json arr = json::array();
    for (std::size_t i = 0; i < n; ++i) arr.push_back(segment_to_json(segs[i]));
    return arr;
}

json stats_to_json(const DetectStats& st) {
    json j = {
        {"lines_a", st.lines_a},
        {"lines_b", st.lines_b},
        {"windows_a", st.windows_a},
        {"windows_b", st.windows_b},
        {"shingles_a", st.shingles_a},
        {"shingles_b", st.shingles_b},
        {"intersection", st.intersection},
        {"union_size", st.union_size},
        {"raw_segments", st.raw_segments},
        {"merged_segments", st.merged_segments}
    };

    json digests = json::array();
    for (Digest d : st.matched_digests) digests.push_back(format_digest(d));
    j["matched_digests"] = std::move(digests);

    if (st.perf_stats) {
        j["t_norm_us"]     = st.t_norm_us;
        j["t_index_us"]    = st.t_index_us;
        j["t_score_us"]    = st.t_score_us;
        j["t_segments_us"] = st.t_segments_us;
    }
    return j;
}
