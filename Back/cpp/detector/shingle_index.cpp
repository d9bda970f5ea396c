#include "shingle_index.h"

#include <string>
#include <vector>

#include "structure_fingerprint.h"

const std::vector<int>* ShingleIndex::find(Digest d) const {
    auto it = positions.find(d);
    return it == positions.end() ? nullptr : &it->second;
}

void ShingleIndex::add(Digest d, int start) {
    auto [it, inserted] = positions.try_emplace(d);
    if (inserted) order.push_back(d);
    it->second.push_back(start);
}

std::string window_text(const std::vector<std::string>& lines, int start) {
    std::size_t total = SHINGLE_K;
    for (int j = 0; j < SHINGLE_K; ++j) total += lines[(std::size_t)(start + j)].size();

    std::string buf;
    buf.reserve(total);
    for (int j = 0; j < SHINGLE_K; ++j) {
        if (j) buf.push_back('\n');
        buf += lines[(std::size_t)(start + j)];
    }
    return buf;
}

ShingleIndex build_shingle_index(const std::vector<std::string>& lines) {
    ShingleIndex idx;
    const int n = (int)lines.size();
    if (n < SHINGLE_K) return idx;

    const int cnt = n - SHINGLE_K + 1;
    idx.positions.reserve((std::size_t)cnt);
    idx.order.reserve((std::size_t)cnt);

    for (int i = 0; i < cnt; ++i) {
        idx.add(hash_fingerprint(structure_fingerprint(window_text(lines, i))), i);
    }
    return idx;
}
