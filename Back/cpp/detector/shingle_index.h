#pragma once
#include <cstdint>
#include <string>
#include <unordered_map>
#include <vector>

#include "text_common.h"

// lines per shingle window
constexpr int SHINGLE_K = 3;

// Digest -> window start indices (ascending) for one document.
// `order` keeps digests in first-seen order so iteration is deterministic.
struct ShingleIndex {
    std::unordered_map<Digest, std::vector<int>> positions;
    std::vector<Digest> order;

    bool empty() const { return order.empty(); }
    std::size_t distinct() const { return order.size(); }
    const std::vector<int>* find(Digest d) const;
    void add(Digest d, int start);
};

// Lines [start, start + SHINGLE_K) joined with '\n'.
std::string window_text(const std::vector<std::string>& lines, int start);

// Empty when lines.size() < SHINGLE_K.
ShingleIndex build_shingle_index(const std::vector<std::string>& lines);
