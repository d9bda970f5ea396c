#pragma once
#include <cstddef>
#include <vector>

#include <nlohmann/json.hpp>

#include "checker_config.h"
#include "corpus_loader.h"
#include "plagiarism_detector.h"

struct PairResult {
    std::size_t i = 0; // index into docs
    std::size_t j = 0; // i < j
    DetectResult result;
    DetectStats stats;
    bool flagged = false; // score >= threshold
};

// Every unordered pair once, i < j, on cfg.threads workers.
// Sorted by score descending; ties keep (i, j) order.
std::vector<PairResult> run_pairwise(const std::vector<SourceDoc>& docs, const CheckerConfig& cfg);

nlohmann::json build_report(
    const std::vector<SourceDoc>& docs,
    const std::vector<PairResult>& results,
    const CheckerConfig& cfg
);
