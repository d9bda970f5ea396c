#include "pair_runner.h"

#include <algorithm>
#include <atomic>
#include <cstddef>
#include <iostream>
#include <system_error>
#include <thread>
#include <utility>
#include <vector>

#include "result_json.h"

using json = nlohmann::json;

std::vector<PairResult> run_pairwise(const std::vector<SourceDoc>& docs, const CheckerConfig& cfg) {
    const std::size_t n = docs.size();

    std::vector<PairResult> results;
    if (n < 2) return results;

    results.resize(n * (n - 1) / 2);
    {
        std::size_t p = 0;
        for (std::size_t i = 0; i < n; ++i) {
            for (std::size_t j = i + 1; j < n; ++j) {
                results[p].i = i;
                results[p].j = j;
                ++p;
            }
        }
    }

    // each slot is written by exactly one worker; no shared mutable state
    std::atomic<std::size_t> next{0};
    auto work = [&]() {
        for (;;) {
            const std::size_t p = next.fetch_add(1, std::memory_order_relaxed);
            if (p >= results.size()) return;

            PairResult& r = results[p];
            r.stats.perf_stats = cfg.perf_stats;
            r.result = detect_plagiarism(
                docs[r.i].text, docs[r.j].text, cfg.threshold,
                cfg.debug ? &r.stats : nullptr
            );
            r.flagged = r.result.similarity_score >= cfg.threshold;
        }
    };

    const unsigned n_workers = (unsigned)std::min<std::size_t>(
        (std::size_t)std::max(cfg.threads, 1), results.size());

    if (n_workers <= 1) {
        work();
    } else {
        std::vector<std::thread> workers;
        workers.reserve(n_workers);
        try {
            for (unsigned t = 0; t < n_workers; ++t) workers.emplace_back(work);
        } catch (const std::system_error& ex) {
            // started workers stay joinable; the calling thread drains the rest
            std::cerr << "[pair_runner] started " << workers.size() << "/" << n_workers
                      << " workers: " << ex.what() << "\n";
            work();
        }
        for (auto& th : workers) th.join();
    }

    std::stable_sort(results.begin(), results.end(),
                     [](const PairResult& a, const PairResult& b) {
                         return a.result.similarity_score > b.result.similarity_score;
                     });
    return results;
}

json build_report(
    const std::vector<SourceDoc>& docs,
    const std::vector<PairResult>& results,
    const CheckerConfig& cfg
) {
    int flagged = 0;

    json arr = json::array();
    for (const auto& r : results) {
        if (r.flagged) ++flagged;

        json item = {
            {"doc1", docs[r.i].doc_id},
            {"doc2", docs[r.j].doc_id},
            {"similarity_score", r.result.similarity_score},
            {"flagged", r.flagged},
            {"segments", segments_to_json(r.result.matched_segments, cfg.max_segments)}
        };
        if (cfg.debug) item["stats"] = stats_to_json(r.stats);
        arr.push_back(std::move(item));
    }

    json out;
    out["ok"] = true;
    out["threshold"] = cfg.threshold;
    out["documents"] = (int)docs.size();
    out["pairs"] = (int)results.size();
    out["flagged"] = flagged;
    out["results"] = std::move(arr);
    return out;
}
