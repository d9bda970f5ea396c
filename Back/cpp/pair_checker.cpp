// cpp/pair_checker.cpp
// Pairwise structural-similarity report over a set of source documents.
//
// Usage:
//   pair_checker <file.cpp|file.h|file.hpp>...
//   pair_checker <corpus.jsonl>
//
// Input JSONL:
//   {"doc_id":"a.cpp","text":"..."}
//
// Env: PD_CONFIG (json file), PD_THRESHOLD, PD_THREADS, PD_DEBUG, PD_PERF_STATS
// Output: one JSON report on stdout.

#include <exception>
#include <iostream>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "checker_config.h"
#include "corpus_loader.h"
#include "pair_runner.h"

namespace {

bool ends_with(const std::string& s, const std::string& suf) {
    return s.size() >= suf.size() &&
           s.compare(s.size() - suf.size(), suf.size(), suf) == 0;
}

} // namespace

int main(int argc, char** argv) {
    if (argc < 2) {
        std::cerr << "Usage: pair_checker <source_file>... | <corpus_jsonl>\n";
        return 1;
    }

    std::ios::sync_with_stdio(false);

    const CheckerConfig cfg = resolve_checker_config();

    std::vector<std::string> inputs(argv + 1, argv + argc);
    std::vector<SourceDoc> docs;
    std::string err;

    if (inputs.size() == 1 && ends_with(inputs[0], ".jsonl")) {
        int skipped = 0;
        if (!load_jsonl_corpus(inputs[0], docs, skipped, err)) {
            std::cerr << "[pair_checker] " << err << "\n";
            return 1;
        }
        if (skipped > 0) {
            std::cerr << "[pair_checker] skipped " << skipped << " malformed corpus lines\n";
        }
    } else {
        std::vector<std::string> rejected;
        if (!load_source_files(inputs, cfg.extensions, docs, rejected, err)) {
            std::cerr << "[pair_checker] " << err << "\n";
            return 1;
        }
        for (const auto& r : rejected) {
            std::cerr << "[pair_checker] unsupported file type, skipped: " << r << "\n";
        }
    }

    if (docs.size() < 2) {
        std::cerr << "[pair_checker] need at least two documents (got " << docs.size() << ")\n";
        return 1;
    }

    try {
        const auto results = run_pairwise(docs, cfg);
        const nlohmann::json report = build_report(docs, results, cfg);

        std::cout << report.dump(2, ' ', false, nlohmann::json::error_handler_t::replace) << "\n";

        std::cerr << "[pair_checker] compared docs=" << docs.size()
                  << " pairs=" << results.size()
                  << " flagged=" << report["flagged"].get<int>()
                  << " threshold=" << cfg.threshold
                  << " threads=" << cfg.threads << "\n";
        return 0;

    } catch (const std::exception& e) {
        std::cerr << "[pair_checker] ERROR: " << e.what() << "\n";
        return 1;
    }
}
