#pragma once
#include <cstddef>
#include <string>
#include <vector>

struct CheckerConfig {
    double threshold  = 0.70; // flag pairs with score >= threshold
    int    threads    = 1;
    int    debug      = 0;    // 0/1: per-pair stats in the report
    int    perf_stats = 0;    // 0/1: phase timings (us) in stats

    std::vector<std::string> extensions = {".cpp", ".h", ".hpp"};

    std::size_t max_segments = 0; // per pair in the report, 0 = all
};

// Keys as in CheckerConfig. Missing / unreadable / malformed file -> `base`.
CheckerConfig load_config_from_json(const std::string& path, CheckerConfig base = {});

// PD_THRESHOLD, PD_THREADS, PD_DEBUG, PD_PERF_STATS
void apply_env_overrides(CheckerConfig& cfg);

void clamp_config(CheckerConfig& cfg);

// defaults -> $PD_CONFIG file -> env -> clamp
CheckerConfig resolve_checker_config();

bool has_accepted_extension(const std::string& path, const std::vector<std::string>& exts);
