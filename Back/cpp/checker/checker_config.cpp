#include "checker_config.h"

#include <cmath>
#include <cstdlib>
#include <fstream>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "env_common.h"

using json = nlohmann::json;

namespace {

constexpr int THREADS_HARD_MAX = 64;
constexpr std::size_t MAX_SEGMENTS_HARD_MAX = 1'000'000;

static inline double clamp01(double x) { return x < 0 ? 0 : (x > 1 ? 1 : x); }

} // namespace

CheckerConfig load_config_from_json(const std::string& path, CheckerConfig cfg) {
    std::ifstream in(path);
    if (!in) return cfg;

    json j;
    try { in >> j; } catch (const json::exception&) { return cfg; }
    if (!j.is_object()) return cfg;

    CheckerConfig out = cfg;
    try {
        if (j.contains("threshold"))    out.threshold    = j["threshold"].get<double>();
        if (j.contains("threads"))      out.threads      = j["threads"].get<int>();
        if (j.contains("debug"))        out.debug        = j["debug"].get<bool>() ? 1 : 0;
        if (j.contains("perf_stats"))   out.perf_stats   = j["perf_stats"].get<bool>() ? 1 : 0;
        if (j.contains("max_segments")) out.max_segments = j["max_segments"].get<std::size_t>();
        if (j.contains("extensions"))   out.extensions   = j["extensions"].get<std::vector<std::string>>();
    } catch (const json::exception&) {
        // wrong value types: keep the caller's config untouched
        return cfg;
    }
    return out;
}

void apply_env_overrides(CheckerConfig& cfg) {
    cfg.threshold  = env_double("PD_THRESHOLD", cfg.threshold);
    cfg.threads    = env_int("PD_THREADS", cfg.threads);
    cfg.debug      = env_bool01("PD_DEBUG", cfg.debug != 0) ? 1 : 0;
    cfg.perf_stats = env_bool01("PD_PERF_STATS", cfg.perf_stats != 0) ? 1 : 0;
}

void clamp_config(CheckerConfig& cfg) {
    if (!std::isfinite(cfg.threshold)) cfg.threshold = 0.70;
    cfg.threshold = clamp01(cfg.threshold);

    if (cfg.threads < 1) cfg.threads = 1;
    if (cfg.threads > THREADS_HARD_MAX) cfg.threads = THREADS_HARD_MAX;

    if (cfg.max_segments > MAX_SEGMENTS_HARD_MAX) cfg.max_segments = MAX_SEGMENTS_HARD_MAX;

    // perf timings live inside stats
    if (!cfg.debug) cfg.perf_stats = 0;
}

CheckerConfig resolve_checker_config() {
    CheckerConfig cfg;
    if (const char* p = std::getenv("PD_CONFIG"); p && *p) {
        cfg = load_config_from_json(p, cfg);
    }
    apply_env_overrides(cfg);
    clamp_config(cfg);
    return cfg;
}

bool has_accepted_extension(const std::string& path, const std::vector<std::string>& exts) {
    for (const auto& e : exts) {
        if (e.empty() || path.size() < e.size()) continue;
        if (path.compare(path.size() - e.size(), e.size(), e) == 0) return true;
    }
    return false;
}
