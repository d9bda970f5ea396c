// cpp/common/detect_core.cpp
#include "detect_core.h"

#include <cmath>
#include <cstdlib>
#include <cstring>
#include <exception>
#include <string>

#include <nlohmann/json.hpp>

#include "env_common.h"
#include "plagiarism_detector.h"
#include "result_json.h"

using json = nlohmann::json;

namespace {

constexpr std::size_t ERR_SNIP_MAX = 512;

static std::string safe_snip(std::string s) {
    if (s.size() > ERR_SNIP_MAX) s.resize(ERR_SNIP_MAX);
    return s;
}

static char* malloc_cstr(const std::string& s) {
    char* p = (char*)std::malloc(s.size() + 1);
    if (!p) return nullptr;
    std::memcpy(p, s.data(), s.size());
    p[s.size()] = '\0';
    return p;
}

static json make_error_json(const std::string& code, const std::string& msg) {
    json j;
    j["ok"] = false;
    j["error"] = {{"code", code}, {"message", msg}};
    return j;
}

} // namespace

extern "C" char* pd_detect_json(
    const char* source_a_utf8,
    const char* source_b_utf8,
    double threshold
) {
    try {
        if (!source_a_utf8 || !source_b_utf8)
            return malloc_cstr(make_error_json("bad_request", "null source").dump());
        if (!std::isfinite(threshold) || threshold < 0.0 || threshold > 1.0)
            return malloc_cstr(make_error_json("bad_request", "threshold must be in [0,1]").dump());

        const bool debug = env_bool01("PD_DEBUG", false);

        DetectStats st{};
        st.perf_stats = env_bool01("PD_PERF_STATS", false) ? 1 : 0;

        const DetectResult r = detect_plagiarism(
            std::string(source_a_utf8),
            std::string(source_b_utf8),
            threshold,
            debug ? &st : nullptr
        );

        json out;
        out["ok"] = true;
        out["similarity_score"] = r.similarity_score;
        out["threshold"] = threshold;
        out["matched_segments"] = segments_to_json(r.matched_segments);
        if (debug) out["stats"] = stats_to_json(st);

        // invalid UTF-8 in echoed lines is replaced, not thrown
        return malloc_cstr(out.dump(-1, ' ', false, json::error_handler_t::replace));
    } catch (const std::exception& ex) {
        return malloc_cstr(make_error_json("exception", safe_snip(ex.what())).dump(
            -1, ' ', false, json::error_handler_t::replace));
    } catch (...) {
        return malloc_cstr(make_error_json("exception", "unknown").dump());
    }
}

extern "C" void pd_free(void* p) {
    if (p) std::free(p);
}
