#pragma once

#include <cctype>
#include <cmath>
#include <cstdlib>
#include <string>

// ───────────────────────────────────────────────────────────────
// Environment knobs: unset / empty / unparsable -> default
// ───────────────────────────────────────────────────────────────

inline int env_int(const char* name, int defv) {
    const char* v = std::getenv(name);
    if (!v || !*v) return defv;
    char* end = nullptr;
    long x = std::strtol(v, &end, 10);
    if (end == v) return defv;
    if (x < 0) x = 0;
    if (x > 1'000'000) x = 1'000'000;
    return (int)x;
}

inline double env_double(const char* name, double defv) {
    const char* v = std::getenv(name);
    if (!v || !*v) return defv;
    char* end = nullptr;
    double x = std::strtod(v, &end);
    if (end == v || !std::isfinite(x)) return defv;
    return x;
}

inline bool env_bool01(const char* name, bool defv) {
    const char* v = std::getenv(name);
    if (!v || !*v) return defv;
    if (v[0] == '1') return true;
    if (v[0] == '0') return false;
    std::string s(v);
    for (auto& c : s) c = (char)std::tolower((unsigned char)c);
    if (s == "true" || s == "yes" || s == "on") return true;
    if (s == "false" || s == "no" || s == "off") return false;
    return defv;
}
