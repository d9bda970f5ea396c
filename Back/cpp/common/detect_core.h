// cpp/common/detect_core.h
#pragma once

#ifdef __cplusplus
extern "C" {
#endif

// Compares two source texts. Returns a malloc'ed JSON string:
//   {"ok":true,"similarity_score":..,"threshold":..,"matched_segments":[..]}
// or {"ok":false,"error":{"code":..,"message":..}}.
// threshold must lie in [0,1]; it is echoed, not applied.
// Release with pd_free().
char* pd_detect_json(const char* source_a_utf8, const char* source_b_utf8, double threshold);

void pd_free(void* p);

#ifdef __cplusplus
}
#endif
