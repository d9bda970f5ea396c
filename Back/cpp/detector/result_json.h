#pragma once
#include <cstddef>

#include <nlohmann/json.hpp>

#include "plagiarism_detector.h"

nlohmann::json segment_to_json(const Segment& s);

// max_segments == 0 -> all
nlohmann::json segments_to_json(const std::vector<Segment>& segs, std::size_t max_segments = 0);

nlohmann::json stats_to_json(const DetectStats& st);
