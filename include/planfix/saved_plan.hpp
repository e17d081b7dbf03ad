#pragma once

#include "planfix/types.hpp"

#include <string>
#include <vector>

namespace planfix {

struct SavedPlan {
    std::string id;
    std::string name;
    std::string file_path;
    Calibration calibration{};
    std::string last_opened;    // ISO-8601, e.g. 2025-03-14T09:26:53.589
};

// Field names match files written by earlier releases: gpsN_x is latitude,
// gpsN_y longitude, pdfN_x/pdfN_y the plan pixel.
std::string to_json(const SavedPlan& plan);
std::string to_json(const std::vector<SavedPlan>& plans);

// Throws std::runtime_error on malformed input. Missing point 3 reads as zeros.
SavedPlan saved_plan_from_json(const std::string& json);
std::vector<SavedPlan> saved_plans_from_json(const std::string& json);

} // namespace planfix
