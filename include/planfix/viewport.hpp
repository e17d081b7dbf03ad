#pragma once

#include "planfix/result.hpp"

namespace planfix {

class TransformEngine;

struct ViewportOptions {
    double visible_meters = 200.0;
    double content_scale = 2.0;     // display pixels per plan pixel at zoom 1
    double min_zoom = 0.1;
    double max_zoom = 20.0;
};

// Above this speed the GPS course is trusted over the compass.
constexpr double GPS_HEADING_MIN_SPEED_MPS = 1.0;

Result<double> zoom_for_visible_distance(double pixels_per_meter, double viewport_width_px,
                                         const ViewportOptions& options = {});
Result<double> zoom_for_visible_distance(const TransformEngine& engine, double viewport_width_px,
                                         const ViewportOptions& options = {});

double marker_heading_deg(double speed_mps, double gps_heading_deg, double compass_heading_deg);

// Rotation for an arrow icon drawn pointing towards -y.
double marker_rotation(double north_angle_rad, double heading_deg);

} // namespace planfix
