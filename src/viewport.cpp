#include "planfix/viewport.hpp"
#include "planfix/geodesy.hpp"
#include "planfix/transform_engine.hpp"

#include <algorithm>
#include <cmath>

namespace planfix {

Result<double> zoom_for_visible_distance(double pixels_per_meter, double viewport_width_px,
                                         const ViewportOptions& options) {
    double required_display_px = options.visible_meters * pixels_per_meter * options.content_scale;
    if (!(required_display_px > 0.0) || !std::isfinite(required_display_px)) {
        return Result<double>::failure(Status::degenerate);
    }

    double zoom = viewport_width_px / required_display_px;
    if (!std::isfinite(zoom) || !(options.min_zoom <= options.max_zoom)) {
        return Result<double>::failure(Status::degenerate);
    }
    return std::clamp(zoom, options.min_zoom, options.max_zoom);
}

Result<double> zoom_for_visible_distance(const TransformEngine& engine, double viewport_width_px,
                                         const ViewportOptions& options) {
    auto ppm = engine.pixels_per_meter();
    if (!ppm) return Result<double>::failure(ppm.status());
    return zoom_for_visible_distance(*ppm, viewport_width_px, options);
}

double marker_heading_deg(double speed_mps, double gps_heading_deg, double compass_heading_deg) {
    return speed_mps > GPS_HEADING_MIN_SPEED_MPS ? gps_heading_deg : compass_heading_deg;
}

double marker_rotation(double north_angle_rad, double heading_deg) {
    return north_angle_rad + deg2rad(heading_deg) + M_PI / 2;
}

} // namespace planfix
