#pragma once

#include <array>

namespace planfix {

struct GeoPoint {
    double lat;
    double lon;
};

// Native raster resolution of the plan, before any display scaling.
struct PixelPoint {
    double x;
    double y;
};

struct ControlPoint {
    GeoPoint geo;
    PixelPoint pixel;
};

using Calibration = std::array<ControlPoint, 3>;

} // namespace planfix
