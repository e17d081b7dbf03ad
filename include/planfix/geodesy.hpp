#pragma once

#include <cmath>

namespace planfix {

constexpr double EARTH_RADIUS_M = 6371000.0;

// Great-circle distance on a spherical Earth.
double haversine_distance_m(double lat1, double lon1, double lat2, double lon2);

inline double deg2rad(double deg) { return deg * M_PI / 180.0; }
inline double rad2deg(double rad) { return rad * 180.0 / M_PI; }

} // namespace planfix
