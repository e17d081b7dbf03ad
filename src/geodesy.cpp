#include "planfix/geodesy.hpp"

#include <algorithm>
#include <cmath>

namespace planfix {

double haversine_distance_m(double lat1, double lon1, double lat2, double lon2) {
    double phi1 = deg2rad(lat1);
    double phi2 = deg2rad(lat2);
    double dphi = deg2rad(lat2 - lat1);
    double dlambda = deg2rad(lon2 - lon1);

    double h = std::sin(dphi / 2) * std::sin(dphi / 2)
             + std::cos(phi1) * std::cos(phi2) * std::sin(dlambda / 2) * std::sin(dlambda / 2);
    // Rounding can push h just past 1 for antipodal points
    h = std::min(1.0, std::max(0.0, h));
    return 2 * EARTH_RADIUS_M * std::asin(std::sqrt(h));
}

} // namespace planfix
