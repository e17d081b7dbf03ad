#include "planfix/plan_transform.hpp"

#include <spdlog/spdlog.h>

#include <cmath>
#include <utility>

namespace planfix {

PlanTransform::PlanTransform()
    : kind_(TransformKind::affine)
    , coeffs_{1.0, 0.0, 0.0, 0.0, 1.0, 0.0} {}

PlanTransform::PlanTransform(TransformKind kind, const std::array<double, 6>& coeffs)
    : kind_(kind)
    , coeffs_(coeffs) {}

Result<PlanTransform> PlanTransform::solve(const Calibration& calibration) {
    double x1 = calibration[0].geo.lon, y1 = calibration[0].geo.lat;
    double x2 = calibration[1].geo.lon, y2 = calibration[1].geo.lat;
    double x3 = calibration[2].geo.lon, y3 = calibration[2].geo.lat;

    double u1 = calibration[0].pixel.x, v1 = calibration[0].pixel.y;
    double u2 = calibration[1].pixel.x, v2 = calibration[1].pixel.y;
    double u3 = calibration[2].pixel.x, v3 = calibration[2].pixel.y;

    double det = x1 * (y2 - y3) - y1 * (x2 - x3) + (x2 * y3 - x3 * y2);
    if (std::abs(det) < MIN_AFFINE_DETERMINANT) {
        spdlog::debug("[PlanTransform] Collinear world points (det={:.3e}), using similarity fit", det);
        return solve_similarity(calibration);
    }

    // Cramer's rule on [x y 1] * [a c; b d; tx ty] = [u v]
    double a  = (u1 * (y2 - y3) + u2 * (y3 - y1) + u3 * (y1 - y2)) / det;
    double b  = (u1 * (x3 - x2) + u2 * (x1 - x3) + u3 * (x2 - x1)) / det;
    double tx = (u1 * (x2 * y3 - x3 * y2) + u2 * (x3 * y1 - x1 * y3) + u3 * (x1 * y2 - x2 * y1)) / det;

    double c  = (v1 * (y2 - y3) + v2 * (y3 - y1) + v3 * (y1 - y2)) / det;
    double d  = (v1 * (x3 - x2) + v2 * (x1 - x3) + v3 * (x2 - x1)) / det;
    double ty = (v1 * (x2 * y3 - x3 * y2) + v2 * (x3 * y1 - x1 * y3) + v3 * (x1 * y2 - x2 * y1)) / det;

    return PlanTransform(TransformKind::affine, {a, b, tx, c, d, ty});
}

Result<PlanTransform> PlanTransform::solve_similarity(const Calibration& calibration) {
    static constexpr std::pair<int, int> PAIRS[] = {{0, 1}, {0, 2}, {1, 2}};

    int best_i = 0;
    int best_j = 1;
    double best_dist_sq = -1.0;
    for (const auto& [i, j] : PAIRS) {
        double dx = calibration[j].geo.lon - calibration[i].geo.lon;
        double dy = calibration[j].geo.lat - calibration[i].geo.lat;
        double dist_sq = dx * dx + dy * dy;
        if (dist_sq > best_dist_sq) {
            best_dist_sq = dist_sq;
            best_i = i;
            best_j = j;
        }
    }

    if (best_dist_sq < MIN_POINT_DISTANCE_SQ) {
        spdlog::debug("[PlanTransform] Calibration points are coincident, no transform available");
        return Result<PlanTransform>::failure(Status::degenerate);
    }

    const ControlPoint& pa = calibration[best_i];
    const ControlPoint& pb = calibration[best_j];
    double xa = pa.geo.lon, ya = pa.geo.lat;
    double dx = pb.geo.lon - xa;
    double dy = pb.geo.lat - ya;
    double du = pb.pixel.x - pa.pixel.x;
    double dv = pb.pixel.y - pa.pixel.y;

    // (A, B) is the complex scale-rotation factor taking (dx, dy) to (du, dv)
    double A = (du * dx + dv * dy) / best_dist_sq;
    double B = (dv * dx - du * dy) / best_dist_sq;
    double tx = pa.pixel.x - (A * xa - B * ya);
    double ty = pa.pixel.y - (B * xa + A * ya);

    return PlanTransform(TransformKind::similarity, {A, -B, tx, B, A, ty});
}

PixelPoint PlanTransform::latlon_to_pixel(double lat, double lon) const {
    const auto& [a, b, tx, c, d, ty] = coeffs_;
    return {a * lon + b * lat + tx, c * lon + d * lat + ty};
}

Result<GeoPoint> PlanTransform::pixel_to_latlon(double x, double y) const {
    const auto& [a, b, tx, c, d, ty] = coeffs_;
    double det = a * d - b * c;
    if (std::abs(det) < MIN_LINEAR_DETERMINANT) {
        return Result<GeoPoint>::failure(Status::degenerate);
    }

    double px = x - tx;
    double py = y - ty;
    double lon = (d * px - b * py) / det;
    double lat = (a * py - c * px) / det;
    return GeoPoint{lat, lon};
}

double PlanTransform::north_angle() const {
    // Column of the latitude term: pixel delta per degree north
    return std::atan2(coeffs_[4], coeffs_[1]);
}

} // namespace planfix
