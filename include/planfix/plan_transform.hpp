#pragma once

#include "planfix/result.hpp"
#include "planfix/types.hpp"

#include <array>

namespace planfix {

enum class TransformKind {
    affine,
    similarity
};

// Below this the three world points are treated as collinear.
constexpr double MIN_AFFINE_DETERMINANT = 1e-10;
// Below this two world points are treated as identical.
constexpr double MIN_POINT_DISTANCE_SQ = 1e-20;
// Below this the linear part cannot be inverted.
constexpr double MIN_LINEAR_DETERMINANT = 1e-20;

/**
 * World-to-plan mapping solved from a three-point calibration.
 *
 * World coordinates are planar with x = longitude and y = latitude, which
 * holds for areas small enough that Earth curvature is negligible.
 * Coefficients are stored as {a, b, tx, c, d, ty}:
 *
 *     pixel_x = a * lon + b * lat + tx
 *     pixel_y = c * lon + d * lat + ty
 *
 * A similarity fallback (used when the world points are collinear) lands in
 * the same layout with a = d and b = -c.
 */
class PlanTransform {
public:
    PlanTransform();

    static Result<PlanTransform> solve(const Calibration& calibration);

    PixelPoint latlon_to_pixel(double lat, double lon) const;
    Result<GeoPoint> pixel_to_latlon(double x, double y) const;

    // Pixel-space direction of increasing latitude, 0 = +x.
    double north_angle() const;

    TransformKind kind() const { return kind_; }
    const std::array<double, 6>& coefficients() const { return coeffs_; }

private:
    PlanTransform(TransformKind kind, const std::array<double, 6>& coeffs);

    static Result<PlanTransform> solve_similarity(const Calibration& calibration);

    TransformKind kind_;
    std::array<double, 6> coeffs_;
};

} // namespace planfix
