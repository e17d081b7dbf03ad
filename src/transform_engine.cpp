#include "planfix/transform_engine.hpp"
#include "planfix/geodesy.hpp"

#include <spdlog/spdlog.h>

#include <cmath>
#include <utility>
#include <vector>

namespace planfix {

bool TransformEngine::is_calibrated() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return calibrated_;
}

void TransformEngine::set_calibration(const Calibration& calibration) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        points_ = calibration;
        calibrated_ = true;
        version_++;
    }

    spdlog::debug("[TransformEngine] Calibration set: ({:.7f},{:.7f})->({:.1f},{:.1f}) "
                  "({:.7f},{:.7f})->({:.1f},{:.1f}) ({:.7f},{:.7f})->({:.1f},{:.1f})",
                  calibration[0].geo.lat, calibration[0].geo.lon, calibration[0].pixel.x, calibration[0].pixel.y,
                  calibration[1].geo.lat, calibration[1].geo.lon, calibration[1].pixel.x, calibration[1].pixel.y,
                  calibration[2].geo.lat, calibration[2].geo.lon, calibration[2].pixel.x, calibration[2].pixel.y);
    if (!PlanTransform::solve(calibration)) {
        spdlog::warn("[TransformEngine] Calibration points are coincident, positions cannot be mapped");
    }

    notify_listeners();
}

void TransformEngine::set_calibration(const ControlPoint& p1, const ControlPoint& p2, const ControlPoint& p3) {
    set_calibration(Calibration{p1, p2, p3});
}

void TransformEngine::clear_calibration() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!calibrated_) return;
        points_ = Calibration{};
        calibrated_ = false;
        version_++;
    }

    spdlog::debug("[TransformEngine] Calibration cleared");
    notify_listeners();
}

Result<Calibration> TransformEngine::calibration() const {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!calibrated_) return Result<Calibration>::failure(Status::not_calibrated);
    return points_;
}

Result<PlanTransform> TransformEngine::transform() const {
    auto points = calibration();
    if (!points) return Result<PlanTransform>::failure(points.status());
    return PlanTransform::solve(*points);
}

Result<PixelPoint> TransformEngine::world_to_pixel(double lat, double lon) const {
    auto t = transform();
    if (!t) return Result<PixelPoint>::failure(t.status());
    return t->latlon_to_pixel(lat, lon);
}

double TransformEngine::north_angle() const {
    auto t = transform();
    return t ? t->north_angle() : 0.0;
}

Result<double> TransformEngine::pixels_per_meter() const {
    auto points = calibration();
    if (!points) return Result<double>::failure(points.status());

    const ControlPoint& p1 = (*points)[0];
    const ControlPoint& p2 = (*points)[1];

    double distance_m = haversine_distance_m(p1.geo.lat, p1.geo.lon, p2.geo.lat, p2.geo.lon);
    if (distance_m == 0.0) return Result<double>::failure(Status::degenerate);

    double dx = p2.pixel.x - p1.pixel.x;
    double dy = p2.pixel.y - p1.pixel.y;
    double distance_px = std::sqrt(dx * dx + dy * dy);
    if (distance_px == 0.0) return Result<double>::failure(Status::degenerate);

    return distance_px / distance_m;
}

uint64_t TransformEngine::version() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return version_;
}

TransformEngine::ListenerId TransformEngine::add_listener(Listener listener) {
    std::lock_guard<std::mutex> lock(mutex_);
    ListenerId id = next_listener_id_++;
    listeners_.emplace(id, std::move(listener));
    return id;
}

bool TransformEngine::remove_listener(ListenerId id) {
    std::lock_guard<std::mutex> lock(mutex_);
    return listeners_.erase(id) > 0;
}

void TransformEngine::notify_listeners() {
    std::vector<Listener> snapshot;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        snapshot.reserve(listeners_.size());
        for (const auto& entry : listeners_) {
            snapshot.push_back(entry.second);
        }
    }

    // Listeners may call back into the engine, so run them unlocked
    for (const auto& listener : snapshot) {
        listener(*this);
    }
}

} // namespace planfix
