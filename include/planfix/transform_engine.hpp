#pragma once

#include "planfix/plan_transform.hpp"
#include "planfix/result.hpp"
#include "planfix/types.hpp"

#include <cstddef>
#include <cstdint>
#include <functional>
#include <map>
#include <mutex>

namespace planfix {

/**
 * Calibration state for one loaded plan and the queries derived from it.
 *
 * Holds either nothing or exactly three control points. The transform is
 * re-solved on every query, so it always reflects the latest calibration.
 * All members are safe to call from several threads. Listeners run on the
 * mutating thread once the change is committed and the lock is released.
 *
 * Owners must call clear_calibration() when a different plan is loaded.
 */
class TransformEngine {
public:
    using Listener = std::function<void(const TransformEngine&)>;
    using ListenerId = std::size_t;

    TransformEngine() = default;

    TransformEngine(const TransformEngine&) = delete;
    TransformEngine& operator=(const TransformEngine&) = delete;

    bool is_calibrated() const;

    void set_calibration(const Calibration& calibration);
    void set_calibration(const ControlPoint& p1, const ControlPoint& p2, const ControlPoint& p3);
    void clear_calibration();

    Result<Calibration> calibration() const;
    Result<PlanTransform> transform() const;

    Result<PixelPoint> world_to_pixel(double lat, double lon) const;
    // 0.0 when uncalibrated or degenerate; check is_calibrated() to tell apart.
    double north_angle() const;
    // Uses control points 1 and 2 only.
    Result<double> pixels_per_meter() const;

    // Bumped on every committed change.
    uint64_t version() const;

    ListenerId add_listener(Listener listener);
    bool remove_listener(ListenerId id);

private:
    void notify_listeners();

    Calibration points_{};
    bool calibrated_ = false;
    uint64_t version_ = 0;

    std::map<ListenerId, Listener> listeners_;
    ListenerId next_listener_id_ = 1;
    mutable std::mutex mutex_;
};

} // namespace planfix
