#pragma once

#include "Types.hpp"
#include "Config.hpp"
#include "MetricGeometry.hpp"
#include "math/Filters.hpp"
#include <array>
#include <map>

namespace posture {

using MetricReadings = std::map<MetricId, MetricReading>;

/**
 * MetricEngine: per-frame deviation of every enabled metric from the baseline.
 *
 * Pipeline per metric:
 *   raw (MetricGeometry) → outlier gate → (raw - reference) → rolling average → / scale
 *
 * A metric whose landmarks are missing, or that has no reference in the
 * baseline, is reported as unavailable and leaves its filters untouched.
 */
class MetricEngine {
public:
    explicit MetricEngine(float minVisibility = MIN_LANDMARK_VISIBILITY);

    /**
     * Apply metric enable flags and performance settings (smoothing window,
     * outlier gate). Filter history is cleared when the filter shape changes.
     */
    void configure(const MetricConfigs& metrics, const PerformanceConfig& performance);

    /**
     * @param baseline may be null (uncalibrated) → all readings unavailable
     */
    MetricReadings compute(const LandmarkFrame& frame, const CalibrationBaseline* baseline);

    /**
     * Drop all smoothing and outlier history (new baseline or new preset).
     */
    void reset();

    [[nodiscard]] const MetricGeometry& geometry() const { return geometry_; }

private:
    struct Channel {
        math::OutlierGate gate;
        math::MovingAverage smoother;
    };

    MetricGeometry geometry_;
    MetricConfigs metrics_{};
    PerformanceConfig performance_;
    std::array<Channel, kMetricCount> channels_;
    int uncalibratedFrames_ = 0;
};

} // namespace posture
