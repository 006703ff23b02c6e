#pragma once

#include "Types.hpp"
#include <optional>

namespace posture {

/**
 * Landmark relationships behind each posture metric.
 *
 * All distance-based metrics are divided by the current shoulder width so the
 * raw value does not depend on how far the user sits from the camera. Every
 * metric is oriented so that a positive deviation from the baseline means a
 * worse posture (for Magnitude metrics the sign carries the side).
 */
class MetricGeometry {
public:
    explicit MetricGeometry(float minVisibility = MIN_LANDMARK_VISIBILITY)
        : minVisibility_(minVisibility) {}

    /**
     * Raw metric value for this frame.
     * @return std::nullopt when a required landmark is missing or low-confidence
     */
    [[nodiscard]] std::optional<double> compute(MetricId metric, const LandmarkFrame& frame) const;

    /**
     * True if compute() would succeed for every metric.
     */
    [[nodiscard]] bool hasAllMetrics(const LandmarkFrame& frame) const;

    /**
     * Normalization scale turning a deviation into a severity.
     * Ratio metrics use 1.0; head tilt is measured in degrees.
     */
    [[nodiscard]] static double scale(MetricId metric);

    /**
     * True for metrics read from the estimated landmark depth.
     */
    [[nodiscard]] static bool usesDepth(MetricId metric) {
        return metric == MetricId::ForwardNeck || metric == MetricId::RoundedShoulders;
    }

    [[nodiscard]] float minVisibility() const { return minVisibility_; }

private:
    float minVisibility_;

    struct Point {
        double x, y, z;
    };

    [[nodiscard]] bool visible(const LandmarkFrame& frame, LandmarkId id) const {
        return frame.isVisible(id, minVisibility_);
    }

    [[nodiscard]] static Point midpoint(const Landmark& a, const Landmark& b);
    [[nodiscard]] std::optional<double> shoulderWidth(const LandmarkFrame& frame) const;

    [[nodiscard]] std::optional<double> slouch(const LandmarkFrame& frame) const;
    [[nodiscard]] std::optional<double> unevenShoulders(const LandmarkFrame& frame) const;
    [[nodiscard]] std::optional<double> headTilt(const LandmarkFrame& frame) const;
    [[nodiscard]] std::optional<double> forwardNeck(const LandmarkFrame& frame) const;
    [[nodiscard]] std::optional<double> roundedShoulders(const LandmarkFrame& frame) const;
    [[nodiscard]] std::optional<double> lateralLean(const LandmarkFrame& frame) const;
};

} // namespace posture
