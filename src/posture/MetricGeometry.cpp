#include "posture/MetricGeometry.hpp"
#include <algorithm>
#include <cmath>

namespace posture {

namespace {

constexpr double RAD_TO_DEG = 180.0 / M_PI;
constexpr double HEAD_TILT_SCALE_DEG = 50.0;

} // namespace

std::optional<double> MetricGeometry::compute(MetricId metric, const LandmarkFrame& frame) const {
    switch (metric) {
        case MetricId::Slouch:           return slouch(frame);
        case MetricId::UnevenShoulders:  return unevenShoulders(frame);
        case MetricId::HeadTilt:         return headTilt(frame);
        case MetricId::ForwardNeck:      return forwardNeck(frame);
        case MetricId::RoundedShoulders: return roundedShoulders(frame);
        case MetricId::LateralLean:      return lateralLean(frame);
        default: return std::nullopt;
    }
}

bool MetricGeometry::hasAllMetrics(const LandmarkFrame& frame) const {
    for (MetricId metric : kAllMetrics) {
        if (!compute(metric, frame)) return false;
    }
    return true;
}

double MetricGeometry::scale(MetricId metric) {
    if (metric == MetricId::HeadTilt) return HEAD_TILT_SCALE_DEG;
    return 1.0;
}

MetricGeometry::Point MetricGeometry::midpoint(const Landmark& a, const Landmark& b) {
    return {
        (static_cast<double>(a.x) + b.x) / 2.0,
        (static_cast<double>(a.y) + b.y) / 2.0,
        (static_cast<double>(a.z) + b.z) / 2.0
    };
}

std::optional<double> MetricGeometry::shoulderWidth(const LandmarkFrame& frame) const {
    if (!visible(frame, LandmarkId::LeftShoulder) || !visible(frame, LandmarkId::RightShoulder)) {
        return std::nullopt;
    }
    const auto& ls = frame.at(LandmarkId::LeftShoulder);
    const auto& rs = frame.at(LandmarkId::RightShoulder);
    double dx = static_cast<double>(ls.x) - rs.x;
    double dy = static_cast<double>(ls.y) - rs.y;
    double width = std::sqrt(dx * dx + dy * dy);
    if (width < MIN_BODY_SCALE) return std::nullopt;  // Degenerate (side view or bad detection)
    return width;
}

std::optional<double> MetricGeometry::slouch(const LandmarkFrame& frame) const {
    // Head sinking towards the shoulder line: ears move down (larger Y)
    // relative to the shoulders. Normally negative (ears above shoulders).
    auto width = shoulderWidth(frame);
    if (!width) return std::nullopt;
    if (!visible(frame, LandmarkId::LeftEar) || !visible(frame, LandmarkId::RightEar)) {
        return std::nullopt;
    }
    Point ears = midpoint(frame.at(LandmarkId::LeftEar), frame.at(LandmarkId::RightEar));
    Point shoulders = midpoint(frame.at(LandmarkId::LeftShoulder), frame.at(LandmarkId::RightShoulder));
    return (ears.y - shoulders.y) / *width;
}

std::optional<double> MetricGeometry::unevenShoulders(const LandmarkFrame& frame) const {
    auto width = shoulderWidth(frame);
    if (!width) return std::nullopt;
    const auto& ls = frame.at(LandmarkId::LeftShoulder);
    const auto& rs = frame.at(LandmarkId::RightShoulder);
    return std::abs(static_cast<double>(ls.y) - rs.y) / *width;
}

std::optional<double> MetricGeometry::headTilt(const LandmarkFrame& frame) const {
    // Ear line angle, eye line as fallback. Left tilt negative, right positive.
    LandmarkId left = LandmarkId::LeftEar;
    LandmarkId right = LandmarkId::RightEar;
    if (!visible(frame, left) || !visible(frame, right)) {
        left = LandmarkId::LeftEye;
        right = LandmarkId::RightEye;
        if (!visible(frame, left) || !visible(frame, right)) return std::nullopt;
    }
    const auto& l = frame.at(left);
    const auto& r = frame.at(right);
    double dy = static_cast<double>(l.y) - r.y;
    double dx = std::abs(static_cast<double>(l.x) - r.x) + 0.001;
    double angle = std::atan2(dy, dx) * RAD_TO_DEG;
    return std::clamp(angle, -90.0, 90.0);
}

std::optional<double> MetricGeometry::forwardNeck(const LandmarkFrame& frame) const {
    // Ears ahead of the shoulder plane (smaller z = closer to camera)
    auto width = shoulderWidth(frame);
    if (!width) return std::nullopt;
    if (!visible(frame, LandmarkId::LeftEar) || !visible(frame, LandmarkId::RightEar)) {
        return std::nullopt;
    }
    Point ears = midpoint(frame.at(LandmarkId::LeftEar), frame.at(LandmarkId::RightEar));
    Point shoulders = midpoint(frame.at(LandmarkId::LeftShoulder), frame.at(LandmarkId::RightShoulder));
    return (shoulders.z - ears.z) / *width;
}

std::optional<double> MetricGeometry::roundedShoulders(const LandmarkFrame& frame) const {
    // Shoulders projected forward of the hips
    auto width = shoulderWidth(frame);
    if (!width) return std::nullopt;
    if (!visible(frame, LandmarkId::LeftHip) || !visible(frame, LandmarkId::RightHip)) {
        return std::nullopt;
    }
    Point hips = midpoint(frame.at(LandmarkId::LeftHip), frame.at(LandmarkId::RightHip));
    Point shoulders = midpoint(frame.at(LandmarkId::LeftShoulder), frame.at(LandmarkId::RightShoulder));
    return (hips.z - shoulders.z) / *width;
}

std::optional<double> MetricGeometry::lateralLean(const LandmarkFrame& frame) const {
    auto width = shoulderWidth(frame);
    if (!width) return std::nullopt;
    if (!visible(frame, LandmarkId::Nose)) return std::nullopt;
    Point shoulders = midpoint(frame.at(LandmarkId::LeftShoulder), frame.at(LandmarkId::RightShoulder));
    return (static_cast<double>(frame.at(LandmarkId::Nose).x) - shoulders.x) / *width;
}

} // namespace posture
