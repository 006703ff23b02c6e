#include "posture/Types.hpp"

#include <algorithm>
#include <cctype>

namespace posture {

namespace {

std::string toLower(std::string value) {
    std::transform(value.begin(), value.end(), value.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return value;
}

} // namespace

const char* landmarkName(LandmarkId id) {
    switch (id) {
        case LandmarkId::Nose:          return "nose";
        case LandmarkId::LeftEye:       return "left_eye";
        case LandmarkId::RightEye:      return "right_eye";
        case LandmarkId::LeftEar:       return "left_ear";
        case LandmarkId::RightEar:      return "right_ear";
        case LandmarkId::LeftShoulder:  return "left_shoulder";
        case LandmarkId::RightShoulder: return "right_shoulder";
        case LandmarkId::LeftHip:       return "left_hip";
        case LandmarkId::RightHip:      return "right_hip";
        default: return "unknown";
    }
}

std::optional<LandmarkId> landmarkFromName(const std::string& name) {
    const std::string key = toLower(name);
    for (size_t i = 0; i < kLandmarkCount; ++i) {
        auto id = static_cast<LandmarkId>(i);
        if (key == landmarkName(id)) return id;
    }
    return std::nullopt;
}

std::optional<LandmarkId> landmarkFromPoseIndex(int index) {
    // MediaPipe Pose topology
    switch (index) {
        case 0:  return LandmarkId::Nose;
        case 2:  return LandmarkId::LeftEye;
        case 5:  return LandmarkId::RightEye;
        case 7:  return LandmarkId::LeftEar;
        case 8:  return LandmarkId::RightEar;
        case 11: return LandmarkId::LeftShoulder;
        case 12: return LandmarkId::RightShoulder;
        case 23: return LandmarkId::LeftHip;
        case 24: return LandmarkId::RightHip;
        default: return std::nullopt;
    }
}

const char* metricName(MetricId id) {
    switch (id) {
        case MetricId::Slouch:           return "slouch";
        case MetricId::UnevenShoulders:  return "uneven_shoulders";
        case MetricId::HeadTilt:         return "head_tilt";
        case MetricId::ForwardNeck:      return "forward_neck";
        case MetricId::RoundedShoulders: return "rounded_shoulders";
        case MetricId::LateralLean:      return "lateral_lean";
        default: return "unknown";
    }
}

const char* metricTitle(MetricId id) {
    switch (id) {
        case MetricId::Slouch:           return "Slouching";
        case MetricId::UnevenShoulders:  return "Uneven Shoulders";
        case MetricId::HeadTilt:         return "Head Tilted";
        case MetricId::ForwardNeck:      return "Neck Forward";
        case MetricId::RoundedShoulders: return "Shoulders Forward";
        case MetricId::LateralLean:      return "Leaning Sideways";
        default: return "Unknown";
    }
}

std::optional<MetricId> metricFromName(const std::string& name) {
    const std::string key = toLower(name);
    for (MetricId id : kAllMetrics) {
        if (key == metricName(id)) return id;
    }
    return std::nullopt;
}

const char* directionName(ViolationDirection direction) {
    switch (direction) {
        case ViolationDirection::Above:     return "above";
        case ViolationDirection::Below:     return "below";
        case ViolationDirection::Magnitude: return "magnitude";
        default: return "unknown";
    }
}

std::optional<ViolationDirection> directionFromName(const std::string& name) {
    const std::string key = toLower(name);
    if (key == "above") return ViolationDirection::Above;
    if (key == "below") return ViolationDirection::Below;
    if (key == "magnitude") return ViolationDirection::Magnitude;
    return std::nullopt;
}

const char* evaluationName(Evaluation evaluation) {
    switch (evaluation) {
        case Evaluation::Ok:          return "OK";
        case Evaluation::Violation:   return "VIOLATION";
        case Evaluation::Unavailable: return "UNAVAILABLE";
        default: return "unknown";
    }
}

const char* alertStateName(AlertState state) {
    switch (state) {
        case AlertState::Normal:        return "NORMAL";
        case AlertState::PendingBad:    return "PENDING_BAD";
        case AlertState::Alerting:      return "ALERTING";
        case AlertState::Cooldown:      return "COOLDOWN";
        case AlertState::PendingNormal: return "PENDING_NORMAL";
        default: return "unknown";
    }
}

const char* alertKindName(AlertKind kind) {
    switch (kind) {
        case AlertKind::BadPosture:   return "bad_posture";
        case AlertKind::BackToNormal: return "back_to_normal";
        default: return "unknown";
    }
}

} // namespace posture
