#pragma once

#include <array>
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>

namespace posture {

using Clock = std::chrono::steady_clock;
using TimePoint = Clock::time_point;
using Duration = Clock::duration;

// ============================================================
// Defaults - Posture Monitor Configuration
// ============================================================

// Landmark quality
constexpr float MIN_LANDMARK_VISIBILITY = 0.7f;   // Below this a landmark counts as missing
constexpr float MIN_BODY_SCALE = 1e-3f;           // Shoulder width floor (normalized units)

// Calibration
constexpr size_t CALIBRATION_MIN_SAMPLES = 20;
constexpr double CALIBRATION_MIN_DURATION_S = 2.0;
constexpr double CALIBRATION_ACCEPT_QUALITY = 0.6;
constexpr double CALIBRATION_MAX_SPREAD = 0.1;    // Normalized std-dev that scores 0 consistency

// Alert hysteresis
constexpr double ALERT_MIN_DURATION_S = 5.0;
constexpr double ALERT_COOLDOWN_S = 30.0;
constexpr double ALERT_RECOVERY_S = 2.0;

// Outlier gate needs this many samples before it starts rejecting
constexpr size_t OUTLIER_MIN_HISTORY = 5;

// Depth deviations below this (shoulder widths) are detector jitter
constexpr double DEPTH_DEAD_ZONE = 0.002;

// Scheduler
constexpr int SCHEDULER_OVERLOAD_FRAMES = 5;      // Consecutive decisions before widening / relaxing
constexpr double SCHEDULER_HEADROOM = 1.2;        // Widened interval = cost * headroom
constexpr double SCHEDULER_MAX_DEGRADE = 4.0;     // Never wider than 4x the target interval
constexpr double SCHEDULER_COST_ALPHA = 0.3;
constexpr double SCHEDULER_JITTER_TOLERANCE = 0.05; // Frames up to 5% early still count as due

// Queue sizing
constexpr size_t FRAME_QUEUE_SIZE = 8;
constexpr size_t EVENT_QUEUE_SIZE = 64;
constexpr size_t COMMAND_QUEUE_SIZE = 8;

// ============================================================
// Landmarks
// ============================================================

enum class LandmarkId : uint8_t {
    Nose = 0,
    LeftEye,
    RightEye,
    LeftEar,
    RightEar,
    LeftShoulder,
    RightShoulder,
    LeftHip,
    RightHip,
    Count
};

constexpr size_t kLandmarkCount = static_cast<size_t>(LandmarkId::Count);

struct Landmark {
    float x = 0.0f;          // Normalized [0,1], image-relative
    float y = 0.0f;          // Normalized [0,1], Y=0 is top
    float z = 0.0f;          // Relative depth, smaller = closer to camera
    float visibility = 0.0f; // 0 = not detected
};

/**
 * One detector output: named keypoints for a single processed frame.
 */
struct LandmarkFrame {
    TimePoint timestamp;
    uint64_t sequenceNum = 0;
    std::array<Landmark, kLandmarkCount> landmarks{};

    [[nodiscard]] const Landmark& at(LandmarkId id) const {
        return landmarks[static_cast<size_t>(id)];
    }
    Landmark& at(LandmarkId id) { return landmarks[static_cast<size_t>(id)]; }

    [[nodiscard]] bool isVisible(LandmarkId id, float minVisibility = MIN_LANDMARK_VISIBILITY) const {
        return at(id).visibility >= minVisibility;
    }
};

[[nodiscard]] const char* landmarkName(LandmarkId id);
[[nodiscard]] std::optional<LandmarkId> landmarkFromName(const std::string& name);

/**
 * Maps a MediaPipe Pose landmark index (0-32) onto the subset used here.
 */
[[nodiscard]] std::optional<LandmarkId> landmarkFromPoseIndex(int index);

// ============================================================
// Metrics
// ============================================================

enum class MetricId : uint8_t {
    Slouch = 0,
    UnevenShoulders,
    HeadTilt,
    ForwardNeck,
    RoundedShoulders,
    LateralLean,
    Count
};

constexpr size_t kMetricCount = static_cast<size_t>(MetricId::Count);

constexpr std::array<MetricId, kMetricCount> kAllMetrics = {
    MetricId::Slouch,
    MetricId::UnevenShoulders,
    MetricId::HeadTilt,
    MetricId::ForwardNeck,
    MetricId::RoundedShoulders,
    MetricId::LateralLean
};

constexpr size_t metricIndex(MetricId id) { return static_cast<size_t>(id); }

[[nodiscard]] const char* metricName(MetricId id);     // "slouch", config key
[[nodiscard]] const char* metricTitle(MetricId id);    // "Slouching", user-facing
[[nodiscard]] std::optional<MetricId> metricFromName(const std::string& name);

enum class ViolationDirection : uint8_t {
    Above,     // severity > threshold
    Below,     // severity < threshold
    Magnitude  // |severity| > threshold
};

[[nodiscard]] const char* directionName(ViolationDirection direction);
[[nodiscard]] std::optional<ViolationDirection> directionFromName(const std::string& name);

struct MetricReading {
    MetricId metric = MetricId::Slouch;
    bool available = false;
    double raw = 0.0;        // Metric value in this frame
    double deviation = 0.0;  // Smoothed (raw - baseline reference)
    double severity = 0.0;   // deviation / metric scale
};

enum class Evaluation : uint8_t {
    Ok,
    Violation,
    Unavailable
};

[[nodiscard]] const char* evaluationName(Evaluation evaluation);

// ============================================================
// Alerts
// ============================================================

enum class AlertState : uint8_t {
    Normal,
    PendingBad,
    Alerting,
    Cooldown,
    PendingNormal
};

[[nodiscard]] const char* alertStateName(AlertState state);

enum class AlertKind : uint8_t {
    BadPosture,
    BackToNormal
};

[[nodiscard]] const char* alertKindName(AlertKind kind);

struct AlertEvent {
    MetricId metric = MetricId::Slouch;
    AlertKind kind = AlertKind::BadPosture;
    TimePoint timestamp;
};

// ============================================================
// Calibration
// ============================================================

/**
 * Per-metric reference values established during calibration.
 * Published as shared_ptr<const CalibrationBaseline>; never mutated after commit.
 */
struct CalibrationBaseline {
    std::array<double, kMetricCount> reference{};
    std::array<bool, kMetricCount> measured{};  // False when the metric had too few samples
    double quality = 0.0;
    bool valid = false;
    size_t sampleCount = 0;
    TimePoint createdAt;

    [[nodiscard]] double referenceOf(MetricId id) const { return reference[metricIndex(id)]; }
    [[nodiscard]] bool hasReference(MetricId id) const { return measured[metricIndex(id)]; }
};

struct CalibrationResult {
    bool accepted = false;
    double quality = 0.0;
    double confidence = 0.0;   // Fraction of frames with usable landmarks
    double consistency = 0.0;  // 1 = perfectly steady samples
    size_t samples = 0;
    size_t framesSeen = 0;
    std::string reason;        // Set when rejected
};

} // namespace posture
