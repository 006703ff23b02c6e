#pragma once

#include "Types.hpp"
#include "MetricGeometry.hpp"
#include <array>
#include <memory>
#include <vector>

namespace posture {

/**
 * Calibrator: establishes the per-metric baseline from a window of frames
 * captured while the user holds a known-good posture.
 *
 * States: Idle → Collecting → (Accepted | Rejected) → Idle
 *
 * The active baseline is published as an immutable snapshot. A rejected
 * session never touches it.
 */
class Calibrator {
public:
    enum class State {
        Idle,
        Collecting
    };

    struct Options {
        size_t minSamples = CALIBRATION_MIN_SAMPLES;
        double minDurationS = CALIBRATION_MIN_DURATION_S;
        double acceptQuality = CALIBRATION_ACCEPT_QUALITY;
        double maxSpread = CALIBRATION_MAX_SPREAD;
        float minVisibility = MIN_LANDMARK_VISIBILITY;
    };

    Calibrator();
    explicit Calibrator(const Options& options);

    /**
     * Begin a new session. Clears any previous window.
     */
    void start(TimePoint now);

    /**
     * Add one frame to the window. Frames lacking the required landmarks are
     * counted against the confidence score but contribute no values.
     */
    void ingest(const LandmarkFrame& frame);

    /**
     * Close the session and score it.
     * @throws CalibrationNotReadyError if not collecting, or if the window is
     *         shorter than minSamples / minDurationS
     */
    CalibrationResult finish(TimePoint now);

    /**
     * Abort the session without scoring. No-op when idle.
     */
    void cancel();

    /**
     * Re-activate a previously committed baseline.
     * @throws InvalidBaselineError if it is invalid or below acceptQuality
     */
    void restore(std::shared_ptr<const CalibrationBaseline> baseline);

    /**
     * Metrics whose landmarks must be present for a frame to count as confident.
     * Empty means all metrics.
     */
    void setRequiredMetrics(const std::vector<MetricId>& metrics);

    [[nodiscard]] std::shared_ptr<const CalibrationBaseline> baseline() const;
    [[nodiscard]] bool isCalibrated() const;

    [[nodiscard]] State getState() const { return state_; }
    [[nodiscard]] size_t sampleCount() const { return confidentFrames_; }
    [[nodiscard]] size_t framesSeen() const { return framesSeen_; }
    [[nodiscard]] const Options& options() const { return options_; }

    [[nodiscard]] static const char* getStateName(State state);

private:
    Options options_;
    MetricGeometry geometry_;
    State state_ = State::Idle;

    TimePoint startTime_;
    size_t framesSeen_ = 0;
    size_t confidentFrames_ = 0;
    std::array<std::vector<double>, kMetricCount> samples_;
    std::array<bool, kMetricCount> required_{};

    std::shared_ptr<const CalibrationBaseline> active_;

    void clearWindow();
    void commit(std::shared_ptr<const CalibrationBaseline> baseline);
};

} // namespace posture
