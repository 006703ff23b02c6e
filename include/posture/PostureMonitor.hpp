#pragma once

#include "Types.hpp"
#include "Config.hpp"
#include "Calibrator.hpp"
#include "MetricEngine.hpp"
#include "ThresholdEvaluator.hpp"
#include "AlertStateMachine.hpp"
#include "Pipeline.hpp"
#include <atomic>
#include <functional>
#include <memory>
#include <optional>
#include <vector>

namespace posture {

/**
 * Everything the processing role learned from one frame.
 */
struct FrameReport {
    uint64_t sequenceNum = 0;
    TimePoint timestamp;
    bool calibrating = false;
    MetricReadings readings;
    Evaluations evaluations;
    std::vector<AlertEvent> events;
};

/**
 * PostureMonitor: the processing role.
 *
 * Per frame: MetricEngine (against the active baseline) → ThresholdEvaluator
 * → AlertStateMachine. While a calibration session is open, frames feed the
 * Calibrator instead and alert timers stay frozen.
 *
 * Config and baseline are immutable snapshots. applyConfig() may be called
 * from any thread; the snapshot is picked up once at the start of the next
 * frame. Everything else belongs to the processing thread.
 */
class PostureMonitor {
public:
    using EventCallback = std::function<void(const AlertEvent& event)>;

    explicit PostureMonitor(std::shared_ptr<const EffectiveConfig> config,
                            const Calibrator::Options& calibration = Calibrator::Options{});

    void applyConfig(std::shared_ptr<const EffectiveConfig> config);
    [[nodiscard]] std::shared_ptr<const EffectiveConfig> config() const;

    void start(TimePoint now);

    /**
     * Stop evaluating. Baseline and config are kept; alert state is cleared.
     */
    void stop();
    [[nodiscard]] bool isRunning() const { return running_; }

    void beginCalibration(TimePoint now);

    /**
     * Score the open session. An accepted baseline replaces the active one and
     * restarts alerting from Normal.
     * @throws CalibrationNotReadyError see Calibrator::finish
     */
    CalibrationResult finishCalibration(TimePoint now);
    void cancelCalibration();

    /**
     * Runs a calibration command between frames. A finish command always
     * yields a result; one that comes too early reports accepted == false with
     * the reason and leaves the session collecting.
     */
    std::optional<CalibrationResult> execute(const Command& command, TimePoint now);

    /**
     * @throws InvalidBaselineError
     */
    void restoreBaseline(std::shared_ptr<const CalibrationBaseline> baseline);

    [[nodiscard]] std::shared_ptr<const CalibrationBaseline> baseline() const { return calibrator_.baseline(); }
    [[nodiscard]] bool isCalibrated() const { return calibrator_.isCalibrated(); }
    [[nodiscard]] bool isCalibrating() const { return calibrator_.getState() == Calibrator::State::Collecting; }

    /**
     * Events are returned in the report and also passed to the callback,
     * in metric order within the frame.
     */
    FrameReport processFrame(const LandmarkFrame& frame);

    [[nodiscard]] AlertState alertState(MetricId metric) const { return alerts_.getState(metric); }
    [[nodiscard]] const AlertStateMachine& alerts() const { return alerts_; }
    [[nodiscard]] const Calibrator& calibrator() const { return calibrator_; }
    [[nodiscard]] uint64_t framesProcessed() const { return framesProcessed_; }

    void setEventCallback(EventCallback callback) { eventCallback_ = std::move(callback); }

private:
    std::shared_ptr<const EffectiveConfig> pending_;
    std::shared_ptr<const EffectiveConfig> active_;

    Calibrator calibrator_;
    MetricEngine engine_;
    AlertStateMachine alerts_;

    bool running_ = false;
    uint64_t framesProcessed_ = 0;
    EventCallback eventCallback_;

    void refreshConfig();
    void freezeAlerts(TimePoint now);
};

} // namespace posture
