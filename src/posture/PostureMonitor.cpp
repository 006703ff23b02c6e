#include "posture/PostureMonitor.hpp"
#include "posture/Errors.hpp"
#include "posture/Logger.hpp"

namespace posture {

PostureMonitor::PostureMonitor(std::shared_ptr<const EffectiveConfig> config,
                               const Calibrator::Options& calibration)
    : calibrator_(calibration), engine_(calibration.minVisibility) {
    applyConfig(std::move(config));
    refreshConfig();
}

void PostureMonitor::applyConfig(std::shared_ptr<const EffectiveConfig> config) {
    if (!config) {
        throw ConfigError("PostureMonitor: null config snapshot");
    }
    std::atomic_store(&pending_, std::move(config));
}

std::shared_ptr<const EffectiveConfig> PostureMonitor::config() const {
    return std::atomic_load(&pending_);
}

void PostureMonitor::refreshConfig() {
    auto next = std::atomic_load(&pending_);
    if (next == active_) return;

    if (active_) {
        for (MetricId id : kAllMetrics) {
            if (active_->metric(id).enabled && !next->metric(id).enabled) {
                alerts_.reset(id);
                Logger::info("PostureMonitor: ", metricTitle(id), " disabled");
            }
        }
        if (active_->metricPreset != next->metricPreset || active_->performancePreset != next->performancePreset) {
            Logger::info("PostureMonitor: Presets ", next->metricPreset, " / ", next->performancePreset);
        }
    }

    engine_.configure(next->metrics, next->performance);
    alerts_.configure(next->alerts);

    std::vector<MetricId> required;
    for (MetricId id : kAllMetrics) {
        if (next->metric(id).enabled) required.push_back(id);
    }
    // Nothing enabled: require everything rather than accept any frame
    calibrator_.setRequiredMetrics(required);

    active_ = std::move(next);
}

void PostureMonitor::start(TimePoint now) {
    refreshConfig();
    alerts_.start(now);
    engine_.reset();
    framesProcessed_ = 0;
    running_ = true;
    Logger::info("PostureMonitor: Started (", isCalibrated() ? "calibrated" : "not calibrated", ")");
}

void PostureMonitor::stop() {
    if (!running_) return;
    running_ = false;
    calibrator_.cancel();
    alerts_.logSummary();
    alerts_.resetAll();
    Logger::info("PostureMonitor: Stopped after ", framesProcessed_, " frames");
}

void PostureMonitor::beginCalibration(TimePoint now) {
    refreshConfig();
    calibrator_.start(now);
}

CalibrationResult PostureMonitor::finishCalibration(TimePoint now) {
    CalibrationResult result = calibrator_.finish(now);
    if (result.accepted) {
        alerts_.resetAll();
        engine_.reset();
    }
    return result;
}

void PostureMonitor::cancelCalibration() {
    calibrator_.cancel();
}

std::optional<CalibrationResult> PostureMonitor::execute(const Command& command, TimePoint now) {
    switch (command.type) {
        case CommandType::BeginCalibration:
            beginCalibration(now);
            break;

        case CommandType::FinishCalibration:
            try {
                return finishCalibration(now);
            } catch (const CalibrationNotReadyError& e) {
                Logger::warn("PostureMonitor: ", e.what());
                CalibrationResult result;
                result.reason = e.what();
                result.samples = calibrator_.sampleCount();
                result.framesSeen = calibrator_.framesSeen();
                return result;
            }

        case CommandType::CancelCalibration:
            cancelCalibration();
            break;
    }
    return std::nullopt;
}

void PostureMonitor::restoreBaseline(std::shared_ptr<const CalibrationBaseline> baseline) {
    calibrator_.restore(std::move(baseline));
    alerts_.resetAll();
    engine_.reset();
}

void PostureMonitor::freezeAlerts(TimePoint now) {
    Evaluations frozen;
    for (MetricId id : kAllMetrics) {
        frozen[id] = Evaluation::Unavailable;
    }
    alerts_.update(frozen, now);
}

FrameReport PostureMonitor::processFrame(const LandmarkFrame& frame) {
    FrameReport report;
    report.sequenceNum = frame.sequenceNum;
    report.timestamp = frame.timestamp;

    if (!running_) {
        static int warnCounter = 0;
        if (warnCounter++ % 100 == 0) {
            Logger::warn("PostureMonitor: Frame ", frame.sequenceNum, " ignored, monitor not started");
        }
        return report;
    }

    refreshConfig();
    framesProcessed_++;

    if (isCalibrating()) {
        calibrator_.ingest(frame);
        freezeAlerts(frame.timestamp);
        report.calibrating = true;
        return report;
    }

    auto baseline = calibrator_.baseline();
    report.readings = engine_.compute(frame, baseline.get());
    report.evaluations = ThresholdEvaluator::evaluate(report.readings, active_->metrics);
    report.events = alerts_.update(report.evaluations, frame.timestamp);

    if (eventCallback_) {
        for (const auto& event : report.events) {
            eventCallback_(event);
        }
    }

    return report;
}

} // namespace posture
