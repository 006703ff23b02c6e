#include "posture/Calibrator.hpp"
#include "posture/Errors.hpp"
#include "posture/Logger.hpp"
#include "math/Filters.hpp"

#include <algorithm>
#include <chrono>
#include <sstream>

namespace posture {

Calibrator::Calibrator() : Calibrator(Options{}) {
}

Calibrator::Calibrator(const Options& options)
    : options_(options), geometry_(options.minVisibility) {
    required_.fill(true);
}

const char* Calibrator::getStateName(State state) {
    switch (state) {
        case State::Idle:       return "IDLE";
        case State::Collecting: return "COLLECTING";
        default: return "unknown";
    }
}

void Calibrator::setRequiredMetrics(const std::vector<MetricId>& metrics) {
    if (metrics.empty()) {
        required_.fill(true);
        return;
    }
    required_.fill(false);
    for (MetricId id : metrics) {
        required_[metricIndex(id)] = true;
    }
}

void Calibrator::clearWindow() {
    framesSeen_ = 0;
    confidentFrames_ = 0;
    for (auto& values : samples_) {
        values.clear();
    }
}

void Calibrator::start(TimePoint now) {
    if (state_ == State::Collecting) {
        Logger::warn("Calibrator: Restarting calibration, discarding ", confidentFrames_, " samples");
    }
    clearWindow();
    startTime_ = now;
    state_ = State::Collecting;
    Logger::info("Calibrator: IDLE → COLLECTING. Hold a good posture...");
}

void Calibrator::cancel() {
    if (state_ != State::Collecting) return;
    clearWindow();
    state_ = State::Idle;
    Logger::info("Calibrator: Calibration cancelled");
}

void Calibrator::ingest(const LandmarkFrame& frame) {
    if (state_ != State::Collecting) {
        static int warnCounter = 0;
        if (warnCounter++ % 100 == 0) {
            Logger::warn("Calibrator: ingest() while ", getStateName(state_), ", frame ignored");
        }
        return;
    }

    framesSeen_++;

    std::array<std::optional<double>, kMetricCount> values;
    bool confident = true;
    for (MetricId id : kAllMetrics) {
        values[metricIndex(id)] = geometry_.compute(id, frame);
        if (required_[metricIndex(id)] && !values[metricIndex(id)]) {
            confident = false;
        }
    }

    if (!confident) {
        Logger::debug("Calibrator: Frame ", frame.sequenceNum, " lacks required landmarks, skipped");
        return;
    }

    confidentFrames_++;
    for (size_t i = 0; i < kMetricCount; ++i) {
        if (values[i]) samples_[i].push_back(*values[i]);
    }
}

CalibrationResult Calibrator::finish(TimePoint now) {
    if (state_ != State::Collecting) {
        throw CalibrationNotReadyError("Calibration has not been started");
    }

    const double elapsed = std::chrono::duration<double>(now - startTime_).count();
    if (confidentFrames_ < options_.minSamples) {
        throw CalibrationNotReadyError("Calibration window too small: " + std::to_string(confidentFrames_) +
                                       " of " + std::to_string(options_.minSamples) + " samples");
    }
    if (elapsed < options_.minDurationS) {
        std::ostringstream msg;
        msg << "Calibration too short: " << elapsed << "s of " << options_.minDurationS << "s";
        throw CalibrationNotReadyError(msg.str());
    }

    auto baseline = std::make_shared<CalibrationBaseline>();
    baseline->sampleCount = confidentFrames_;
    baseline->createdAt = now;

    // Consistency: normalized spread per measured metric
    double consistencySum = 0.0;
    size_t measured = 0;
    for (MetricId id : kAllMetrics) {
        const auto& values = samples_[metricIndex(id)];
        if (values.size() < options_.minSamples) continue;

        baseline->reference[metricIndex(id)] = math::median(values);
        baseline->measured[metricIndex(id)] = true;

        double spread = math::standardDeviation(values) / MetricGeometry::scale(id);
        double score = std::clamp(1.0 - spread / options_.maxSpread, 0.0, 1.0);
        consistencySum += score;
        measured++;

        Logger::debug("Calibrator: ", metricName(id), " ref=", baseline->reference[metricIndex(id)],
                      " spread=", spread, " score=", score);
    }

    CalibrationResult result;
    result.samples = confidentFrames_;
    result.framesSeen = framesSeen_;
    result.confidence = framesSeen_ > 0 ? static_cast<double>(confidentFrames_) / framesSeen_ : 0.0;
    result.consistency = measured > 0 ? consistencySum / measured : 0.0;
    result.quality = result.confidence * result.consistency;
    baseline->quality = result.quality;

    clearWindow();
    state_ = State::Idle;

    if (measured == 0) {
        result.accepted = false;
        result.reason = "No metric could be measured";
    } else if (result.quality < options_.acceptQuality) {
        result.accepted = false;
        std::ostringstream reason;
        reason << "Calibration quality " << static_cast<int>(result.quality * 100.0) << "% below "
               << static_cast<int>(options_.acceptQuality * 100.0) << "%";
        if (result.confidence < 0.7) reason << ", landmarks poorly visible";
        if (result.consistency < 0.7) reason << ", posture not steady";
        result.reason = reason.str();
    } else {
        result.accepted = true;
    }

    if (!result.accepted) {
        Logger::warn("Calibrator: Rejected (", result.reason, "). Keeping ",
                     active_ ? "previous baseline" : "uncalibrated state", ". Please retry.");
        return result;
    }

    baseline->valid = true;
    commit(std::move(baseline));
    Logger::info("Calibrator: Accepted, quality ", static_cast<int>(result.quality * 100.0), "% (",
                 result.samples, "/", result.framesSeen, " frames)");
    return result;
}

void Calibrator::restore(std::shared_ptr<const CalibrationBaseline> baseline) {
    if (!baseline || !baseline->valid) {
        throw InvalidBaselineError("Baseline is not valid");
    }
    if (baseline->quality < options_.acceptQuality) {
        throw InvalidBaselineError("Baseline quality " + std::to_string(baseline->quality) +
                                   " below acceptance threshold");
    }
    const int percent = static_cast<int>(baseline->quality * 100.0);
    if (state_ == State::Collecting) cancel();
    commit(std::move(baseline));
    Logger::info("Calibrator: Restored baseline (quality ", percent, "%)");
}

void Calibrator::commit(std::shared_ptr<const CalibrationBaseline> baseline) {
    std::atomic_store(&active_, std::move(baseline));
}

std::shared_ptr<const CalibrationBaseline> Calibrator::baseline() const {
    return std::atomic_load(&active_);
}

bool Calibrator::isCalibrated() const {
    auto current = baseline();
    return current && current->valid;
}

} // namespace posture
