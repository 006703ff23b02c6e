#include "posture/MetricEngine.hpp"
#include "posture/Logger.hpp"

#include <cmath>

namespace posture {

MetricEngine::MetricEngine(float minVisibility)
    : geometry_(minVisibility) {
    configure(metrics_, performance_);
}

void MetricEngine::configure(const MetricConfigs& metrics, const PerformanceConfig& performance) {
    const bool filterChanged = performance.smoothingWindow != performance_.smoothingWindow ||
                               performance.historySize != performance_.historySize ||
                               performance.outlierStdDeviations != performance_.outlierStdDeviations;

    metrics_ = metrics;
    performance_ = performance;

    for (auto& channel : channels_) {
        channel.gate.configure(static_cast<size_t>(performance_.historySize), performance_.outlierStdDeviations);
        channel.smoother.setWindow(static_cast<size_t>(performance_.smoothingWindow));
    }

    if (filterChanged) {
        reset();
    }

    // Disabled metrics restart from scratch when re-enabled
    for (MetricId id : kAllMetrics) {
        if (!metrics_[metricIndex(id)].enabled) {
            channels_[metricIndex(id)].gate.reset();
            channels_[metricIndex(id)].smoother.reset();
        }
    }
}

void MetricEngine::reset() {
    for (auto& channel : channels_) {
        channel.gate.reset();
        channel.smoother.reset();
    }
}

MetricReadings MetricEngine::compute(const LandmarkFrame& frame, const CalibrationBaseline* baseline) {
    MetricReadings readings;

    const bool calibrated = baseline && baseline->valid;
    if (!calibrated) {
        if (uncalibratedFrames_++ % 300 == 0) {
            Logger::warn("MetricEngine: No baseline, metrics unavailable until calibration");
        }
    }

    for (MetricId id : kAllMetrics) {
        const size_t idx = metricIndex(id);
        if (!metrics_[idx].enabled) continue;

        MetricReading reading;
        reading.metric = id;

        if (!calibrated || !baseline->hasReference(id)) {
            readings[id] = reading;
            continue;
        }

        auto raw = geometry_.compute(id, frame);
        if (!raw) {
            readings[id] = reading;  // Unavailable: no evidence either way
            continue;
        }

        Channel& channel = channels_[idx];
        const double gated = channel.gate.filter(*raw);
        double delta = gated - baseline->referenceOf(id);
        if (MetricGeometry::usesDepth(id) && std::abs(delta) < DEPTH_DEAD_ZONE) {
            delta = 0.0;
        }
        const double deviation = channel.smoother.update(delta);

        reading.available = true;
        reading.raw = *raw;
        reading.deviation = deviation;
        reading.severity = deviation / MetricGeometry::scale(id);
        readings[id] = reading;
    }

    return readings;
}

} // namespace posture
