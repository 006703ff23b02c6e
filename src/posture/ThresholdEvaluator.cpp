#include "posture/ThresholdEvaluator.hpp"
#include <cmath>

namespace posture {

bool ThresholdEvaluator::violates(double severity, const MetricConfig& config) {
    switch (config.direction) {
        case ViolationDirection::Above:     return severity > config.threshold;
        case ViolationDirection::Below:     return severity < config.threshold;
        case ViolationDirection::Magnitude: return std::abs(severity) > config.threshold;
        default: return false;
    }
}

Evaluation ThresholdEvaluator::evaluateOne(const MetricReading& reading, const MetricConfig& config) {
    if (!config.enabled) return Evaluation::Ok;
    if (!reading.available) return Evaluation::Unavailable;
    return violates(reading.severity, config) ? Evaluation::Violation : Evaluation::Ok;
}

Evaluations ThresholdEvaluator::evaluate(const MetricReadings& readings, const MetricConfigs& config) {
    Evaluations result;
    for (MetricId id : kAllMetrics) {
        const MetricConfig& metricConfig = config[metricIndex(id)];
        if (!metricConfig.enabled) {
            result[id] = Evaluation::Ok;
            continue;
        }
        auto it = readings.find(id);
        if (it == readings.end()) {
            result[id] = Evaluation::Unavailable;
            continue;
        }
        result[id] = evaluateOne(it->second, metricConfig);
    }
    return result;
}

} // namespace posture
