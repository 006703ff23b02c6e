#pragma once

#include "Types.hpp"
#include "Config.hpp"
#include "MetricEngine.hpp"
#include <map>

namespace posture {

using Evaluations = std::map<MetricId, Evaluation>;

/**
 * Stateless threshold check. Timing and hysteresis live in AlertStateMachine.
 */
class ThresholdEvaluator {
public:
    /**
     * Every metric appears in the result. Disabled metrics are always Ok;
     * enabled metrics without an available reading are Unavailable.
     */
    [[nodiscard]] static Evaluations evaluate(const MetricReadings& readings, const MetricConfigs& config);

    [[nodiscard]] static Evaluation evaluateOne(const MetricReading& reading, const MetricConfig& config);

    [[nodiscard]] static bool violates(double severity, const MetricConfig& config);
};

} // namespace posture
