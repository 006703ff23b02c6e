#pragma once

#include "Types.hpp"
#include <array>
#include <map>
#include <string>
#include <variant>

namespace posture {

struct MetricConfig {
    bool enabled = true;
    double threshold = 0.0;
    ViolationDirection direction = ViolationDirection::Above;

    bool operator==(const MetricConfig& other) const {
        return enabled == other.enabled && threshold == other.threshold && direction == other.direction;
    }
    bool operator!=(const MetricConfig& other) const { return !(*this == other); }
};

using MetricConfigs = std::array<MetricConfig, kMetricCount>;

struct PerformanceConfig {
    double targetFps = 15.0;            // Processing rate
    double displayFps = 15.0;           // Presentation rate (consumed by the UI layer)
    int modelComplexity = 1;            // Detector model 0 (lite) .. 2 (full)
    int landmarkCount = 20;             // Face landmark reduction for the detector
    int historySize = 20;               // Outlier gate history
    double outlierStdDeviations = 3.0;  // 0 disables the outlier gate
    int smoothingWindow = 4;            // Rolling average length per metric

    bool operator==(const PerformanceConfig& other) const {
        return targetFps == other.targetFps &&
               displayFps == other.displayFps &&
               modelComplexity == other.modelComplexity &&
               landmarkCount == other.landmarkCount &&
               historySize == other.historySize &&
               outlierStdDeviations == other.outlierStdDeviations &&
               smoothingWindow == other.smoothingWindow;
    }
    bool operator!=(const PerformanceConfig& other) const { return !(*this == other); }
};

struct AlertConfig {
    double minDurationS = ALERT_MIN_DURATION_S;   // Violation must persist this long before alerting
    double cooldownS = ALERT_COOLDOWN_S;          // Minimum gap between alerts of one metric
    double recoveryS = ALERT_RECOVERY_S;          // Recovery must persist this long before clearing

    bool operator==(const AlertConfig& other) const {
        return minDurationS == other.minDurationS &&
               cooldownS == other.cooldownS &&
               recoveryS == other.recoveryS;
    }
    bool operator!=(const AlertConfig& other) const { return !(*this == other); }
};

/**
 * Fully resolved configuration. Produced by PresetResolver, published as an
 * immutable snapshot (shared_ptr<const EffectiveConfig>).
 */
struct EffectiveConfig {
    std::string metricPreset;
    std::string performancePreset;
    MetricConfigs metrics{};
    PerformanceConfig performance;
    AlertConfig alerts;

    [[nodiscard]] const MetricConfig& metric(MetricId id) const { return metrics[metricIndex(id)]; }
    MetricConfig& metric(MetricId id) { return metrics[metricIndex(id)]; }

    bool operator==(const EffectiveConfig& other) const {
        return metricPreset == other.metricPreset &&
               performancePreset == other.performancePreset &&
               metrics == other.metrics &&
               performance == other.performance &&
               alerts == other.alerts;
    }
    bool operator!=(const EffectiveConfig& other) const { return !(*this == other); }
};

struct PresetSelection {
    std::string metricPreset = "Default";
    std::string performancePreset = "Medium";
};

/**
 * Field-level overrides keyed by dotted path:
 *   metric.<metric>.enabled|threshold|direction
 *   performance.<field>
 *   alert.min_duration_s|cooldown_s|recovery_s
 */
using OverrideValue = std::variant<bool, double, std::string>;
using Overrides = std::map<std::string, OverrideValue>;

} // namespace posture
