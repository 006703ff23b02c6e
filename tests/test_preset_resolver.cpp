#include <gtest/gtest.h>
#include "posture/PresetResolver.hpp"
#include "posture/Errors.hpp"
#include <algorithm>
#include <cmath>
#include <limits>

namespace posture {
namespace testing {

class PresetResolverTest : public ::testing::Test {
protected:
    PresetResolver resolver;
};

TEST_F(PresetResolverTest, DefaultSelectionResolvesBuiltins) {
    EffectiveConfig config = resolver.resolve(PresetSelection{});
    EXPECT_EQ(config.metricPreset, "Default");
    EXPECT_EQ(config.performancePreset, "Medium");
    EXPECT_DOUBLE_EQ(config.metric(MetricId::Slouch).threshold, 0.15);
    EXPECT_EQ(config.metric(MetricId::HeadTilt).direction, ViolationDirection::Magnitude);
    EXPECT_DOUBLE_EQ(config.performance.targetFps, 15.0);
    EXPECT_EQ(config.performance.smoothingWindow, 4);
    EXPECT_EQ(config.alerts, AlertConfig{});
}

TEST_F(PresetResolverTest, ResolveIsIdempotent) {
    Overrides overrides{{"metric.slouch.threshold", 0.3}, {"performance.target_fps", 10.0}};
    PresetSelection selection{"Sensitive", "Low"};
    EXPECT_EQ(resolver.resolve(selection, overrides), resolver.resolve(selection, overrides));
}

TEST_F(PresetResolverTest, NamesAreCaseInsensitive) {
    EffectiveConfig config = resolver.resolve({"relaxed", "HIGH"});
    EXPECT_EQ(config.metricPreset, "Relaxed");
    EXPECT_EQ(config.performancePreset, "High");
    EXPECT_DOUBLE_EQ(config.metric(MetricId::HeadTilt).threshold, 0.30);
    EXPECT_DOUBLE_EQ(config.performance.targetFps, 30.0);
}

TEST_F(PresetResolverTest, OverridesReplaceSingleFields) {
    Overrides overrides{
        {"metric.head_tilt.enabled", false},
        {"metric.slouch.threshold", 0.25},
        {"metric.lateral_lean.direction", std::string("above")},
        {"performance.smoothing_window", 2.0},
        {"alert.cooldown_s", 10.0},
    };
    EffectiveConfig config = resolver.resolve(PresetSelection{}, overrides);

    EXPECT_FALSE(config.metric(MetricId::HeadTilt).enabled);
    EXPECT_DOUBLE_EQ(config.metric(MetricId::Slouch).threshold, 0.25);
    EXPECT_EQ(config.metric(MetricId::LateralLean).direction, ViolationDirection::Above);
    EXPECT_EQ(config.performance.smoothingWindow, 2);
    EXPECT_DOUBLE_EQ(config.alerts.cooldownS, 10.0);

    // Untouched fields keep preset values
    EXPECT_DOUBLE_EQ(config.metric(MetricId::UnevenShoulders).threshold, 0.10);
    EXPECT_DOUBLE_EQ(config.performance.targetFps, 15.0);
}

TEST_F(PresetResolverTest, UnknownPresetThrows) {
    EXPECT_THROW(resolver.resolve({"Athletic", "Medium"}), InvalidPresetError);
    EXPECT_THROW(resolver.resolve({"Default", "Ultra"}), InvalidPresetError);
}

TEST_F(PresetResolverTest, BadOverridesThrow) {
    EXPECT_THROW(resolver.resolve({}, {{"metric.posture.threshold", 0.1}}), InvalidPresetError);
    EXPECT_THROW(resolver.resolve({}, {{"metric.slouch.colour", 0.1}}), InvalidPresetError);
    EXPECT_THROW(resolver.resolve({}, {{"display.brightness", 0.1}}), InvalidPresetError);
    EXPECT_THROW(resolver.resolve({}, {{"slouch", 0.1}}), InvalidPresetError);
    // Wrong value types
    EXPECT_THROW(resolver.resolve({}, {{"metric.slouch.enabled", 1.0}}), InvalidPresetError);
    EXPECT_THROW(resolver.resolve({}, {{"metric.slouch.threshold", std::string("high")}}), InvalidPresetError);
    EXPECT_THROW(resolver.resolve({}, {{"performance.history_size", 2.5}}), InvalidPresetError);
    // Integers must be representable before they are converted
    const double inf = std::numeric_limits<double>::infinity();
    EXPECT_THROW(resolver.resolve({}, {{"performance.history_size", inf}}), InvalidPresetError);
    EXPECT_THROW(resolver.resolve({}, {{"performance.smoothing_window", -inf}}), InvalidPresetError);
    EXPECT_THROW(resolver.resolve({}, {{"performance.landmark_count", std::nan("")}}), InvalidPresetError);
    EXPECT_THROW(resolver.resolve({}, {{"performance.history_size", 1e12}}), InvalidPresetError);
    EXPECT_THROW(resolver.resolve({}, {{"performance.model_complexity", -1e12}}), InvalidPresetError);
    // Out of range
    EXPECT_THROW(resolver.resolve({}, {{"performance.target_fps", 0.0}}), InvalidPresetError);
    EXPECT_THROW(resolver.resolve({}, {{"performance.model_complexity", 3.0}}), InvalidPresetError);
    EXPECT_THROW(resolver.resolve({}, {{"alert.recovery_s", -1.0}}), InvalidPresetError);
    EXPECT_THROW(resolver.resolve({}, {{"metric.head_tilt.threshold", -0.2}}), InvalidPresetError);
}

TEST_F(PresetResolverTest, CustomPresetsSitNextToBuiltins) {
    MetricConfigs strict = PresetResolver::builtinMetricPreset("Sensitive");
    strict[metricIndex(MetricId::Slouch)].threshold = 0.05;
    resolver.addMetricPreset("Strict", strict);

    EffectiveConfig config = resolver.resolve({"strict", "Medium"});
    EXPECT_EQ(config.metricPreset, "Strict");
    EXPECT_DOUBLE_EQ(config.metric(MetricId::Slouch).threshold, 0.05);

    auto names = resolver.metricPresetNames();
    EXPECT_NE(std::find(names.begin(), names.end(), "Strict"), names.end());

    EXPECT_TRUE(resolver.removeMetricPreset("Strict"));
    EXPECT_THROW(resolver.resolve({"Strict", "Medium"}), InvalidPresetError);
}

TEST_F(PresetResolverTest, BuiltinsCannotBeReplacedOrRemoved) {
    EXPECT_THROW(resolver.addMetricPreset("default", PresetResolver::builtinMetricPreset("Relaxed")),
                 InvalidPresetError);
    EXPECT_THROW(resolver.addPerformancePreset("Low", PresetResolver::builtinPerformancePreset("High")),
                 InvalidPresetError);
    EXPECT_FALSE(resolver.removeMetricPreset("Default"));
    EXPECT_FALSE(resolver.removePerformancePreset("medium"));
}

TEST_F(PresetResolverTest, InvalidCustomPerformancePresetIsRejected) {
    PerformanceConfig broken = PresetResolver::builtinPerformancePreset("Low");
    broken.targetFps = -5.0;
    EXPECT_THROW(resolver.addPerformancePreset("Broken", broken), InvalidPresetError);
    EXPECT_THROW(resolver.resolve({"Default", "Broken"}), InvalidPresetError);
}

TEST_F(PresetResolverTest, PerformancePresetTable) {
    PerformanceConfig low = PresetResolver::builtinPerformancePreset("Low");
    EXPECT_DOUBLE_EQ(low.targetFps, 5.0);
    EXPECT_EQ(low.modelComplexity, 0);
    EXPECT_EQ(low.historySize, 10);
    EXPECT_DOUBLE_EQ(low.outlierStdDeviations, 2.5);
    EXPECT_EQ(low.smoothingWindow, 3);

    PerformanceConfig high = PresetResolver::builtinPerformancePreset("High");
    EXPECT_EQ(high.modelComplexity, 2);
    EXPECT_EQ(high.landmarkCount, 40);
    EXPECT_EQ(high.smoothingWindow, 6);
}

} // namespace testing
} // namespace posture
