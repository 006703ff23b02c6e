#include <gtest/gtest.h>
#include "posture/AppConfig.hpp"
#include "posture/PresetResolver.hpp"
#include "posture/Errors.hpp"
#include <variant>

namespace posture {
namespace testing {

namespace {

const char* kConfig =
    "%YAML:1.0\n"
    "---\n"
    "log_level: debug\n"
    "metric_preset: Sensitive\n"
    "performance_preset: Low\n"
    "overrides:\n"
    "  metric:\n"
    "    head_tilt: { enabled: \"false\", threshold: 0.25 }\n"
    "    slouch: { enabled: 1, direction: below }\n"
    "  alert: { cooldown_s: 60 }\n"
    "calibration: { duration_s: 4, min_samples: 30, accept_quality: 0.7 }\n"
    "osc: { host: \"192.168.1.20\", port: 9001, back_to_normal: \"off\" }\n"
    "replay: { path: \"data/session.yml\", realtime: \"no\", loop: 1 }\n";

} // namespace

TEST(AppConfigTest, DefaultsWhenEmpty) {
    AppConfig config = AppConfig::parse("%YAML:1.0\n---\nunused: 0\n");
    EXPECT_EQ(config.logLevel, LogLevel::INFO);
    EXPECT_EQ(config.presets.metricPreset, "Default");
    EXPECT_EQ(config.presets.performancePreset, "Medium");
    EXPECT_TRUE(config.overrides.empty());
    EXPECT_EQ(config.oscPort, "9000");
    EXPECT_TRUE(config.notifyBackToNormal);
    EXPECT_TRUE(config.replayPath.empty());
}

TEST(AppConfigTest, ReadsEverySection) {
    AppConfig config = AppConfig::parse(kConfig);
    EXPECT_EQ(config.logLevel, LogLevel::DEBUG);
    EXPECT_EQ(config.presets.metricPreset, "Sensitive");
    EXPECT_EQ(config.presets.performancePreset, "Low");

    EXPECT_DOUBLE_EQ(config.calibrationDurationS, 4.0);
    EXPECT_EQ(config.calibration.minSamples, 30u);
    EXPECT_DOUBLE_EQ(config.calibration.acceptQuality, 0.7);

    EXPECT_EQ(config.oscHost, "192.168.1.20");
    EXPECT_EQ(config.oscPort, "9001");
    EXPECT_FALSE(config.notifyBackToNormal);

    EXPECT_EQ(config.replayPath, "data/session.yml");
    EXPECT_FALSE(config.replayRealtime);
    EXPECT_TRUE(config.replayLoop);
}

TEST(AppConfigTest, OverridesAreFlattenedToDottedKeys) {
    AppConfig config = AppConfig::parse(kConfig);
    const Overrides& o = config.overrides;
    ASSERT_EQ(o.size(), 5u);

    ASSERT_TRUE(std::holds_alternative<bool>(o.at("metric.head_tilt.enabled")));
    EXPECT_FALSE(std::get<bool>(o.at("metric.head_tilt.enabled")));
    ASSERT_TRUE(std::holds_alternative<double>(o.at("metric.head_tilt.threshold")));
    EXPECT_DOUBLE_EQ(std::get<double>(o.at("metric.head_tilt.threshold")), 0.25);
    // An integer under an `enabled` key is a flag
    ASSERT_TRUE(std::holds_alternative<bool>(o.at("metric.slouch.enabled")));
    EXPECT_TRUE(std::get<bool>(o.at("metric.slouch.enabled")));
    ASSERT_TRUE(std::holds_alternative<std::string>(o.at("metric.slouch.direction")));
    EXPECT_EQ(std::get<std::string>(o.at("metric.slouch.direction")), "below");
    ASSERT_TRUE(std::holds_alternative<double>(o.at("alert.cooldown_s")));
    EXPECT_DOUBLE_EQ(std::get<double>(o.at("alert.cooldown_s")), 60.0);

    // And the resolver accepts them as-is
    PresetResolver resolver;
    EffectiveConfig effective = resolver.resolve(config.presets, config.overrides);
    EXPECT_FALSE(effective.metric(MetricId::HeadTilt).enabled);
    EXPECT_DOUBLE_EQ(effective.alerts.cooldownS, 60.0);
}

TEST(AppConfigTest, InvalidValuesThrow) {
    EXPECT_THROW(AppConfig::parse("%YAML:1.0\n---\nlog_level: verbose\n"), ConfigError);
    EXPECT_THROW(AppConfig::parse("%YAML:1.0\n---\nosc: { back_to_normal: maybe }\n"), ConfigError);
    EXPECT_THROW(AppConfig::parse("%YAML:1.0\n---\ncalibration: { min_samples: -3 }\n"), ConfigError);
    EXPECT_THROW(AppConfig::parse("%YAML:1.0\n---\ncalibration: { duration_s: 1.0, min_duration_s: 2.0 }\n"),
                 ConfigError);
    EXPECT_THROW(AppConfig::parse("%YAML:1.0\n---\noverrides: [1, 2]\n"), ConfigError);
}

TEST(AppConfigTest, MissingFileThrows) {
    EXPECT_THROW(AppConfig::load("/nonexistent/posture.yml"), ConfigError);
}

} // namespace testing
} // namespace posture
