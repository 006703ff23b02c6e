#include <gtest/gtest.h>
#include "posture/PostureMonitor.hpp"
#include "posture/PresetResolver.hpp"
#include "posture/Errors.hpp"
#include "TestHelpers.hpp"
#include <vector>

namespace posture {
namespace testing {

/**
 * 10 FPS session: calibrate upright for 2.5 s, then feed scripted posture.
 */
class PostureMonitorTest : public ::testing::Test {
protected:
    void SetUp() override {
        monitor = std::make_unique<PostureMonitor>(unfilteredConfig(1.0, 30.0, 0.5));
        monitor->setEventCallback([this](const AlertEvent& event) { delivered.push_back(event); });
        monitor->start(t0);
    }

    void calibrate() {
        monitor->beginCalibration(t0);
        for (int i = 0; i < 25; ++i) {
            step(uprightFrame(next()));
        }
        CalibrationResult result = monitor->finishCalibration(now);
        ASSERT_TRUE(result.accepted) << result.reason;
    }

    TimePoint next() {
        now += std::chrono::milliseconds(100);
        return now;
    }

    FrameReport step(const LandmarkFrame& frame) {
        return monitor->processFrame(frame);
    }

    // Feeds `count` frames; returns the 1-based index of every event
    std::vector<std::pair<int, AlertEvent>> run(int count, double drop) {
        std::vector<std::pair<int, AlertEvent>> events;
        for (int i = 1; i <= count; ++i) {
            FrameReport report = step(drop == 0.0 ? uprightFrame(next()) : slouchedFrame(next(), drop));
            for (const auto& event : report.events) {
                events.emplace_back(i, event);
            }
        }
        return events;
    }

    TimePoint t0 = Clock::now();
    TimePoint now = t0;
    std::unique_ptr<PostureMonitor> monitor;
    std::vector<AlertEvent> delivered;
};

TEST_F(PostureMonitorTest, UncalibratedFramesRaiseNothing) {
    auto events = run(50, 0.3);
    EXPECT_TRUE(events.empty());
    EXPECT_FALSE(monitor->isCalibrated());
}

TEST_F(PostureMonitorTest, CalibrationFramesAreNotEvaluated) {
    monitor->beginCalibration(t0);
    FrameReport report = step(slouchedFrame(next(), 0.3));
    EXPECT_TRUE(report.calibrating);
    EXPECT_TRUE(report.readings.empty());
    EXPECT_TRUE(report.events.empty());
}

TEST_F(PostureMonitorTest, SustainedSlouchAlertsAtTenthSample) {
    calibrate();

    auto events = run(12, 0.2);
    ASSERT_EQ(events.size(), 1u);
    EXPECT_EQ(events[0].first, 10);
    EXPECT_EQ(events[0].second.metric, MetricId::Slouch);
    EXPECT_EQ(events[0].second.kind, AlertKind::BadPosture);
    EXPECT_EQ(monitor->alertState(MetricId::Slouch), AlertState::Cooldown);

    ASSERT_EQ(delivered.size(), 1u);
    EXPECT_EQ(delivered[0].metric, MetricId::Slouch);
}

TEST_F(PostureMonitorTest, RecoveryClearsAtFifthUprightSample) {
    calibrate();
    run(12, 0.2);

    auto events = run(10, 0.0);
    ASSERT_EQ(events.size(), 1u);
    EXPECT_EQ(events[0].first, 5);
    EXPECT_EQ(events[0].second.kind, AlertKind::BackToNormal);
    EXPECT_EQ(monitor->alertState(MetricId::Slouch), AlertState::Normal);
}

TEST_F(PostureMonitorTest, ShortSlouchIsIgnored) {
    calibrate();
    EXPECT_TRUE(run(5, 0.2).empty());
    EXPECT_TRUE(run(20, 0.0).empty());
}

TEST_F(PostureMonitorTest, CalibrationTimeIsNotCountedAsViolation) {
    calibrate();
    run(5, 0.2);

    // Recalibrating in the middle of a pending violation starts over
    monitor->beginCalibration(now);
    for (int i = 0; i < 25; ++i) step(uprightFrame(next()));
    ASSERT_TRUE(monitor->finishCalibration(now).accepted);
    EXPECT_EQ(monitor->alertState(MetricId::Slouch), AlertState::Normal);

    auto events = run(10, 0.2);
    ASSERT_EQ(events.size(), 1u);
    EXPECT_EQ(events[0].first, 10);
}

TEST_F(PostureMonitorTest, EarlyFinishCommandKeepsSessionOpen) {
    ASSERT_FALSE(monitor->execute(Command{CommandType::BeginCalibration}, t0).has_value());
    for (int i = 0; i < 5; ++i) step(uprightFrame(next()));

    auto early = monitor->execute(Command{CommandType::FinishCalibration}, now);
    ASSERT_TRUE(early.has_value());
    EXPECT_FALSE(early->accepted);
    EXPECT_FALSE(early->reason.empty());
    EXPECT_TRUE(monitor->isCalibrating());

    // The same session keeps its samples and completes later
    for (int i = 0; i < 20; ++i) step(uprightFrame(next()));
    auto done = monitor->execute(Command{CommandType::FinishCalibration}, now);
    ASSERT_TRUE(done.has_value());
    EXPECT_TRUE(done->accepted) << done->reason;
    EXPECT_EQ(done->samples, 25u);
    EXPECT_TRUE(monitor->isCalibrated());
}

TEST_F(PostureMonitorTest, CancelCommandDropsSession) {
    monitor->execute(Command{CommandType::BeginCalibration}, t0);
    EXPECT_FALSE(monitor->execute(Command{CommandType::CancelCalibration}, now).has_value());
    EXPECT_FALSE(monitor->isCalibrating());
}

TEST_F(PostureMonitorTest, DisablingMetricResetsItsAlertState) {
    calibrate();
    run(12, 0.2);
    ASSERT_EQ(monitor->alertState(MetricId::Slouch), AlertState::Cooldown);

    PresetResolver resolver;
    Overrides overrides{
        {"performance.outlier_std_deviations", 0.0},
        {"performance.smoothing_window", 1.0},
        {"alert.min_duration_s", 1.0},
        {"alert.recovery_s", 0.5},
        {"metric.slouch.enabled", false},
    };
    monitor->applyConfig(std::make_shared<const EffectiveConfig>(resolver.resolve(PresetSelection{}, overrides)));

    // Picked up at the next frame, silently
    FrameReport report = step(slouchedFrame(next(), 0.2));
    EXPECT_TRUE(report.events.empty());
    EXPECT_EQ(report.evaluations[MetricId::Slouch], Evaluation::Ok);
    EXPECT_EQ(monitor->alertState(MetricId::Slouch), AlertState::Normal);
    EXPECT_TRUE(run(30, 0.2).empty());
}

TEST_F(PostureMonitorTest, RejectedRecalibrationKeepsBaseline) {
    calibrate();
    auto baseline = monitor->baseline();

    monitor->beginCalibration(now);
    // Half the frames lack the nose: enough samples, too little confidence
    for (int i = 0; i < 50; ++i) {
        LandmarkFrame frame = uprightFrame(next());
        if (i % 2 != 0) hide(frame, LandmarkId::Nose);
        step(frame);
    }
    CalibrationResult result = monitor->finishCalibration(now);
    EXPECT_FALSE(result.accepted);
    EXPECT_EQ(monitor->baseline(), baseline);
}

/**
 * Recalibrating from any alert state returns it to Normal without an event,
 * and no stale BackToNormal follows once posture is good.
 */
class RecalibrationResetTest : public PostureMonitorTest {
protected:
    void recalibrateSilently() {
        const size_t before = delivered.size();
        monitor->beginCalibration(now);
        for (int i = 0; i < 25; ++i) {
            FrameReport report = step(uprightFrame(next()));
            EXPECT_TRUE(report.events.empty());
        }
        ASSERT_TRUE(monitor->finishCalibration(now).accepted);
        EXPECT_EQ(monitor->alertState(MetricId::Slouch), AlertState::Normal);
        EXPECT_TRUE(run(20, 0.0).empty());
        EXPECT_EQ(delivered.size(), before);
    }
};

TEST_F(RecalibrationResetTest, FromAlerting) {
    calibrate();
    run(10, 0.2);
    ASSERT_EQ(monitor->alertState(MetricId::Slouch), AlertState::Alerting);
    recalibrateSilently();
}

TEST_F(RecalibrationResetTest, FromCooldown) {
    calibrate();
    run(15, 0.2);
    ASSERT_EQ(monitor->alertState(MetricId::Slouch), AlertState::Cooldown);
    recalibrateSilently();
}

TEST_F(RecalibrationResetTest, FromPendingNormal) {
    calibrate();
    run(12, 0.2);
    run(2, 0.0);
    ASSERT_EQ(monitor->alertState(MetricId::Slouch), AlertState::PendingNormal);
    recalibrateSilently();
}

TEST_F(RecalibrationResetTest, NewViolationNeedsFullMinDuration) {
    calibrate();
    run(15, 0.2);
    recalibrateSilently();

    auto events = run(10, 0.2);
    ASSERT_EQ(events.size(), 1u);
    EXPECT_EQ(events[0].first, 10);
}

TEST_F(PostureMonitorTest, RestoredBaselineSkipsCalibration) {
    calibrate();
    auto saved = monitor->baseline();

    PostureMonitor fresh(unfilteredConfig(1.0, 30.0, 0.5));
    fresh.start(now);
    EXPECT_THROW(fresh.restoreBaseline(nullptr), InvalidBaselineError);
    fresh.restoreBaseline(saved);
    ASSERT_TRUE(fresh.isCalibrated());

    int alertAt = 0;
    for (int i = 1; i <= 12; ++i) {
        FrameReport report = fresh.processFrame(slouchedFrame(next(), 0.2));
        if (!report.events.empty() && alertAt == 0) alertAt = i;
    }
    EXPECT_EQ(alertAt, 10);
}

TEST_F(PostureMonitorTest, FinishingTooEarlyThrows) {
    monitor->beginCalibration(t0);
    for (int i = 0; i < 5; ++i) step(uprightFrame(next()));
    EXPECT_THROW(monitor->finishCalibration(now), CalibrationNotReadyError);
    EXPECT_TRUE(monitor->isCalibrating());
}

TEST_F(PostureMonitorTest, StopKeepsBaselineAndIgnoresFrames) {
    calibrate();
    auto baseline = monitor->baseline();
    monitor->stop();

    EXPECT_FALSE(monitor->isRunning());
    EXPECT_EQ(monitor->baseline(), baseline);
    FrameReport report = step(slouchedFrame(next(), 0.2));
    EXPECT_TRUE(report.readings.empty());
}

TEST_F(PostureMonitorTest, NullConfigIsRejected) {
    EXPECT_THROW(monitor->applyConfig(nullptr), ConfigError);
    EXPECT_TRUE(monitor->config() != nullptr);
}

} // namespace testing
} // namespace posture
