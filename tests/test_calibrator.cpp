#include <gtest/gtest.h>
#include "posture/Calibrator.hpp"
#include "posture/Errors.hpp"
#include "TestHelpers.hpp"

namespace posture {
namespace testing {

class CalibratorTest : public ::testing::Test {
protected:
    Calibrator calibrator;
    TimePoint t0 = Clock::now();

    // 100 ms apart, starting 100 ms after t0
    void feedUpright(int count, int startMs = 100) {
        for (int i = 0; i < count; ++i) {
            calibrator.ingest(uprightFrame(at(t0, startMs + 100 * i), i));
        }
    }
};

TEST_F(CalibratorTest, FinishWithoutStartThrows) {
    EXPECT_THROW(calibrator.finish(t0), CalibrationNotReadyError);
}

TEST_F(CalibratorTest, TooFewSamplesThrows) {
    calibrator.start(t0);
    feedUpright(10);
    EXPECT_THROW(calibrator.finish(at(t0, 5000)), CalibrationNotReadyError);
    // The session stays open
    EXPECT_EQ(calibrator.getState(), Calibrator::State::Collecting);
}

TEST_F(CalibratorTest, TooShortThrows) {
    calibrator.start(t0);
    for (int i = 0; i < 30; ++i) {
        calibrator.ingest(uprightFrame(at(t0, 10 * i), i));
    }
    EXPECT_THROW(calibrator.finish(at(t0, 1000)), CalibrationNotReadyError);
}

TEST_F(CalibratorTest, SteadyPostureIsAccepted) {
    calibrator.start(t0);
    feedUpright(30);
    CalibrationResult result = calibrator.finish(at(t0, 3000));

    EXPECT_TRUE(result.accepted);
    EXPECT_NEAR(result.quality, 1.0, 1e-9);
    EXPECT_EQ(result.samples, 30u);
    EXPECT_EQ(calibrator.getState(), Calibrator::State::Idle);

    auto baseline = calibrator.baseline();
    ASSERT_TRUE(baseline);
    EXPECT_TRUE(baseline->valid);
    EXPECT_TRUE(calibrator.isCalibrated());
    EXPECT_NEAR(baseline->referenceOf(MetricId::Slouch), -0.2 / 0.3, 1e-5);
    EXPECT_TRUE(baseline->hasReference(MetricId::RoundedShoulders));
}

TEST_F(CalibratorTest, UnsteadyPostureIsRejectedAndKeepsPreviousBaseline) {
    calibrator.start(t0);
    feedUpright(30);
    ASSERT_TRUE(calibrator.finish(at(t0, 3000)).accepted);
    auto previous = calibrator.baseline();

    // Alternating extremes: large spread on every head metric
    TimePoint t1 = at(t0, 10000);
    calibrator.start(t1);
    for (int i = 0; i < 30; ++i) {
        LandmarkFrame frame = i % 2 == 0 ? slouchedFrame(at(t1, 100 * (i + 1)), 0.5)
                                         : slouchedFrame(at(t1, 100 * (i + 1)), -0.5);
        frame.at(LandmarkId::Nose).x += (i % 2 == 0 ? 0.1f : -0.1f);
        frame.at(LandmarkId::LeftShoulder).y += (i % 2 == 0 ? 0.05f : -0.05f);
        frame.at(LandmarkId::LeftHip).z += (i % 2 == 0 ? 0.1f : -0.1f);
        frame.at(LandmarkId::LeftEar).z += (i % 2 == 0 ? 0.1f : -0.1f);
        frame.at(LandmarkId::LeftEar).y += (i % 2 == 0 ? 0.05f : -0.05f);
        calibrator.ingest(frame);
    }
    CalibrationResult result = calibrator.finish(at(t1, 3100));

    EXPECT_FALSE(result.accepted);
    EXPECT_LT(result.quality, calibrator.options().acceptQuality);
    EXPECT_FALSE(result.reason.empty());
    EXPECT_EQ(calibrator.baseline(), previous);
}

TEST_F(CalibratorTest, PoorVisibilityLowersConfidence) {
    calibrator.start(t0);
    for (int i = 0; i < 60; ++i) {
        LandmarkFrame frame = uprightFrame(at(t0, 50 * (i + 1)), i);
        if (i % 3 != 0) hide(frame, LandmarkId::LeftShoulder);
        calibrator.ingest(frame);
    }
    CalibrationResult result = calibrator.finish(at(t0, 3100));
    EXPECT_EQ(result.framesSeen, 60u);
    EXPECT_EQ(result.samples, 20u);
    EXPECT_NEAR(result.confidence, 1.0 / 3.0, 1e-9);
    EXPECT_FALSE(result.accepted);
    EXPECT_FALSE(calibrator.isCalibrated());
}

TEST_F(CalibratorTest, OptionalMetricsWithoutLandmarksStayUnmeasured) {
    calibrator.setRequiredMetrics({MetricId::Slouch, MetricId::HeadTilt, MetricId::LateralLean});
    calibrator.start(t0);
    for (int i = 0; i < 25; ++i) {
        LandmarkFrame frame = uprightFrame(at(t0, 100 * (i + 1)), i);
        hide(frame, LandmarkId::LeftHip);
        calibrator.ingest(frame);
    }
    CalibrationResult result = calibrator.finish(at(t0, 2600));

    ASSERT_TRUE(result.accepted);
    auto baseline = calibrator.baseline();
    EXPECT_TRUE(baseline->hasReference(MetricId::Slouch));
    EXPECT_FALSE(baseline->hasReference(MetricId::RoundedShoulders));
}

TEST_F(CalibratorTest, CancelDiscardsSession) {
    calibrator.start(t0);
    feedUpright(5);
    calibrator.cancel();
    EXPECT_EQ(calibrator.getState(), Calibrator::State::Idle);
    EXPECT_EQ(calibrator.sampleCount(), 0u);
    EXPECT_THROW(calibrator.finish(at(t0, 3000)), CalibrationNotReadyError);
}

TEST_F(CalibratorTest, RestoreValidatesBaseline) {
    auto weak = std::make_shared<CalibrationBaseline>();
    weak->valid = true;
    weak->quality = 0.3;
    EXPECT_THROW(calibrator.restore(weak), InvalidBaselineError);
    EXPECT_THROW(calibrator.restore(nullptr), InvalidBaselineError);
    EXPECT_FALSE(calibrator.isCalibrated());

    auto good = std::make_shared<CalibrationBaseline>();
    good->valid = true;
    good->quality = 0.9;
    good->measured.fill(true);
    calibrator.restore(good);
    EXPECT_EQ(calibrator.baseline(), good);
}

} // namespace testing
} // namespace posture
