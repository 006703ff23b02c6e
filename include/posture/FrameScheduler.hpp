#pragma once

#include "Types.hpp"
#include "Config.hpp"
#include "math/Filters.hpp"
#include <atomic>
#include <memory>

namespace posture {

/**
 * FrameScheduler: decides per captured frame whether it is processed or
 * dropped, so processing keeps pace with the target FPS of the active
 * performance preset.
 *
 * Dropped frames are never queued. When the measured processing cost stays
 * above the target interval, the effective interval widens (bounded), and it
 * relaxes back once the cost has been under target for a while.
 *
 * Thread-safety: shouldProcess() belongs to the capture thread;
 * setPerformanceConfig() may be called from any thread.
 */
class FrameScheduler {
public:
    explicit FrameScheduler(const PerformanceConfig& config = PerformanceConfig{});

    /**
     * @param lastFrameCost processing time of the most recent processed frame,
     *        zero when nothing has been measured yet
     */
    bool shouldProcess(TimePoint now, Duration lastFrameCost);

    /**
     * Publish a new performance configuration. Takes effect at the next decision.
     */
    void setPerformanceConfig(const PerformanceConfig& config);

    void reset();

    [[nodiscard]] Duration targetInterval() const { return targetInterval_; }
    [[nodiscard]] Duration effectiveInterval() const { return effectiveInterval_; }
    [[nodiscard]] bool isDegraded() const { return degraded_; }
    [[nodiscard]] double averageCostS() const { return costAverage_.value(); }
    [[nodiscard]] uint64_t processedCount() const { return processed_; }
    [[nodiscard]] uint64_t skippedCount() const { return skipped_; }

private:
    std::shared_ptr<const PerformanceConfig> pending_;
    std::shared_ptr<const PerformanceConfig> active_;

    Duration targetInterval_{};
    Duration effectiveInterval_{};
    TimePoint lastProcessed_;
    bool hasProcessed_ = false;

    math::ExponentialAverage costAverage_{SCHEDULER_COST_ALPHA};
    int overCount_ = 0;
    int underCount_ = 0;
    bool degraded_ = false;

    uint64_t processed_ = 0;
    uint64_t skipped_ = 0;

    void applyPending();
    void updateLoad(Duration lastFrameCost);
};

} // namespace posture
