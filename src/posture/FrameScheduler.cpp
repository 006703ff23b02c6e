#include "posture/FrameScheduler.hpp"
#include "posture/Logger.hpp"

#include <algorithm>
#include <chrono>

namespace posture {

namespace {

Duration intervalForFps(double fps) {
    if (fps <= 0.0) return Duration::zero();
    return std::chrono::round<Duration>(std::chrono::duration<double>(1.0 / fps));
}

double toSeconds(Duration d) {
    return std::chrono::duration<double>(d).count();
}

} // namespace

FrameScheduler::FrameScheduler(const PerformanceConfig& config) {
    setPerformanceConfig(config);
    applyPending();
}

void FrameScheduler::setPerformanceConfig(const PerformanceConfig& config) {
    std::atomic_store(&pending_, std::shared_ptr<const PerformanceConfig>(
        std::make_shared<PerformanceConfig>(config)));
}

void FrameScheduler::applyPending() {
    auto pending = std::atomic_load(&pending_);
    if (!pending || pending == active_) return;

    const bool first = !active_;
    active_ = pending;
    targetInterval_ = intervalForFps(active_->targetFps);

    // Restart load tracking against the new target
    effectiveInterval_ = targetInterval_;
    degraded_ = false;
    overCount_ = 0;
    underCount_ = 0;

    if (!first) {
        Logger::info("FrameScheduler: Target ", active_->targetFps, " FPS (interval ",
                     toSeconds(targetInterval_) * 1000.0, " ms)");
    }
}

void FrameScheduler::reset() {
    hasProcessed_ = false;
    costAverage_.reset();
    effectiveInterval_ = targetInterval_;
    degraded_ = false;
    overCount_ = 0;
    underCount_ = 0;
    processed_ = 0;
    skipped_ = 0;
}

bool FrameScheduler::shouldProcess(TimePoint now, Duration lastFrameCost) {
    applyPending();

    // Capture timestamps jitter around the nominal period: slightly early is due
    const Duration due = effectiveInterval_ - std::chrono::duration_cast<Duration>(
        effectiveInterval_ * SCHEDULER_JITTER_TOLERANCE);
    if (hasProcessed_ && now - lastProcessed_ < due) {
        skipped_++;
        return false;
    }

    updateLoad(lastFrameCost);

    lastProcessed_ = now;
    hasProcessed_ = true;
    processed_++;
    return true;
}

void FrameScheduler::updateLoad(Duration lastFrameCost) {
    if (lastFrameCost <= Duration::zero()) return;

    const double cost = costAverage_.update(toSeconds(lastFrameCost));
    const double target = toSeconds(targetInterval_);

    if (cost > target) {
        underCount_ = 0;
        if (++overCount_ >= SCHEDULER_OVERLOAD_FRAMES) {
            const double widened = std::min(cost * SCHEDULER_HEADROOM, target * SCHEDULER_MAX_DEGRADE);
            effectiveInterval_ = std::max(targetInterval_, std::chrono::round<Duration>(
                std::chrono::duration<double>(widened)));
            if (!degraded_) {
                Logger::warn("FrameScheduler: Overloaded (avg cost ", cost * 1000.0,
                             " ms), interval widened to ", toSeconds(effectiveInterval_) * 1000.0, " ms");
                degraded_ = true;
            }
        }
    } else {
        overCount_ = 0;
        if (++underCount_ >= SCHEDULER_OVERLOAD_FRAMES && degraded_) {
            effectiveInterval_ = targetInterval_;
            degraded_ = false;
            Logger::info("FrameScheduler: Load recovered, back to target interval");
        }
    }
}

} // namespace posture
