#pragma once

#include <thread>
#include <atomic>
#include <memory>

#include "posture/FrameScheduler.hpp"
#include "posture/LandmarkSource.hpp"
#include "posture/Pipeline.hpp"

namespace posture {

/**
 * Capture/schedule role. Pulls landmark frames from the source, asks the
 * FrameScheduler whether each one is worth processing, and forwards the
 * chosen ones to the processing thread. Dropped frames are gone for good.
 */
class InputLoop {
public:
    InputLoop(std::shared_ptr<LandmarkSource> source,
              std::shared_ptr<FrameQueue> outputQueue,
              std::shared_ptr<const FrameCostGauge> costGauge,
              const PerformanceConfig& performance);

    ~InputLoop();

    void start();
    void stop();

    /**
     * Forwarded to the scheduler; effective at the next frame.
     */
    void setPerformanceConfig(const PerformanceConfig& performance);

    [[nodiscard]] bool isRunning() const { return running_; }
    [[nodiscard]] bool isFinished() const { return finished_; }
    [[nodiscard]] bool hasError() const { return hasError_; }

private:
    void loop();

    std::shared_ptr<LandmarkSource> source_;
    std::shared_ptr<FrameQueue> outputQueue_;  // To processing thread
    std::shared_ptr<const FrameCostGauge> costGauge_;
    FrameScheduler scheduler_;

    std::thread thread_;
    std::atomic<bool> running_{false};
    std::atomic<bool> finished_{false};
    std::atomic<bool> hasError_{false};
};

} // namespace posture
