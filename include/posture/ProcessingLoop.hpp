#pragma once

#include <atomic>
#include <thread>
#include <memory>
#include <chrono>

#include "posture/Pipeline.hpp"
#include "posture/PostureMonitor.hpp"

namespace posture {

/**
 * Processing role thread.
 *
 * Drains calibration commands and scheduled frames, runs the PostureMonitor
 * on each frame, records the frame cost for the scheduler, and forwards
 * alert events and calibration results to the notification queue in order.
 */
class ProcessingLoop {
public:
    ProcessingLoop(std::shared_ptr<PostureMonitor> monitor,
                   std::shared_ptr<FrameQueue> inputQueue,
                   std::shared_ptr<CommandQueue> commandQueue,
                   std::shared_ptr<NotificationQueue> outputQueue,
                   std::shared_ptr<FrameCostGauge> costGauge);
    ~ProcessingLoop();

    void start();
    void stop();
    bool isRunning() const;

private:
    void loop();
    void execute(const Command& command);
    void processFrame(const LandmarkFrame& frame);
    void publish(Notification notification);

    std::shared_ptr<PostureMonitor> _monitor;
    std::shared_ptr<FrameQueue> _inputQueue;
    std::shared_ptr<CommandQueue> _commandQueue;
    std::shared_ptr<NotificationQueue> _outputQueue;
    std::shared_ptr<FrameCostGauge> _costGauge;

    std::atomic<bool> _running;
    std::thread _thread;

    // FPS Counting
    std::chrono::steady_clock::time_point _lastFpsTime;
    int _frameCount = 0;
    float _currentFps = 0.0f;
};

} // namespace posture
