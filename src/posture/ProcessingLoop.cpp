#include "posture/ProcessingLoop.hpp"
#include "posture/Logger.hpp"

namespace posture {

ProcessingLoop::ProcessingLoop(std::shared_ptr<PostureMonitor> monitor,
                               std::shared_ptr<FrameQueue> inputQueue,
                               std::shared_ptr<CommandQueue> commandQueue,
                               std::shared_ptr<NotificationQueue> outputQueue,
                               std::shared_ptr<FrameCostGauge> costGauge)
    : _monitor(std::move(monitor)),
      _inputQueue(std::move(inputQueue)),
      _commandQueue(std::move(commandQueue)),
      _outputQueue(std::move(outputQueue)),
      _costGauge(std::move(costGauge)),
      _running(false) {
}

ProcessingLoop::~ProcessingLoop() {
    stop();
}

void ProcessingLoop::start() {
    if (_running) return;
    _monitor->start(Clock::now());
    _lastFpsTime = std::chrono::steady_clock::now();
    _running = true;
    _thread = std::thread(&ProcessingLoop::loop, this);
    Logger::info("ProcessingLoop started.");
}

void ProcessingLoop::stop() {
    if (!_running) return;
    _running = false;
    if (_thread.joinable()) {
        _thread.join();
    }
    _monitor->stop();
    Logger::info("ProcessingLoop stopped.");
}

bool ProcessingLoop::isRunning() const {
    return _running;
}

void ProcessingLoop::loop() {
    while (_running) {
        bool idle = true;

        // Commands run between frames, never mid-frame
        while (auto command = _commandQueue->try_pop()) {
            execute(*command);
            idle = false;
        }

        if (auto frame = _inputQueue->try_pop()) {
            processFrame(*frame);
            idle = false;
        }

        if (idle) {
            std::this_thread::sleep_for(std::chrono::microseconds(100));
        }
    }
}

void ProcessingLoop::execute(const Command& command) {
    if (auto result = _monitor->execute(command, Clock::now())) {
        Notification notification;
        notification.type = Notification::Type::Calibration;
        notification.calibration = std::move(*result);
        publish(std::move(notification));
    }
}

void ProcessingLoop::processFrame(const LandmarkFrame& frame) {
    const auto begin = Clock::now();
    FrameReport report = _monitor->processFrame(frame);
    const auto end = Clock::now();
    _costGauge->record(end - begin);

    for (const auto& event : report.events) {
        Notification notification;
        notification.type = Notification::Type::Alert;
        notification.alert = event;
        publish(std::move(notification));
    }

    // FPS Calculation
    _frameCount++;
    auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(end - _lastFpsTime).count();
    if (elapsed >= 10000) {
        _currentFps = _frameCount * 1000.0f / elapsed;
        _frameCount = 0;
        _lastFpsTime = end;
        Logger::debug("ProcessingLoop: ", _currentFps, " FPS, last frame ",
                      std::chrono::duration_cast<std::chrono::microseconds>(end - begin).count(), " us");
    }
}

void ProcessingLoop::publish(Notification notification) {
    if (!_outputQueue->try_push(std::move(notification))) {
        static int dropCounter = 0;
        if (dropCounter++ % 10 == 0) {
            Logger::warn("ProcessingLoop: NotificationQueue full, dropping notification");
        }
    }
}

} // namespace posture
