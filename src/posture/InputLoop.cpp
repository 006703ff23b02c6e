#include "posture/InputLoop.hpp"
#include "posture/Logger.hpp"
#include <chrono>

namespace posture {

InputLoop::InputLoop(std::shared_ptr<LandmarkSource> source,
                     std::shared_ptr<FrameQueue> outputQueue,
                     std::shared_ptr<const FrameCostGauge> costGauge,
                     const PerformanceConfig& performance)
    : source_(std::move(source)), outputQueue_(std::move(outputQueue)),
      costGauge_(std::move(costGauge)), scheduler_(performance) {
}

InputLoop::~InputLoop() {
    stop();
}

void InputLoop::start() {
    if (running_) return;
    finished_ = false;
    hasError_ = false;
    running_ = true;
    thread_ = std::thread(&InputLoop::loop, this);
    Logger::info("InputLoop started. Source: ", source_->describe());
}

void InputLoop::stop() {
    running_ = false;
    if (thread_.joinable()) {
        thread_.join();
        Logger::info("InputLoop stopped. Processed ", scheduler_.processedCount(),
                     " frames, skipped ", scheduler_.skippedCount());
    }
}

void InputLoop::setPerformanceConfig(const PerformanceConfig& performance) {
    scheduler_.setPerformanceConfig(performance);
}

void InputLoop::loop() {
    while (running_) {
        try {
            auto frame = source_->next();
            if (!frame) {
                if (source_->finished()) {
                    Logger::info("InputLoop: Source finished");
                    finished_ = true;
                    running_ = false;
                    break;
                }
                std::this_thread::sleep_for(std::chrono::milliseconds(1));
                continue;
            }

            if (!scheduler_.shouldProcess(frame->timestamp, costGauge_->last())) {
                continue;
            }

            if (!outputQueue_->try_push(std::move(*frame))) {
                // Processing is behind; drop instead of building a backlog
                static int dropCounter = 0;
                if (dropCounter++ % 100 == 0) {
                    Logger::warn("InputLoop: FrameQueue full, dropping frame (", outputQueue_->dropped(), " total)");
                }
            }
        } catch (const std::exception& e) {
            Logger::error("InputLoop Critical Error (source failed?): ", e.what());
            hasError_ = true;
            running_ = false;
        }
    }
}

} // namespace posture
