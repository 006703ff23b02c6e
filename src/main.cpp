#include "posture/AppConfig.hpp"
#include "posture/CalibrationController.hpp"
#include "posture/Errors.hpp"
#include "posture/InputLoop.hpp"
#include "posture/Logger.hpp"
#include "posture/PostureMonitor.hpp"
#include "posture/PresetResolver.hpp"
#include "posture/ProcessingLoop.hpp"
#include "posture/ReplaySource.hpp"
#include "net/OscNotifier.hpp"
#include <csignal>
#include <atomic>
#include <thread>
#include <chrono>

using posture::Logger;

// Global flags for shutdown / recalibration
std::atomic<bool> g_running{true};
std::atomic<bool> g_recalibrate{false};

void signalHandler(int signum) {
    if (signum == SIGUSR1) {
        g_recalibrate = true;
        return;
    }
    g_running = false;
}

namespace {

constexpr int MAX_CALIBRATION_ATTEMPTS = 3;

} // namespace

int main(int argc, char** argv) {
    std::signal(SIGINT, signalHandler);
    std::signal(SIGTERM, signalHandler);
    std::signal(SIGUSR1, signalHandler);

    const std::string configPath = argc > 1 ? argv[1] : "config/posture.yml";

    try {
        posture::AppConfig app = posture::AppConfig::load(configPath);
        Logger::setLevel(app.logLevel);
        Logger::info("Starting PostureMonitor (config ", configPath, ", log level ", posture::logLevelName(app.logLevel), ")");

        if (app.replayPath.empty()) {
            throw posture::ConfigError(configPath + ": replay.path is required");
        }

        // 1. Configuration snapshot
        posture::PresetResolver resolver;
        auto config = std::make_shared<const posture::EffectiveConfig>(resolver.resolve(app.presets, app.overrides));
        Logger::info("Presets: metric=", config->metricPreset, " performance=", config->performancePreset,
                     " target=", config->performance.targetFps, " FPS");

        // 2. Infrastructure
        auto monitor = std::make_shared<posture::PostureMonitor>(config, app.calibration);
        auto source = std::make_shared<posture::ReplaySource>(
            posture::ReplaySource::load(app.replayPath, {app.replayRealtime, app.replayLoop}));
        auto frameQueue = std::make_shared<posture::FrameQueue>();
        auto commandQueue = std::make_shared<posture::CommandQueue>();
        auto notificationQueue = std::make_shared<posture::NotificationQueue>();
        auto costGauge = std::make_shared<posture::FrameCostGauge>();

        // 3. Start roles, consumers first
        net::OscNotifier notifier(notificationQueue, {app.oscHost, app.oscPort, app.notifyBackToNormal});
        notifier.start();

        posture::ProcessingLoop processingLoop(monitor, frameQueue, commandQueue, notificationQueue, costGauge);
        processingLoop.start();

        posture::InputLoop inputLoop(source, frameQueue, costGauge, config->performance);
        inputLoop.start();

        // 4. Auto-calibration: the user is expected to sit upright at startup
        posture::CalibrationController::Options calibrationOptions;
        calibrationOptions.window = std::chrono::duration_cast<posture::Duration>(
            std::chrono::duration<double>(app.calibrationDurationS));
        calibrationOptions.maxAttempts = MAX_CALIBRATION_ATTEMPTS;
        posture::CalibrationController calibration(monitor, commandQueue, calibrationOptions);

        calibration.request(posture::Clock::now());
        Logger::info("Service running. Ctrl+C to exit, SIGUSR1 to recalibrate.");

        int exitCode = 0;
        while (g_running) {
            const auto now = posture::Clock::now();

            if (g_recalibrate.exchange(false)) {
                Logger::info("Recalibration requested");
                calibration.request(now);
            }
            calibration.poll(now);

            if (inputLoop.hasError()) {
                Logger::error("InputLoop reported critical error. Shutting down...");
                exitCode = 1;
                break;
            }
            if (inputLoop.isFinished()) {
                Logger::info("Replay finished.");
                break;
            }

            std::this_thread::sleep_for(std::chrono::milliseconds(20));
        }

        // Shutdown: producers first so queued frames and alerts drain
        Logger::info("Stopping modules (calibration ", posture::calibrationStatusName(calibration.getStatus()), ")...");
        inputLoop.stop();
        for (int i = 0; i < 100 && !frameQueue->empty(); ++i) {
            std::this_thread::sleep_for(std::chrono::milliseconds(10));
        }
        processingLoop.stop();
        notifier.stop();

        Logger::info("Service stopped cleanly.");
        return exitCode;

    } catch (const std::exception& e) {
        Logger::error("Fatal error: ", e.what());
        return 1;
    }
}
