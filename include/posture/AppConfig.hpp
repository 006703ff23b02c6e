#pragma once

#include "Config.hpp"
#include "Calibrator.hpp"
#include "Logger.hpp"
#include <string>

namespace cv {
class FileNode;
}

namespace posture {

/**
 * Application settings, read from a YAML/JSON file.
 *
 *   log_level: info
 *   metric_preset: Default
 *   performance_preset: Medium
 *   overrides:
 *     metric: { head_tilt: { enabled: false, threshold: 0.25 } }
 *     performance: { target_fps: 10 }
 *     alert: { min_duration_s: 5, cooldown_s: 30, recovery_s: 2 }
 *   calibration: { duration_s: 3, min_samples: 20, accept_quality: 0.6 }
 *   osc: { host: 127.0.0.1, port: "9000", back_to_normal: true }
 *   replay: { path: data/sample_session.yml, realtime: true, loop: false }
 *
 * Every key is optional; missing ones keep the defaults below.
 */
struct AppConfig {
    LogLevel logLevel = LogLevel::INFO;

    PresetSelection presets;
    Overrides overrides;

    double calibrationDurationS = 3.0;   // Auto-calibration window at startup
    Calibrator::Options calibration;

    std::string oscHost = "127.0.0.1";
    std::string oscPort = "9000";
    bool notifyBackToNormal = true;

    std::string replayPath;
    bool replayRealtime = true;
    bool replayLoop = false;

    /**
     * @throws ConfigError if the file cannot be opened or a value has the wrong type
     */
    static AppConfig load(const std::string& path);

    /**
     * Same as load() but from in-memory YAML/JSON text.
     */
    static AppConfig parse(const std::string& content);

private:
    static AppConfig read(const cv::FileNode& root, const std::string& origin);
};

} // namespace posture
