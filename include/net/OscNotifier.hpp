#pragma once

#include <thread>
#include <atomic>
#include <memory>
#include <string>
#include <lo/lo.h>

#include "posture/Pipeline.hpp"

namespace net {

/**
 * Notification role. Drains alert events and calibration results and sends
 * them as OSC messages:
 *
 *   /posture/alert        i:metric s:name s:kind f:seconds s:message
 *   /posture/calibration  i:accepted f:quality s:reason
 */
class OscNotifier {
public:
    struct Options {
        std::string host = "127.0.0.1";
        std::string port = "9000";
        bool notifyBackToNormal = true;
    };

    OscNotifier(std::shared_ptr<posture::NotificationQueue> inputQueue, const Options& options);
    ~OscNotifier();

    void start();
    void stop();

    /**
     * "Posture Alert: Slouching" / "Posture is back to normal!"
     */
    [[nodiscard]] static std::string formatMessage(const posture::AlertEvent& event);

private:
    void loop();
    void send(const posture::AlertEvent& event);
    void send(const posture::CalibrationResult& result);

    std::shared_ptr<posture::NotificationQueue> _inputQueue;
    Options _options;

    lo_address _loAddress = nullptr;
    posture::TimePoint _startTime;

    std::atomic<bool> _running;
    std::atomic<size_t> _sent{0};
    std::thread _thread;
};

} // namespace net
