#include "net/OscNotifier.hpp"
#include "posture/Logger.hpp"
#include <chrono>

namespace net {

using posture::Logger;

OscNotifier::OscNotifier(std::shared_ptr<posture::NotificationQueue> inputQueue, const Options& options)
    : _inputQueue(std::move(inputQueue)), _options(options), _running(false) {
}

OscNotifier::~OscNotifier() {
    stop();
    if (_loAddress) {
        lo_address_free(_loAddress);
    }
}

std::string OscNotifier::formatMessage(const posture::AlertEvent& event) {
    if (event.kind == posture::AlertKind::BackToNormal) {
        return "Posture is back to normal!";
    }
    return std::string("Posture Alert: ") + posture::metricTitle(event.metric);
}

void OscNotifier::start() {
    if (_running) return;

    if (!_loAddress) {
        _loAddress = lo_address_new(_options.host.c_str(), _options.port.c_str());
        if (!_loAddress) {
            Logger::error("OscNotifier: Failed to create LO address for ", _options.host, ":", _options.port);
            return;
        }
    }

    _startTime = posture::Clock::now();
    _running = true;
    _thread = std::thread(&OscNotifier::loop, this);
    Logger::info("OscNotifier started. Target: ", _options.host, ":", _options.port);
}

void OscNotifier::stop() {
    if (!_running) return;
    _running = false;
    if (_thread.joinable()) {
        _thread.join();
    }
    Logger::info("OscNotifier stopped. Sent ", _sent.load(), " messages");
}

void OscNotifier::loop() {
    // Keep draining after stop() was requested so no queued alert is lost
    while (true) {
        auto notification = _inputQueue->try_pop();
        if (!notification) {
            if (!_running) break;
            std::this_thread::sleep_for(std::chrono::milliseconds(1));
            continue;
        }

        switch (notification->type) {
            case posture::Notification::Type::Alert:
                if (notification->alert.kind == posture::AlertKind::BackToNormal && !_options.notifyBackToNormal) {
                    break;
                }
                send(notification->alert);
                break;
            case posture::Notification::Type::Calibration:
                send(notification->calibration);
                break;
        }
    }
}

void OscNotifier::send(const posture::AlertEvent& event) {
    if (!_loAddress) return;

    const std::string text = formatMessage(event);
    const float seconds = std::chrono::duration<float>(event.timestamp - _startTime).count();

    lo_message msg = lo_message_new();
    lo_message_add_int32(msg, static_cast<int32_t>(posture::metricIndex(event.metric)));
    lo_message_add_string(msg, posture::metricName(event.metric));
    lo_message_add_string(msg, posture::alertKindName(event.kind));
    lo_message_add_float(msg, seconds);
    lo_message_add_string(msg, text.c_str());

    int ret = lo_send_message(_loAddress, "/posture/alert", msg);
    if (ret == -1) {
        Logger::error("OscNotifier: Failed to send /posture/alert: ", lo_address_errstr(_loAddress));
    } else {
        _sent++;
    }
    lo_message_free(msg);

    Logger::info("Notify: ", text);
}

void OscNotifier::send(const posture::CalibrationResult& result) {
    if (!_loAddress) return;

    lo_message msg = lo_message_new();
    lo_message_add_int32(msg, result.accepted ? 1 : 0);
    lo_message_add_float(msg, static_cast<float>(result.quality));
    lo_message_add_string(msg, result.reason.c_str());

    int ret = lo_send_message(_loAddress, "/posture/calibration", msg);
    if (ret == -1) {
        Logger::error("OscNotifier: Failed to send /posture/calibration: ", lo_address_errstr(_loAddress));
    } else {
        _sent++;
    }
    lo_message_free(msg);
}

} // namespace net
