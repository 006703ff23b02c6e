#pragma once

#include "Types.hpp"
#include "SpscQueue.hpp"
#include <atomic>
#include <chrono>
#include <cstdint>

namespace posture {

// ============================================================
// Messages between pipeline roles
// ============================================================

enum class CommandType : uint8_t {
    BeginCalibration,
    FinishCalibration,
    CancelCalibration
};

struct Command {
    CommandType type = CommandType::BeginCalibration;
};

/**
 * Processing → notification. Either an alert event or a calibration outcome.
 */
struct Notification {
    enum class Type : uint8_t {
        Alert,
        Calibration
    };

    Type type = Type::Alert;
    AlertEvent alert;
    CalibrationResult calibration;
};

/**
 * Cost of the most recent processed frame, written by the processing thread
 * and read by the capture thread's scheduler.
 */
class FrameCostGauge {
public:
    void record(Duration cost) { _costNs.store(toNs(cost), std::memory_order_relaxed); }
    [[nodiscard]] Duration last() const {
        return std::chrono::duration_cast<Duration>(std::chrono::nanoseconds(_costNs.load(std::memory_order_relaxed)));
    }

private:
    static int64_t toNs(Duration d) { return std::chrono::duration_cast<std::chrono::nanoseconds>(d).count(); }

    std::atomic<int64_t> _costNs{0};
};

// Queue instantiations
using FrameQueue = SpscQueue<LandmarkFrame, FRAME_QUEUE_SIZE>;
using CommandQueue = SpscQueue<Command, COMMAND_QUEUE_SIZE>;
using NotificationQueue = SpscQueue<Notification, EVENT_QUEUE_SIZE>;

} // namespace posture
