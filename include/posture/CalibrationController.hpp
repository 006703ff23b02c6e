#pragma once

#include "Types.hpp"
#include "Pipeline.hpp"
#include "PostureMonitor.hpp"
#include <chrono>
#include <memory>

namespace posture {

/**
 * Drives calibration sessions from the control thread.
 *
 * request() opens a session. After the collection window a finish command is
 * sent, and once the result had time to land the attempt is judged by whether
 * a new baseline was committed. A previous baseline staying active therefore
 * counts as a failed attempt. Failed attempts are retried up to maxAttempts,
 * then the controller gives up until the next request().
 *
 * Only the monitor's baseline snapshot is read, which is safe from any thread.
 */
class CalibrationController {
public:
    enum class Status : uint8_t {
        Idle,
        Collecting,
        Verifying,
        Succeeded,
        Failed
    };

    struct Options {
        Duration window = std::chrono::seconds(3);
        Duration resultWait = std::chrono::milliseconds(500);
        int maxAttempts = 3;
    };

    CalibrationController(std::shared_ptr<const PostureMonitor> monitor,
                          std::shared_ptr<CommandQueue> commandQueue,
                          const Options& options);

    // Starts over with a fresh attempt budget
    void request(TimePoint now);

    void poll(TimePoint now);

    [[nodiscard]] Status getStatus() const { return status_; }
    [[nodiscard]] int attempts() const { return attempts_; }

private:
    std::shared_ptr<const PostureMonitor> monitor_;
    std::shared_ptr<CommandQueue> commandQueue_;
    Options options_;

    Status status_ = Status::Idle;
    int attempts_ = 0;
    TimePoint deadline_;
    std::shared_ptr<const CalibrationBaseline> previous_;

    void beginAttempt(TimePoint now);
    void verify(TimePoint now);
};

[[nodiscard]] const char* calibrationStatusName(CalibrationController::Status status);

} // namespace posture
