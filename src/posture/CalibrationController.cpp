#include "posture/CalibrationController.hpp"
#include "posture/Logger.hpp"

namespace posture {

namespace {

double toSeconds(Duration d) {
    return std::chrono::duration<double>(d).count();
}

} // namespace

const char* calibrationStatusName(CalibrationController::Status status) {
    switch (status) {
        case CalibrationController::Status::Idle:       return "idle";
        case CalibrationController::Status::Collecting: return "collecting";
        case CalibrationController::Status::Verifying:  return "verifying";
        case CalibrationController::Status::Succeeded:  return "succeeded";
        case CalibrationController::Status::Failed:     return "failed";
    }
    return "unknown";
}

CalibrationController::CalibrationController(std::shared_ptr<const PostureMonitor> monitor,
                                             std::shared_ptr<CommandQueue> commandQueue,
                                             const Options& options)
    : monitor_(std::move(monitor)), commandQueue_(std::move(commandQueue)), options_(options) {
}

void CalibrationController::request(TimePoint now) {
    attempts_ = 0;
    beginAttempt(now);
}

void CalibrationController::beginAttempt(TimePoint now) {
    if (!commandQueue_->try_push(Command{CommandType::BeginCalibration})) {
        Logger::warn("CalibrationController: CommandQueue full, calibration request dropped");
        status_ = Status::Failed;
        return;
    }

    attempts_++;
    previous_ = monitor_->baseline();
    deadline_ = now + options_.window;
    status_ = Status::Collecting;
    Logger::info("Calibrating for ", toSeconds(options_.window), "s (attempt ", attempts_, "/",
                 options_.maxAttempts, "). Sit upright...");
}

void CalibrationController::poll(TimePoint now) {
    switch (status_) {
        case Status::Collecting:
            if (now < deadline_) return;
            // A full queue is retried at the next poll
            if (commandQueue_->try_push(Command{CommandType::FinishCalibration})) {
                deadline_ = now + options_.resultWait;
                status_ = Status::Verifying;
            }
            break;

        case Status::Verifying:
            if (now >= deadline_) verify(now);
            break;

        default:
            break;
    }
}

void CalibrationController::verify(TimePoint now) {
    auto current = monitor_->baseline();
    if (current && current != previous_) {
        status_ = Status::Succeeded;
        Logger::info("CalibrationController: Baseline accepted (quality ",
                     static_cast<int>(current->quality * 100.0), "%)");
        return;
    }

    if (attempts_ < options_.maxAttempts) {
        Logger::warn("CalibrationController: Attempt ", attempts_, "/", options_.maxAttempts,
                     " not accepted, retrying");
        beginAttempt(now);
        return;
    }

    status_ = Status::Failed;
    Logger::error("CalibrationController: Calibration failed ", attempts_, " times",
                  previous_ ? ", keeping the previous baseline" : "", ". Send SIGUSR1 to try again.");
}

} // namespace posture
