#include "posture/AlertStateMachine.hpp"
#include "posture/Logger.hpp"

#include <chrono>

namespace posture {

namespace {

Duration toDuration(double seconds) {
    return std::chrono::round<Duration>(std::chrono::duration<double>(seconds));
}

double toSeconds(Duration d) {
    return std::chrono::duration<double>(d).count();
}

} // namespace

// ═══════════════════════════════════════════════════════════════════════════
// MetricAlertFSM
// ═══════════════════════════════════════════════════════════════════════════

MetricAlertFSM::MetricAlertFSM(MetricId metric, const AlertConfig& config)
    : metric_(metric) {
    configure(config);
}

void MetricAlertFSM::configure(const AlertConfig& config) {
    minDuration_ = toDuration(config.minDurationS);
    cooldown_ = toDuration(config.cooldownS);
    recovery_ = toDuration(config.recoveryS);
}

void MetricAlertFSM::start(TimePoint now) {
    reset();
    lastSample_ = now;
    hasLastSample_ = true;
    alertCount_ = 0;
    alertingTime_ = Duration::zero();
}

void MetricAlertFSM::reset() {
    if (state_ != AlertState::Normal) {
        Logger::debug("AlertFSM[", metricName(metric_), "]: reset from ", alertStateName(state_));
    }
    state_ = AlertState::Normal;
    timer_ = Duration::zero();
}

std::optional<AlertEvent> MetricAlertFSM::update(Evaluation evaluation, TimePoint now) {
    Duration dt = hasLastSample_ ? now - lastSample_ : Duration::zero();
    if (dt < Duration::zero()) dt = Duration::zero();
    lastSample_ = now;
    hasLastSample_ = true;

    // No evidence either way: hold state and timers
    if (evaluation == Evaluation::Unavailable) {
        return std::nullopt;
    }

    const bool bad = evaluation == Evaluation::Violation;

    if (state_ == AlertState::Alerting || state_ == AlertState::Cooldown ||
        state_ == AlertState::PendingNormal) {
        alertingTime_ += dt;
    }

    switch (state_) {
        case AlertState::Normal:
            if (bad) {
                timer_ = dt;
                transitionTo(AlertState::PendingBad);
                if (timer_ >= minDuration_) return fire(now);
            }
            return std::nullopt;

        case AlertState::PendingBad:
            if (!bad) {
                // Momentary dip, not worth an alert
                timer_ = Duration::zero();
                transitionTo(AlertState::Normal);
                return std::nullopt;
            }
            timer_ += dt;
            if (timer_ >= minDuration_) return fire(now);
            return std::nullopt;

        case AlertState::Alerting:
            if (!bad) return beginRecovery(dt, now);
            if (cooldownElapsed(now)) return fire(now);
            transitionTo(AlertState::Cooldown);
            return std::nullopt;

        case AlertState::Cooldown:
            if (!bad) return beginRecovery(dt, now);
            if (cooldownElapsed(now)) return fire(now);  // Reminder
            return std::nullopt;

        case AlertState::PendingNormal:
            if (bad) {
                timer_ = Duration::zero();
                transitionTo(AlertState::Cooldown);
                if (cooldownElapsed(now)) return fire(now);
                return std::nullopt;
            }
            timer_ += dt;
            if (timer_ >= recovery_) return clear(now);
            return std::nullopt;
    }

    return std::nullopt;
}

AlertEvent MetricAlertFSM::fire(TimePoint now) {
    lastAlert_ = now;
    timer_ = Duration::zero();
    alertCount_++;
    transitionTo(AlertState::Alerting);
    Logger::info("AlertFSM[", metricName(metric_), "]: ", metricTitle(metric_), " alert #", alertCount_);
    return {metric_, AlertKind::BadPosture, now};
}

std::optional<AlertEvent> MetricAlertFSM::beginRecovery(Duration dt, TimePoint now) {
    timer_ = dt;
    transitionTo(AlertState::PendingNormal);
    if (timer_ >= recovery_) return clear(now);
    return std::nullopt;
}

AlertEvent MetricAlertFSM::clear(TimePoint now) {
    timer_ = Duration::zero();
    transitionTo(AlertState::Normal);
    Logger::info("AlertFSM[", metricName(metric_), "]: back to normal");
    return {metric_, AlertKind::BackToNormal, now};
}

void MetricAlertFSM::transitionTo(AlertState newState) {
    AlertState oldState = state_;
    if (oldState == newState) return;
    state_ = newState;

    Logger::debug("AlertFSM[", metricName(metric_), "]: ", alertStateName(oldState), " → ",
                  alertStateName(newState));

    if (transitionCallback_) {
        transitionCallback_(metric_, oldState, newState);
    }
}

// ═══════════════════════════════════════════════════════════════════════════
// AlertStateMachine
// ═══════════════════════════════════════════════════════════════════════════

AlertStateMachine::AlertStateMachine(const AlertConfig& config) {
    for (MetricId id : kAllMetrics) {
        machines_.emplace(id, MetricAlertFSM(id, config));
    }
}

void AlertStateMachine::configure(const AlertConfig& config) {
    for (auto& [id, fsm] : machines_) {
        fsm.configure(config);
    }
}

void AlertStateMachine::start(TimePoint now) {
    for (auto& [id, fsm] : machines_) {
        fsm.start(now);
    }
}

std::vector<AlertEvent> AlertStateMachine::update(const Evaluations& evaluations, TimePoint now) {
    std::vector<AlertEvent> events;
    for (const auto& [id, evaluation] : evaluations) {
        auto it = machines_.find(id);
        if (it == machines_.end()) continue;
        if (auto event = it->second.update(evaluation, now)) {
            events.push_back(*event);
        }
    }
    return events;
}

void AlertStateMachine::reset(MetricId metric) {
    auto it = machines_.find(metric);
    if (it != machines_.end()) it->second.reset();
}

void AlertStateMachine::resetAll() {
    for (auto& [id, fsm] : machines_) {
        fsm.reset();
    }
}

AlertState AlertStateMachine::getState(MetricId metric) const {
    return machine(metric).getState();
}

const MetricAlertFSM& AlertStateMachine::machine(MetricId metric) const {
    return machines_.at(metric);
}

void AlertStateMachine::setTransitionCallback(const MetricAlertFSM::TransitionCallback& callback) {
    for (auto& [id, fsm] : machines_) {
        fsm.setTransitionCallback(callback);
    }
}

void AlertStateMachine::logSummary() const {
    for (const auto& [id, fsm] : machines_) {
        if (fsm.alertCount() == 0) continue;
        Logger::info("Session: ", metricTitle(id), " alerts=", fsm.alertCount(),
                     " bad posture time=", toSeconds(fsm.alertingTime()), "s");
    }
}

} // namespace posture
