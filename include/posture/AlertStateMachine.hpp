#pragma once

#include "Types.hpp"
#include "Config.hpp"
#include "ThresholdEvaluator.hpp"
#include <functional>
#include <map>
#include <optional>
#include <vector>

namespace posture {

/**
 * Hysteresis for a single metric.
 *
 * States: Normal → PendingBad → Alerting ⇄ Cooldown → PendingNormal → Normal
 *
 * Timers accumulate evidence time: every available sample adds the interval
 * since the previous sample. Unavailable samples add nothing, which freezes
 * whichever timer is running.
 */
class MetricAlertFSM {
public:
    using TransitionCallback = std::function<void(MetricId metric, AlertState from, AlertState to)>;

    explicit MetricAlertFSM(MetricId metric, const AlertConfig& config = AlertConfig{});

    void configure(const AlertConfig& config);

    /**
     * Set the time origin for the first sample's interval.
     */
    void start(TimePoint now);

    /**
     * Feed one evaluator result.
     * @return BadPosture on entering Alerting, BackToNormal on leaving
     *         PendingNormal for Normal, nothing otherwise
     */
    std::optional<AlertEvent> update(Evaluation evaluation, TimePoint now);

    /**
     * Back to Normal without an event; pending timers are discarded.
     */
    void reset();

    [[nodiscard]] MetricId metric() const { return metric_; }
    [[nodiscard]] AlertState getState() const { return state_; }
    [[nodiscard]] Duration pendingTime() const { return timer_; }
    [[nodiscard]] int alertCount() const { return alertCount_; }
    [[nodiscard]] Duration alertingTime() const { return alertingTime_; }

    void setTransitionCallback(TransitionCallback callback) { transitionCallback_ = std::move(callback); }

private:
    MetricId metric_;
    Duration minDuration_{};
    Duration cooldown_{};
    Duration recovery_{};

    AlertState state_ = AlertState::Normal;
    Duration timer_{};
    TimePoint lastSample_;
    bool hasLastSample_ = false;
    TimePoint lastAlert_;

    // Session statistics
    int alertCount_ = 0;
    Duration alertingTime_{};

    TransitionCallback transitionCallback_;

    [[nodiscard]] bool cooldownElapsed(TimePoint now) const { return now - lastAlert_ >= cooldown_; }

    AlertEvent fire(TimePoint now);
    std::optional<AlertEvent> beginRecovery(Duration dt, TimePoint now);
    AlertEvent clear(TimePoint now);
    void transitionTo(AlertState newState);
};

/**
 * Owns one MetricAlertFSM per metric, keyed by MetricId.
 */
class AlertStateMachine {
public:
    explicit AlertStateMachine(const AlertConfig& config = AlertConfig{});

    void configure(const AlertConfig& config);
    void start(TimePoint now);

    /**
     * Advance every metric present in the evaluations.
     * @return events in metric order
     */
    std::vector<AlertEvent> update(const Evaluations& evaluations, TimePoint now);

    void reset(MetricId metric);
    void resetAll();

    [[nodiscard]] AlertState getState(MetricId metric) const;
    [[nodiscard]] const MetricAlertFSM& machine(MetricId metric) const;

    void setTransitionCallback(const MetricAlertFSM::TransitionCallback& callback);

    /**
     * Log per-metric alert counts and time spent in bad posture.
     */
    void logSummary() const;

private:
    std::map<MetricId, MetricAlertFSM> machines_;
};

} // namespace posture
