#pragma once

#include <cstddef>
#include <deque>
#include <vector>

namespace math {

/**
 * Rolling mean over the last N samples.
 */
class MovingAverage {
public:
    explicit MovingAverage(size_t window = 1);

    double update(double sample);
    void reset();
    void setWindow(size_t window);

    [[nodiscard]] size_t window() const { return _window; }
    [[nodiscard]] size_t size() const { return _samples.size(); }
    [[nodiscard]] bool empty() const { return _samples.empty(); }
    [[nodiscard]] double value() const;

private:
    size_t _window;
    std::deque<double> _samples;
    double _sum = 0.0;
};

class ExponentialAverage {
public:
    explicit ExponentialAverage(double alpha = 0.3) : _alpha(alpha) {}

    double update(double value) {
        if (!_initialized) {
            _value = value;
            _initialized = true;
            return _value;
        }
        _value = _alpha * value + (1.0 - _alpha) * _value;
        return _value;
    }

    void reset() {
        _value = 0.0;
        _initialized = false;
    }

    [[nodiscard]] double value() const { return _value; }
    [[nodiscard]] bool initialized() const { return _initialized; }

private:
    double _alpha;
    double _value = 0.0;
    bool _initialized = false;
};

/**
 * Rejects samples further than N standard deviations from the recent history.
 * A rejected sample is replaced by the last accepted one but still enters the
 * history, so a genuine step change is accepted after a few frames.
 */
class OutlierGate {
public:
    OutlierGate(size_t historySize = 20, double stdDeviations = 3.0, size_t minHistory = 5);

    double filter(double value);
    void reset();
    void configure(size_t historySize, double stdDeviations);

    [[nodiscard]] bool enabled() const { return _stdDeviations > 0.0; }
    [[nodiscard]] size_t rejected() const { return _rejected; }

private:
    size_t _historySize;
    double _stdDeviations;
    size_t _minHistory;
    std::deque<double> _history;
    double _lastAccepted = 0.0;
    bool _hasAccepted = false;
    size_t _rejected = 0;
};

// Sample statistics (population std-dev)
[[nodiscard]] double mean(const std::vector<double>& values);
[[nodiscard]] double standardDeviation(const std::vector<double>& values);
[[nodiscard]] double median(std::vector<double> values);

} // namespace math
