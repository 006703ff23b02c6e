#include "math/Filters.hpp"

#include <algorithm>
#include <cmath>
#include <numeric>

namespace math {

MovingAverage::MovingAverage(size_t window)
    : _window(std::max<size_t>(window, 1)) {
}

double MovingAverage::update(double sample) {
    _samples.push_back(sample);
    _sum += sample;
    while (_samples.size() > _window) {
        _sum -= _samples.front();
        _samples.pop_front();
    }
    return value();
}

double MovingAverage::value() const {
    if (_samples.empty()) return 0.0;
    return _sum / static_cast<double>(_samples.size());
}

void MovingAverage::reset() {
    _samples.clear();
    _sum = 0.0;
}

void MovingAverage::setWindow(size_t window) {
    _window = std::max<size_t>(window, 1);
    // Recompute instead of subtracting to avoid drift
    while (_samples.size() > _window) {
        _samples.pop_front();
    }
    _sum = std::accumulate(_samples.begin(), _samples.end(), 0.0);
}

OutlierGate::OutlierGate(size_t historySize, double stdDeviations, size_t minHistory)
    : _historySize(std::max<size_t>(historySize, 1)),
      _stdDeviations(stdDeviations),
      _minHistory(minHistory) {
}

double OutlierGate::filter(double value) {
    if (!enabled()) {
        _lastAccepted = value;
        _hasAccepted = true;
        return value;
    }

    bool outlier = false;
    if (_history.size() >= _minHistory) {
        double sum = std::accumulate(_history.begin(), _history.end(), 0.0);
        double avg = sum / static_cast<double>(_history.size());
        double variance = 0.0;
        for (double h : _history) {
            variance += (h - avg) * (h - avg);
        }
        variance /= static_cast<double>(_history.size());
        double stdDev = variance > 0.0 ? std::sqrt(variance) : 0.001;
        outlier = std::abs(value - avg) > _stdDeviations * stdDev;
    }

    _history.push_back(value);
    while (_history.size() > _historySize) {
        _history.pop_front();
    }

    if (outlier && _hasAccepted) {
        _rejected++;
        return _lastAccepted;
    }

    _lastAccepted = value;
    _hasAccepted = true;
    return value;
}

void OutlierGate::reset() {
    _history.clear();
    _lastAccepted = 0.0;
    _hasAccepted = false;
    _rejected = 0;
}

void OutlierGate::configure(size_t historySize, double stdDeviations) {
    _historySize = std::max<size_t>(historySize, 1);
    _stdDeviations = stdDeviations;
    while (_history.size() > _historySize) {
        _history.pop_front();
    }
}

double mean(const std::vector<double>& values) {
    if (values.empty()) return 0.0;
    return std::accumulate(values.begin(), values.end(), 0.0) / static_cast<double>(values.size());
}

double standardDeviation(const std::vector<double>& values) {
    if (values.size() < 2) return 0.0;
    double avg = mean(values);
    double variance = 0.0;
    for (double v : values) {
        variance += (v - avg) * (v - avg);
    }
    return std::sqrt(variance / static_cast<double>(values.size()));
}

double median(std::vector<double> values) {
    if (values.empty()) return 0.0;
    const size_t mid = values.size() / 2;
    std::nth_element(values.begin(), values.begin() + mid, values.end());
    double upper = values[mid];
    if (values.size() % 2 == 1) return upper;
    double lower = *std::max_element(values.begin(), values.begin() + mid);
    return (lower + upper) / 2.0;
}

} // namespace math
