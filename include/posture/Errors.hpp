#pragma once

#include <stdexcept>
#include <string>

namespace posture {

/**
 * Base for all recoverable failures raised by the posture core.
 * None of them is fatal: the failing call leaves committed state untouched.
 */
class PostureError : public std::runtime_error {
public:
    explicit PostureError(const std::string& what) : std::runtime_error(what) {}
};

// Unknown preset name, unknown override key/metric, or out-of-range override value
class InvalidPresetError : public PostureError {
public:
    explicit InvalidPresetError(const std::string& what) : PostureError(what) {}
};

// finish() before the minimum window / time, or outside a calibration session
class CalibrationNotReadyError : public PostureError {
public:
    explicit CalibrationNotReadyError(const std::string& what) : PostureError(what) {}
};

// A restored baseline that is invalid or below the acceptance threshold
class InvalidBaselineError : public PostureError {
public:
    explicit InvalidBaselineError(const std::string& what) : PostureError(what) {}
};

// Unreadable or malformed application config / replay file
class ConfigError : public PostureError {
public:
    explicit ConfigError(const std::string& what) : PostureError(what) {}
};

} // namespace posture
