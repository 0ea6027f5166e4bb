#pragma once
#include <stdexcept>
#include <string>

namespace proctor {

// Base of all errors raised by the monitoring core.
class MonitorError : public std::runtime_error {
public:
    explicit MonitorError(const std::string& msg) : std::runtime_error(msg) {}
};

// Invalid thresholds / interval / unreadable config. Raised at construction or load time only.
class ConfigurationError : public MonitorError {
public:
    explicit ConfigurationError(const std::string& msg) : MonitorError("configuration error: " + msg) {}
};

// reset() while a classification tick is in flight.
class InvalidResetError : public MonitorError {
public:
    InvalidResetError() : MonitorError("reset rejected: a tick is in flight") {}
};

// Detector model not loaded / not ready. The whole tick is skipped.
class DetectorUnavailableError : public MonitorError {
public:
    explicit DetectorUnavailableError(const std::string& which)
        : MonitorError(which + " detector unavailable") {}
};

} // namespace proctor
