#include "proctor/monitor/Severity.h"

namespace proctor {

namespace {
constexpr int kCriticalAt = 20;
constexpr int kHighAt     = 15;
constexpr int kMediumAt   = 8;
constexpr int kLowAt      = 3;
}

Severity severityFromTotal(int total) {
    if (total >= kCriticalAt) return Severity::CRITICAL;
    if (total >= kHighAt)     return Severity::HIGH_RISK;
    if (total >= kMediumAt)   return Severity::MEDIUM_RISK;
    if (total >= kLowAt)      return Severity::LOW_RISK;
    return Severity::NORMAL;
}

std::string severityDescription(Severity s) {
    switch (s) {
        case Severity::CRITICAL:    return "Immediate intervention required";
        case Severity::HIGH_RISK:   return "Close monitoring needed";
        case Severity::MEDIUM_RISK: return "Attention recommended";
        case Severity::LOW_RISK:    return "Minor concerns detected";
        default:                    return "All systems normal";
    }
}

} // namespace proctor
