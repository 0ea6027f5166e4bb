#pragma once
#include <array>
#include <cstddef>
#include <string>

namespace proctor {

// Enumeration: violation kinds tracked per monitoring session.
enum class ViolationKind {
    FOCUS_LOST = 0,
    FACE_ABSENT,
    MULTIPLE_FACES,
    PHONE_DETECTED,
    NOTES_DETECTED,
    DROWSINESS
};

constexpr std::size_t kViolationKindCount = 6;

// statistics order
constexpr std::array<ViolationKind, kViolationKindCount> kAllViolationKinds = {
    ViolationKind::FOCUS_LOST,
    ViolationKind::FACE_ABSENT,
    ViolationKind::MULTIPLE_FACES,
    ViolationKind::PHONE_DETECTED,
    ViolationKind::NOTES_DETECTED,
    ViolationKind::DROWSINESS
};

inline std::size_t indexOf(ViolationKind k) { return static_cast<std::size_t>(k); }

// wire key, e.g. "faceAbsent"
inline std::string toString(ViolationKind k) {
    switch (k) {
        case ViolationKind::FOCUS_LOST:     return "focusLost";
        case ViolationKind::FACE_ABSENT:    return "faceAbsent";
        case ViolationKind::MULTIPLE_FACES: return "multipleFaces";
        case ViolationKind::PHONE_DETECTED: return "phoneDetected";
        case ViolationKind::NOTES_DETECTED: return "notesDetected";
        case ViolationKind::DROWSINESS:     return "drowsiness";
    }
    return "unknown";
}

// human readable label for reports
inline std::string toLabel(ViolationKind k) {
    switch (k) {
        case ViolationKind::FOCUS_LOST:     return "Focus Lost";
        case ViolationKind::FACE_ABSENT:    return "Face Absent";
        case ViolationKind::MULTIPLE_FACES: return "Multiple Faces";
        case ViolationKind::PHONE_DETECTED: return "Phone Detected";
        case ViolationKind::NOTES_DETECTED: return "Notes Detected";
        case ViolationKind::DROWSINESS:     return "Drowsiness";
    }
    return "Unknown";
}

// Object taxonomy after label mapping.
enum class ObjectClass {
    PHONE = 0,
    NOTES,
    OTHER
};

inline std::string toString(ObjectClass c) {
    switch (c) {
        case ObjectClass::PHONE: return "phone";
        case ObjectClass::NOTES: return "notes";
        default:                 return "other";
    }
}

// Qualitative risk level derived from the total violation count.
enum class Severity {
    NORMAL = 0,
    LOW_RISK,
    MEDIUM_RISK,
    HIGH_RISK,
    CRITICAL
};

inline std::string toString(Severity s) {
    switch (s) {
        case Severity::CRITICAL:    return "Critical";
        case Severity::HIGH_RISK:   return "High Risk";
        case Severity::MEDIUM_RISK: return "Medium Risk";
        case Severity::LOW_RISK:    return "Low Risk";
        default:                    return "Normal";
    }
}

} // namespace proctor
