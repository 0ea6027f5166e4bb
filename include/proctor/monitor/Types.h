#pragma once
#include <opencv2/core.hpp>
#include <array>
#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <vector>
#include "Enums.h"

namespace proctor {

// Coarse face key points + optional 6-point eye contours (68-point ordering:
// outer corner, upper lid x2, inner corner, lower lid x2).
struct FaceLandmarks {
    std::map<std::string, cv::Point2f> points;   // "right_eye","left_eye","nose","mouth","right_ear","left_ear"
    std::vector<cv::Point2f> right_eye_contour;
    std::vector<cv::Point2f> left_eye_contour;
};

struct FaceDetection {
    cv::Rect2f  bbox;                 // top-left + size
    cv::Point2f center;
    float       probability = 0.f;    // 0~1
    std::optional<FaceLandmarks> landmarks;
};

struct ObjectDetection {
    ObjectClass cls = ObjectClass::OTHER;
    std::string label;                // raw detector label ("cell phone", "book"...)
    float       confidence = 0.f;
    cv::Rect2f  bbox;
};

// One sampling tick worth of detector output.
struct FrameDetections {
    int64_t frame_index = -1;
    int64_t ts_ms = 0;
    int frame_w = 0;                  // 0 = unknown
    int frame_h = 0;
    std::vector<FaceDetection>   faces;
    std::vector<ObjectDetection> objects;
};

struct ViolationState {
    bool active = false;
    int  count = 0;
};

// Edge transition of one violation kind.
struct TransitionEvent {
    ViolationKind kind = ViolationKind::FOCUS_LOST;
    bool    active = false;
    int64_t ts_ms = 0;
    int64_t frame_index = -1;
    int     count = 0;                // count after this transition
};

// Read-only, point-in-time copy of the statistics.
struct MonitorSnapshot {
    std::map<ViolationKind, int>  counts;
    std::map<ViolationKind, bool> active;
    int      total = 0;
    Severity severity = Severity::NORMAL;
    uint64_t ticks = 0;               // committed ticks since start / last reset
};

struct TickResult {
    ViolationKind kind;
    bool active;
};

// Published once per committed tick: full six-element result list plus the
// transitions of that tick.
struct TickReport {
    int64_t frame_index = -1;
    int64_t ts_ms = 0;
    bool    frame_size_defaulted = false;
    std::array<TickResult, kViolationKindCount> results{};
    std::vector<TransitionEvent> transitions;
    MonitorSnapshot snapshot;
};

// ===================== serialization ===================== //

// Parse one detection record line (see config/sample_session.jsonl).
// Throws MonitorError on malformed input. detector_ready receives the
// record's "detector_ready" flag (default true) when non-null.
FrameDetections parseFrameDetectionsFromJson(const std::string& line, bool* detector_ready = nullptr);

std::string frameDetectionsToJson(const FrameDetections& frame);

// {"type":"transition", kind, active, ts_ms, frame_index, count}
std::string transitionToJsonLine(const TransitionEvent& ev);

// {"type":"tick", frame_index, ts_ms, results:[...], transitions:[...], snapshot:{...}}
std::string tickReportToJsonLine(const TickReport& report);

std::string snapshotToJson(const MonitorSnapshot& snap);

} // namespace proctor
