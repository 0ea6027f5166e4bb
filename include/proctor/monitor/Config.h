#pragma once
#include <string>

namespace proctor {

// Monitoring session config (load from monitor.yml)
struct MonitorConfig {
    // ===================== hysteresis ===================== //

    int   focus_lost_frames    = 35;     // ticks of sustained drift/absence before focus is lost
    int   drowsiness_frames    = 15;     // ticks of closed eyes before drowsiness
    float focus_drift_fraction = 0.25f;  // drift limit = min(frame_w, frame_h) * fraction
    float ear_threshold        = 0.2f;   // eye aspect ratio below this = closed

    // ===================== scheduling ===================== //

    int tick_interval_ms = 300;

    // used when a frame arrives without its size
    int default_frame_width  = 640;
    int default_frame_height = 480;

    // ===================== replay tool ===================== //

    std::string detections_jsonl = "assets/sessions/session.jsonl";  // recorded FrameDetections, one per line
    std::string events_output    = "runtime/monitor_events.jsonl";   // transitions + tick reports
    bool realtime           = false;   // pace replay at tick_interval_ms instead of back to back
    bool write_tick_reports = true;    // false: only transitions are written

    // ===================== methods ===================== //

    // Throws ConfigurationError on non-positive thresholds or interval.
    void validate() const;

    // Keys present in the file override the defaults above, then validate().
    // Throws ConfigurationError when the file cannot be read or parsed.
    static MonitorConfig fromYaml(const std::string& yaml_path);
    static MonitorConfig fromJson(const std::string& json_path);
};

} // namespace proctor
