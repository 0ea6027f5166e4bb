#include "proctor/monitor/Config.h"
#include "proctor/monitor/Errors.h"

#include <nlohmann/json.hpp>
#include <yaml-cpp/yaml.h>

#include <fstream>

using nlohmann::json;

namespace proctor {

static void try_get(const YAML::Node& n, const char* key, std::string& v) { if (n[key]) v = n[key].as<std::string>(); }
static void try_get(const YAML::Node& n, const char* key, int& v)         { if (n[key]) v = n[key].as<int>(); }
static void try_get(const YAML::Node& n, const char* key, float& v)       { if (n[key]) v = n[key].as<float>(); }
static void try_get(const YAML::Node& n, const char* key, bool& v)        { if (n[key]) v = n[key].as<bool>(); }

void MonitorConfig::validate() const {
    if (focus_lost_frames <= 0)
        throw ConfigurationError("focus_lost_frames must be positive, got " + std::to_string(focus_lost_frames));
    if (drowsiness_frames <= 0)
        throw ConfigurationError("drowsiness_frames must be positive, got " + std::to_string(drowsiness_frames));
    if (!(focus_drift_fraction > 0.f))
        throw ConfigurationError("focus_drift_fraction must be positive");
    if (!(ear_threshold > 0.f))
        throw ConfigurationError("ear_threshold must be positive");
    if (tick_interval_ms <= 0)
        throw ConfigurationError("tick_interval_ms must be positive, got " + std::to_string(tick_interval_ms));
    if (default_frame_width <= 0 || default_frame_height <= 0)
        throw ConfigurationError("default frame size must be positive");
}

MonitorConfig MonitorConfig::fromYaml(const std::string& yaml_path) {
    MonitorConfig c;
    try {
        YAML::Node r = YAML::LoadFile(yaml_path);
        try_get(r, "focus_lost_frames",    c.focus_lost_frames);
        try_get(r, "drowsiness_frames",    c.drowsiness_frames);
        try_get(r, "focus_drift_fraction", c.focus_drift_fraction);
        try_get(r, "ear_threshold",        c.ear_threshold);

        try_get(r, "tick_interval_ms",     c.tick_interval_ms);
        try_get(r, "default_frame_width",  c.default_frame_width);
        try_get(r, "default_frame_height", c.default_frame_height);

        try_get(r, "detections_jsonl",   c.detections_jsonl);
        try_get(r, "events_output",      c.events_output);
        try_get(r, "realtime",           c.realtime);
        try_get(r, "write_tick_reports", c.write_tick_reports);
    } catch (const YAML::Exception& e) {
        throw ConfigurationError("cannot load " + yaml_path + ": " + e.what());
    }
    c.validate();
    return c;
}

MonitorConfig MonitorConfig::fromJson(const std::string& json_path) {
    MonitorConfig c;
    std::ifstream ifs(json_path);
    if (!ifs.is_open()) throw ConfigurationError("cannot open " + json_path);
    try {
        json r; ifs >> r;
        auto get_s = [&](const char* k, std::string& v){ if(r.contains(k)) v = r[k].get<std::string>(); };
        auto get_i = [&](const char* k, int& v){ if(r.contains(k)) v = r[k].get<int>(); };
        auto get_f = [&](const char* k, float& v){ if(r.contains(k)) v = r[k].get<float>(); };
        auto get_b = [&](const char* k, bool& v){ if(r.contains(k)) v = r[k].get<bool>(); };

        get_i("focus_lost_frames", c.focus_lost_frames);
        get_i("drowsiness_frames", c.drowsiness_frames);
        get_f("focus_drift_fraction", c.focus_drift_fraction);
        get_f("ear_threshold", c.ear_threshold);

        get_i("tick_interval_ms", c.tick_interval_ms);
        get_i("default_frame_width", c.default_frame_width);
        get_i("default_frame_height", c.default_frame_height);

        get_s("detections_jsonl", c.detections_jsonl);
        get_s("events_output", c.events_output);
        get_b("realtime", c.realtime);
        get_b("write_tick_reports", c.write_tick_reports);
    } catch (const json::exception& e) {
        throw ConfigurationError("cannot parse " + json_path + ": " + e.what());
    }
    c.validate();
    return c;
}

} // namespace proctor
