#include "proctor/monitor/Types.h"
#include "proctor/monitor/Errors.h"
#include "proctor/monitor/ObjectClassifier.h"
#include <nlohmann/json.hpp>

using nlohmann::json;

namespace proctor {

static cv::Rect2f rectFromJson(const json& r) {
    return cv::Rect2f(r.value("x", 0.f), r.value("y", 0.f), r.value("w", 0.f), r.value("h", 0.f));
}

static json rectToJson(const cv::Rect2f& r) {
    return {{"x", r.x}, {"y", r.y}, {"w", r.width}, {"h", r.height}};
}

static cv::Point2f pointFromJson(const json& p) {
    if (p.is_array() && p.size() == 2) return cv::Point2f(p[0].get<float>(), p[1].get<float>());
    if (p.is_object()) return cv::Point2f(p.value("x", 0.f), p.value("y", 0.f));
    throw MonitorError("point must be [x,y] or {x,y}");
}

static std::vector<cv::Point2f> contourFromJson(const json& arr) {
    std::vector<cv::Point2f> out;
    if (!arr.is_array()) return out;
    for (auto& p : arr) out.push_back(pointFromJson(p));
    return out;
}

static json contourToJson(const std::vector<cv::Point2f>& pts) {
    json arr = json::array();
    for (auto& p : pts) arr.push_back({p.x, p.y});
    return arr;
}

FrameDetections parseFrameDetectionsFromJson(const std::string& line, bool* detector_ready) {
    FrameDetections f;
    try {
        json j = json::parse(line);
        f.frame_index = j.value("frame_index", static_cast<int64_t>(-1));
        f.ts_ms       = j.value("ts_ms", static_cast<int64_t>(0));
        f.frame_w     = j.value("frame_w", 0);
        f.frame_h     = j.value("frame_h", 0);
        if (detector_ready) *detector_ready = j.value("detector_ready", true);

        if (j.contains("faces") && j["faces"].is_array()) {
            for (auto& fj : j["faces"]) {
                FaceDetection face;
                face.bbox = rectFromJson(fj.value("bbox", json::object()));
                // center defaults to the box center
                if (fj.contains("center")) face.center = pointFromJson(fj["center"]);
                else face.center = cv::Point2f(face.bbox.x + face.bbox.width * 0.5f,
                                               face.bbox.y + face.bbox.height * 0.5f);
                face.probability = fj.value("probability", 0.f);

                if (fj.contains("landmarks") && fj["landmarks"].is_object()) {
                    const json& lj = fj["landmarks"];
                    FaceLandmarks lm;
                    if (lj.contains("points") && lj["points"].is_object()) {
                        for (auto it = lj["points"].begin(); it != lj["points"].end(); ++it) {
                            lm.points[it.key()] = pointFromJson(it.value());
                        }
                    }
                    if (lj.contains("right_eye_contour")) lm.right_eye_contour = contourFromJson(lj["right_eye_contour"]);
                    if (lj.contains("left_eye_contour"))  lm.left_eye_contour  = contourFromJson(lj["left_eye_contour"]);
                    face.landmarks = std::move(lm);
                }
                f.faces.push_back(std::move(face));
            }
        }

        if (j.contains("objects") && j["objects"].is_array()) {
            for (auto& oj : j["objects"]) {
                ObjectDetection obj;
                obj.label = oj.value("class", std::string("other"));
                obj.cls = objectClassFromLabel(obj.label);
                obj.confidence = oj.value("confidence", 0.f);
                obj.bbox = rectFromJson(oj.value("bbox", json::object()));
                f.objects.push_back(std::move(obj));
            }
        }
    } catch (const json::exception& e) {
        throw MonitorError(std::string("malformed detection record: ") + e.what());
    }
    return f;
}

std::string frameDetectionsToJson(const FrameDetections& frame) {
    json root;
    root["frame_index"] = frame.frame_index;
    root["ts_ms"] = frame.ts_ms;
    root["frame_w"] = frame.frame_w;
    root["frame_h"] = frame.frame_h;

    json faces = json::array();
    for (const auto& face : frame.faces) {
        json fj;
        fj["bbox"] = rectToJson(face.bbox);
        fj["center"] = {{"x", face.center.x}, {"y", face.center.y}};
        fj["probability"] = face.probability;
        if (face.landmarks) {
            json lj;
            json pts = json::object();
            for (auto& kv : face.landmarks->points) pts[kv.first] = {kv.second.x, kv.second.y};
            lj["points"] = std::move(pts);
            if (!face.landmarks->right_eye_contour.empty())
                lj["right_eye_contour"] = contourToJson(face.landmarks->right_eye_contour);
            if (!face.landmarks->left_eye_contour.empty())
                lj["left_eye_contour"] = contourToJson(face.landmarks->left_eye_contour);
            fj["landmarks"] = std::move(lj);
        }
        faces.push_back(std::move(fj));
    }
    root["faces"] = std::move(faces);

    json objects = json::array();
    for (const auto& obj : frame.objects) {
        objects.push_back({
            {"class", obj.label.empty() ? toString(obj.cls) : obj.label},
            {"confidence", obj.confidence},
            {"bbox", rectToJson(obj.bbox)}
        });
    }
    root["objects"] = std::move(objects);
    return root.dump();
}

static json transitionToJsonObject(const TransitionEvent& ev) {
    return {
        {"kind", toString(ev.kind)},
        {"active", ev.active},
        {"ts_ms", ev.ts_ms},
        {"frame_index", ev.frame_index},
        {"count", ev.count}
    };
}

static json snapshotToJsonObject(const MonitorSnapshot& snap) {
    json counts = json::object();
    json active = json::object();
    for (auto k : kAllViolationKinds) {
        auto c = snap.counts.find(k);
        auto a = snap.active.find(k);
        counts[toString(k)] = c == snap.counts.end() ? 0 : c->second;
        active[toString(k)] = a == snap.active.end() ? false : a->second;
    }
    return {
        {"counts", std::move(counts)},
        {"active", std::move(active)},
        {"total", snap.total},
        {"severity", toString(snap.severity)},
        {"ticks", snap.ticks}
    };
}

std::string transitionToJsonLine(const TransitionEvent& ev) {
    json o = transitionToJsonObject(ev);
    o["type"] = "transition";
    return o.dump();
}

std::string tickReportToJsonLine(const TickReport& report) {
    json root;
    root["type"] = "tick";
    root["frame_index"] = report.frame_index;
    root["ts_ms"] = report.ts_ms;
    root["frame_size_defaulted"] = report.frame_size_defaulted;

    json results = json::array();
    for (const auto& r : report.results) {
        results.push_back({{"type", toString(r.kind)}, {"active", r.active}});
    }
    root["results"] = std::move(results);

    json transitions = json::array();
    for (const auto& ev : report.transitions) transitions.push_back(transitionToJsonObject(ev));
    root["transitions"] = std::move(transitions);

    root["snapshot"] = snapshotToJsonObject(report.snapshot);
    return root.dump();
}

std::string snapshotToJson(const MonitorSnapshot& snap) {
    return snapshotToJsonObject(snap).dump();
}

} // namespace proctor
