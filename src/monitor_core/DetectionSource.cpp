#include "proctor/monitor/DetectionSource.h"
#include "proctor/monitor/Errors.h"

#include <filesystem>
#include <fstream>
#include <iostream>

namespace fs = std::filesystem;

namespace proctor {

bool ReplayDetectionSource::loadJsonl(const std::string& jsonl_path) {
    if (jsonl_path.empty()) {
        std::cerr << "[Replay] Error: empty detections path\n";
        return false;
    }
    if (!fs::exists(jsonl_path) || !fs::is_regular_file(jsonl_path)) {
        std::cerr << "[Replay] Error: detections file not found: " << jsonl_path << "\n";
        return false;
    }
    std::ifstream file(jsonl_path);
    if (!file.is_open()) {
        std::cerr << "[Replay] Error: failed to open detections file: " << jsonl_path << "\n";
        return false;
    }

    std::string line;
    std::size_t line_no = 0;
    std::size_t loaded = 0;
    while (std::getline(file, line)) {
        ++line_no;
        if (line.empty() || line[0] == '#') continue;
        try {
            bool ready = true;
            FrameDetections f = parseFrameDetectionsFromJson(line, &ready);
            addRecord(f, ready);
            ++loaded;
        } catch (const MonitorError& e) {
            std::cerr << "[Replay] line " << line_no << " skipped: " << e.what() << "\n";
            ++skipped_lines_;
        }
    }

    std::cout << "[Replay] Loaded " << loaded << " frames from " << jsonl_path << "\n";
    return loaded > 0;
}

void ReplayDetectionSource::addRecord(const FrameDetections& frame, bool detector_ready) {
    records_.push_back(Record{frame, detector_ready});
}

std::optional<FrameRef> ReplayDetectionSource::nextFrame() {
    if (cursor_ >= records_.size()) return std::nullopt;
    const FrameDetections& f = records_[cursor_].frame;
    FrameRef ref;
    ref.seq = cursor_;
    ref.frame_index = f.frame_index >= 0 ? f.frame_index : static_cast<int64_t>(cursor_);
    ref.ts_ms = f.ts_ms;
    ref.width = f.frame_w;
    ref.height = f.frame_h;
    ++cursor_;
    return ref;
}

const ReplayDetectionSource::Record& ReplayDetectionSource::recordFor(const FrameRef& frame) const {
    if (frame.seq >= records_.size()) throw MonitorError("frame seq out of range");
    return records_[frame.seq];
}

std::vector<FaceDetection> ReplayDetectionSource::detectFaces(const FrameRef& frame) {
    const Record& r = recordFor(frame);
    if (!r.detector_ready) throw DetectorUnavailableError("face");
    return r.frame.faces;
}

std::vector<ObjectDetection> ReplayDetectionSource::detectObjects(const FrameRef& frame) {
    const Record& r = recordFor(frame);
    if (!r.detector_ready) throw DetectorUnavailableError("object");
    return r.frame.objects;
}

} // namespace proctor
