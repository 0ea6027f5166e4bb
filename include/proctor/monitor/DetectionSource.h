#pragma once
#include "Types.h"
#include <opencv2/core.hpp>
#include <optional>
#include <string>
#include <vector>

namespace proctor {

// Handle of one sampled frame. image stays empty when detections are replayed.
struct FrameRef {
    std::size_t seq = 0;          // position in the source's stream
    int64_t frame_index = -1;
    int64_t ts_ms = 0;
    int width = 0;                // 0 = unknown
    int height = 0;
    cv::Mat image;
};

/*  DetectionSource 检测源接口 (camera + face model + object model live behind it)
*
*   - nextFrame():      next sample, nullopt at end of stream
*   - detectFaces():    may block; called concurrently with detectObjects()
*   - detectObjects():  pre-filtered to {phone, notes}
*
*   Detector methods throw DetectorUnavailableError when the model is not ready
*   (tick skipped) and any other std::exception on failure (result treated as empty).
*/
class DetectionSource {
public:
    virtual ~DetectionSource() = default;

    virtual bool isReady() const = 0;
    virtual std::optional<FrameRef> nextFrame() = 0;
    virtual std::vector<FaceDetection> detectFaces(const FrameRef& frame) = 0;
    virtual std::vector<ObjectDetection> detectObjects(const FrameRef& frame) = 0;
};

// Replays recorded FrameDetections (one JSON record per line).
class ReplayDetectionSource : public DetectionSource {
public:
    ReplayDetectionSource() = default;

    // Returns false when the file is missing or holds no valid record.
    // Malformed lines are logged and skipped.
    bool loadJsonl(const std::string& jsonl_path);

    void addRecord(const FrameDetections& frame, bool detector_ready = true);

    bool isReady() const override { return !records_.empty(); }
    std::optional<FrameRef> nextFrame() override;
    std::vector<FaceDetection> detectFaces(const FrameRef& frame) override;
    std::vector<ObjectDetection> detectObjects(const FrameRef& frame) override;

    std::size_t size() const { return records_.size(); }
    std::size_t skippedLines() const { return skipped_lines_; }
    void rewind() { cursor_ = 0; }

private:
    struct Record {
        FrameDetections frame;
        bool detector_ready = true;
    };
    const Record& recordFor(const FrameRef& frame) const;

    std::vector<Record> records_;
    std::size_t cursor_ = 0;
    std::size_t skipped_lines_ = 0;
};

} // namespace proctor
