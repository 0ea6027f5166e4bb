#pragma once
#include "Types.h"
#include <functional>
#include <optional>
#include <vector>

namespace proctor {

// EAR of one 6-point eye contour: (|p2-p6| + |p3-p5|) / (2 |p1-p4|).
// nullopt when the contour is not 6 points or has no horizontal span.
std::optional<double> eyeAspectRatio(const std::vector<cv::Point2f>& eye);

// Mean EAR over the eyes with a usable contour; nullopt if none.
std::optional<double> faceEyeAspectRatio(const FaceDetection& face);

using EarFunction = std::function<std::optional<double>(const FaceDetection&)>;

// Sustained eye closure. Counter resets whenever closure cannot be assessed
// (no face, no landmarks, EAR not computable) or the eyes are open.
class DrowsinessTracker {
public:
    DrowsinessTracker(int drowsy_frames, float ear_threshold, EarFunction ear_fn = faceEyeAspectRatio);

    bool update(const std::optional<FaceDetection>& face);

    void reset() { counter_ = 0; }
    int counter() const { return counter_; }

private:
    int drowsy_frames_;
    float ear_threshold_;
    EarFunction ear_fn_;
    int counter_ = 0;
};

} // namespace proctor
