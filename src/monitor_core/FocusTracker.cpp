#include "proctor/monitor/FocusTracker.h"
#include <algorithm>
#include <opencv2/core.hpp>

namespace proctor {

FocusTracker::FocusTracker(int lost_frames, float drift_fraction)
    : lost_frames_(lost_frames), drift_fraction_(drift_fraction) {}

bool FocusTracker::update(const std::optional<FaceDetection>& face, int frame_w, int frame_h) {
    if (!face) {
        ++counter_;
        return lost();
    }

    const cv::Point2f frame_center(frame_w * 0.5f, frame_h * 0.5f);
    const double drift = cv::norm(face->center - frame_center);
    const double limit = std::min(frame_w, frame_h) * static_cast<double>(drift_fraction_);

    if (drift > limit) ++counter_;
    else counter_ = std::max(0, counter_ - 1);   // decay, tolerate brief recoveries

    return lost();
}

} // namespace proctor
