#include "proctor/monitor/DrowsinessTracker.h"
#include <opencv2/core.hpp>
#include <utility>

namespace proctor {

std::optional<double> eyeAspectRatio(const std::vector<cv::Point2f>& eye) {
    if (eye.size() != 6) return std::nullopt;
    double a = cv::norm(eye[1] - eye[5]);
    double b = cv::norm(eye[2] - eye[4]);
    double c = cv::norm(eye[0] - eye[3]);
    if (c <= 1e-6) return std::nullopt;
    return (a + b) / (2.0 * c);
}

std::optional<double> faceEyeAspectRatio(const FaceDetection& face) {
    if (!face.landmarks) return std::nullopt;
    double sum = 0.0;
    int n = 0;
    for (const auto* contour : {&face.landmarks->right_eye_contour, &face.landmarks->left_eye_contour}) {
        if (auto ear = eyeAspectRatio(*contour)) {
            sum += *ear;
            ++n;
        }
    }
    if (n == 0) return std::nullopt;
    return sum / n;
}

DrowsinessTracker::DrowsinessTracker(int drowsy_frames, float ear_threshold, EarFunction ear_fn)
    : drowsy_frames_(drowsy_frames), ear_threshold_(ear_threshold), ear_fn_(std::move(ear_fn)) {
    if (!ear_fn_) ear_fn_ = faceEyeAspectRatio;
}

bool DrowsinessTracker::update(const std::optional<FaceDetection>& face) {
    if (!face || !face->landmarks) {
        counter_ = 0;
        return false;
    }
    auto ear = ear_fn_(*face);
    if (!ear) {
        counter_ = 0;
        return false;
    }
    const bool closed = *ear < ear_threshold_;
    counter_ = closed ? counter_ + 1 : 0;
    return counter_ >= drowsy_frames_;
}

} // namespace proctor
