#pragma once
#include "Types.h"
#include <optional>

namespace proctor {

/*  @brief FocusTracker 注视偏离滞回
*
*   Tracks sustained drift of the primary face center away from the frame
*   center. Uses the bounding box center only, no gaze vector.
*
*   per update:
*   - no face                        -> counter + 1
*   - drift > min(w, h) * fraction   -> counter + 1
*   - otherwise                      -> counter - 1 (floored at 0)
*
*   @return counter >= lost_frames
*/
class FocusTracker {
public:
    FocusTracker(int lost_frames, float drift_fraction);

    // frame_w / frame_h must be positive; the caller resolves unknown sizes.
    bool update(const std::optional<FaceDetection>& face, int frame_w, int frame_h);

    void reset() { counter_ = 0; }
    int counter() const { return counter_; }
    bool lost() const { return counter_ >= lost_frames_; }

private:
    int lost_frames_;
    float drift_fraction_;
    int counter_ = 0;
};

} // namespace proctor
