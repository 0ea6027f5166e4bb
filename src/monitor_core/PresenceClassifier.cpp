#include "proctor/monitor/PresenceClassifier.h"

namespace proctor {

PresenceResult classifyPresence(const std::vector<FaceDetection>& faces) {
    PresenceResult r;
    r.face_absent = faces.empty();
    r.multiple_faces = faces.size() > 1;
    return r;
}

} // namespace proctor
