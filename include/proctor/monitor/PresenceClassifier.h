#pragma once
#include "Types.h"
#include <vector>

namespace proctor {

struct PresenceResult {
    bool face_absent = false;      // no face in frame
    bool multiple_faces = false;   // more than one face
};

PresenceResult classifyPresence(const std::vector<FaceDetection>& faces);

} // namespace proctor
