#pragma once
#include "Types.h"
#include <string>
#include <vector>

namespace proctor {

struct ObjectResult {
    bool phone_detected = false;
    bool notes_detected = false;
};

// Any detection of the class counts; confidence filtering is the detector's job.
ObjectResult classifyObjects(const std::vector<ObjectDetection>& objects);

// Map raw detector labels onto the taxonomy:
// "cell phone"/"phone" -> PHONE, "book"/"notes" -> NOTES, everything else -> OTHER.
// Case-insensitive, surrounding whitespace ignored.
ObjectClass objectClassFromLabel(const std::string& label);

} // namespace proctor
