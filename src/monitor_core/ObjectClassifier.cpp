#include "proctor/monitor/ObjectClassifier.h"
#include <algorithm>
#include <cctype>

namespace proctor {

ObjectResult classifyObjects(const std::vector<ObjectDetection>& objects) {
    ObjectResult r;
    for (const auto& o : objects) {
        if (o.cls == ObjectClass::PHONE) r.phone_detected = true;
        else if (o.cls == ObjectClass::NOTES) r.notes_detected = true;
    }
    return r;
}

ObjectClass objectClassFromLabel(const std::string& label) {
    std::string s;
    s.reserve(label.size());
    for (char c : label) s.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(c))));
    auto not_space = [](unsigned char c) { return !std::isspace(c); };
    s.erase(s.begin(), std::find_if(s.begin(), s.end(), not_space));
    s.erase(std::find_if(s.rbegin(), s.rend(), not_space).base(), s.end());

    if (s == "cell phone" || s == "phone") return ObjectClass::PHONE;
    if (s == "book" || s == "notes")       return ObjectClass::NOTES;
    return ObjectClass::OTHER;
}

} // namespace proctor
