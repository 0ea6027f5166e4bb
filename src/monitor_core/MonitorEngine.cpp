#include "proctor/monitor/MonitorEngine.h"
#include "proctor/monitor/ObjectClassifier.h"
#include "proctor/monitor/PresenceClassifier.h"
#include "proctor/monitor/Severity.h"

#include <chrono>
#include <iostream>
#include <utility>

namespace proctor {

namespace {

const MonitorConfig& validated(const MonitorConfig& cfg) {
    cfg.validate();
    return cfg;
}

int64_t now_ms() {
    return std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::system_clock::now().time_since_epoch()).count();
}

// order of the per-tick result list
constexpr ViolationKind kTickResultOrder[kViolationKindCount] = {
    ViolationKind::FACE_ABSENT,
    ViolationKind::MULTIPLE_FACES,
    ViolationKind::FOCUS_LOST,
    ViolationKind::DROWSINESS,
    ViolationKind::PHONE_DETECTED,
    ViolationKind::NOTES_DETECTED
};

} // namespace

MonitorEngine::MonitorEngine(const MonitorConfig& cfg)
    : MonitorEngine(cfg, faceEyeAspectRatio) {}

MonitorEngine::MonitorEngine(const MonitorConfig& cfg, EarFunction ear_fn)
    : cfg_(validated(cfg)),
      state_{FocusTracker(cfg.focus_lost_frames, cfg.focus_drift_fraction),
             DrowsinessTracker(cfg.drowsiness_frames, cfg.ear_threshold, std::move(ear_fn)),
             ViolationAggregator{},
             0} {}

TickReport MonitorEngine::processTick(const FrameDetections& frame) {
    TickReport report;
    report.frame_index = frame.frame_index;
    report.ts_ms = frame.ts_ms > 0 ? frame.ts_ms : now_ms();

    // frame size: caller supplied, else explicit configured fallback
    int frame_w = frame.frame_w;
    int frame_h = frame.frame_h;
    if (frame_w <= 0 || frame_h <= 0) {
        frame_w = cfg_.default_frame_width;
        frame_h = cfg_.default_frame_height;
        report.frame_size_defaulted = true;
        if (!warned_default_size_) {
            std::cerr << "[MonitorEngine] frame " << frame.frame_index << " has no size, using default "
                      << frame_w << "x" << frame_h << "\n";
            warned_default_size_ = true;
        }
    }

    std::optional<FaceDetection> main_face;
    if (!frame.faces.empty()) main_face = frame.faces.front();

    // work on a copy, commit at the end
    EngineState next = state_;

    const PresenceResult presence = classifyPresence(frame.faces);
    const ObjectResult objects = classifyObjects(frame.objects);

    ViolationFlags flags;
    flags[ViolationKind::FACE_ABSENT]    = presence.face_absent;
    flags[ViolationKind::MULTIPLE_FACES] = presence.multiple_faces;
    flags[ViolationKind::FOCUS_LOST]     = next.focus.update(main_face, frame_w, frame_h);
    flags[ViolationKind::DROWSINESS]     = next.drowsiness.update(main_face);
    flags[ViolationKind::PHONE_DETECTED] = objects.phone_detected;
    flags[ViolationKind::NOTES_DETECTED] = objects.notes_detected;

    report.transitions = next.aggregator.apply(flags, report.ts_ms, frame.frame_index);
    ++next.ticks;

    for (std::size_t i = 0; i < kViolationKindCount; ++i) {
        report.results[i] = TickResult{kTickResultOrder[i], flags[kTickResultOrder[i]]};
    }
    report.snapshot = snapshotOf(next);

    state_ = std::move(next);
    return report;
}

void MonitorEngine::reset() {
    state_.focus.reset();
    state_.drowsiness.reset();
    state_.aggregator.reset();
    state_.ticks = 0;
    warned_default_size_ = false;
}

MonitorSnapshot MonitorEngine::snapshot() const {
    return snapshotOf(state_);
}

MonitorSnapshot MonitorEngine::snapshotOf(const EngineState& st) const {
    MonitorSnapshot snap;
    for (auto kind : kAllViolationKinds) {
        const ViolationState& vs = st.aggregator.state(kind);
        snap.counts[kind] = vs.count;
        snap.active[kind] = vs.active;
    }
    snap.total = st.aggregator.total();
    snap.severity = severityFromTotal(snap.total);
    snap.ticks = st.ticks;
    return snap;
}

} // namespace proctor
