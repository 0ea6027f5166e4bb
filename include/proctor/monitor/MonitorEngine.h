#pragma once
#include "Config.h"
#include "DrowsinessTracker.h"
#include "FocusTracker.h"
#include "Types.h"
#include "ViolationAggregator.h"

namespace proctor {

// All mutable per-session state. Copied, advanced, then committed as a whole.
struct EngineState {
    FocusTracker focus;
    DrowsinessTracker drowsiness;
    ViolationAggregator aggregator;
    uint64_t ticks = 0;
};

/*  @brief MonitorEngine 单帧分类与聚合
*
*   processTick():
*   - presence / objects classified from the frame
*   - primary face (faces[0]) feeds FocusTracker and DrowsinessTracker
*   - ViolationAggregator turns the six flags into edge transitions
*   - state committed all-or-nothing; the returned report is an immutable copy
*
*   @note not thread-safe: the Scheduler serializes ticks and reset()
*/
class MonitorEngine {
public:
    // Throws ConfigurationError on invalid thresholds.
    explicit MonitorEngine(const MonitorConfig& cfg);
    MonitorEngine(const MonitorConfig& cfg, EarFunction ear_fn);

    TickReport processTick(const FrameDetections& frame);

    // counts -> 0, active -> false, tracker counters -> 0
    void reset();

    MonitorSnapshot snapshot() const;

    const EngineState& state() const { return state_; }

private:
    MonitorSnapshot snapshotOf(const EngineState& st) const;

    MonitorConfig cfg_;
    EngineState state_;
    bool warned_default_size_ = false;
};

} // namespace proctor
