#include "proctor/monitor/ViolationAggregator.h"

namespace proctor {

std::vector<TransitionEvent> ViolationAggregator::apply(const ViolationFlags& flags,
                                                        int64_t ts_ms,
                                                        int64_t frame_index) {
    std::vector<TransitionEvent> out;
    for (auto kind : kAllViolationKinds) {
        ViolationState& st = states_[indexOf(kind)];
        const bool now_active = flags[kind];
        if (now_active == st.active) continue;

        if (now_active) ++st.count;   // rising edge only
        st.active = now_active;

        TransitionEvent ev;
        ev.kind = kind;
        ev.active = now_active;
        ev.ts_ms = ts_ms;
        ev.frame_index = frame_index;
        ev.count = st.count;
        out.push_back(ev);
    }
    return out;
}

void ViolationAggregator::reset() {
    states_.fill(ViolationState{});
}

int ViolationAggregator::total() const {
    int t = 0;
    for (const auto& st : states_) t += st.count;
    return t;
}

} // namespace proctor
