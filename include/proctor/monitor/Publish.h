#pragma once
#include "Types.h"
#include <functional>
#include <utility>

namespace proctor {

using TransitionCallback = std::function<void(const TransitionEvent&)>;
using TickCallback = std::function<void(const TickReport&)>;

// Observer sink. Receives immutable copies only, after the tick has committed.
class Publisher {
public:
    void setTransitionCallback(TransitionCallback cb) { on_transition_ = std::move(cb); }
    void setTickCallback(TickCallback cb) { on_tick_ = std::move(cb); }

    void publishTransition(const TransitionEvent& ev) {
        if (on_transition_) on_transition_(ev);
    }
    void publishTick(const TickReport& report) {
        if (on_tick_) on_tick_(report);
    }

private:
    TransitionCallback on_transition_;
    TickCallback on_tick_;
};

} // namespace proctor
