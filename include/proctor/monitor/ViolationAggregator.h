#pragma once
#include "Types.h"
#include <array>
#include <vector>

namespace proctor {

// Raw per-tick classifier outputs, one flag per ViolationKind.
struct ViolationFlags {
    std::array<bool, kViolationKindCount> values{};

    bool& operator[](ViolationKind k) { return values[indexOf(k)]; }
    bool operator[](ViolationKind k) const { return values[indexOf(k)]; }
};

/*  ViolationAggregator 违规聚合
*
*   Edge-triggered fusion point. For every kind:
*   - false -> true : count + 1, transition {kind, true}
*   - true -> false : transition {kind, false}, count unchanged
*   - unchanged     : nothing
*
*   count never decreases except on reset().
*/
class ViolationAggregator {
public:
    // Applies one tick; returns the transitions in kAllViolationKinds order.
    std::vector<TransitionEvent> apply(const ViolationFlags& flags, int64_t ts_ms, int64_t frame_index = -1);

    void reset();

    const ViolationState& state(ViolationKind k) const { return states_[indexOf(k)]; }
    int total() const;

private:
    std::array<ViolationState, kViolationKindCount> states_{};
};

} // namespace proctor
