#pragma once
#include "Types.h"
#include <string>
#include <vector>

namespace proctor {

// count(kind) / max(total, 1) * 100
double shareOfTotal(const MonitorSnapshot& snap, ViolationKind kind);

// active kinds in statistics order
std::vector<ViolationKind> activeAlerts(const MonitorSnapshot& snap);

// Multi-line console summary: per-kind counts and share, active alerts,
// total and risk assessment.
std::string formatStatistics(const MonitorSnapshot& snap);

} // namespace proctor
