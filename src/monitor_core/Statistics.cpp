#include "proctor/monitor/Statistics.h"
#include "proctor/monitor/Severity.h"

#include <algorithm>
#include <iomanip>
#include <sstream>

namespace proctor {

static int countOf(const MonitorSnapshot& snap, ViolationKind kind) {
    auto it = snap.counts.find(kind);
    return it == snap.counts.end() ? 0 : it->second;
}

double shareOfTotal(const MonitorSnapshot& snap, ViolationKind kind) {
    const int denom = std::max(snap.total, 1);
    return std::min(100.0, countOf(snap, kind) * 100.0 / denom);
}

std::vector<ViolationKind> activeAlerts(const MonitorSnapshot& snap) {
    std::vector<ViolationKind> out;
    for (auto k : kAllViolationKinds) {
        auto it = snap.active.find(k);
        if (it != snap.active.end() && it->second) out.push_back(k);
    }
    return out;
}

std::string formatStatistics(const MonitorSnapshot& snap) {
    std::ostringstream oss;
    oss << "==================== Detection Statistics ====================\n";
    for (auto k : kAllViolationKinds) {
        const int c = countOf(snap, k);
        oss << "  " << std::left << std::setw(16) << toLabel(k)
            << std::right << std::setw(5) << c << " violations";
        if (c > 0) oss << "  (" << std::fixed << std::setprecision(1) << shareOfTotal(snap, k) << "% of total)";
        else       oss << "  (No violations detected)";
        oss << "\n";
    }

    oss << "--------------------------------------------------------------\n";
    auto alerts = activeAlerts(snap);
    if (alerts.empty()) {
        oss << "  Active alerts: none\n";
    } else {
        for (auto k : alerts) oss << "  Active alert: " << toLabel(k) << "\n";
    }
    oss << "  Total violations: " << snap.total << " (" << snap.ticks << " ticks)\n";
    oss << "  Risk assessment:  " << toString(snap.severity) << " - " << severityDescription(snap.severity) << "\n";
    return oss.str();
}

} // namespace proctor
