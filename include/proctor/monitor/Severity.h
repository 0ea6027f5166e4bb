#pragma once
#include "Enums.h"
#include <string>

namespace proctor {

// Inclusive lower bounds, evaluated highest first:
// >=20 Critical, >=15 High Risk, >=8 Medium Risk, >=3 Low Risk, else Normal.
Severity severityFromTotal(int total);

// "Immediate intervention required", ... "All systems normal"
std::string severityDescription(Severity s);

} // namespace proctor
