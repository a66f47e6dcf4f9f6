#pragma once

#include <string>

// Reports a broken pane-tree invariant (unknown id, malformed node). Callers
// treat the operation as a no-op afterwards. Builds configured with
// TERMDECK_STRICT_INVARIANTS throw std::logic_error instead so the fault
// surfaces during development.
void reportInvariantViolation(const char* where, const std::string& detail);
