#pragma once

#include <string>
#include "types.hpp"

// Server status string → PlanStatus. Unrecognised strings map to Unknown.
PlanStatus parse_plan_status(const std::string& s);

// PlanStatus → server status string ("mfa_waiting", "finished", ...).
const char* plan_status_name(PlanStatus status);

// Terminal statuses never transition further: finished, errored, canceled,
// unreachable. Unknown is treated as non-terminal.
bool is_terminal(PlanStatus status);
