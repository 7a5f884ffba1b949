#include "plan_status.hpp"

PlanStatus parse_plan_status(const std::string& s) {
    if (s == "created")     return PlanStatus::Created;
    if (s == "queued")      return PlanStatus::Queued;
    if (s == "pending")     return PlanStatus::Pending;
    if (s == "running")     return PlanStatus::Running;
    if (s == "mfa_waiting") return PlanStatus::MFAWaiting;
    if (s == "finished")    return PlanStatus::Finished;
    if (s == "errored")     return PlanStatus::Errored;
    if (s == "canceled")    return PlanStatus::Canceled;
    if (s == "unreachable") return PlanStatus::Unreachable;
    return PlanStatus::Unknown;
}

const char* plan_status_name(PlanStatus status) {
    switch (status) {
        case PlanStatus::Created:     return "created";
        case PlanStatus::Queued:      return "queued";
        case PlanStatus::Pending:     return "pending";
        case PlanStatus::Running:     return "running";
        case PlanStatus::MFAWaiting:  return "mfa_waiting";
        case PlanStatus::Finished:    return "finished";
        case PlanStatus::Errored:     return "errored";
        case PlanStatus::Canceled:    return "canceled";
        case PlanStatus::Unreachable: return "unreachable";
        case PlanStatus::Unknown:     break;
    }
    return "unknown";
}

bool is_terminal(PlanStatus status) {
    switch (status) {
        case PlanStatus::Finished:
        case PlanStatus::Errored:
        case PlanStatus::Canceled:
        case PlanStatus::Unreachable:
            return true;
        default:
            return false;
    }
}
