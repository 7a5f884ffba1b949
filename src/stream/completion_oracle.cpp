#include "completion_oracle.hpp"
#include <api/plans.hpp>
#include <core/log.hpp>
#include <core/plan_status.hpp>
#include <fmt/format.h>

PlanCompletionOracle::PlanCompletionOracle(Plans& plans, std::string plan_id, CancelToken cancel)
    : plans_(plans), plan_id_(std::move(plan_id)), cancel_(std::move(cancel)) {}

Result<bool> PlanCompletionOracle::is_done() {
    auto plan = plans_.read(plan_id_, cancel_);
    if (plan.is_err()) {
        planlog_log(fmt::format("oracle: status fetch for {} failed: {}", plan_id_, plan.error));
        return Result<bool>::Err(plan);
    }

    bool done = is_terminal(plan.value.status);
    planlog_log(fmt::format("oracle: plan {} is {}{}", plan_id_, plan.value.raw_status,
                            done ? " (terminal)" : ""));
    return Result<bool>::Ok(done);
}
