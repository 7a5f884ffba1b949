#include "plans.hpp"
#include "json_api.hpp"
#include "url.hpp"
#include <core/constants.hpp>
#include <core/log.hpp>
#include <core/utils.hpp>
#include <stream/completion_oracle.hpp>
#include <fmt/format.h>

static Result<void> check_plan_id(const std::string& plan_id) {
    if (!valid_string_id(plan_id)) {
        return Result<void>::Err(ErrorKind::InvalidIdentifier,
                                 fmt::format("invalid value for plan ID: '{}'", plan_id));
    }
    return Result<void>::Ok();
}

Plans::Plans(Transport& transport, const Config& config)
    : transport_(transport), config_(config) {}

Result<std::string> Plans::get_plan_path(const char* path_template, const std::string& plan_id,
                                         const CancelToken& cancel) {
    auto valid = check_plan_id(plan_id);
    if (valid.is_err()) return Result<std::string>::Err(valid);

    std::string url = config_.api_url(fmt::format(fmt::runtime(path_template), query_escape(plan_id)));
    return transport_.get(url, cancel);
}

Result<Plan> Plans::read(const std::string& plan_id, const CancelToken& cancel) {
    auto body = get_plan_path(PLAN_PATH, plan_id, cancel);
    if (body.is_err()) return Result<Plan>::Err(body);
    return decode_plan(body.value);
}

Result<std::unique_ptr<LogReader>> Plans::logs(const std::string& plan_id, const CancelToken& cancel) {
    using ReaderResult = Result<std::unique_ptr<LogReader>>;

    auto valid = check_plan_id(plan_id);
    if (valid.is_err()) return ReaderResult::Err(valid);

    // Get the plan to make sure it exists.
    auto plan = read(plan_id, cancel);
    if (plan.is_err()) return ReaderResult::Err(plan);

    if (plan.value.log_read_url.empty()) {
        return ReaderResult::Err(ErrorKind::MissingLogLocation,
                                 fmt::format("plan {} does not have a log URL", plan_id));
    }

    auto url = parse_url(plan.value.log_read_url);
    if (url.is_err()) {
        return ReaderResult::Err(ErrorKind::InvalidLogUrl, "invalid log URL: " + url.error);
    }

    planlog_log(fmt::format("plans: streaming log for {} ({}) from {}",
                            plan.value.id, plan.value.raw_status, url.value.to_string()));

    auto oracle = std::make_unique<PlanCompletionOracle>(*this, plan.value.id, cancel);
    auto reader = std::make_unique<LogReader>(transport_, url.value, std::move(oracle),
                                              config_.client().poll, cancel);
    return ReaderResult::Ok(std::move(reader));
}

Result<std::string> Plans::read_json_output(const std::string& plan_id, const CancelToken& cancel) {
    return get_plan_path(PLAN_JSON_OUTPUT_PATH, plan_id, cancel);
}

Result<std::string> Plans::read_json_output_redacted(const std::string& plan_id,
                                                     const CancelToken& cancel) {
    return get_plan_path(PLAN_JSON_REDACTED_PATH, plan_id, cancel);
}

Result<std::vector<ResourceChange>> Plans::read_resource_changes(const std::string& plan_id,
                                                                 const CancelToken& cancel) {
    auto body = read_json_output_redacted(plan_id, cancel);
    if (body.is_err()) return Result<std::vector<ResourceChange>>::Err(body);
    return decode_resource_changes(body.value);
}
