#include "plan_helpers.hpp"
#include "../theme.hpp"
#include <iostream>
#include <fmt/format.h>

int do_show(BaseCLI& cli, const std::string& arg) {
    auto args = split_args(arg);
    if (args.size() != 1) {
        std::cerr << theme::fail("Usage: planlog show <plan-id>");
        return 1;
    }
    if (!cli.require_client()) return 1;

    auto result = cli.plans->read(args[0], cli.cancel);
    if (result.is_err()) return report_error(result.kind, result.error);
    const Plan& p = result.value;

    std::cout << theme::section("Plan " + p.id);
    std::cout << theme::kv("status", theme::status(p.status, p.raw_status));
    std::cout << theme::kv("has changes", p.has_changes ? "yes" : "no");
    std::cout << theme::kv("resources",
                           fmt::format("+{} ~{} -{} ({} imported)",
                                       p.resource_additions, p.resource_changes,
                                       p.resource_destructions, p.resource_imports));
    if (p.generated_configuration) {
        std::cout << theme::kv("generated", "configuration was generated");
    }
    std::cout << theme::kv("log", p.log_read_url.empty() ? theme::dim("none") : p.log_read_url);

    if (p.status_timestamps) {
        const auto& ts = *p.status_timestamps;
        if (!ts.queued_at.empty())   std::cout << theme::kv("queued", ts.queued_at);
        if (!ts.started_at.empty())  std::cout << theme::kv("started", ts.started_at);
        if (!ts.finished_at.empty()) std::cout << theme::kv("finished", ts.finished_at);
        if (!ts.errored_at.empty())  std::cout << theme::kv("errored", ts.errored_at);
        if (!ts.canceled_at.empty()) std::cout << theme::kv("canceled", ts.canceled_at);
        if (!ts.force_canceled_at.empty()) {
            std::cout << theme::kv("force canceled", ts.force_canceled_at);
        }
    }
    std::cout << "\n";
    return 0;
}

int do_json_output(BaseCLI& cli, const std::string& arg) {
    auto args = split_args(arg);
    bool redacted = false;
    std::string plan_id;
    for (const auto& a : args) {
        if (a == "--redacted") {
            redacted = true;
        } else if (plan_id.empty()) {
            plan_id = a;
        } else {
            plan_id.clear();
            break;
        }
    }
    if (plan_id.empty()) {
        std::cerr << theme::fail("Usage: planlog json-output <plan-id> [--redacted]");
        return 1;
    }
    if (!cli.require_client()) return 1;

    auto result = redacted ? cli.plans->read_json_output_redacted(plan_id, cli.cancel)
                           : cli.plans->read_json_output(plan_id, cli.cancel);
    if (result.is_err()) return report_error(result.kind, result.error);

    std::cout << result.value;
    if (!result.value.empty() && result.value.back() != '\n') std::cout << "\n";
    return 0;
}

int do_changes(BaseCLI& cli, const std::string& arg) {
    auto args = split_args(arg);
    if (args.size() != 1) {
        std::cerr << theme::fail("Usage: planlog changes <plan-id>");
        return 1;
    }
    if (!cli.require_client()) return 1;

    auto result = cli.plans->read_resource_changes(args[0], cli.cancel);
    if (result.is_err()) return report_error(result.kind, result.error);

    std::cout << theme::section("Changes in " + args[0]);
    if (result.value.empty()) {
        std::cout << theme::info("No resource changes");
        return 0;
    }
    for (const auto& rc : result.value) {
        std::string actions;
        for (const auto& a : rc.actions) {
            if (!actions.empty()) actions += ",";
            actions += a;
        }
        std::cout << theme::kv(actions.empty() ? "-" : actions, rc.address);
    }
    std::cout << "\n";
    return 0;
}
