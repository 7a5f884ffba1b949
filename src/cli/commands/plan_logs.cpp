#include "plan_helpers.hpp"
#include "../theme.hpp"
#include <core/constants.hpp>
#include <platform/interrupt.hpp>
#include <iostream>
#include <fmt/format.h>

int do_logs(BaseCLI& cli, const std::string& arg) {
    auto args = split_args(arg);
    if (args.size() != 1) {
        std::cerr << theme::fail("Usage: planlog logs <plan-id>");
        return 1;
    }
    if (!cli.require_client()) return 1;

    const std::string& plan_id = args[0];
    platform::InterruptGuard interrupt(cli.cancel);

    auto reader = cli.plans->logs(plan_id, cli.cancel);
    if (reader.is_err()) return report_error(reader.kind, reader.error);

    auto drained = reader.value->drain([](const char* data, std::size_t len) {
        std::cout.write(data, static_cast<std::streamsize>(len));
        std::cout.flush();
    }, cli.config->client().chunk_size);

    if (drained.is_err()) {
        if (drained.kind == ErrorKind::Canceled) {
            std::cerr << "\n" << theme::info("Interrupted. The plan keeps running remotely.");
            return 130;
        }
        return report_error(drained.kind, drained.error);
    }

    // Final status for the summary line; failure here doesn't affect the log.
    auto plan = cli.plans->read(plan_id, cli.cancel);
    if (plan.is_ok()) {
        std::cerr << theme::ok(fmt::format("Plan {} {} ({} bytes of log)", plan_id,
                                           theme::status(plan.value.status, plan.value.raw_status),
                                           drained.value));
    }
    return 0;
}
