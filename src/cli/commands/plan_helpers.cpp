#include "plan_helpers.hpp"
#include "../theme.hpp"
#include <iostream>
#include <sstream>
#include <fmt/format.h>

std::vector<std::string> split_args(const std::string& arg) {
    std::vector<std::string> out;
    std::istringstream iss(arg);
    std::string word;
    while (iss >> word) out.push_back(word);
    return out;
}

int report_error(ErrorKind kind, const std::string& error) {
    std::cerr << theme::fail(fmt::format("{} ({})", error, error_kind_name(kind)));
    return 1;
}

void register_plan_commands(BaseCLI& cli) {
    cli.add_command("logs", do_logs, "Stream a plan's log until it finishes");
    cli.add_command("show", do_show, "Show a plan's status and resource counts");
    cli.add_command("json-output", do_json_output,
                    "Print the JSON execution plan (--redacted for the redacted form)");
    cli.add_command("changes", do_changes, "List the resource changes a plan proposes");
}
