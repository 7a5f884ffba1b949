#include "plan_helpers.hpp"
#include "../planlog_cli.hpp"
#include "../theme.hpp"
#include <core/config.hpp>
#include <iostream>
#include <filesystem>

static int do_init(BaseCLI&, const std::string&) {
    auto path = get_config_path();
    if (std::filesystem::exists(path)) {
        std::cout << theme::info("Config already exists at " + path.string());
        return 0;
    }

    auto result = create_default_config();
    if (result.is_err()) return report_error(result.kind, result.error);

    std::cout << theme::ok("Wrote " + path.string());
    std::cout << theme::step("Edit 'address' to point at your run service.");
    return 0;
}

void register_setup_commands(BaseCLI& cli) {
    cli.add_command("init", do_init, "Write a default config file");
}
