#include "base_cli.hpp"
#include "theme.hpp"
#include <iostream>
#include <vector>
#include <fmt/format.h>

BaseCLI::BaseCLI() {
    auto config_result = Config::load();
    if (config_result.is_ok()) {
        config = config_result.value;
    } else {
        config_error = config_result.error;
    }
}

void BaseCLI::add_command(const std::string& name,
                         CommandHandler handler,
                         const std::string& help) {
    commands_[name] = {handler, help};
}

bool BaseCLI::require_client() {
    if (!config.has_value()) {
        std::cerr << theme::fail(config_error.empty() ? "Not configured." : config_error);
        std::cerr << theme::step("Run 'planlog init' or set PLANLOG_ADDRESS.");
        return false;
    }
    if (!plans) {
        transport = std::make_unique<HttpClient>(config->client().timeouts);
        plans = std::make_unique<Plans>(*transport, config.value());
    }
    return true;
}

bool BaseCLI::has_command(const std::string& command) const {
    return commands_.count(command) > 0;
}

int BaseCLI::execute_command(const std::string& command, const std::string& args) {
    auto it = commands_.find(command);
    if (it == commands_.end()) {
        std::cerr << theme::fail("Unknown command: " + command);
        std::cerr << theme::step("Run 'planlog help' for available commands.");
        return 1;
    }

    try {
        return it->second.first(*this, args);
    } catch (const std::exception& e) {
        std::cerr << theme::fail(std::string(e.what()));
        return 1;
    }
}

void BaseCLI::print_help() const {
    std::vector<std::pair<std::string, std::vector<std::string>>> categories = {
        {"Plans",   {"logs", "show", "json-output", "changes"}},
        {"Setup",   {"init"}},
        {"General", {"help"}},
    };

    for (const auto& [cat_name, cmd_names] : categories) {
        std::cout << "\n" << theme::color::BROWN << theme::color::BOLD
                  << "  " << cat_name << theme::color::RESET << "\n";

        for (const auto& name : cmd_names) {
            auto it = commands_.find(name);
            if (it != commands_.end()) {
                std::cout << theme::color::BLUE
                          << fmt::format("    {:<14}", name)
                          << theme::color::RESET
                          << theme::color::DIM
                          << it->second.second
                          << theme::color::RESET << "\n";
            }
        }
    }
    std::cout << "\n";
}
