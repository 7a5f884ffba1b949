#pragma once

#include "../base_cli.hpp"
#include <string>
#include <vector>

// Shared helpers used by plan command files (plan_logs.cpp, plan_show.cpp)

// Split "plan-abc --redacted" into words.
std::vector<std::string> split_args(const std::string& arg);

// Print a failed Result's message with its kind and return exit code 1.
int report_error(ErrorKind kind, const std::string& error);

// Forward declarations for command handlers (used by register_plan_commands)
int do_logs(BaseCLI& cli, const std::string& arg);
int do_show(BaseCLI& cli, const std::string& arg);
int do_json_output(BaseCLI& cli, const std::string& arg);
int do_changes(BaseCLI& cli, const std::string& arg);
