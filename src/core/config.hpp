#pragma once

#include <string>
#include <filesystem>
#include "types.hpp"

namespace fs = std::filesystem;

class Config {
public:
    // Load from $PLANLOG_CONFIG, else ~/.planlog/config.yaml, then apply
    // the PLANLOG_ADDRESS environment override.
    static Result<Config> load();

    // Load a specific YAML file (no environment overrides).
    static Result<Config> load_file(const fs::path& path);

    // Parse YAML text directly.
    static Result<Config> parse(const std::string& yaml_text);

    // Configuration with built-in defaults and the given address.
    static Config with_address(const std::string& address);

    const ClientConfig& client() const { return client_; }

    // Full URL for an API path relative to base_path, e.g. "plans/plan-1".
    std::string api_url(const std::string& relative) const;

    Config();

private:
    static Result<Config> from_client(ClientConfig client);
    Result<void> validate() const;

    ClientConfig client_;
};

// Get paths
fs::path get_config_dir();
fs::path get_config_path();

// Create a commented default config if none exists.
Result<void> create_default_config();
