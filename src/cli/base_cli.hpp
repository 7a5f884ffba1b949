#pragma once

#include <string>
#include <map>
#include <memory>
#include <functional>
#include <optional>
#include <core/config.hpp>
#include <core/cancel_token.hpp>
#include <api/http_client.hpp>
#include <api/plans.hpp>

class BaseCLI {
public:
    BaseCLI();
    virtual ~BaseCLI() = default;

    // Handlers return the process exit code.
    using CommandHandler = std::function<int(BaseCLI&, const std::string&)>;

    void add_command(const std::string& name,
                    CommandHandler handler,
                    const std::string& help);

    // Ensure config is loaded and the API client is built. Prints the
    // reason and returns false otherwise.
    bool require_client();

    int execute_command(const std::string& command, const std::string& args = "");
    bool has_command(const std::string& command) const;
    void print_help() const;

    // Public state
    std::optional<Config> config;
    std::string config_error;
    std::unique_ptr<HttpClient> transport;
    std::unique_ptr<Plans> plans;
    CancelToken cancel;

protected:
    std::map<std::string, std::pair<CommandHandler, std::string>> commands_;
};
