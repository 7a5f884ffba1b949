#include "config.hpp"
#include "constants.hpp"
#include <platform/platform.hpp>
#include <yaml-cpp/yaml.h>
#include <fstream>
#include <iterator>
#include <cstdlib>

namespace fs = std::filesystem;

static ClientConfig default_client_config() {
    ClientConfig c;
    c.address = "";
    c.base_path = DEFAULT_BASE_PATH;
    c.poll = PollConfig{LOG_POLL_MIN_MS, LOG_POLL_MAX_MS};
    c.chunk_size = LOG_CHUNK_SIZE;
    c.timeouts = TimeoutConfig{HTTP_CONNECT_TIMEOUT_SECS, HTTP_REQUEST_TIMEOUT_SECS};
    return c;
}

// Normalise to "/segment/.../" so api_url() can append relative paths.
static std::string normalise_base_path(std::string base) {
    if (base.empty() || base[0] != '/') base = "/" + base;
    if (base.back() != '/') base += "/";
    return base;
}

static std::string strip_trailing_slashes(std::string s) {
    while (!s.empty() && s.back() == '/') s.pop_back();
    return s;
}

Config::Config() : client_(default_client_config()) {}

Config Config::with_address(const std::string& address) {
    Config config;
    config.client_.address = strip_trailing_slashes(address);
    return config;
}

std::string Config::api_url(const std::string& relative) const {
    return client_.address + client_.base_path + relative;
}

fs::path get_config_dir() {
    return platform::home_dir() / CONFIG_DIR_NAME;
}

fs::path get_config_path() {
    const char* override_path = std::getenv("PLANLOG_CONFIG");
    if (override_path && *override_path) {
        return fs::path(override_path);
    }
    return get_config_dir() / CONFIG_FILE_NAME;
}

Result<void> create_default_config() {
    fs::path config_path = get_config_path();

    // Don't overwrite existing config
    if (fs::exists(config_path)) {
        return Result<void>::Ok();
    }

    std::error_code ec;
    fs::create_directories(config_path.parent_path(), ec);
    if (ec) {
        return Result<void>::Err(ErrorKind::Config,
                                 "Failed to create " + config_path.parent_path().string() +
                                 ": " + ec.message());
    }

    const char* default_config = R"(# planlog configuration

# Run service endpoint (http:// or https://)
address: "https://app.terraform.io"
base_path: "/api/v2/"

# Backoff between polls while a plan is running and its log is quiet
poll:
  min_ms: 500
  max_ms: 2000

# Bytes requested per log fetch
chunk_size: 65536

timeouts:
  connect_secs: 10
  request_secs: 30
)";

    std::ofstream out(config_path);
    if (!out) {
        return Result<void>::Err(ErrorKind::Config,
                                 "Failed to create config file at " + config_path.string());
    }
    out << default_config;
    return Result<void>::Ok();
}

static ClientConfig parse_client_config(const YAML::Node& root) {
    ClientConfig c = default_client_config();
    c.address = strip_trailing_slashes(root["address"].as<std::string>(""));
    c.base_path = normalise_base_path(root["base_path"].as<std::string>(DEFAULT_BASE_PATH));

    if (root["poll"] && root["poll"].IsMap()) {
        c.poll.min_ms = root["poll"]["min_ms"].as<int>(LOG_POLL_MIN_MS);
        c.poll.max_ms = root["poll"]["max_ms"].as<int>(LOG_POLL_MAX_MS);
    }

    if (root["chunk_size"] && root["chunk_size"].IsScalar()) {
        long long size = root["chunk_size"].as<long long>(static_cast<long long>(LOG_CHUNK_SIZE));
        c.chunk_size = size > 0 ? static_cast<std::size_t>(size) : 0;
    }

    if (root["timeouts"] && root["timeouts"].IsMap()) {
        c.timeouts.connect_secs = root["timeouts"]["connect_secs"].as<int>(HTTP_CONNECT_TIMEOUT_SECS);
        c.timeouts.request_secs = root["timeouts"]["request_secs"].as<int>(HTTP_REQUEST_TIMEOUT_SECS);
    }

    return c;
}

Result<void> Config::validate() const {
    if (client_.address.empty()) {
        return Result<void>::Err(ErrorKind::Config, "address is not set");
    }
    if (client_.address.rfind("http://", 0) != 0 && client_.address.rfind("https://", 0) != 0) {
        return Result<void>::Err(ErrorKind::Config,
                                 "address must start with http:// or https:// (got " +
                                 client_.address + ")");
    }
    if (client_.poll.min_ms <= 0 || client_.poll.max_ms <= 0) {
        return Result<void>::Err(ErrorKind::Config, "poll intervals must be positive");
    }
    if (client_.poll.min_ms > client_.poll.max_ms) {
        return Result<void>::Err(ErrorKind::Config, "poll.min_ms exceeds poll.max_ms");
    }
    if (client_.chunk_size == 0) {
        return Result<void>::Err(ErrorKind::Config, "chunk_size must be positive");
    }
    if (client_.timeouts.connect_secs <= 0 || client_.timeouts.request_secs <= 0) {
        return Result<void>::Err(ErrorKind::Config, "timeouts must be positive");
    }
    return Result<void>::Ok();
}

// Parse YAML text into a ClientConfig without validating it. load() applies
// the environment address before validation so a file without one still loads.
static Result<ClientConfig> parse_yaml(const std::string& yaml_text) {
    try {
        YAML::Node root = YAML::Load(yaml_text);
        if (!root || root.IsNull()) {
            return Result<ClientConfig>::Ok(default_client_config());
        }
        if (!root.IsMap()) {
            return Result<ClientConfig>::Err(ErrorKind::Config, "config root must be a mapping");
        }
        return Result<ClientConfig>::Ok(parse_client_config(root));
    } catch (const std::exception& e) {
        return Result<ClientConfig>::Err(ErrorKind::Config,
                                         std::string("Failed to parse config: ") + e.what());
    }
}

Result<Config> Config::from_client(ClientConfig client) {
    Config config;
    config.client_ = std::move(client);
    auto valid = config.validate();
    if (valid.is_err()) {
        return Result<Config>::Err(valid);
    }
    return Result<Config>::Ok(config);
}

Result<Config> Config::parse(const std::string& yaml_text) {
    auto parsed = parse_yaml(yaml_text);
    if (parsed.is_err()) return Result<Config>::Err(parsed);
    return from_client(parsed.value);
}

static Result<std::string> read_text(const fs::path& path) {
    std::ifstream in(path);
    if (!in) {
        return Result<std::string>::Err(ErrorKind::Config, "Cannot read " + path.string());
    }
    std::string text((std::istreambuf_iterator<char>(in)),
                     std::istreambuf_iterator<char>());
    return Result<std::string>::Ok(text);
}

Result<Config> Config::load_file(const fs::path& path) {
    if (!fs::exists(path)) {
        return Result<Config>::Err(ErrorKind::Config, "Config not found at " + path.string());
    }
    auto text = read_text(path);
    if (text.is_err()) return Result<Config>::Err(text);
    return parse(text.value);
}

Result<Config> Config::load() {
    const char* env_address = std::getenv("PLANLOG_ADDRESS");
    bool has_env_address = env_address && *env_address;
    fs::path path = get_config_path();

    ClientConfig client = default_client_config();
    if (fs::exists(path)) {
        auto text = read_text(path);
        if (text.is_err()) return Result<Config>::Err(text);
        auto parsed = parse_yaml(text.value);
        if (parsed.is_err()) return Result<Config>::Err(parsed);
        client = parsed.value;
    } else if (!has_env_address) {
        return Result<Config>::Err(ErrorKind::Config,
                                   "Config not found at " + path.string() +
                                   " (set PLANLOG_ADDRESS or create the file)");
    }

    if (has_env_address) {
        client.address = strip_trailing_slashes(env_address);
    }
    return from_client(client);
}
