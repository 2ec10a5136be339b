#include "config.hpp"
#include "constants.hpp"
#include <platform/platform.hpp>
#include <yaml-cpp/yaml.h>
#include <fstream>

namespace fs = std::filesystem;

Config::Config() {
    github_.owner = DEFAULT_GITHUB_OWNER;
    github_.repo = DEFAULT_GITHUB_REPO;
    github_.api_base = DEFAULT_GITHUB_API_BASE;
    http_.timeout = HTTP_TIMEOUT_SECS;
    http_.connect_timeout = HTTP_CONNECT_TIMEOUT_SECS;
    http_.user_agent = HTTP_USER_AGENT;
    display_.refresh_ms = LIVE_REFRESH_MS;
}

bool global_config_exists() {
    return fs::exists(get_global_config_path());
}

fs::path get_global_config_dir() {
    return platform::home_dir() / ".forgeloop";
}

fs::path get_global_config_path() {
    return get_global_config_dir() / "config.yaml";
}

Result<void> create_default_global_config() {
    fs::path config_path = get_global_config_path();

    // Don't overwrite existing config
    if (fs::exists(config_path)) {
        return Result<void>::Ok();
    }

    std::error_code ec;
    fs::create_directories(config_path.parent_path(), ec);
    if (ec) {
        return Result<void>::Err("Failed to create " + config_path.parent_path().string()
                                 + ": " + ec.message());
    }

    const char* default_config = R"(# ForgeLoop configuration
# Every key is optional; omitted keys use the built-in defaults.

github:
  owner: "forgeloop-dev"
  repo: "forgeloop"
  api_base: "https://api.github.com"

http:
  timeout: 60                      # seconds per request
  connect_timeout: 15
  user_agent: "forgeloop-cli"

# Used when `forgeloop init` is run without --ai / --script
defaults:
  ai: ""
  script: "sh"

display:
  refresh_ms: 80                   # minimum gap between live redraws

# Write a debug log to the system temp directory
debug: false
)";

    std::ofstream out(config_path);
    if (!out) {
        return Result<void>::Err("Failed to create config file at " + config_path.string());
    }
    out << default_config;
    return Result<void>::Ok();
}

static void parse_github_config(const YAML::Node& node, GithubConfig& gh) {
    gh.owner = node["owner"].as<std::string>(gh.owner);
    gh.repo = node["repo"].as<std::string>(gh.repo);
    gh.api_base = node["api_base"].as<std::string>(gh.api_base);

    // "https://api.github.com/" and "https://api.github.com" are the same base
    while (!gh.api_base.empty() && gh.api_base.back() == '/') {
        gh.api_base.pop_back();
    }
}

static void parse_http_config(const YAML::Node& node, HttpConfig& http) {
    http.timeout = node["timeout"].as<int>(http.timeout);
    http.connect_timeout = node["connect_timeout"].as<int>(http.connect_timeout);
    http.user_agent = node["user_agent"].as<std::string>(http.user_agent);
}

static void parse_defaults(const YAML::Node& node, InitDefaults& d) {
    d.ai = node["ai"].as<std::string>(d.ai);
    d.script = node["script"].as<std::string>(d.script);
}

class ConfigBuilder {
public:
    static Result<Config> from_node(const YAML::Node& root) {
        Config config;
        if (!root || root.IsNull()) {
            return Result<Config>::Ok(config);
        }
        if (!root.IsMap()) {
            return Result<Config>::Err("Config root must be a mapping");
        }

        if (root["github"]) parse_github_config(root["github"], config.github_);
        if (root["http"]) parse_http_config(root["http"], config.http_);
        if (root["defaults"]) parse_defaults(root["defaults"], config.defaults_);
        if (root["display"]) {
            config.display_.refresh_ms = root["display"]["refresh_ms"].as<int>(config.display_.refresh_ms);
        }
        config.debug_ = root["debug"].as<bool>(false);

        if (config.defaults_.script != "sh" && config.defaults_.script != "ps") {
            return Result<Config>::Err("defaults.script must be 'sh' or 'ps', got '"
                                       + config.defaults_.script + "'");
        }
        if (config.http_.timeout <= 0 || config.http_.connect_timeout <= 0) {
            return Result<Config>::Err("http timeouts must be positive");
        }
        return Result<Config>::Ok(config);
    }
};

Result<Config> Config::parse(const std::string& yaml_text) {
    try {
        return ConfigBuilder::from_node(YAML::Load(yaml_text));
    } catch (const std::exception& e) {
        return Result<Config>::Err(std::string("Failed to parse config: ") + e.what());
    }
}

Result<Config> Config::load_from(const fs::path& path) {
    if (!fs::exists(path)) {
        return Result<Config>::Err("Config not found at " + path.string());
    }

    try {
        return ConfigBuilder::from_node(YAML::LoadFile(path.string()));
    } catch (const std::exception& e) {
        return Result<Config>::Err("Failed to parse " + path.string() + ": " + e.what());
    }
}

Result<Config> Config::load() {
    if (!global_config_exists()) {
        return Result<Config>::Ok(Config());
    }
    return load_from(get_global_config_path());
}
