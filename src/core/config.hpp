#pragma once

#include <string>
#include <optional>
#include <filesystem>
#include "types.hpp"

namespace fs = std::filesystem;

class Config {
public:
    // Load global config from ~/.forgeloop/config.yaml.
    // A missing file is not an error: built-in defaults are returned.
    static Result<Config> load();

    // Load from an explicit path (missing file is an error here)
    static Result<Config> load_from(const fs::path& path);

    // Parse YAML text on top of the defaults
    static Result<Config> parse(const std::string& yaml_text);

    // Accessors
    const GithubConfig& github() const { return github_; }
    const HttpConfig& http() const { return http_; }
    const InitDefaults& defaults() const { return defaults_; }
    const DisplayConfig& display() const { return display_; }
    bool debug() const { return debug_; }

public:
    Config();

private:
    GithubConfig github_;
    HttpConfig http_;
    InitDefaults defaults_;
    DisplayConfig display_;
    bool debug_ = false;

    friend class ConfigBuilder;
};

bool global_config_exists();

// Get paths
fs::path get_global_config_dir();
fs::path get_global_config_path();

// Create default global config
Result<void> create_default_global_config();
