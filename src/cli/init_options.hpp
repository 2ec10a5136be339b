#pragma once

#include <filesystem>
#include <optional>
#include <string>
#include <vector>
#include <core/config.hpp>
#include <core/types.hpp>

namespace fs = std::filesystem;

struct InitOptions {
    std::string project_name;                 // empty with --here / "."
    bool here = false;
    std::string ai;                           // agent key
    std::string script;                       // "sh" or "ps"
    std::optional<std::string> github_token;
    bool ignore_agent_tools = false;
    bool no_git = false;
    bool force = false;                       // allow --here into a non-empty directory
    bool debug = false;
    fs::path base_dir = fs::current_path();   // where <project_name> is created

    fs::path target_dir() const {
        return here ? base_dir : base_dir / project_name;
    }
};

// Parse the arguments after "init". Accepts "--opt value" and "--opt=value".
Result<InitOptions> parse_init_args(const std::vector<std::string>& args);

// Fill --ai / --script from config defaults and validate both against the
// agent catalog.
Result<InitOptions> resolve_init_options(InitOptions opts, const Config& config);
