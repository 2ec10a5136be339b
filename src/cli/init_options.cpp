#include "init_options.hpp"
#include <core/agents.hpp>
#include <fmt/format.h>

// Split "--ai=claude" into ("--ai", "claude")
static std::pair<std::string, std::optional<std::string>> split_flag(const std::string& arg) {
    auto eq = arg.find('=');
    if (arg.rfind("--", 0) != 0 || eq == std::string::npos) return {arg, std::nullopt};
    return {arg.substr(0, eq), arg.substr(eq + 1)};
}

Result<InitOptions> parse_init_args(const std::vector<std::string>& args) {
    InitOptions opts;
    std::vector<std::string> positional;

    for (size_t i = 0; i < args.size(); i++) {
        auto split = split_flag(args[i]);
        const std::string flag = split.first;
        const std::optional<std::string> inline_value = split.second;

        auto take_value = [&](std::string& out) -> bool {
            if (inline_value) {
                out = *inline_value;
                return true;
            }
            if (i + 1 >= args.size()) return false;
            out = args[++i];
            return true;
        };

        if (flag == "--ai" || flag == "--script" || flag == "--github-token") {
            std::string value;
            if (!take_value(value)) {
                return Result<InitOptions>::Err("Missing value for " + flag);
            }
            if (flag == "--ai") opts.ai = value;
            else if (flag == "--script") opts.script = value;
            else opts.github_token = value;
        } else if (flag == "--here") {
            opts.here = true;
        } else if (flag == "--ignore-agent-tools") {
            opts.ignore_agent_tools = true;
        } else if (flag == "--no-git") {
            opts.no_git = true;
        } else if (flag == "--force") {
            opts.force = true;
        } else if (flag == "--debug") {
            opts.debug = true;
        } else if (flag.rfind("--", 0) == 0) {
            return Result<InitOptions>::Err("Unknown option: " + flag);
        } else {
            positional.push_back(args[i]);
        }
    }

    if (positional.size() > 1) {
        return Result<InitOptions>::Err("Expected one project name, got " + std::to_string(positional.size()));
    }

    if (!positional.empty()) {
        if (positional[0] == ".") {
            if (opts.here) {
                return Result<InitOptions>::Err("Use either '.' or --here, not both");
            }
            opts.here = true;
        } else if (opts.here) {
            return Result<InitOptions>::Err("Cannot specify both a project name and --here");
        } else {
            opts.project_name = positional[0];
        }
    }

    if (!opts.here && opts.project_name.empty()) {
        return Result<InitOptions>::Err("Must specify a project name, '.' or --here");
    }
    if (opts.project_name.find('/') != std::string::npos || opts.project_name == "..") {
        return Result<InitOptions>::Err("Project name must be a single directory name: " + opts.project_name);
    }

    return Result<InitOptions>::Ok(opts);
}

Result<InitOptions> resolve_init_options(InitOptions opts, const Config& config) {
    if (opts.ai.empty()) opts.ai = config.defaults().ai;
    if (opts.script.empty()) opts.script = config.defaults().script;

    if (opts.ai.empty()) {
        return Result<InitOptions>::Err("No agent selected. Pass --ai <agent> (one of: "
                                        + agent_keys_joined() + ")");
    }
    if (!find_agent(opts.ai)) {
        return Result<InitOptions>::Err(fmt::format("Unknown agent '{}'. Choose one of: {}",
                                                    opts.ai, agent_keys_joined()));
    }
    if (!is_valid_script_type(opts.script)) {
        return Result<InitOptions>::Err(fmt::format("Invalid script type '{}'. Choose 'sh' or 'ps'",
                                                    opts.script));
    }
    return Result<InitOptions>::Ok(opts);
}
