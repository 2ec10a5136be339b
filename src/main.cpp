#include <iostream>
#include <vector>
#include <string>
#include <fmt/format.h>
#include "cli/check_command.hpp"
#include "cli/init_command.hpp"
#include "cli/init_options.hpp"
#include "cli/theme.hpp"
#include "core/agents.hpp"
#include "core/config.hpp"
#include "core/constants.hpp"
#include "core/log.hpp"
#include "platform/terminal.hpp"

static void print_usage_line(const std::string& cmd, const std::string& arg, const std::string& desc) {
    size_t used = cmd.size() + (arg.empty() ? 0 : arg.size() + 1);
    std::cout << theme::color::CYAN << "    forgeloop " << cmd << theme::color::RESET;
    if (!arg.empty()) {
        std::cout << " " << theme::color::YELLOW << arg << theme::color::RESET;
    }
    std::cout << std::string(used < 16 ? 16 - used : 1, ' ')
              << theme::color::DIM << desc << theme::color::RESET << "\n";
}

void print_usage() {
    std::cout << theme::banner(FORGELOOP_VERSION);
    std::cout << theme::section("Usage");
    print_usage_line("init", "<name>", "Create a project from the latest template");
    print_usage_line("init", "--here", "Initialize the current directory");
    print_usage_line("check", "", "Check for git and agent CLIs");
    print_usage_line("config", "", "Show the effective configuration");
    print_usage_line("config", "init", "Write a default config file");
    std::cout << "\n";
    std::cout << theme::section("Init Options");
    std::cout << theme::kv("--ai", "Agent: " + agent_keys_joined());
    std::cout << theme::kv("--script", "Script type: sh or ps (default sh)");
    std::cout << theme::kv("--github-token", "Token for GitHub API (else GH_TOKEN / GITHUB_TOKEN)");
    std::cout << theme::kv("--force", "Merge into a non-empty directory with --here");
    std::cout << theme::kv("--no-git", "Skip git repository initialization");
    std::cout << theme::kv("--ignore-agent-tools", "Skip the agent CLI check");
    std::cout << theme::kv("--debug", "Write a debug log to " + forgeloop_log_path());
    std::cout << "\n";
    std::cout << theme::color::DIM
              << "    forgeloop --version   Show version\n"
              << "    forgeloop --help      Show this help"
              << theme::color::RESET << "\n\n";
}

static int run_config(const Config& config, const std::vector<std::string>& args) {
    if (!args.empty() && args[0] == "init") {
        if (global_config_exists()) {
            std::cout << theme::info("Config already exists: " + get_global_config_path().string());
            return 0;
        }
        auto created = create_default_global_config();
        if (created.is_err()) {
            std::cout << theme::fail(created.error);
            return 1;
        }
        std::cout << theme::ok("Wrote " + get_global_config_path().string());
        return 0;
    }
    if (!args.empty()) {
        std::cout << theme::fail("Unknown config subcommand: " + args[0]);
        return 1;
    }

    std::cout << theme::section("Configuration");
    std::cout << theme::kv("File", get_global_config_path().string()
                                   + (global_config_exists() ? "" : " (not present, defaults)"));
    std::cout << theme::kv("Repository", config.github().owner + "/" + config.github().repo);
    std::cout << theme::kv("API", config.github().api_base);
    std::cout << theme::kv("Timeout", fmt::format("{}s (connect {}s)", config.http().timeout,
                                                  config.http().connect_timeout));
    std::cout << theme::kv("User-Agent", config.http().user_agent);
    std::cout << theme::kv("Default agent", config.defaults().ai.empty() ? "(none)" : config.defaults().ai);
    std::cout << theme::kv("Script", config.defaults().script);
    std::cout << theme::kv("Refresh", fmt::format("{} ms", config.display().refresh_ms));
    std::cout << theme::kv("Debug log", config.debug() ? forgeloop_log_path() : "off");
    std::cout << "\n";
    return 0;
}

int main(int argc, char** argv) {
    try {
        if (argc == 1) {
            print_usage();
            return 0;
        }

        std::string cmd = argv[1];
        std::vector<std::string> rest(argv + 2, argv + argc);

        if (cmd == "--version") {
            std::cout << theme::color::CYAN << theme::color::BOLD << "forgeloop"
                      << theme::color::RESET << theme::color::DIM
                      << " version " << FORGELOOP_VERSION << theme::color::RESET << "\n";
            return 0;
        } else if (cmd == "--help" || cmd == "-h") {
            print_usage();
            return 0;
        }

        auto config = Config::load();
        if (config.is_err()) {
            std::cout << theme::fail(config.error);
            return 1;
        }
        set_debug_logging(config.value.debug());

        bool ansi = platform::ansi_enabled();

        if (cmd == "init") {
            auto parsed = parse_init_args(rest);
            if (parsed.is_err()) {
                std::cout << theme::fail(parsed.error);
                std::cout << theme::step("Usage: forgeloop init <name> | . | --here [--ai <agent>]");
                return 1;
            }
            if (parsed.value.debug) set_debug_logging(true);

            auto opts = resolve_init_options(parsed.value, config.value);
            if (opts.is_err()) {
                std::cout << theme::fail(opts.error);
                return 1;
            }

            std::cout << theme::banner(FORGELOOP_VERSION);
            InitCommand init(config.value, opts.value, std::cout, ansi);
            return init.run();
        } else if (cmd == "check") {
            std::cout << theme::banner(FORGELOOP_VERSION);
            CheckCommand check(config.value, std::cout, ansi);
            return check.run();
        } else if (cmd == "config") {
            return run_config(config.value, rest);
        } else {
            std::cout << theme::fail("Unknown command: " + cmd);
            print_usage();
            return 1;
        }
    } catch (const std::exception& e) {
        std::cout << theme::fail(std::string(e.what()));
        return 1;
    }
}
