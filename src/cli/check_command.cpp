#include "check_command.hpp"
#include "theme.hpp"
#include <core/agents.hpp>
#include <core/log.hpp>
#include <platform/platform.hpp>
#include <progress/live_display.hpp>
#include <fmt/format.h>

CheckCommand::CheckCommand(const Config& config, std::ostream& out, bool ansi)
    : config_(config), out_(out), ansi_(ansi), tracker_("Check Available Tools") {}

int CheckCommand::run() {
    out_ << theme::section("Tools");

    std::vector<const AgentInfo*> cli_agents;
    for (const auto& agent : all_agents()) {
        if (agent.requires_cli) cli_agents.push_back(&agent);
    }

    int missing_agents = 0;
    bool have_git = false;
    {
        LiveDisplay display(tracker_, out_, ansi_, config_.display().refresh_ms);

        tracker_.add("git", "Git version control");
        for (const auto* agent : cli_agents) {
            tracker_.add(agent->key, agent->name);
        }

        tracker_.start("git");
        auto git = platform::find_executable("git");
        have_git = git.has_value();
        if (have_git) {
            tracker_.complete("git", "available");
        } else {
            tracker_.skip("git", "not found");
        }

        for (const auto* agent : cli_agents) {
            tracker_.start(agent->key);
            auto path = platform::find_executable(agent->key);
            forgeloop_logf("check {}: {}", agent->key, path ? path->string() : "missing");
            if (path) {
                tracker_.complete(agent->key, "available");
            } else {
                tracker_.skip(agent->key, "not found");
                missing_agents++;
            }
        }
        display.finish();
    }

    out_ << "\n";
    if (!have_git) {
        out_ << theme::info("Install git for repository management");
    }
    if (missing_agents == static_cast<int>(cli_agents.size())) {
        out_ << theme::info("No agent CLI found; IDE-based agents still work with --ignore-agent-tools");
    }
    out_ << theme::ok("ForgeLoop CLI is ready to use") << "\n";
    return 0;
}
