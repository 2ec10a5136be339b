#pragma once

#include <string>
#include <vector>

// A coding-assistant integration a scaffolded project can be configured for.
struct AgentInfo {
    std::string key;            // CLI value for --ai, also part of the asset name
    std::string name;           // display name
    std::string folder;         // agent's config folder inside the project
    std::string install_url;    // empty for IDE-based agents
    bool requires_cli = false;  // true if a CLI tool named `key` must be on PATH
};

// Look up an agent by key. Returns nullptr if unknown.
const AgentInfo* find_agent(const std::string& key);

// All agents in catalog order.
const std::vector<AgentInfo>& all_agents();

// Comma-separated agent keys, for error messages.
std::string agent_keys_joined();

// Script flavours shipped in every release: "sh" and "ps".
bool is_valid_script_type(const std::string& script);
std::string script_type_description(const std::string& script);
