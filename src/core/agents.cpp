#include "agents.hpp"

static const std::vector<AgentInfo> AGENTS = {
    {"copilot",      "GitHub Copilot",         ".github/",    "", false},
    {"claude",       "Claude Code",            ".claude/",    "https://docs.anthropic.com/en/docs/claude-code/setup", true},
    {"gemini",       "Gemini CLI",             ".gemini/",    "https://github.com/google-gemini/gemini-cli", true},
    {"cursor-agent", "Cursor",                 ".cursor/",    "", false},
    {"qwen",         "Qwen Code",              ".qwen/",      "https://github.com/QwenLM/qwen-code", true},
    {"opencode",     "opencode",               ".opencode/",  "https://opencode.ai", true},
    {"codex",        "Codex CLI",              ".codex/",     "https://github.com/openai/codex", true},
    {"windsurf",     "Windsurf",               ".windsurf/",  "", false},
    {"kilocode",     "Kilo Code",              ".kilocode/",  "", false},
    {"auggie",       "Auggie CLI",             ".augment/",   "https://docs.augmentcode.com/cli/setup-auggie/install-auggie-cli", true},
    {"codebuddy",    "CodeBuddy",              ".codebuddy/", "https://www.codebuddy.ai/cli", true},
    {"roo",          "Roo Code",               ".roo/",       "", false},
    {"q",            "Amazon Q Developer CLI", ".amazonq/",   "https://aws.amazon.com/developer/learning/q-developer-cli/", true},
    {"amp",          "Amp",                    ".agents/",    "https://ampcode.com/manual#install", true},
    {"shai",         "SHAI",                   ".shai/",      "https://github.com/ovh/shai", true},
};

const AgentInfo* find_agent(const std::string& key) {
    for (const auto& a : AGENTS) {
        if (a.key == key) return &a;
    }
    return nullptr;
}

const std::vector<AgentInfo>& all_agents() {
    return AGENTS;
}

std::string agent_keys_joined() {
    std::string out;
    for (size_t i = 0; i < AGENTS.size(); i++) {
        if (i > 0) out += ", ";
        out += AGENTS[i].key;
    }
    return out;
}

bool is_valid_script_type(const std::string& script) {
    return script == "sh" || script == "ps";
}

std::string script_type_description(const std::string& script) {
    if (script == "sh") return "POSIX Shell (bash/zsh)";
    if (script == "ps") return "PowerShell";
    return script;
}
