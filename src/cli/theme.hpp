#pragma once

#include <string>
#include <fmt/format.h>

namespace theme {

// ANSI escape sequences
namespace color {
    const std::string CYAN      = "\033[36m";
    const std::string RED       = "\033[91m";
    const std::string GREEN     = "\033[92m";
    const std::string YELLOW    = "\033[93m";
    const std::string BOLD      = "\033[1m";
    const std::string DIM       = "\033[2m";
    const std::string RESET     = "\033[0m";
}

// ── Layout ──────────────────────────────────────────────

inline std::string rule() {
    std::string line;
    for (int i = 0; i < 44; i++) line += "\xe2\x94\x80";  // ─
    return color::DIM + "  " + line + color::RESET + "\n";
}

// Banner: title, version, tagline, then rule
inline std::string banner(const std::string& version) {
    return
        "\n"
        + color::CYAN + color::BOLD
        + "  ForgeLoop\n"
        + color::RESET + color::DIM + "  v" + version + "\n"
        + "  Spec-Driven Development Toolkit"
        + color::RESET + "\n\n"
        + rule();
}

// Section header, blank line before and after
inline std::string section(const std::string& title) {
    return "\n" + color::CYAN + color::BOLD + "  " + title + color::RESET + "\n\n";
}

// ── Status indicators ───────────────────────────────────

inline std::string ok(const std::string& msg) {
    return color::GREEN + "    + " + color::RESET + msg + "\n";
}

inline std::string fail(const std::string& msg) {
    return color::RED + "    x " + color::RESET + msg + "\n";
}

inline std::string info(const std::string& msg) {
    return color::CYAN + "    ~ " + color::RESET + msg + "\n";
}

inline std::string step(const std::string& msg) {
    return color::YELLOW + "    > " + color::RESET + msg + "\n";
}

// Key-value row for summary panels
inline std::string kv(const std::string& key, const std::string& value) {
    return color::DIM + fmt::format("    {:<14}", key) + color::RESET + value + "\n";
}

} // namespace theme
