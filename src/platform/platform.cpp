#include "platform.hpp"
#include <cstdlib>
#include <ctime>
#include <random>
#include <sstream>

#ifdef _WIN32
#  ifndef WIN32_LEAN_AND_MEAN
#    define WIN32_LEAN_AND_MEAN
#  endif
#  include <windows.h>
#else
#  include <unistd.h>
#endif

namespace fs = std::filesystem;

namespace platform {

fs::path home_dir() {
#ifdef _WIN32
    const char* home = std::getenv("USERPROFILE");
    if (!home) home = std::getenv("HOME");
#else
    const char* home = std::getenv("HOME");
#endif
    if (!home) return temp_dir();
    return fs::path(home);
}

fs::path temp_dir() {
    return fs::temp_directory_path();
}

fs::path temp_file(const std::string& prefix, const std::string& suffix) {
    static std::mt19937 rng(static_cast<unsigned>(std::time(nullptr)) ^ std::random_device{}());
    std::uniform_int_distribution<int> dist(100000, 999999);
    fs::path p;
    do {
        p = temp_dir() / (prefix + "_" + std::to_string(dist(rng)) + suffix);
    } while (fs::exists(p));
    return p;
}

std::optional<std::string> get_env(const std::string& name) {
    const char* v = std::getenv(name.c_str());
    if (!v || !*v) return std::nullopt;
    return std::string(v);
}

std::optional<fs::path> find_executable(const std::string& name) {
    auto path_var = get_env("PATH");
    if (!path_var) return std::nullopt;

#ifdef _WIN32
    const char sep = ';';
    const char* exts[] = {".exe", ".cmd", ".bat", ""};
#else
    const char sep = ':';
    const char* exts[] = {""};
#endif

    std::istringstream ss(*path_var);
    std::string dir;
    while (std::getline(ss, dir, sep)) {
        if (dir.empty()) continue;
        for (const char* ext : exts) {
            fs::path candidate = fs::path(dir) / (name + ext);
            std::error_code ec;
            if (!fs::is_regular_file(candidate, ec)) continue;
#ifndef _WIN32
            if (access(candidate.c_str(), X_OK) != 0) continue;
#endif
            return candidate;
        }
    }
    return std::nullopt;
}

void make_executable(const fs::path& path) {
#ifndef _WIN32
    auto perms = fs::status(path).permissions();
    auto add = fs::perms::none;
    if ((perms & fs::perms::owner_read) != fs::perms::none)  add |= fs::perms::owner_exec;
    if ((perms & fs::perms::group_read) != fs::perms::none)  add |= fs::perms::group_exec;
    if ((perms & fs::perms::others_read) != fs::perms::none) add |= fs::perms::others_exec;
    fs::permissions(path, add, fs::perm_options::add);
#else
    (void)path;
#endif
}

} // namespace platform
