#pragma once

#include <string>
#include <optional>
#include <filesystem>

namespace platform {

// Returns the user's home directory (HOME on Unix, USERPROFILE on Windows).
std::filesystem::path home_dir();

// Returns the system temporary directory (/tmp on Unix, GetTempPath on Windows).
std::filesystem::path temp_dir();

// Returns a not-yet-existing path in the temp directory: <tmp>/<prefix>_<random><suffix>
std::filesystem::path temp_file(const std::string& prefix, const std::string& suffix = "");

// Read an environment variable. Unset and empty both yield nullopt.
std::optional<std::string> get_env(const std::string& name);

// Search PATH for an executable. Returns its full path if found.
std::optional<std::filesystem::path> find_executable(const std::string& name);

// Add the owner/group/other execute bits where the matching read bit is set.
// No-op on Windows.
void make_executable(const std::filesystem::path& path);

} // namespace platform
