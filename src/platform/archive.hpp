#pragma once

#include <string>
#include <vector>
#include <filesystem>

namespace platform {

// Extract a zip archive into dest_dir (created if needed).
// Entries with absolute paths or ".." components are rejected.
// Returns the relative paths of the regular files written.
// Throws std::runtime_error on any archive or filesystem failure.
std::vector<std::string> extract_zip(const std::filesystem::path& zip_path,
                                     const std::filesystem::path& dest_dir);

// If dir holds exactly one entry and it is a directory, move that
// directory's contents up into dir and remove it. Returns true if flattened.
bool flatten_single_root(const std::filesystem::path& dir);

// Recursively copy src into dst, creating directories and overwriting files.
// Returns the relative paths of the files copied.
std::vector<std::string> merge_tree(const std::filesystem::path& src, const std::filesystem::path& dst);

} // namespace platform
