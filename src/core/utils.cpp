#include "utils.hpp"
#include <fmt/format.h>
#include <cerrno>
#include <cstdlib>

std::optional<int64_t> parse_int64(const std::string& s) {
    std::string t = trimmed(s);
    if (t.empty()) return std::nullopt;

    errno = 0;
    char* end = nullptr;
    long long v = std::strtoll(t.c_str(), &end, 10);
    if (errno == ERANGE || end == t.c_str() || *end != '\0') {
        return std::nullopt;
    }
    return static_cast<int64_t>(v);
}

std::string format_bytes(int64_t bytes) {
    if (bytes < 1024) return fmt::format("{} B", bytes);
    double kb = bytes / 1024.0;
    if (kb < 1024.0) return fmt::format("{:.1f} KB", kb);
    return fmt::format("{:.1f} MB", kb / 1024.0);
}
