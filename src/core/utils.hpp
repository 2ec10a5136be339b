#pragma once

#include <string>
#include <optional>
#include <cstdint>

// Strict integer parse. Surrounding whitespace and a leading sign are accepted;
// anything else (empty, trailing garbage, overflow) yields nullopt.
std::optional<int64_t> parse_int64(const std::string& s);

// Format a byte count as "512 B", "1.4 KB", "3.2 MB".
std::string format_bytes(int64_t bytes);

// Trim leading and trailing whitespace in-place.
inline void trim(std::string& s) {
    auto start = s.find_first_not_of(" \t\r\n");
    if (start == std::string::npos) { s.clear(); return; }
    s.erase(0, start);
    s.erase(s.find_last_not_of(" \t\r\n") + 1);
}

inline std::string trimmed(std::string s) {
    trim(s);
    return s;
}
