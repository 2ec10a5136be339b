#pragma once

#include <string>
#include <fmt/format.h>

// Debug log at <tmp>/forgeloop_debug.log. Off unless enabled by --debug
// or `debug: true` in the global config.
std::string forgeloop_log_path();

void set_debug_logging(bool enabled);
bool debug_logging_enabled();

// Append a "[HH:MM:SS.mmm] msg" line. No-op while logging is disabled.
void forgeloop_log(const std::string& msg);

template <typename... Args>
void forgeloop_logf(fmt::format_string<Args...> fmt_str, Args&&... args) {
    if (!debug_logging_enabled()) return;
    forgeloop_log(fmt::format(fmt_str, std::forward<Args>(args)...));
}
