#include "log.hpp"
#include <platform/platform.hpp>
#include <fstream>
#include <chrono>
#include <ctime>
#include <cstdio>

static bool g_debug_enabled = false;

std::string forgeloop_log_path() {
    static std::string path = (platform::temp_dir() / "forgeloop_debug.log").string();
    return path;
}

void set_debug_logging(bool enabled) {
    g_debug_enabled = enabled;
}

bool debug_logging_enabled() {
    return g_debug_enabled;
}

void forgeloop_log(const std::string& msg) {
    if (!g_debug_enabled) return;

    std::ofstream out(forgeloop_log_path(), std::ios::app);
    if (!out) return;

    auto now = std::chrono::system_clock::now();
    auto t = std::chrono::system_clock::to_time_t(now);
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
        now.time_since_epoch()) % 1000;
    struct tm tm_buf;
#ifdef _WIN32
    localtime_s(&tm_buf, &t);
#else
    localtime_r(&t, &tm_buf);
#endif

    char ts[32];
    std::snprintf(ts, sizeof(ts), "%02d:%02d:%02d.%03d",
                  tm_buf.tm_hour, tm_buf.tm_min, tm_buf.tm_sec,
                  static_cast<int>(ms.count()));
    out << "[" << ts << "] " << msg << "\n";
}
