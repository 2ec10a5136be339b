#include "rate_limit.hpp"
#include <core/constants.hpp>
#include <core/log.hpp>
#include <core/markup.hpp>
#include <core/utils.hpp>
#include <fmt/format.h>
#include <ctime>
#include <vector>

static const char* HDR_LIMIT       = "X-RateLimit-Limit";
static const char* HDR_REMAINING   = "X-RateLimit-Remaining";
static const char* HDR_RESET       = "X-RateLimit-Reset";
static const char* HDR_RETRY_AFTER = "Retry-After";

bool has_rate_limit_headers(const HttpHeaders& headers) {
    for (const char* name : {HDR_LIMIT, HDR_REMAINING, HDR_RESET, HDR_RETRY_AFTER}) {
        if (headers.count(name)) return true;
    }
    return false;
}

// system_clock counts in sub-second ticks; larger epochs overflow from_time_t
static bool reset_epoch_in_range(int64_t epoch) {
    using std::chrono::duration_cast;
    using std::chrono::seconds;
    using std::chrono::system_clock;
    static const int64_t lo = duration_cast<seconds>(system_clock::duration::min()).count();
    static const int64_t hi = duration_cast<seconds>(system_clock::duration::max()).count();
    return epoch > lo && epoch < hi;
}

RateLimitInfo parse_rate_limit_headers(const HttpHeaders& headers) {
    RateLimitInfo info;

    auto it = headers.find(HDR_LIMIT);
    if (it != headers.end()) {
        info.limit = parse_int64(it->second);
        if (!info.limit) forgeloop_logf("ignoring non-numeric {}: '{}'", HDR_LIMIT, it->second);
    }

    it = headers.find(HDR_REMAINING);
    if (it != headers.end()) {
        info.remaining = parse_int64(it->second);
        if (!info.remaining) forgeloop_logf("ignoring non-numeric {}: '{}'", HDR_REMAINING, it->second);
    }

    it = headers.find(HDR_RESET);
    if (it != headers.end()) {
        auto epoch = parse_int64(it->second);
        if (!epoch) {
            std::string raw = trimmed(it->second);
            if (!raw.empty()) info.reset_raw = raw;
        } else if (*epoch != 0) {
            // A zero epoch means "no reset reported", not 1970-01-01
            if (reset_epoch_in_range(*epoch)) {
                info.reset_epoch = *epoch;
                info.reset_time = std::chrono::system_clock::from_time_t(static_cast<std::time_t>(*epoch));
            } else {
                forgeloop_logf("{} out of clock range: '{}'", HDR_RESET, it->second);
                info.reset_raw = trimmed(it->second);
            }
        }
    }

    it = headers.find(HDR_RETRY_AFTER);
    if (it != headers.end()) {
        auto secs = parse_int64(it->second);
        if (secs) {
            info.retry_after_seconds = *secs;
        } else {
            std::string raw = trimmed(it->second);
            if (!raw.empty()) info.retry_after_raw = raw;
        }
    }

    return info;
}

std::string format_reset_local(std::chrono::system_clock::time_point t) {
    std::time_t tt = std::chrono::system_clock::to_time_t(t);
    struct tm tm_buf;
    localtime_r(&tt, &tm_buf);
    char buf[64];
    if (std::strftime(buf, sizeof(buf), "%Y-%m-%d %H:%M:%S %Z", &tm_buf) == 0) {
        return std::to_string(static_cast<long long>(tt));
    }
    return std::string(buf);
}

static std::string build_rate_limit_error(int status_code, const HttpHeaders& headers,
                                          const std::string& url) {
    RateLimitInfo info = parse_rate_limit_headers(headers);

    std::vector<std::string> lines;
    lines.push_back(fmt::format("GitHub API returned status {} for {}", status_code, markup::escape(url)));
    lines.push_back("");

    if (!info.empty()) {
        lines.push_back("[bold]Rate Limit Information:[/bold]");
        if (info.limit) {
            lines.push_back(fmt::format("  \xe2\x80\xa2 Rate Limit: {} requests/hour", *info.limit));
        }
        if (info.remaining) {
            lines.push_back(fmt::format("  \xe2\x80\xa2 Remaining: {}", *info.remaining));
        }
        if (info.reset_time) {
            lines.push_back(fmt::format("  \xe2\x80\xa2 Resets at: {}", format_reset_local(*info.reset_time)));
        } else if (info.reset_raw) {
            lines.push_back(fmt::format("  \xe2\x80\xa2 Resets at: {}", markup::escape(*info.reset_raw)));
        }
        if (info.retry_after_seconds) {
            lines.push_back(fmt::format("  \xe2\x80\xa2 Retry after: {} seconds", *info.retry_after_seconds));
        } else if (info.retry_after_raw) {
            lines.push_back(fmt::format("  \xe2\x80\xa2 Retry after: {}", markup::escape(*info.retry_after_raw)));
        }
        lines.push_back("");
    }

    lines.push_back("[bold]Troubleshooting Tips:[/bold]");
    lines.push_back("  \xe2\x80\xa2 If you're on a shared CI or corporate environment, you may be rate-limited.");
    lines.push_back(fmt::format("  \xe2\x80\xa2 Consider using a GitHub token via --github-token or the {}/{} environment variable.",
                                TOKEN_ENV_PRIMARY, TOKEN_ENV_SECONDARY));
    lines.push_back(fmt::format("  \xe2\x80\xa2 Authenticated requests have a limit of {} vs {} for unauthenticated.",
                                RATE_LIMIT_AUTHENTICATED, RATE_LIMIT_UNAUTHENTICATED));

    std::string out;
    for (size_t i = 0; i < lines.size(); i++) {
        if (i > 0) out += "\n";
        out += lines[i];
    }
    return out;
}

std::string format_rate_limit_error(int status_code, const HttpHeaders& headers,
                                    const std::string& url) {
    try {
        return build_rate_limit_error(status_code, headers, url);
    } catch (const std::exception&) {
        // Keep the minimum actionable signal: status and URL
        return "GitHub API returned status " + std::to_string(status_code) + " for " + url;
    }
}
