#pragma once

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include "http_types.hpp"

// Rate-limit facts GitHub reports on a response. Every field is unset unless
// the matching header was present (and, for the numeric ones, parseable).
struct RateLimitInfo {
    std::optional<int64_t> limit;                   // X-RateLimit-Limit
    std::optional<int64_t> remaining;               // X-RateLimit-Remaining
    std::optional<int64_t> reset_epoch;             // X-RateLimit-Reset, seconds (0 = absent)
    std::optional<std::chrono::system_clock::time_point> reset_time;  // UTC instant
    std::optional<std::string> reset_raw;           // non-numeric X-RateLimit-Reset
    std::optional<int64_t> retry_after_seconds;     // Retry-After as delta seconds
    std::optional<std::string> retry_after_raw;     // Retry-After as HTTP date / other

    bool empty() const {
        return !limit && !remaining && !reset_epoch && !reset_raw
            && !retry_after_seconds && !retry_after_raw;
    }
};

// True if any X-RateLimit-* or Retry-After header is present.
bool has_rate_limit_headers(const HttpHeaders& headers);

RateLimitInfo parse_rate_limit_headers(const HttpHeaders& headers);

// Reset instant in the local timezone: "2025-01-15 14:35:22 EST"
std::string format_reset_local(std::chrono::system_clock::time_point t);

// Multi-section diagnostic with light markup:
//   status + URL, rate-limit facts (omitted when none), troubleshooting tips.
// Never throws.
std::string format_rate_limit_error(int status_code, const HttpHeaders& headers,
                                    const std::string& url);
