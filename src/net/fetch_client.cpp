#include "fetch_client.hpp"
#include "rate_limit.hpp"
#include <core/constants.hpp>
#include <core/log.hpp>
#include <core/markup.hpp>
#include <core/utils.hpp>
#include <platform/platform.hpp>
#include <fmt/format.h>

std::optional<std::string> resolve_github_token(const std::optional<std::string>& explicit_token) {
    std::string token;
    if (explicit_token) token = *explicit_token;
    if (token.empty()) token = platform::get_env(TOKEN_ENV_PRIMARY).value_or("");
    if (token.empty()) token = platform::get_env(TOKEN_ENV_SECONDARY).value_or("");

    trim(token);
    if (token.empty()) return std::nullopt;
    return token;
}

HttpHeaders github_auth_headers(const std::optional<std::string>& explicit_token) {
    HttpHeaders headers;
    auto token = resolve_github_token(explicit_token);
    if (token) {
        headers["Authorization"] = "Bearer " + *token;
    }
    return headers;
}

const char* failure_kind_name(FailureKind kind) {
    switch (kind) {
        case FailureKind::Transport:   return "transport";
        case FailureKind::RateLimited: return "rate-limited";
        case FailureKind::HttpStatus:  return "http-status";
    }
    return "unknown";
}

FailureKind classify_failure(const HttpResponse& resp) {
    bool limit_status = (resp.status == 403 || resp.status == 429);
    if (limit_status && has_rate_limit_headers(resp.headers)) {
        return FailureKind::RateLimited;
    }
    return FailureKind::HttpStatus;
}

std::string describe_http_failure(const HttpResponse& resp, const std::string& url) {
    if (classify_failure(resp) == FailureKind::RateLimited) {
        return format_rate_limit_error(resp.status, resp.headers, url);
    }
    return fmt::format("Request failed with status {} for {}", resp.status, markup::escape(url));
}

// ── FetchClient ──────────────────────────────────────────────

FetchClient::FetchClient(HttpClient& http, const std::optional<std::string>& explicit_token)
    : http_(http), auth_(github_auth_headers(explicit_token)) {
    forgeloop_logf("fetch client ready (authenticated: {})", authenticated() ? "yes" : "no");
}

Result<HttpResponse> FetchClient::check(Result<HttpResponse> result, const std::string& url) const {
    if (result.is_err()) {
        forgeloop_logf("{} failure for {}", failure_kind_name(FailureKind::Transport), url);
        return Result<HttpResponse>::Err(markup::escape(result.error));
    }
    if (!result.value.ok()) {
        FailureKind kind = classify_failure(result.value);
        forgeloop_logf("{} failure for {} (status {})", failure_kind_name(kind), url, result.value.status);
        return Result<HttpResponse>::Err(describe_http_failure(result.value, url));
    }
    return result;
}

Result<HttpResponse> FetchClient::get_json(const std::string& url) {
    HttpHeaders headers = auth_;
    headers["Accept"] = "application/vnd.github+json";
    headers["X-GitHub-Api-Version"] = "2022-11-28";
    return check(http_.get(url, headers), url);
}

Result<HttpResponse> FetchClient::download(const std::string& url, const fs::path& dest,
                                           ProgressCallback progress) {
    HttpHeaders headers = auth_;
    headers["Accept"] = "application/octet-stream";
    return check(http_.download(url, headers, dest, std::move(progress)), url);
}
