#pragma once

#include <optional>
#include <string>
#include <core/types.hpp>
#include "http_client.hpp"
#include "http_types.hpp"

// Resolve the GitHub token: explicit value, then GH_TOKEN, then GITHUB_TOKEN.
// Values are trimmed; blank counts as absent.
std::optional<std::string> resolve_github_token(const std::optional<std::string>& explicit_token);

// {"Authorization": "Bearer <token>"} when a token resolves, otherwise empty.
HttpHeaders github_auth_headers(const std::optional<std::string>& explicit_token);

enum class FailureKind {
    Transport,      // no HTTP response at all
    RateLimited,    // 403/429 carrying rate-limit headers
    HttpStatus,     // any other non-2xx
};

const char* failure_kind_name(FailureKind kind);

// Classify a non-2xx response. The status code alone does not decide: a 403
// without rate-limit headers is a plain HttpStatus failure.
FailureKind classify_failure(const HttpResponse& resp);

// Ready-to-print diagnostic (light markup) for a non-2xx response. Always
// names the status code and the URL.
std::string describe_http_failure(const HttpResponse& resp, const std::string& url);

// GitHub-facing wrapper over a borrowed HttpClient: attaches auth and turns
// every non-2xx response into an Err carrying the classified diagnostic.
// Single attempt, no retries; retry policy belongs to the caller.
class FetchClient {
public:
    FetchClient(HttpClient& http, const std::optional<std::string>& explicit_token);

    // GET with the GitHub JSON media type
    Result<HttpResponse> get_json(const std::string& url);

    // Stream a release asset to dest
    Result<HttpResponse> download(const std::string& url, const fs::path& dest,
                                  ProgressCallback progress = nullptr);

    bool authenticated() const { return !auth_.empty(); }

private:
    Result<HttpResponse> check(Result<HttpResponse> result, const std::string& url) const;

    HttpClient& http_;
    HttpHeaders auth_;
};
