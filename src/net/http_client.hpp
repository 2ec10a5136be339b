#pragma once

#include <cstdint>
#include <filesystem>
#include <functional>
#include <string>
#include <core/types.hpp>
#include "http_types.hpp"

namespace fs = std::filesystem;

// libcurl forward declaration
typedef void CURL;

struct HttpClientOptions {
    std::string user_agent;
    long timeout_secs = 60;
    long connect_timeout_secs = 15;
    bool follow_redirects = true;
};

// Called from the transfer loop. total is 0 while the size is unknown.
using ProgressCallback = std::function<void(int64_t downloaded, int64_t total)>;

// Fold one raw response header line (CRLF included) into headers. A status
// line starts a new hop and clears what earlier hops left; a repeated name
// keeps the last value.
void apply_header_line(HttpHeaders& headers, const std::string& line);

// RAII pairing of curl_global_init / curl_global_cleanup
class CurlGlobal {
public:
    CurlGlobal();
    ~CurlGlobal();

    CurlGlobal(const CurlGlobal&) = delete;
    CurlGlobal& operator=(const CurlGlobal&) = delete;
};

// Blocking HTTPS client over a single reused curl handle.
//
// Peers are verified against the operating system's trust store; no CA
// bundle ships with the tool. Construct one per run and pass it down.
// A transport failure (DNS, TLS, timeout) is an Err; any HTTP status,
// including 4xx/5xx, is an Ok response for the caller to classify.
class HttpClient {
public:
    explicit HttpClient(HttpClientOptions options);
    virtual ~HttpClient();

    HttpClient(const HttpClient&) = delete;
    HttpClient& operator=(const HttpClient&) = delete;

    // Buffer the response body in memory
    virtual Result<HttpResponse> get(const std::string& url, const HttpHeaders& headers = {});

    // Stream the response body to dest. The file is removed unless the
    // status is 2xx.
    virtual Result<HttpResponse> download(const std::string& url, const HttpHeaders& headers,
                                          const fs::path& dest,
                                          ProgressCallback progress = nullptr);

    const HttpClientOptions& options() const { return options_; }

private:
    using WriteFn = std::function<bool(const char* data, size_t len)>;

    Result<HttpResponse> perform(const std::string& url, const HttpHeaders& headers,
                                 WriteFn write, ProgressCallback progress);

    CurlGlobal global_;
    HttpClientOptions options_;
    CURL* curl_ = nullptr;
};
