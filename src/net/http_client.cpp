#include "http_client.hpp"
#include <core/constants.hpp>
#include <core/log.hpp>
#include <core/utils.hpp>
#include <curl/curl.h>
#include <fmt/format.h>
#include <chrono>
#include <fstream>
#include <stdexcept>

void apply_header_line(HttpHeaders& headers, const std::string& line) {
    // Each hop of a redirect chain starts with a status line; keep only the last hop
    if (line.rfind("HTTP/", 0) == 0) {
        headers.clear();
        return;
    }

    auto colon = line.find(':');
    if (colon == std::string::npos) return;

    std::string name = trimmed(line.substr(0, colon));
    std::string value = trimmed(line.substr(colon + 1));
    if (!name.empty()) headers[name] = value;
}

// ── CurlGlobal ───────────────────────────────────────────────

CurlGlobal::CurlGlobal() {
    if (curl_global_init(CURL_GLOBAL_DEFAULT) != CURLE_OK) {
        throw std::runtime_error("Failed to initialize libcurl");
    }
}

CurlGlobal::~CurlGlobal() {
    curl_global_cleanup();
}

// ── Transfer state shared with the C callbacks ──────────────

namespace {

struct TransferContext {
    std::function<bool(const char*, size_t)> write;
    ProgressCallback progress;
    HttpHeaders headers;
    std::string callback_error;     // exception text from a user callback
};

size_t on_body(char* ptr, size_t size, size_t nmemb, void* userdata) {
    auto* ctx = static_cast<TransferContext*>(userdata);
    size_t len = size * nmemb;
    try {
        return ctx->write(ptr, len) ? len : 0;
    } catch (const std::exception& e) {
        ctx->callback_error = e.what();
        return 0;  // short write aborts the transfer
    }
}

size_t on_header(char* ptr, size_t size, size_t nmemb, void* userdata) {
    auto* ctx = static_cast<TransferContext*>(userdata);
    size_t len = size * nmemb;
    apply_header_line(ctx->headers, std::string(ptr, len));
    return len;
}

int on_progress(void* userdata, curl_off_t dltotal, curl_off_t dlnow, curl_off_t, curl_off_t) {
    auto* ctx = static_cast<TransferContext*>(userdata);
    if (!ctx->progress) return 0;
    try {
        ctx->progress(static_cast<int64_t>(dlnow), static_cast<int64_t>(dltotal));
        return 0;
    } catch (const std::exception& e) {
        ctx->callback_error = e.what();
        return 1;  // non-zero aborts the transfer
    }
}

} // namespace

// ── HttpClient ───────────────────────────────────────────────

HttpClient::HttpClient(HttpClientOptions options) : options_(std::move(options)) {
    if (options_.user_agent.empty()) options_.user_agent = HTTP_USER_AGENT;
    curl_ = curl_easy_init();
    if (!curl_) {
        throw std::runtime_error("Failed to create curl handle");
    }
}

HttpClient::~HttpClient() {
    if (curl_) curl_easy_cleanup(curl_);
}

Result<HttpResponse> HttpClient::perform(const std::string& url, const HttpHeaders& headers,
                                         WriteFn write, ProgressCallback progress) {
    // reset() drops per-request options but keeps the connection cache
    curl_easy_reset(curl_);

    TransferContext ctx;
    ctx.write = std::move(write);
    ctx.progress = std::move(progress);

    curl_easy_setopt(curl_, CURLOPT_URL, url.c_str());
    curl_easy_setopt(curl_, CURLOPT_USERAGENT, options_.user_agent.c_str());
    curl_easy_setopt(curl_, CURLOPT_TIMEOUT, options_.timeout_secs);
    curl_easy_setopt(curl_, CURLOPT_CONNECTTIMEOUT, options_.connect_timeout_secs);
    curl_easy_setopt(curl_, CURLOPT_NOSIGNAL, 1L);
    curl_easy_setopt(curl_, CURLOPT_FOLLOWLOCATION, options_.follow_redirects ? 1L : 0L);
    curl_easy_setopt(curl_, CURLOPT_MAXREDIRS, HTTP_MAX_REDIRECTS);

    // Verify against the OS trust store rather than a bundled CA file
    curl_easy_setopt(curl_, CURLOPT_SSL_VERIFYPEER, 1L);
    curl_easy_setopt(curl_, CURLOPT_SSL_VERIFYHOST, 2L);
    curl_easy_setopt(curl_, CURLOPT_SSL_OPTIONS, static_cast<long>(CURLSSLOPT_NATIVE_CA));

    curl_easy_setopt(curl_, CURLOPT_WRITEFUNCTION, on_body);
    curl_easy_setopt(curl_, CURLOPT_WRITEDATA, &ctx);
    curl_easy_setopt(curl_, CURLOPT_HEADERFUNCTION, on_header);
    curl_easy_setopt(curl_, CURLOPT_HEADERDATA, &ctx);

    if (ctx.progress) {
        curl_easy_setopt(curl_, CURLOPT_NOPROGRESS, 0L);
        curl_easy_setopt(curl_, CURLOPT_XFERINFOFUNCTION, on_progress);
        curl_easy_setopt(curl_, CURLOPT_XFERINFODATA, &ctx);
    }

    struct curl_slist* header_list = nullptr;
    for (const auto& [name, value] : headers) {
        header_list = curl_slist_append(header_list, (name + ": " + value).c_str());
    }
    if (header_list) {
        curl_easy_setopt(curl_, CURLOPT_HTTPHEADER, header_list);
    }

    auto t0 = std::chrono::steady_clock::now();
    CURLcode rc = curl_easy_perform(curl_);
    auto elapsed_ms = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - t0).count();

    curl_slist_free_all(header_list);

    if (rc != CURLE_OK) {
        std::string reason = !ctx.callback_error.empty() ? ctx.callback_error
                                                          : curl_easy_strerror(rc);
        forgeloop_logf("GET {} failed after {}ms: {}", url, elapsed_ms, reason);
        return Result<HttpResponse>::Err(fmt::format("Request to {} failed: {}", url, reason));
    }

    long status = 0;
    curl_easy_getinfo(curl_, CURLINFO_RESPONSE_CODE, &status);
    forgeloop_logf("GET {} -> {} ({}ms)", url, status, elapsed_ms);

    HttpResponse resp;
    resp.status = static_cast<int>(status);
    resp.headers = std::move(ctx.headers);
    return Result<HttpResponse>::Ok(std::move(resp));
}

Result<HttpResponse> HttpClient::get(const std::string& url, const HttpHeaders& headers) {
    std::string body;
    auto result = perform(url, headers, [&body](const char* data, size_t len) {
        body.append(data, len);
        return true;
    }, nullptr);

    if (result.is_ok()) result.value.body = std::move(body);
    return result;
}

Result<HttpResponse> HttpClient::download(const std::string& url, const HttpHeaders& headers,
                                          const fs::path& dest, ProgressCallback progress) {
    std::ofstream out(dest, std::ios::binary | std::ios::trunc);
    if (!out) {
        return Result<HttpResponse>::Err("Cannot open " + dest.string() + " for writing");
    }

    auto result = perform(url, headers, [&out](const char* data, size_t len) {
        out.write(data, static_cast<std::streamsize>(len));
        return static_cast<bool>(out);
    }, std::move(progress));
    out.close();

    if (result.is_err() || !result.value.ok()) {
        std::error_code ec;
        fs::remove(dest, ec);
    }
    return result;
}
