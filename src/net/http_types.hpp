#pragma once

#include <algorithm>
#include <cctype>
#include <map>
#include <string>

// Header names compare case-insensitively ("x-ratelimit-reset" == "X-RateLimit-Reset")
struct CaseInsensitiveLess {
    bool operator()(const std::string& a, const std::string& b) const {
        return std::lexicographical_compare(
            a.begin(), a.end(), b.begin(), b.end(),
            [](unsigned char x, unsigned char y) { return std::tolower(x) < std::tolower(y); });
    }
};

using HttpHeaders = std::map<std::string, std::string, CaseInsensitiveLess>;

struct HttpResponse {
    int status = 0;
    HttpHeaders headers;
    std::string body;           // empty for downloads streamed to disk

    bool ok() const { return status >= 200 && status < 300; }

    // Header value or "" when absent
    std::string header(const std::string& name) const {
        auto it = headers.find(name);
        return it == headers.end() ? "" : it->second;
    }
};
