#pragma once

#include <cstdint>
#include <string>
#include <vector>
#include <core/types.hpp>
#include "fetch_client.hpp"

struct ReleaseAsset {
    std::string name;
    std::string download_url;   // browser_download_url
    int64_t size = 0;
};

struct ReleaseInfo {
    std::string tag;
    std::vector<ReleaseAsset> assets;
};

// URL of the latest-release endpoint for the configured repository
std::string latest_release_url(const GithubConfig& gh);

// Parse a GitHub release JSON document. url is only used in error text.
Result<ReleaseInfo> parse_release_json(const std::string& body, const std::string& url);

// GET the latest release
Result<ReleaseInfo> fetch_latest_release(FetchClient& client, const GithubConfig& gh);

// Pick the template zip for an agent/script pair
// (forge-loop-template-{agent}-{script}-*.zip).
Result<ReleaseAsset> select_template_asset(const ReleaseInfo& release,
                                           const std::string& agent,
                                           const std::string& script);
