#include "release.hpp"
#include <core/constants.hpp>
#include <core/log.hpp>
#include <fmt/format.h>
#include <nlohmann/json.hpp>

using json = nlohmann::json;

std::string latest_release_url(const GithubConfig& gh) {
    return fmt::format(GITHUB_LATEST_RELEASE, gh.api_base, gh.owner, gh.repo);
}

// Throws json::exception on type mismatches (e.g. "tag_name": null)
static ReleaseInfo read_release(const json& doc) {
    ReleaseInfo info;
    info.tag = doc.value("tag_name", "");

    auto assets = doc.find("assets");
    if (assets != doc.end() && assets->is_array()) {
        for (const auto& a : *assets) {
            if (!a.is_object()) continue;
            ReleaseAsset asset;
            asset.name = a.value("name", "");
            asset.download_url = a.value("browser_download_url", "");
            asset.size = a.value("size", static_cast<int64_t>(0));
            if (asset.name.empty() || asset.download_url.empty()) continue;
            info.assets.push_back(std::move(asset));
        }
    }
    return info;
}

Result<ReleaseInfo> parse_release_json(const std::string& body, const std::string& url) {
    json doc = json::parse(body, nullptr, false);
    if (doc.is_discarded() || !doc.is_object()) {
        return Result<ReleaseInfo>::Err("Invalid JSON in release response from " + url);
    }

    ReleaseInfo info;
    try {
        info = read_release(doc);
    } catch (const json::exception& e) {
        return Result<ReleaseInfo>::Err(fmt::format("Unexpected release format from {}: {}", url, e.what()));
    }

    if (info.tag.empty()) {
        return Result<ReleaseInfo>::Err("Release response from " + url + " has no tag_name");
    }
    return Result<ReleaseInfo>::Ok(std::move(info));
}

Result<ReleaseInfo> fetch_latest_release(FetchClient& client, const GithubConfig& gh) {
    std::string url = latest_release_url(gh);
    auto resp = client.get_json(url);
    if (resp.is_err()) {
        return Result<ReleaseInfo>::Err(resp.error);
    }

    auto release = parse_release_json(resp.value.body, url);
    if (release.is_ok()) {
        forgeloop_logf("latest release {} ({} assets)", release.value.tag, release.value.assets.size());
    }
    return release;
}

Result<ReleaseAsset> select_template_asset(const ReleaseInfo& release,
                                           const std::string& agent,
                                           const std::string& script) {
    std::string pattern = fmt::format(TEMPLATE_ASSET_PREFIX, agent, script);

    for (const auto& asset : release.assets) {
        const std::string& n = asset.name;
        bool is_zip = n.size() >= 4 && n.compare(n.size() - 4, 4, ".zip") == 0;
        // Require the separator after the script so "claude-sh" can't match "claude-shx"
        bool matches = n.rfind(pattern + "-", 0) == 0 || n == pattern + ".zip";
        if (is_zip && matches) {
            return Result<ReleaseAsset>::Ok(asset);
        }
    }

    std::string available;
    for (size_t i = 0; i < release.assets.size(); i++) {
        if (i > 0) available += ", ";
        available += release.assets[i].name;
    }
    if (available.empty()) available = "(none)";
    return Result<ReleaseAsset>::Err(fmt::format(
        "No template matching '{}' in release {}. Available assets: {}",
        pattern, release.tag, available));
}
