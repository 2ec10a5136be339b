#include <gtest/gtest.h>
#include <net/release.hpp>
#include "fake_http_client.hpp"

static const char* RELEASE_JSON = R"({
  "tag_name": "v0.0.52",
  "assets": [
    {"name": "forge-loop-template-claude-sh-v0.0.52.zip",
     "browser_download_url": "https://dl/claude-sh.zip", "size": 1234},
    {"name": "forge-loop-template-claude-ps-v0.0.52.zip",
     "browser_download_url": "https://dl/claude-ps.zip", "size": 1300},
    {"name": "forge-loop-template-gemini-sh-v0.0.52.zip",
     "browser_download_url": "https://dl/gemini-sh.zip", "size": 999},
    {"name": "no-url.zip"}
  ]
})";

TEST(Release, LatestReleaseUrl) {
    GithubConfig gh{"owner", "repo", "https://api.github.com"};
    EXPECT_EQ(latest_release_url(gh), "https://api.github.com/repos/owner/repo/releases/latest");
}

TEST(Release, ParseRelease) {
    auto res = parse_release_json(RELEASE_JSON, "u");
    ASSERT_TRUE(res.is_ok()) << res.error;
    EXPECT_EQ(res.value.tag, "v0.0.52");
    ASSERT_EQ(res.value.assets.size(), 3u);  // asset without a URL is dropped
    EXPECT_EQ(res.value.assets[0].download_url, "https://dl/claude-sh.zip");
    EXPECT_EQ(res.value.assets[0].size, 1234);
}

TEST(Release, InvalidJson) {
    auto res = parse_release_json("<html>not json</html>", "https://u");
    ASSERT_TRUE(res.is_err());
    EXPECT_NE(res.error.find("https://u"), std::string::npos);
}

TEST(Release, MissingTag) {
    EXPECT_TRUE(parse_release_json(R"({"assets": []})", "u").is_err());
    EXPECT_TRUE(parse_release_json("[]", "u").is_err());
}

TEST(Release, WrongFieldType) {
    auto res = parse_release_json(R"({"tag_name": 5})", "u");
    EXPECT_TRUE(res.is_err());
}

TEST(Release, SelectMatchingAsset) {
    auto release = parse_release_json(RELEASE_JSON, "u").value;
    auto asset = select_template_asset(release, "claude", "ps");
    ASSERT_TRUE(asset.is_ok()) << asset.error;
    EXPECT_EQ(asset.value.name, "forge-loop-template-claude-ps-v0.0.52.zip");
}

TEST(Release, SelectNoMatchListsAssets) {
    auto release = parse_release_json(RELEASE_JSON, "u").value;
    auto asset = select_template_asset(release, "qwen", "sh");
    ASSERT_TRUE(asset.is_err());
    EXPECT_NE(asset.error.find("forge-loop-template-qwen-sh"), std::string::npos);
    EXPECT_NE(asset.error.find("forge-loop-template-gemini-sh-v0.0.52.zip"), std::string::npos);
}

TEST(Release, SelectRequiresSeparator) {
    ReleaseInfo release;
    release.tag = "v1";
    release.assets.push_back({"forge-loop-template-q-shx.zip", "https://dl/a", 1});
    EXPECT_TRUE(select_template_asset(release, "q", "sh").is_err());

    release.assets.push_back({"forge-loop-template-q-sh.zip", "https://dl/b", 1});
    auto asset = select_template_asset(release, "q", "sh");
    ASSERT_TRUE(asset.is_ok());
    EXPECT_EQ(asset.value.download_url, "https://dl/b");
}

TEST(Release, SelectFromEmptyRelease) {
    ReleaseInfo release;
    release.tag = "v1";
    auto asset = select_template_asset(release, "claude", "sh");
    ASSERT_TRUE(asset.is_err());
    EXPECT_NE(asset.error.find("(none)"), std::string::npos);
}

TEST(Release, FetchLatestRelease) {
    GithubConfig gh{"o", "r", "https://api.example"};
    FakeHttpClient http;
    http.on("https://api.example/repos/o/r/releases/latest", 200, RELEASE_JSON);
    FetchClient client(http, std::nullopt);

    auto res = fetch_latest_release(client, gh);
    ASSERT_TRUE(res.is_ok()) << res.error;
    EXPECT_EQ(res.value.tag, "v0.0.52");
}

TEST(Release, FetchLatestReleaseNotFound) {
    GithubConfig gh{"o", "r", "https://api.example"};
    FakeHttpClient http;
    http.on("https://api.example/repos/o/r/releases/latest", 404);
    FetchClient client(http, std::nullopt);

    auto res = fetch_latest_release(client, gh);
    ASSERT_TRUE(res.is_err());
    EXPECT_NE(res.error.find("404"), std::string::npos);
}
