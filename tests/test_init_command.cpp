#include <gtest/gtest.h>
#include <cli/init_command.hpp>
#include <platform/platform.hpp>
#include <cstdlib>
#include <fstream>
#include <sstream>
#include "fake_http_client.hpp"
#include "zip_builder.hpp"

static const char* RELEASE_URL = "https://api.github.com/repos/forgeloop-dev/forgeloop/releases/latest";
static const char* ASSET_URL = "https://dl.example/forge-loop-template-copilot-sh-v1.2.0.zip";

class InitCommandTest : public ::testing::Test {
protected:
    fs::path base;
    Config config;
    FakeHttpClient http;
    std::ostringstream out;

    void SetUp() override {
        base = platform::temp_file("forgeloop_init_test");
        fs::create_directories(base);
        unsetenv("GH_TOKEN");
        unsetenv("GITHUB_TOKEN");
    }

    void TearDown() override {
        fs::remove_all(base);
    }

    InitOptions options(const std::string& name) {
        InitOptions opts;
        opts.project_name = name;
        opts.ai = "copilot";
        opts.script = "sh";
        opts.no_git = true;
        opts.base_dir = base;
        return opts;
    }

    void serve_release() {
        http.on(RELEASE_URL, 200, std::string(R"({"tag_name": "v1.2.0", "assets": [)")
                + R"({"name": "forge-loop-template-copilot-sh-v1.2.0.zip", "browser_download_url": ")"
                + ASSET_URL + R"(", "size": 100}]})");

        fs::path zip = base / "template.zip";
        write_zip(zip, {
            {"forge-loop/", "", 0755, true},
            {"forge-loop/README.md", "# Template\n"},
            {"forge-loop/scripts/setup.sh", "#!/bin/sh\necho hi\n", 0644},
            {"forge-loop/.github/prompts/plan.md", "plan"},
        });
        std::ifstream in(zip, std::ios::binary);
        std::stringstream ss;
        ss << in.rdbuf();
        fs::remove(zip);
        http.on_file(ASSET_URL, ss.str());
    }

    StepStatus status_of(const InitCommand& cmd, const std::string& key) {
        const Step* s = cmd.tracker().find(key);
        EXPECT_NE(s, nullptr) << key;
        return s ? s->status : StepStatus::Pending;
    }
};

TEST_F(InitCommandTest, CreatesProjectFromTemplate) {
    serve_release();
    InitCommand cmd(config, options("demo"), out, false);

    ASSERT_EQ(cmd.run(http), 0) << out.str();

    fs::path project = base / "demo";
    EXPECT_TRUE(fs::exists(project / "README.md"));
    EXPECT_TRUE(fs::exists(project / ".github" / "prompts" / "plan.md"));
    EXPECT_FALSE(fs::exists(project / "forge-loop"));

    auto perms = fs::status(project / "scripts" / "setup.sh").permissions();
    EXPECT_NE(perms & fs::perms::owner_exec, fs::perms::none);

    EXPECT_EQ(status_of(cmd, "precheck"), StepStatus::Done);
    EXPECT_EQ(status_of(cmd, "fetch"), StepStatus::Done);
    EXPECT_EQ(cmd.tracker().find("fetch")->detail, "v1.2.0");
    EXPECT_EQ(status_of(cmd, "download"), StepStatus::Done);
    EXPECT_EQ(status_of(cmd, "extract"), StepStatus::Done);
    EXPECT_EQ(status_of(cmd, "chmod"), StepStatus::Done);
    EXPECT_EQ(cmd.tracker().find("chmod")->detail, "1 updated");
    EXPECT_EQ(status_of(cmd, "cleanup"), StepStatus::Done);
    EXPECT_EQ(status_of(cmd, "git"), StepStatus::Skipped);
    EXPECT_EQ(status_of(cmd, "final"), StepStatus::Done);

    EXPECT_NE(out.str().find("Next Steps"), std::string::npos);
    EXPECT_EQ(out.str().find("\033[?25l"), std::string::npos);

    ASSERT_EQ(http.requests.size(), 2u);
    EXPECT_EQ(http.requests[0].url, RELEASE_URL);
    EXPECT_EQ(http.requests[1].url, ASSET_URL);
}

TEST_F(InitCommandTest, RateLimitStopsAtFetch) {
    HttpHeaders headers;
    headers["X-RateLimit-Limit"] = "60";
    headers["X-RateLimit-Remaining"] = "0";
    headers["X-RateLimit-Reset"] = "1700000000";
    http.on(RELEASE_URL, 403, "", headers);

    InitCommand cmd(config, options("demo"), out, false);
    EXPECT_EQ(cmd.run(http), 1);

    EXPECT_FALSE(fs::exists(base / "demo"));
    EXPECT_EQ(status_of(cmd, "precheck"), StepStatus::Done);
    EXPECT_EQ(status_of(cmd, "fetch"), StepStatus::Error);
    EXPECT_EQ(cmd.tracker().find("fetch")->detail,
              std::string("GitHub API returned status 403 for ") + RELEASE_URL);
    for (const char* key : {"download", "extract", "chmod", "cleanup", "git", "final"}) {
        EXPECT_EQ(status_of(cmd, key), StepStatus::Skipped) << key;
    }

    std::string text = out.str();
    EXPECT_NE(text.find("Remaining: 0"), std::string::npos);
    EXPECT_NE(text.find("Troubleshooting Tips:"), std::string::npos);
    EXPECT_EQ(text.find("[bold]"), std::string::npos);
}

TEST_F(InitCommandTest, MissingAssetFailsFetch) {
    http.on(RELEASE_URL, 200, R"({"tag_name": "v1.2.0", "assets": []})");
    InitCommand cmd(config, options("demo"), out, false);

    EXPECT_EQ(cmd.run(http), 1);
    EXPECT_EQ(status_of(cmd, "fetch"), StepStatus::Error);
    EXPECT_NE(out.str().find("forge-loop-template-copilot-sh"), std::string::npos);
}

TEST_F(InitCommandTest, CorruptDownloadFailsExtractAndRemovesProject) {
    serve_release();
    http.on_file(ASSET_URL, "definitely not a zip");
    InitCommand cmd(config, options("demo"), out, false);

    EXPECT_EQ(cmd.run(http), 1);
    EXPECT_EQ(status_of(cmd, "download"), StepStatus::Done);
    EXPECT_EQ(status_of(cmd, "extract"), StepStatus::Error);
    EXPECT_EQ(status_of(cmd, "final"), StepStatus::Skipped);
    EXPECT_FALSE(fs::exists(base / "demo"));
}

TEST_F(InitCommandTest, ExistingDirectoryRefused) {
    fs::create_directories(base / "demo");
    InitCommand cmd(config, options("demo"), out, false);

    EXPECT_EQ(cmd.run(http), 1);
    EXPECT_TRUE(cmd.tracker().steps().empty());
    EXPECT_TRUE(http.requests.empty());
    EXPECT_NE(out.str().find("already exists"), std::string::npos);
}

TEST_F(InitCommandTest, HereRequiresForceWhenNotEmpty) {
    std::ofstream(base / "existing.txt") << "keep me";
    InitOptions opts = options("");
    opts.here = true;

    InitCommand refused(config, opts, out, false);
    EXPECT_EQ(refused.run(http), 1);
    EXPECT_TRUE(http.requests.empty());

    serve_release();
    opts.force = true;
    InitCommand forced(config, opts, out, false);
    EXPECT_EQ(forced.run(http), 0) << out.str();
    EXPECT_TRUE(fs::exists(base / "README.md"));
    EXPECT_TRUE(fs::exists(base / "existing.txt"));
}

TEST_F(InitCommandTest, PowerShellSkipsChmod) {
    http.on(RELEASE_URL, 200, std::string(R"({"tag_name": "v1.2.0", "assets": [)")
            + R"({"name": "forge-loop-template-copilot-ps-v1.2.0.zip", "browser_download_url": ")"
            + ASSET_URL + R"(", "size": 100}]})");
    fs::path zip = base / "t.zip";
    write_zip(zip, {{"scripts/setup.ps1", "Write-Host hi"}});
    std::ifstream in(zip, std::ios::binary);
    std::stringstream ss;
    ss << in.rdbuf();
    in.close();
    fs::remove(zip);
    http.on_file(ASSET_URL, ss.str());

    InitOptions opts = options("demo");
    opts.script = "ps";
    InitCommand cmd(config, opts, out, false);

    ASSERT_EQ(cmd.run(http), 0) << out.str();
    EXPECT_EQ(status_of(cmd, "chmod"), StepStatus::Skipped);
    EXPECT_TRUE(fs::exists(base / "demo" / "scripts" / "setup.ps1"));
}
