#pragma once

#include <ostream>
#include <string>
#include <vector>
#include <core/config.hpp>
#include <net/fetch_client.hpp>
#include <net/http_client.hpp>
#include <progress/step_tracker.hpp>
#include "init_options.hpp"

// Drives `forgeloop init`: fetch the latest template release for the chosen
// agent, extract it into the target directory, and report every step through
// a StepTracker bound to a live display.
class InitCommand {
public:
    InitCommand(const Config& config, InitOptions options, std::ostream& out, bool ansi);

    // Build the run's HttpClient from config and run. Returns the exit code.
    int run();

    // Run against a caller-owned client
    int run(HttpClient& http);

    const StepTracker& tracker() const { return tracker_; }

private:
    bool validate_target();
    bool run_steps(FetchClient& fetch);

    bool step_precheck();
    bool step_fetch(FetchClient& fetch, std::string& asset_url, std::string& asset_name);
    bool step_download(FetchClient& fetch, const std::string& url, const fs::path& zip_path);
    bool step_extract(const fs::path& zip_path, const fs::path& staging);
    void step_chmod();
    void step_cleanup(const fs::path& zip_path, const fs::path& staging);
    void step_git();

    // Mark key as failed, remember the full diagnostic, skip what's left
    void fail_step(const std::string& key, const std::string& diagnostic);

    void print_next_steps();

    const Config& config_;
    InitOptions opts_;
    std::ostream& out_;
    bool ansi_;
    StepTracker tracker_;
    std::string failure_;   // full diagnostic of the failed step, with markup
    std::vector<std::string> written_;  // template files merged into the target
    bool created_target_ = false;
};
