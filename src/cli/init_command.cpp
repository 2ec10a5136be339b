#include "init_command.hpp"
#include "theme.hpp"
#include <core/agents.hpp>
#include <core/constants.hpp>
#include <core/log.hpp>
#include <core/markup.hpp>
#include <core/utils.hpp>
#include <net/release.hpp>
#include <platform/archive.hpp>
#include <platform/platform.hpp>
#include <platform/process.hpp>
#include <progress/live_display.hpp>
#include <fmt/format.h>
#include <system_error>

static constexpr int GIT_TIMEOUT_MS = 60000;

// Removes a temp file or directory on scope exit unless it is already gone
class TempPathGuard {
public:
    explicit TempPathGuard(fs::path path) : path_(std::move(path)) {}
    ~TempPathGuard() {
        std::error_code ec;
        fs::remove_all(path_, ec);
        if (ec) forgeloop_logf("temp cleanup failed for {}: {}", path_.string(), ec.message());
    }
    TempPathGuard(const TempPathGuard&) = delete;
    TempPathGuard& operator=(const TempPathGuard&) = delete;

private:
    fs::path path_;
};

static std::string first_line(const std::string& text) {
    auto nl = text.find('\n');
    return trimmed(nl == std::string::npos ? text : text.substr(0, nl));
}

InitCommand::InitCommand(const Config& config, InitOptions options, std::ostream& out, bool ansi)
    : config_(config), opts_(std::move(options)), out_(out), ansi_(ansi),
      tracker_("Initialize ForgeLoop Project") {}

int InitCommand::run() {
    HttpClientOptions http_opts;
    http_opts.user_agent = fmt::format("{}/{}", config_.http().user_agent, FORGELOOP_VERSION);
    http_opts.timeout_secs = config_.http().timeout;
    http_opts.connect_timeout_secs = config_.http().connect_timeout;
    HttpClient http(http_opts);
    return run(http);
}

int InitCommand::run(HttpClient& http) {
    const AgentInfo* agent = find_agent(opts_.ai);

    out_ << theme::section("New Project");
    out_ << theme::kv("Project", opts_.here ? fs::path(opts_.target_dir()).filename().string()
                                            : opts_.project_name);
    out_ << theme::kv("Directory", opts_.target_dir().string());
    out_ << theme::kv("Agent", agent ? agent->name : opts_.ai);
    out_ << theme::kv("Script", script_type_description(opts_.script));
    out_ << "\n";

    if (!validate_target()) return 1;

    FetchClient fetch(http, opts_.github_token);
    forgeloop_logf("init: target={} agent={} script={} authenticated={}",
                   opts_.target_dir().string(), opts_.ai, opts_.script, fetch.authenticated());

    bool ok;
    {
        LiveDisplay display(tracker_, out_, ansi_, config_.display().refresh_ms);
        ok = run_steps(fetch);
        display.finish();
    }

    if (!ok) {
        if (created_target_) {
            std::error_code ec;
            fs::remove_all(opts_.target_dir(), ec);
            if (ec) forgeloop_logf("could not remove {}: {}", opts_.target_dir().string(), ec.message());
        }
        out_ << "\n" << (ansi_ ? markup::to_ansi(failure_) : markup::strip(failure_)) << "\n";
        return 1;
    }

    print_next_steps();
    return 0;
}

bool InitCommand::validate_target() {
    fs::path target = opts_.target_dir();
    std::error_code ec;

    if (opts_.here) {
        if (!fs::is_directory(target, ec)) {
            out_ << theme::fail("Not a directory: " + target.string());
            return false;
        }
        bool empty = fs::directory_iterator(target, ec) == fs::directory_iterator();
        if (ec) {
            out_ << theme::fail(fmt::format("Cannot read {}: {}", target.string(), ec.message()));
            return false;
        }
        if (!empty && !opts_.force) {
            out_ << theme::fail("Current directory is not empty");
            out_ << theme::info("Template files will be merged and may overwrite existing files");
            out_ << theme::info("Re-run with --force to continue");
            return false;
        }
        if (!empty) {
            out_ << theme::step("Merging template into non-empty directory (--force)");
        }
        return true;
    }

    if (fs::exists(target, ec)) {
        out_ << theme::fail(fmt::format("Directory '{}' already exists", opts_.project_name));
        out_ << theme::info("Choose a different name or use --here inside it");
        return false;
    }
    return true;
}

bool InitCommand::run_steps(FetchClient& fetch) {
    tracker_.add("precheck", "Check required tools");
    tracker_.add("fetch", "Fetch latest release");
    tracker_.add("download", "Download template");
    tracker_.add("extract", "Extract template");
    tracker_.add("chmod", "Ensure scripts executable");
    tracker_.add("cleanup", "Remove temporary files");
    tracker_.add("git", "Initialize git repository");
    tracker_.add("final", "Finalize");

    if (!step_precheck()) return false;

    std::string asset_url;
    std::string asset_name;
    if (!step_fetch(fetch, asset_url, asset_name)) return false;

    fs::path zip_path = platform::temp_file("forgeloop", ".zip");
    fs::path staging = platform::temp_file("forgeloop_extract");
    TempPathGuard zip_guard(zip_path);
    TempPathGuard staging_guard(staging);

    if (!step_download(fetch, asset_url, zip_path)) return false;
    if (!step_extract(zip_path, staging)) return false;

    step_chmod();
    step_cleanup(zip_path, staging);
    step_git();

    tracker_.complete("final", "project ready");
    return true;
}

bool InitCommand::step_precheck() {
    tracker_.start("precheck");
    const AgentInfo* agent = find_agent(opts_.ai);
    if (!agent) {
        fail_step("precheck", fmt::format("Unknown agent '{}'", markup::escape(opts_.ai)));
        return false;
    }
    if (!agent->requires_cli) {
        tracker_.complete("precheck", agent->name + ", no CLI needed");
        return true;
    }
    if (opts_.ignore_agent_tools) {
        tracker_.skip("precheck", "--ignore-agent-tools");
        return true;
    }

    bool found = platform::find_executable(agent->key).has_value();
    if (!found && agent->key == "claude") {
        // `claude migrate-installer` moves the binary out of PATH
        std::error_code ec;
        found = fs::exists(platform::home_dir() / ".claude" / "local" / "claude", ec);
    }
    if (!found) {
        fail_step("precheck", fmt::format(
            "[bold]{} CLI not found[/bold]\n"
            "Install it from {} or re-run with --ignore-agent-tools",
            markup::escape(agent->name), markup::escape(agent->install_url)));
        return false;
    }
    tracker_.complete("precheck", agent->name);
    return true;
}

bool InitCommand::step_fetch(FetchClient& fetch, std::string& asset_url, std::string& asset_name) {
    const auto& gh = config_.github();
    tracker_.start("fetch", fmt::format("{}/{}", gh.owner, gh.repo));

    auto release = fetch_latest_release(fetch, gh);
    if (release.is_err()) {
        fail_step("fetch", release.error);
        return false;
    }

    auto asset = select_template_asset(release.value, opts_.ai, opts_.script);
    if (asset.is_err()) {
        fail_step("fetch", asset.error);
        return false;
    }

    asset_url = asset.value.download_url;
    asset_name = asset.value.name;
    tracker_.complete("fetch", release.value.tag);
    forgeloop_logf("selected asset {} ({} bytes)", asset_name, asset.value.size);
    return true;
}

bool InitCommand::step_download(FetchClient& fetch, const std::string& url, const fs::path& zip_path) {
    tracker_.start("download");

    auto progress = [this](int64_t downloaded, int64_t total) {
        if (total > 0) {
            tracker_.start("download", fmt::format("{} / {}", format_bytes(downloaded), format_bytes(total)));
        } else {
            tracker_.start("download", format_bytes(downloaded));
        }
    };

    auto result = fetch.download(url, zip_path, progress);
    if (result.is_err()) {
        fail_step("download", result.error);
        return false;
    }

    std::error_code ec;
    auto size = fs::file_size(zip_path, ec);
    tracker_.complete("download", ec ? std::string("done") : format_bytes(static_cast<int64_t>(size)));
    return true;
}

bool InitCommand::step_extract(const fs::path& zip_path, const fs::path& staging) {
    tracker_.start("extract");
    fs::path target = opts_.target_dir();
    try {
        platform::extract_zip(zip_path, staging);
        if (platform::flatten_single_root(staging)) {
            forgeloop_log("flattened single top-level directory in template");
        }
        if (!opts_.here && !fs::exists(target)) {
            fs::create_directories(target);
            created_target_ = true;
        }
        written_ = platform::merge_tree(staging, target);
    } catch (const std::exception& e) {
        fail_step("extract", markup::escape(e.what()));
        return false;
    }
    tracker_.complete("extract", fmt::format("{} files", written_.size()));
    return true;
}

void InitCommand::step_chmod() {
    if (opts_.script != "sh") {
        tracker_.skip("chmod", "PowerShell scripts");
        return;
    }
    tracker_.start("chmod");

    fs::path target = opts_.target_dir();
    int updated = 0;
    int failed = 0;
    for (const auto& rel : written_) {
        fs::path p = target / rel;
        if (p.extension() != ".sh") continue;
        try {
            platform::make_executable(p);
            updated++;
        } catch (const fs::filesystem_error& e) {
            forgeloop_logf("chmod failed for {}: {}", p.string(), e.what());
            failed++;
        }
    }

    if (failed > 0) {
        tracker_.error("chmod", fmt::format("{} updated, {} failed", updated, failed));
    } else {
        tracker_.complete("chmod", fmt::format("{} updated", updated));
    }
}

void InitCommand::step_cleanup(const fs::path& zip_path, const fs::path& staging) {
    tracker_.start("cleanup");
    std::error_code zip_ec;
    std::error_code dir_ec;
    fs::remove(zip_path, zip_ec);
    fs::remove_all(staging, dir_ec);
    if (zip_ec || dir_ec) {
        tracker_.error("cleanup", (zip_ec ? zip_ec : dir_ec).message());
    } else {
        tracker_.complete("cleanup");
    }
}

void InitCommand::step_git() {
    fs::path target = opts_.target_dir();

    if (opts_.no_git) {
        tracker_.skip("git", "--no-git");
        return;
    }
    std::error_code ec;
    if (fs::exists(target / ".git", ec)) {
        tracker_.skip("git", "existing repo detected");
        return;
    }
    if (!platform::find_executable("git")) {
        tracker_.skip("git", "git not found");
        return;
    }

    tracker_.start("git", "init");
    const std::string dir = target.string();
    const std::vector<std::vector<std::string>> commands = {
        {"-C", dir, "init", "--quiet"},
        {"-C", dir, "add", "."},
        {"-C", dir, "commit", "--quiet", "-m", "Initial commit from ForgeLoop template"},
    };
    for (const auto& args : commands) {
        auto res = platform::run_process("git", args, GIT_TIMEOUT_MS);
        if (!res.success()) {
            forgeloop_logf("git {} failed ({}): {}", args[2], res.exit_code, res.output);
            std::string why = res.timed_out ? "timed out" : first_line(res.output);
            tracker_.error("git", fmt::format("git {} failed{}{}", args[2],
                                              why.empty() ? "" : ": ", why));
            return;
        }
    }
    tracker_.complete("git", "initial commit");
}

void InitCommand::fail_step(const std::string& key, const std::string& diagnostic) {
    failure_ = diagnostic;
    forgeloop_logf("step {} failed: {}", key, markup::strip(diagnostic));

    std::string summary = first_line(markup::strip(diagnostic));
    tracker_.error(key, summary);

    std::vector<std::string> pending;
    for (const auto& s : tracker_.steps()) {
        if (s.status == StepStatus::Pending) pending.push_back(s.key);
    }
    for (const auto& k : pending) {
        tracker_.skip(k);
    }
}

void InitCommand::print_next_steps() {
    const AgentInfo* agent = find_agent(opts_.ai);

    out_ << theme::section("Next Steps");
    int n = 1;
    if (!opts_.here) {
        out_ << theme::step(fmt::format("{}. cd {}", n++, opts_.project_name));
    }
    if (agent) {
        out_ << theme::step(fmt::format("{}. Start {} in the project folder", n++, agent->name));
    }
    out_ << theme::step(fmt::format("{}. Review the template files under {}", n++,
                                    opts_.here ? std::string(".") : opts_.project_name));

    if (agent && !agent->folder.empty()) {
        out_ << "\n";
        out_ << theme::info(fmt::format("{} may store credentials or auth tokens; "
                                        "consider adding it to .gitignore", agent->folder));
    }
    out_ << "\n" << theme::ok("Project ready") << "\n";
}
