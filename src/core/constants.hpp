#pragma once

// ── Version ─────────────────────────────────────────────────
constexpr const char* FORGELOOP_VERSION = "0.4.0";

// ── GitHub defaults ─────────────────────────────────────────
constexpr const char* DEFAULT_GITHUB_OWNER    = "forgeloop-dev";
constexpr const char* DEFAULT_GITHUB_REPO     = "forgeloop";
constexpr const char* DEFAULT_GITHUB_API_BASE = "https://api.github.com";

// Use fmt::format with these: fmt::format(GITHUB_LATEST_RELEASE, api_base, owner, repo)
constexpr const char* GITHUB_LATEST_RELEASE = "{}/repos/{}/{}/releases/latest";

// Release assets are named forge-loop-template-{agent}-{script}-{version}.zip
constexpr const char* TEMPLATE_ASSET_PREFIX = "forge-loop-template-{}-{}";

// ── Token lookup ────────────────────────────────────────────
// Checked in this order after an explicit --github-token.
constexpr const char* TOKEN_ENV_PRIMARY   = "GH_TOKEN";
constexpr const char* TOKEN_ENV_SECONDARY = "GITHUB_TOKEN";

// ── HTTP ────────────────────────────────────────────────────
constexpr int HTTP_TIMEOUT_SECS         = 60;
constexpr int HTTP_CONNECT_TIMEOUT_SECS = 15;
constexpr const char* HTTP_USER_AGENT   = "forgeloop-cli";
constexpr long HTTP_MAX_REDIRECTS       = 10;

// ── Display ─────────────────────────────────────────────────
constexpr int LIVE_REFRESH_MS = 80;       // coalescing window for live redraws

// ── Rate limits (documented GitHub quotas, used in diagnostics) ──
constexpr const char* RATE_LIMIT_AUTHENTICATED   = "5,000/hour";
constexpr const char* RATE_LIMIT_UNAUTHENTICATED = "60/hour";
