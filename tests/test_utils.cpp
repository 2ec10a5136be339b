#include <gtest/gtest.h>
#include <core/utils.hpp>
#include <core/agents.hpp>
#include <platform/platform.hpp>
#include <filesystem>
#include <cstdlib>
#include <fstream>

TEST(Utils, ParseInt64) {
    EXPECT_EQ(parse_int64("42").value_or(-1), 42);
    EXPECT_EQ(parse_int64("  7 ").value_or(-1), 7);
    EXPECT_EQ(parse_int64("-3").value_or(0), -3);
    EXPECT_FALSE(parse_int64(""));
    EXPECT_FALSE(parse_int64("12abc"));
    EXPECT_FALSE(parse_int64("abc"));
    EXPECT_FALSE(parse_int64("99999999999999999999999"));
}

TEST(Utils, FormatBytes) {
    EXPECT_EQ(format_bytes(512), "512 B");
    EXPECT_EQ(format_bytes(1536), "1.5 KB");
    EXPECT_EQ(format_bytes(3 * 1024 * 1024), "3.0 MB");
}

TEST(Utils, Trimmed) {
    EXPECT_EQ(trimmed("  a b \t\n"), "a b");
    EXPECT_EQ(trimmed("   "), "");
}

TEST(Agents, CatalogLookup) {
    const AgentInfo* claude = find_agent("claude");
    ASSERT_NE(claude, nullptr);
    EXPECT_TRUE(claude->requires_cli);
    EXPECT_EQ(claude->folder, ".claude/");

    const AgentInfo* copilot = find_agent("copilot");
    ASSERT_NE(copilot, nullptr);
    EXPECT_FALSE(copilot->requires_cli);

    EXPECT_EQ(find_agent("unknown"), nullptr);
    EXPECT_EQ(all_agents().size(), 15u);
    EXPECT_EQ(agent_keys_joined().rfind("copilot, claude", 0), 0u);
}

TEST(Agents, ScriptTypes) {
    EXPECT_TRUE(is_valid_script_type("sh"));
    EXPECT_TRUE(is_valid_script_type("ps"));
    EXPECT_FALSE(is_valid_script_type("bash"));
}

TEST(Platform, TempFileIsFresh) {
    auto a = platform::temp_file("forgeloop_t", ".zip");
    auto b = platform::temp_file("forgeloop_t", ".zip");
    EXPECT_NE(a, b);
    EXPECT_FALSE(std::filesystem::exists(a));
    EXPECT_EQ(a.extension(), ".zip");
}

TEST(Platform, MakeExecutable) {
    auto p = platform::temp_file("forgeloop_exec", ".sh");
    std::ofstream(p) << "#!/bin/sh\n";
    std::filesystem::permissions(p, std::filesystem::perms::owner_read | std::filesystem::perms::owner_write,
                                 std::filesystem::perm_options::replace);

    platform::make_executable(p);
    auto perms = std::filesystem::status(p).permissions();
    std::filesystem::remove(p);

    EXPECT_NE(perms & std::filesystem::perms::owner_exec, std::filesystem::perms::none);
    EXPECT_EQ(perms & std::filesystem::perms::others_exec, std::filesystem::perms::none);
}

TEST(Platform, GetEnvTreatsEmptyAsUnset) {
    setenv("FORGELOOP_TEST_VAR", "", 1);
    EXPECT_FALSE(platform::get_env("FORGELOOP_TEST_VAR"));
    setenv("FORGELOOP_TEST_VAR", "x", 1);
    EXPECT_EQ(platform::get_env("FORGELOOP_TEST_VAR").value_or(""), "x");
    unsetenv("FORGELOOP_TEST_VAR");
}
