/*
 * test_environment.cpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include "shell/environment.hpp"

#include <algorithm>

using namespace bottles::shell;
using bottles::config::EnvironmentSnapshot;
using ::testing::HasSubstr;
using ::testing::Not;

namespace {

EnvironmentSnapshot parentEnvironment() {
    return EnvironmentSnapshot({{"HOME", "/home/tester"},
                                {"LANG", "C.UTF-8"},
                                {"PATH", "/usr/local/secret/bin:/usr/bin"},
                                {"PS1", "$ "},
                                {"PROMPT_COMMAND", "history -a"},
                                {"AWS_SECRET_ACCESS_KEY", "hunter2"}});
}

}  // namespace

// ============================================================================
// Clean Environment Tests
// ============================================================================

TEST(CleanEnvironmentTest, KeepsOnlyEssentialVariables) {
    auto env = createCleanEnvironment(parentEnvironment(), {}, {});

    EXPECT_EQ(env["HOME"], "/home/tester");
    EXPECT_EQ(env["LANG"], "C.UTF-8");
    EXPECT_FALSE(env.contains("AWS_SECRET_ACCESS_KEY"));
    EXPECT_FALSE(env.contains("PS1"));
}

TEST(CleanEnvironmentTest, SetsNonInteractiveFlags) {
    auto env = createCleanEnvironment(parentEnvironment(), {}, {});

    EXPECT_EQ(env["TERM"], "dumb");
    EXPECT_EQ(env["NO_COLOR"], "1");
    EXPECT_EQ(env["CI"], "true");
    EXPECT_EQ(env["NONINTERACTIVE"], "1");
}

TEST(CleanEnvironmentTest, PathStartsWithPreservedEntries) {
    auto env = createCleanEnvironment(parentEnvironment(), {},
                                      {"/opt/tools/bin", "/opt/tools/bin"});

    const auto& path = env["PATH"];
    EXPECT_TRUE(path.starts_with("/opt/tools/bin"));
    EXPECT_EQ(path.find("/opt/tools/bin"), path.rfind("/opt/tools/bin"));
    EXPECT_THAT(path, Not(HasSubstr("/usr/local/secret/bin")));
}

TEST(CleanEnvironmentTest, CustomVariablesWin) {
    auto env = createCleanEnvironment(parentEnvironment(),
                                      {{"TERM", "xterm"}, {"EXTRA", "1"}}, {});
    EXPECT_EQ(env["TERM"], "xterm");
    EXPECT_EQ(env["EXTRA"], "1");
}

// ============================================================================
// Standard Environment Tests
// ============================================================================

TEST(StandardEnvironmentTest, InheritsParentWithoutPrompts) {
    auto env = createStandardEnvironment(parentEnvironment(), {});

    EXPECT_EQ(env["AWS_SECRET_ACCESS_KEY"], "hunter2");
    EXPECT_EQ(env["PATH"], "/usr/local/secret/bin:/usr/bin");
    EXPECT_FALSE(env.contains("PS1"));
    EXPECT_FALSE(env.contains("PROMPT_COMMAND"));
    EXPECT_EQ(env["TERM"], "dumb");
    EXPECT_EQ(env["CI"], "true");
}

TEST(StandardEnvironmentTest, CustomOverridesParent) {
    auto env =
        createStandardEnvironment(parentEnvironment(), {{"HOME", "/tmp/h"}});
    EXPECT_EQ(env["HOME"], "/tmp/h");
}

TEST(EnvironmentBlockTest, SkipsInvalidNames) {
    auto block =
        toEnvironmentBlock({{"GOOD", "1"}, {"BAD=NAME", "2"}, {"", "3"}});
    ASSERT_EQ(block.size(), 1u);
    EXPECT_EQ(block[0], "GOOD=1");
}

TEST(PlatformTest, DefaultShellIsAbsolute) {
    EXPECT_TRUE(defaultShell().starts_with("/"));
    EXPECT_EQ(platformName(), "linux");
}
