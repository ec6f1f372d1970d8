/*
 * test_shell_engine.cpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

#include <gtest/gtest.h>

#include "shell/shell_engine.hpp"

#include <chrono>
#include <future>
#include <thread>

using namespace bottles::shell;
using namespace std::chrono_literals;

class ShellEngineTest : public ::testing::Test {
protected:
    void SetUp() override {
        EngineOptions options;
        options.id = "engine-test";
        engine_ = std::make_unique<ShellEngine>(options);
        auto init = engine_->initialize();
        ASSERT_TRUE(init.has_value()) << shellErrorToString(init.error());
    }

    void TearDown() override { engine_.reset(); }

    std::unique_ptr<ShellEngine> engine_;
};

// ============================================================================
// Lifecycle Tests
// ============================================================================

TEST_F(ShellEngineTest, InitializedEngineIsAlive) {
    EXPECT_TRUE(engine_->isInitialized());
    EXPECT_TRUE(engine_->isAlive());

    auto status = engine_->getStatus();
    EXPECT_EQ(status.id, "engine-test");
    EXPECT_TRUE(status.alive);
    EXPECT_EQ(status.platform, "linux");
}

TEST_F(ShellEngineTest, InitializeTwiceIsNoOp) {
    EXPECT_TRUE(engine_->initialize().has_value());
    EXPECT_TRUE(engine_->isAlive());
}

TEST(ShellEngineStandaloneTest, ExecuteBeforeInitializeFails) {
    ShellEngine engine;
    auto result = engine.execute("echo hi", 1000ms);
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error(), ShellError::NotInitialized);
}

// ============================================================================
// Execution Tests
// ============================================================================

TEST_F(ShellEngineTest, CapturesStdoutAndExitCode) {
    auto result = engine_->execute("echo hello", 5000ms);
    ASSERT_TRUE(result.has_value());
    EXPECT_EQ(result->stdoutText, "hello");
    EXPECT_EQ(result->exitCode, 0);
    EXPECT_FALSE(result->timedOut);
    EXPECT_TRUE(result->success());
}

TEST_F(ShellEngineTest, CapturesStderrAndFailure) {
    auto result = engine_->execute("echo oops >&2; false", 5000ms);
    ASSERT_TRUE(result.has_value());
    EXPECT_EQ(result->stderrText, "oops");
    EXPECT_EQ(result->exitCode, 1);
    EXPECT_FALSE(result->success());
}

TEST_F(ShellEngineTest, StatePersistsBetweenCommands) {
    ASSERT_TRUE(engine_->execute("export BOTTLES_PERSIST=kept", 5000ms));
    ASSERT_TRUE(engine_->execute("cd /tmp", 5000ms));

    auto var = engine_->execute("echo $BOTTLES_PERSIST", 5000ms);
    ASSERT_TRUE(var.has_value());
    EXPECT_EQ(var->stdoutText, "kept");

    auto cwd = engine_->execute("pwd", 5000ms);
    ASSERT_TRUE(cwd.has_value());
    EXPECT_EQ(cwd->stdoutText, "/tmp");
}

TEST_F(ShellEngineTest, CommandCannotReadShellInput) {
    auto result = engine_->execute("cat", 2000ms);
    ASSERT_TRUE(result.has_value());
    EXPECT_FALSE(result->timedOut);

    auto next = engine_->execute("echo still-here", 5000ms);
    ASSERT_TRUE(next.has_value());
    EXPECT_EQ(next->stdoutText, "still-here");
}

TEST_F(ShellEngineTest, EmptyCommandSucceeds) {
    auto result = engine_->execute("   ", 5000ms);
    ASSERT_TRUE(result.has_value());
    EXPECT_EQ(result->exitCode, 0);
}

// ============================================================================
// Timeout Tests
// ============================================================================

TEST_F(ShellEngineTest, StdoutActivityResetsTimeout) {
    auto result = engine_->execute(
        "for i in $(seq 1 20); do echo tick $i; sleep 0.1; done", 300ms);
    ASSERT_TRUE(result.has_value());
    EXPECT_FALSE(result->timedOut);
    EXPECT_EQ(result->exitCode, 0);
    EXPECT_GE(result->duration, 1900ms);
}

TEST_F(ShellEngineTest, StderrActivityDoesNotResetTimeout) {
    auto result = engine_->execute(
        "for i in $(seq 1 20); do echo tick $i >&2; sleep 0.1; done", 300ms);
    ASSERT_TRUE(result.has_value());
    EXPECT_TRUE(result->timedOut);
    EXPECT_EQ(result->exitCode, -1);
    EXPECT_LT(result->duration, 1500ms);
}

TEST_F(ShellEngineTest, ShellUsableAfterTimeout) {
    auto slow = engine_->execute("sleep 5", 200ms);
    ASSERT_TRUE(slow.has_value());
    EXPECT_TRUE(slow->timedOut);

    auto next = engine_->execute("echo recovered", 5000ms);
    ASSERT_TRUE(next.has_value());
    EXPECT_FALSE(next->timedOut);
    EXPECT_EQ(next->exitCode, 0);
    EXPECT_EQ(next->stdoutText, "recovered");
}

TEST_F(ShellEngineTest, ShellUsableAfterLoopTimeout) {
    auto slow = engine_->execute(
        "for i in $(seq 1 20); do echo tick $i >&2; sleep 0.1; done", 300ms);
    ASSERT_TRUE(slow.has_value());
    EXPECT_TRUE(slow->timedOut);

    auto next = engine_->execute("echo recovered", 1000ms);
    ASSERT_TRUE(next.has_value());
    EXPECT_FALSE(next->timedOut);
    EXPECT_EQ(next->exitCode, 0);
    EXPECT_EQ(next->stdoutText, "recovered");
    EXPECT_TRUE(engine_->isAlive());
}

TEST_F(ShellEngineTest, ShellUsableAfterEndlessLoopTimeout) {
    auto slow = engine_->execute("while true; do sleep 0.2; done", 300ms);
    ASSERT_TRUE(slow.has_value());
    EXPECT_TRUE(slow->timedOut);
    EXPECT_EQ(slow->exitCode, -1);

    auto next = engine_->execute("echo recovered", 1000ms);
    ASSERT_TRUE(next.has_value());
    EXPECT_EQ(next->exitCode, 0);
    EXPECT_EQ(next->stdoutText, "recovered");
}

TEST_F(ShellEngineTest, StatePersistsAfterInterruptedSimpleCommand) {
    ASSERT_TRUE(engine_->execute("export BOTTLES_KEEP=kept", 1000ms));

    auto slow = engine_->execute("sleep 5", 200ms);
    ASSERT_TRUE(slow.has_value());
    EXPECT_TRUE(slow->timedOut);

    auto next = engine_->execute("echo $BOTTLES_KEEP", 1000ms);
    ASSERT_TRUE(next.has_value());
    EXPECT_EQ(next->stdoutText, "kept");
}

// ============================================================================
// Syntax Error Tests
// ============================================================================

TEST_F(ShellEngineTest, UnbalancedQuoteFailsWithoutPoisoningShell) {
    auto broken = engine_->execute("echo \"abc", 1000ms);
    ASSERT_TRUE(broken.has_value());
    EXPECT_FALSE(broken->timedOut);
    EXPECT_NE(broken->exitCode, 0);

    auto next = engine_->execute("echo recovered", 1000ms);
    ASSERT_TRUE(next.has_value());
    EXPECT_FALSE(next->timedOut);
    EXPECT_EQ(next->exitCode, 0);
    EXPECT_EQ(next->stdoutText, "recovered");
}

TEST_F(ShellEngineTest, UnclosedBraceFailsWithoutPoisoningShell) {
    auto broken = engine_->execute("{ echo partial", 1000ms);
    ASSERT_TRUE(broken.has_value());
    EXPECT_FALSE(broken->timedOut);
    EXPECT_NE(broken->exitCode, 0);

    auto next = engine_->execute("echo recovered", 1000ms);
    ASSERT_TRUE(next.has_value());
    EXPECT_EQ(next->stdoutText, "recovered");
}

TEST_F(ShellEngineTest, SingleQuotesInCommandArePreserved) {
    auto result = engine_->execute("echo 'it'\"'\"'s here'", 1000ms);
    ASSERT_TRUE(result.has_value());
    EXPECT_EQ(result->exitCode, 0);
    EXPECT_EQ(result->stdoutText, "it's here");
}

// ============================================================================
// Concurrency Tests
// ============================================================================

TEST_F(ShellEngineTest, ConcurrentExecuteIsRejected) {
    auto first = std::async(std::launch::async, [this] {
        return engine_->execute("sleep 1; echo done", 5000ms);
    });
    std::this_thread::sleep_for(200ms);

    auto second = engine_->execute("echo intruder", 5000ms);
    ASSERT_FALSE(second.has_value());
    EXPECT_EQ(second.error(), ShellError::EngineBusy);

    auto firstResult = first.get();
    ASSERT_TRUE(firstResult.has_value());
    EXPECT_EQ(firstResult->stdoutText, "done");
}

// ============================================================================
// Signal Tests
// ============================================================================

TEST_F(ShellEngineTest, TerminateKillsShell) {
    auto result = engine_->terminate();
    EXPECT_TRUE(result.success);
    EXPECT_EQ(result.signal, "SIGTERM");
    EXPECT_FALSE(engine_->isAlive());

    auto after = engine_->execute("echo hi", 1000ms);
    ASSERT_FALSE(after.has_value());
    EXPECT_EQ(after.error(), ShellError::ShellNotAlive);
}

TEST_F(ShellEngineTest, SignalsOnDeadShellReportErrors) {
    ASSERT_TRUE(engine_->forceKill().success);

    auto interrupt = engine_->interrupt();
    EXPECT_FALSE(interrupt.success);
    EXPECT_EQ(interrupt.signal, "SIGINT");
    EXPECT_TRUE(interrupt.error.has_value());

    auto kill = engine_->forceKill();
    EXPECT_FALSE(kill.success);
    EXPECT_TRUE(kill.error.has_value());
}

TEST_F(ShellEngineTest, CleanupIsIdempotent) {
    engine_->cleanup();
    EXPECT_FALSE(engine_->isAlive());
    engine_->cleanup();
    EXPECT_FALSE(engine_->isAlive());
}

// ============================================================================
// Environment Tests
// ============================================================================

TEST(ShellEngineEnvironmentTest, CleanModeDropsParentVariables) {
    EngineOptions options;
    options.cleanEnv = true;
    options.env = {{"BOTTLES_CUSTOM", "yes"}};
    bottles::config::EnvironmentSnapshot parent(
        {{"PATH", "/usr/bin:/bin"}, {"BOTTLES_LEAK", "secret"}});
    ShellEngine engine(options, parent);
    ASSERT_TRUE(engine.initialize().has_value());

    auto result = engine.execute(
        "echo \"${BOTTLES_LEAK:-unset}:${BOTTLES_CUSTOM}:${NONINTERACTIVE}\"",
        5000ms);
    ASSERT_TRUE(result.has_value());
    EXPECT_EQ(result->stdoutText, "unset:yes:1");
}
