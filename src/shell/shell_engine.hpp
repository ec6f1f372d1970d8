/*
 * shell_engine.hpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/**
 * @file shell_engine.hpp
 * @brief Persistent shell process with activity-based command timeouts
 * @date 2024
 * @version 1.0.0
 *
 * A ShellEngine owns exactly one long-lived shell child process:
 * - Commands run sequentially; a concurrent execute() is rejected
 * - The idle timeout resets on stdout activity only
 * - A timed-out command is interrupted but the shell stays usable; a
 *   command that ignores the interrupt costs a shell restart and its state
 * - Signal operations never throw
 */

#ifndef BOTTLES_SHELL_SHELL_ENGINE_HPP
#define BOTTLES_SHELL_SHELL_ENGINE_HPP

#include <chrono>
#include <memory>
#include <string>

#include "command_runner.hpp"
#include "config/environment_snapshot.hpp"
#include "types.hpp"

namespace bottles::shell {

/**
 * @brief One persistent interactive-style shell session
 */
class ShellEngine : public ICommandRunner {
public:
    /**
     * @brief Construct without spawning; call initialize() before use
     * @param options Engine options
     * @param environment Parent environment used to build the child's
     */
    explicit ShellEngine(
        EngineOptions options = {},
        config::EnvironmentSnapshot environment =
            config::EnvironmentSnapshot::capture());

    /**
     * @brief Runs cleanup()
     */
    ~ShellEngine() override;

    ShellEngine(const ShellEngine&) = delete;
    ShellEngine& operator=(const ShellEngine&) = delete;
    ShellEngine(ShellEngine&&) noexcept;
    ShellEngine& operator=(ShellEngine&&) noexcept;

    /**
     * @brief Spawn the shell and wait for its ready marker
     *
     * No-op when already initialized and alive.
     */
    [[nodiscard]] ShellResult<void> initialize();

    /**
     * @brief Execute a command
     * @param command Shell command line
     * @param timeout Maximum time without stdout output (<= 0: default)
     * @return Result with timedOut set on timeout, or an error if the
     * command could not be submitted
     */
    auto execute(const std::string& command,
                 std::chrono::milliseconds timeout)
        -> ShellResult<CommandResult> override;

    /**
     * @brief Execute with a timeout picked from the command's category
     */
    auto execute(const std::string& command) -> ShellResult<CommandResult>;

    /**
     * @brief Best-effort SIGINT to the running command
     */
    SignalResult interrupt() noexcept;

    /**
     * @brief SIGTERM the shell; the engine is dead afterwards
     */
    SignalResult terminate() noexcept;

    /**
     * @brief SIGKILL the shell; the engine is dead afterwards
     */
    SignalResult forceKill() noexcept;

    /**
     * @brief Ask the shell to exit, escalate if needed, release resources
     */
    void cleanup() noexcept;

    [[nodiscard]] auto isAlive() const noexcept -> bool override;

    [[nodiscard]] bool isInitialized() const noexcept;

    [[nodiscard]] EngineStatus getStatus() const;

    [[nodiscard]] const std::string& id() const noexcept;

    [[nodiscard]] const EngineOptions& options() const noexcept;

private:
    class Impl;
    std::unique_ptr<Impl> pImpl_;
};

}  // namespace bottles::shell

#endif  // BOTTLES_SHELL_SHELL_ENGINE_HPP
