/*
 * command_runner.hpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/**
 * @file command_runner.hpp
 * @brief Abstract interface for anything that runs shell commands
 * @date 2024
 * @version 1.0.0
 */

#ifndef BOTTLES_SHELL_COMMAND_RUNNER_HPP
#define BOTTLES_SHELL_COMMAND_RUNNER_HPP

#include <chrono>
#include <string>

#include "types.hpp"

namespace bottles::shell {

/**
 * @brief Contract consumed by package manager adapters
 *
 * ShellEngine is the production implementation; tests substitute a mock
 * that records command lines.
 */
class ICommandRunner {
public:
    virtual ~ICommandRunner() = default;

    /**
     * @brief Run a command with an activity-based timeout
     * @param command Shell command line
     * @param timeout Maximum time without stdout activity
     */
    virtual auto execute(const std::string& command,
                         std::chrono::milliseconds timeout)
        -> ShellResult<CommandResult> = 0;

    [[nodiscard]] virtual auto isAlive() const noexcept -> bool = 0;
};

}  // namespace bottles::shell

#endif  // BOTTLES_SHELL_COMMAND_RUNNER_HPP
