/*
 * types.hpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/**
 * @file types.hpp
 * @brief Type definitions for the persistent shell engine
 * @date 2024
 * @version 1.0.0
 *
 * Error codes, option structures and result types shared by ShellEngine,
 * ShellPool and every command runner implementation.
 */

#ifndef BOTTLES_SHELL_TYPES_HPP
#define BOTTLES_SHELL_TYPES_HPP

#include <chrono>
#include <cstdint>
#include <expected>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace bottles::shell {

/**
 * @brief Error codes for shell engine operations
 */
enum class ShellError {
    Success = 0,
    InitFailed,      ///< Shell process could not be spawned
    InitTimeout,     ///< Shell did not print the ready marker in time
    InitDied,        ///< Shell exited before it became ready
    NotInitialized,  ///< execute() before a successful initialize()
    ShellNotAlive,   ///< Shell was terminated or crashed
    EngineBusy,      ///< Another command is in flight on this engine
    WriteFailed,     ///< Writing to the shell's stdin failed
    UnknownError
};

/**
 * @brief Get string representation of ShellError
 */
[[nodiscard]] constexpr std::string_view shellErrorToString(
    ShellError error) noexcept {
    switch (error) {
        case ShellError::Success:
            return "Success";
        case ShellError::InitFailed:
            return "Failed to spawn shell process";
        case ShellError::InitTimeout:
            return "Shell initialization timed out";
        case ShellError::InitDied:
            return "Shell process died during initialization";
        case ShellError::NotInitialized:
            return "Shell is not initialized";
        case ShellError::ShellNotAlive:
            return "Shell process is not alive";
        case ShellError::EngineBusy:
            return "Another command is already executing";
        case ShellError::WriteFailed:
            return "Failed to write to shell";
        case ShellError::UnknownError:
            return "Unknown error";
    }
    return "Unknown error";
}

/**
 * @brief Result type for shell operations
 */
template <typename T>
using ShellResult = std::expected<T, ShellError>;

using EnvironmentMap = std::map<std::string, std::string>;

/**
 * @brief Outcome of one execute() call
 */
struct CommandResult {
    std::string stdoutText;          ///< Output between the command markers
    std::string stderrText;          ///< Everything written to stderr
    int exitCode{-1};                ///< -1 on timeout or crash
    std::chrono::milliseconds duration{0};
    bool timedOut{false};

    [[nodiscard]] bool success() const noexcept {
        return exitCode == 0 && !timedOut;
    }
};

/**
 * @brief Outcome of a signal operation; never thrown
 */
struct SignalResult {
    bool success{false};
    std::string signal;  ///< "SIGINT", "SIGTERM" or "SIGKILL"
    std::optional<std::string> error;
};

/**
 * @brief Snapshot of an engine's state
 */
struct EngineStatus {
    std::string id;
    bool alive{false};
    bool initialized{false};
    std::string platform;
    std::string shell;
};

/**
 * @brief Options for constructing a ShellEngine
 */
struct EngineOptions {
    std::string cwd;                      ///< Empty = inherit
    EnvironmentMap env;                   ///< Overrides applied last
    std::string shell;                    ///< Empty = platform default
    std::chrono::milliseconds defaultTimeout{30000};
    std::chrono::milliseconds initTimeout{5000};
    std::chrono::milliseconds maxCommandDuration{600000};
    bool cleanEnv{false};                 ///< Minimal instead of inherited env
    std::vector<std::string> preservePaths;  ///< Leading PATH entries (clean)
    std::string id;                       ///< Empty = generated
    double timeoutMultiplier{1.0};        ///< Scales classifier timeouts
};

}  // namespace bottles::shell

#endif  // BOTTLES_SHELL_TYPES_HPP
