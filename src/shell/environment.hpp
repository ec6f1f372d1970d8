/*
 * environment.hpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/**
 * @file environment.hpp
 * @brief Environment construction and platform helpers for shell engines
 * @date 2024
 * @version 1.0.0
 */

#ifndef BOTTLES_SHELL_ENVIRONMENT_HPP
#define BOTTLES_SHELL_ENVIRONMENT_HPP

#include <string>
#include <string_view>
#include <vector>

#include "config/environment_snapshot.hpp"
#include "types.hpp"

namespace bottles::shell {

inline constexpr std::string_view CMD_START_MARKER = "___CMD_START___";
inline constexpr std::string_view CMD_END_MARKER = "___CMD_END___";

/**
 * @brief Variables copied from the parent in clean mode when set
 */
[[nodiscard]] const std::vector<std::string>& essentialVariables();

/**
 * @brief Tools whose directories are added to a clean PATH
 */
[[nodiscard]] const std::vector<std::string>& commonToolNames();

/**
 * @brief /bin/bash when present, /bin/sh otherwise
 */
[[nodiscard]] std::string defaultShell();

/**
 * @brief "linux", "darwin" or "win32"
 */
[[nodiscard]] std::string platformName();

/**
 * @brief Build a minimal, deterministic environment
 *
 * Essential variables from @p parent, a PATH made of @p preservePaths, the
 * directories of detected common tools and the standard system directories,
 * plus TERM=dumb, NO_COLOR=1, CI=true and NONINTERACTIVE=1. Entries in
 * @p custom win.
 */
[[nodiscard]] EnvironmentMap createCleanEnvironment(
    const config::EnvironmentSnapshot& parent, const EnvironmentMap& custom,
    const std::vector<std::string>& preservePaths);

/**
 * @brief Inherit the parent environment minus prompt variables
 */
[[nodiscard]] EnvironmentMap createStandardEnvironment(
    const config::EnvironmentSnapshot& parent, const EnvironmentMap& custom);

/**
 * @brief Flatten to NAME=value strings for execve
 */
[[nodiscard]] std::vector<std::string> toEnvironmentBlock(
    const EnvironmentMap& env);

}  // namespace bottles::shell

#endif  // BOTTLES_SHELL_ENVIRONMENT_HPP
