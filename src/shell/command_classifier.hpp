/*
 * command_classifier.hpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/**
 * @file command_classifier.hpp
 * @brief Classifies shell commands to pick sensible timeouts
 * @date 2024
 * @version 1.0.0
 */

#ifndef BOTTLES_SHELL_COMMAND_CLASSIFIER_HPP
#define BOTTLES_SHELL_COMMAND_CLASSIFIER_HPP

#include <chrono>
#include <string_view>

namespace bottles::shell {

/**
 * @brief Broad kind of a shell command
 */
enum class CommandCategory {
    PackageInstall,
    PackageUninstall,
    PackageList,
    PackageSync,
    PackageBuild,
    EnvCreate,
    EnvSet,
    VersionCheck,
    Navigation,
    QuickCommand,
    Unknown
};

[[nodiscard]] constexpr std::string_view commandCategoryToString(
    CommandCategory category) noexcept {
    switch (category) {
        case CommandCategory::PackageInstall: return "package_install";
        case CommandCategory::PackageUninstall: return "package_uninstall";
        case CommandCategory::PackageList: return "package_list";
        case CommandCategory::PackageSync: return "package_sync";
        case CommandCategory::PackageBuild: return "package_build";
        case CommandCategory::EnvCreate: return "env_create";
        case CommandCategory::EnvSet: return "env_set";
        case CommandCategory::VersionCheck: return "version_check";
        case CommandCategory::Navigation: return "navigation";
        case CommandCategory::QuickCommand: return "quick_command";
        case CommandCategory::Unknown: return "unknown";
    }
    return "unknown";
}

/**
 * @brief Idle timeout plus an absolute ceiling for one command
 */
struct TimeoutProfile {
    std::chrono::milliseconds idleTimeout{30000};
    std::chrono::milliseconds absoluteMaximum{600000};

    [[nodiscard]] TimeoutProfile scaled(double multiplier) const;
};

[[nodiscard]] CommandCategory classifyCommand(std::string_view command);

/**
 * @brief Timeout profile for a category; @p command refines install and
 * build categories by package manager
 */
[[nodiscard]] TimeoutProfile recommendedTimeout(CommandCategory category,
                                                std::string_view command);

/**
 * @brief classifyCommand followed by recommendedTimeout
 */
[[nodiscard]] TimeoutProfile recommendedTimeout(std::string_view command);

}  // namespace bottles::shell

#endif  // BOTTLES_SHELL_COMMAND_CLASSIFIER_HPP
