/*
 * environment_snapshot.hpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/**
 * @file environment_snapshot.hpp
 * @brief Immutable copy of process environment variables
 * @date 2024
 * @version 1.0.0
 *
 * Components that depend on ambient variables (PATH, HOME, CI, ...) receive
 * an EnvironmentSnapshot instead of reading the live process environment.
 */

#ifndef BOTTLES_CONFIG_ENVIRONMENT_SNAPSHOT_HPP
#define BOTTLES_CONFIG_ENVIRONMENT_SNAPSHOT_HPP

#include <filesystem>
#include <functional>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace bottles::config {

/**
 * @brief Read-only view of environment variables captured at one point
 */
class EnvironmentSnapshot {
public:
    using VariableMap = std::map<std::string, std::string, std::less<>>;

    EnvironmentSnapshot() = default;
    explicit EnvironmentSnapshot(VariableMap variables);

    /**
     * @brief Capture the current process environment
     */
    [[nodiscard]] static EnvironmentSnapshot capture();

    [[nodiscard]] std::optional<std::string> get(std::string_view name) const;

    [[nodiscard]] std::string getOr(std::string_view name,
                                    std::string_view fallback) const;

    [[nodiscard]] bool has(std::string_view name) const;

    /**
     * @brief True when CI is set to anything other than "", "0" or "false"
     */
    [[nodiscard]] bool isCI() const;

    [[nodiscard]] const VariableMap& variables() const noexcept {
        return variables_;
    }

    /**
     * @brief Copy of this snapshot with the given variables replaced
     */
    [[nodiscard]] EnvironmentSnapshot with(const VariableMap& overrides) const;

    /**
     * @brief Directories listed in PATH, in order
     */
    [[nodiscard]] std::vector<std::filesystem::path> searchPath() const;

    /**
     * @brief Locate an executable on PATH
     * @return Full path of the first match, or nullopt
     */
    [[nodiscard]] std::optional<std::filesystem::path> findExecutable(
        std::string_view name) const;

    /**
     * @brief HOME (USERPROFILE on Windows), falling back to the temp dir
     */
    [[nodiscard]] std::filesystem::path homeDirectory() const;

private:
    VariableMap variables_;
};

}  // namespace bottles::config

#endif  // BOTTLES_CONFIG_ENVIRONMENT_SNAPSHOT_HPP
