/*
 * bottles_config.hpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2024-11-30

Description: Library-wide configuration for bottles

**************************************************/

#ifndef BOTTLES_CONFIG_BOTTLES_CONFIG_HPP
#define BOTTLES_CONFIG_BOTTLES_CONFIG_HPP

#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "environment_snapshot.hpp"
#include "logging/types.hpp"

namespace bottles::config {

using json = nlohmann::json;

/**
 * @brief Defaults for persistent shell engines
 */
struct ShellSettings {
    std::string shellPath;                 ///< Empty = /bin/bash, else /bin/sh
    uint64_t defaultTimeoutMs{30000};      ///< Idle timeout for execute()
    uint64_t initTimeoutMs{5000};          ///< Readiness wait (3000 in CI)
    uint64_t maxCommandDurationMs{600000}; ///< Absolute per-command ceiling
    bool cleanEnv{false};                  ///< Minimal environment mode
    std::vector<std::string> preservePaths;  ///< Extra PATH entries (clean)

    [[nodiscard]] json toJson() const {
        return {{"shellPath", shellPath},
                {"defaultTimeoutMs", defaultTimeoutMs},
                {"initTimeoutMs", initTimeoutMs},
                {"maxCommandDurationMs", maxCommandDurationMs},
                {"cleanEnv", cleanEnv},
                {"preservePaths", preservePaths}};
    }

    [[nodiscard]] static ShellSettings fromJson(const json& j);
};

/**
 * @brief Execution pool configuration
 */
struct PoolSettings {
    size_t maxSize{5};  ///< Pooled instances before unpooled creation

    [[nodiscard]] json toJson() const { return {{"maxSize", maxSize}}; }

    [[nodiscard]] static PoolSettings fromJson(const json& j) {
        PoolSettings cfg;
        cfg.maxSize = j.value("maxSize", cfg.maxSize);
        return cfg;
    }
};

/**
 * @brief Top-level configuration
 *
 * Every field has a usable default; a JSON file only needs to name the
 * values it changes.
 */
struct BottlesConfig {
    std::filesystem::path bottlesDir;  ///< Root for all bottle state
    std::filesystem::path cacheRoot;   ///< Volume controller base directory
    ShellSettings shell;
    PoolSettings pool;
    std::optional<double> timeoutMultiplier;  ///< Overrides env detection
    logging::LoggingConfig logging;

    [[nodiscard]] json toJson() const;

    /**
     * @brief Build from JSON, keeping defaults for missing keys
     * @throws InvalidConfigException on type mismatches
     */
    [[nodiscard]] static BottlesConfig fromJson(const json& j);

    /**
     * @brief Load from a JSON file
     * @throws ConfigIOException if the file cannot be read or parsed
     */
    [[nodiscard]] static BottlesConfig loadFromFile(
        const std::filesystem::path& file);

    /**
     * @brief Defaults resolved against an environment snapshot
     *
     * Honors BOTTLE_CACHE_ROOT, PKG_LOCAL_TIMEOUT_MULTIPLIER,
     * BOTTLES_LOG_LEVEL and CI.
     */
    [[nodiscard]] static BottlesConfig fromEnvironment(
        const EnvironmentSnapshot& env);

    /**
     * @brief Apply environment overrides on top of this configuration
     */
    void applyEnvironment(const EnvironmentSnapshot& env);

    /**
     * @brief Install the logging section as the process-wide spdlog setup
     */
    void applyLogging() const;
};

/**
 * @brief Directory holding all bottle state
 *
 * $BOTTLE_CACHE_ROOT/bottles, else <cwd>/.pkg-local-cache/bottles.
 */
[[nodiscard]] std::filesystem::path resolveBottlesDir(
    const EnvironmentSnapshot& env);

/**
 * @brief Cache root below the bottles directory
 */
[[nodiscard]] std::filesystem::path resolveCacheRoot(
    const EnvironmentSnapshot& env);

}  // namespace bottles::config

#endif  // BOTTLES_CONFIG_BOTTLES_CONFIG_HPP
