/*
 * adapter.hpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/**
 * @file adapter.hpp
 * @brief Abstract base for package manager adapters
 * @date 2024
 * @version 1.0.0
 *
 * An adapter turns high-level package operations into command lines run
 * through an ICommandRunner, with the manager's cache redirected into the
 * bottle's volume. Derived classes provide detection, manifest parsing and
 * the concrete command lines; the base provides command execution,
 * environment construction and virtual environment discovery.
 */

#ifndef BOTTLES_PM_ADAPTER_HPP
#define BOTTLES_PM_ADAPTER_HPP

#include <chrono>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "timeouts.hpp"
#include "types.hpp"

namespace bottles::pm {

class PackageManagerAdapter {
public:
    /**
     * @param context Runner, volume controller, environment and project
     * directory; runner and volumes must not be null
     */
    explicit PackageManagerAdapter(AdapterContext context);
    virtual ~PackageManagerAdapter() = default;

    PackageManagerAdapter(const PackageManagerAdapter&) = delete;
    PackageManagerAdapter& operator=(const PackageManagerAdapter&) = delete;

    // Identity

    [[nodiscard]] virtual std::string_view name() const noexcept = 0;
    [[nodiscard]] virtual std::string_view displayName() const noexcept = 0;
    [[nodiscard]] virtual volume::PackageManagerId managerId() const noexcept = 0;
    [[nodiscard]] virtual std::string executable() const = 0;
    [[nodiscard]] virtual const std::vector<std::string>& manifestFiles()
        const = 0;
    [[nodiscard]] virtual const std::vector<std::string>& lockFiles() const = 0;

    // Project inspection

    [[nodiscard]] virtual PmResult<DetectionResult> detectProject(
        const fs::path& dir) = 0;

    /**
     * @return nullopt when the directory has no manifest this adapter reads
     */
    [[nodiscard]] virtual PmResult<std::optional<Manifest>> parseManifest(
        const fs::path& dir) = 0;

    // Package operations

    [[nodiscard]] virtual PmResult<CommandOutcome> installPackages(
        const std::vector<std::string>& packages,
        const InstallOptions& options) = 0;

    [[nodiscard]] virtual PmResult<CommandOutcome> uninstallPackages(
        const std::vector<std::string>& packages,
        const InstallOptions& options) = 0;

    [[nodiscard]] virtual PmResult<std::vector<PackageInfo>>
    getInstalledPackages(const fs::path& dir) = 0;

    // Virtual environments

    [[nodiscard]] virtual PmResult<CommandOutcome> createEnvironment(
        const fs::path& dir, const std::optional<std::string>& pythonVersion) = 0;

    /**
     * @brief Variables that activate the project's virtual environment
     */
    [[nodiscard]] virtual PmResult<EnvironmentMap> activateEnvironment(
        const fs::path& dir) = 0;

    // Shared behavior

    /**
     * @brief Cache directories of the manager's mount
     */
    [[nodiscard]] virtual PmResult<CachePaths> getCachePaths() const;

    /**
     * @brief Check that the executable runs and the project has manifests
     */
    [[nodiscard]] virtual ValidationResult validateInstallation(
        const fs::path& dir);

    [[nodiscard]] virtual VersionSpec parseVersionSpec(
        std::string_view spec) const;

    [[nodiscard]] std::string normalizePackageName(std::string_view name) const;

    [[nodiscard]] const fs::path& projectDir() const noexcept {
        return context_.projectDir;
    }
    [[nodiscard]] const config::EnvironmentSnapshot& environment()
        const noexcept {
        return context_.environment;
    }

protected:
    /**
     * @brief Run @p command with the adapter environment exported
     *
     * Runner failures map to ExecutionError, idle timeouts to
     * CommandTimedOut and non-zero exits to CommandFailed unless
     * options.suppressErrors is set.
     */
    [[nodiscard]] PmResult<CommandOutcome> executeCommand(
        const std::string& command, const ExecuteOptions& options);

    /**
     * @brief Environment for commands of this manager
     *
     * Mounts the cache when needed, then layers <NAME>_CACHE_DIR, the volume
     * variables and @p overrides, and finally inherits the snapshot.
     *
     * @param dir Directory the command runs in
     */
    [[nodiscard]] virtual PmResult<EnvironmentMap> getEnvironmentVariables(
        const EnvironmentMap& overrides, const fs::path& dir);

    /**
     * @brief Manifest files present in @p dir, in manifestFiles() order
     */
    [[nodiscard]] std::vector<fs::path> findManifestFiles(
        const fs::path& dir) const;
    [[nodiscard]] std::vector<fs::path> findLockFiles(const fs::path& dir) const;

    /**
     * @brief First of .venv, venv and env that exists, else <dir>/.venv
     */
    [[nodiscard]] fs::path getVenvPath(const fs::path& dir) const;
    [[nodiscard]] bool hasVenv(const fs::path& dir) const;

    /**
     * @brief `. "<venv>/bin/activate" && ` or empty when there is no venv
     */
    [[nodiscard]] std::string getVenvActivationPrefix(const fs::path& dir) const;

    [[nodiscard]] std::chrono::milliseconds timeoutFor(TimeoutTier tier) const;

    /**
     * @brief Space-joined, double-quoted arguments
     */
    [[nodiscard]] static std::string quoteArguments(
        const std::vector<std::string>& args);

    [[nodiscard]] static std::string shellQuote(std::string_view value);

    AdapterContext context_;
};

}  // namespace bottles::pm

#endif  // BOTTLES_PM_ADAPTER_HPP
