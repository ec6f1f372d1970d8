/*
 * uv_adapter.hpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/**
 * @file uv_adapter.hpp
 * @brief Adapter for uv projects and uv-managed virtual environments
 * @date 2024
 * @version 1.0.0
 *
 * Projects with a named [project] table use `uv add`/`uv remove`/`uv sync`;
 * anything else falls back to `uv pip` against <dir>/.venv.
 */

#ifndef BOTTLES_PM_UV_ADAPTER_HPP
#define BOTTLES_PM_UV_ADAPTER_HPP

#include "adapter.hpp"

namespace bottles::pm {

namespace uv_confidence {
inline constexpr double BASE = 0.5;
inline constexpr double LOCK_FILE = 0.95;
inline constexpr double DEPENDENCY_GROUPS = 0.85;
inline constexpr double TOOL_UV = 0.9;
inline constexpr double UV_SOURCES = 0.92;
inline constexpr double UV_INDEX = 0.9;
inline constexpr double WORKSPACE = 0.95;
inline constexpr double WORKSPACE_LOCK_BONUS = 0.02;
inline constexpr double UNREADABLE_FACTOR = 0.5;
inline constexpr double UNREADABLE_FLOOR = 0.1;
inline constexpr double THRESHOLD = 0.5;  ///< Detected at or above
}  // namespace uv_confidence

class UvAdapter : public PackageManagerAdapter {
public:
    explicit UvAdapter(AdapterContext context);

    [[nodiscard]] std::string_view name() const noexcept override {
        return "uv";
    }
    [[nodiscard]] std::string_view displayName() const noexcept override {
        return "uv";
    }
    [[nodiscard]] volume::PackageManagerId managerId() const noexcept override {
        return volume::PackageManagerId::Uv;
    }

    /**
     * @brief UV_COMMAND from the environment, default uv
     */
    [[nodiscard]] std::string executable() const override;

    [[nodiscard]] const std::vector<std::string>& manifestFiles()
        const override;
    [[nodiscard]] const std::vector<std::string>& lockFiles() const override;

    [[nodiscard]] PmResult<DetectionResult> detectProject(
        const fs::path& dir) override;

    /**
     * @brief Read pyproject.toml, pinning versions from uv.lock when present
     *
     * @return nullopt when there is no pyproject.toml or it has no [project]
     * table; ManifestParseError when pyproject.toml is not valid TOML
     */
    [[nodiscard]] PmResult<std::optional<Manifest>> parseManifest(
        const fs::path& dir) override;

    [[nodiscard]] PmResult<CommandOutcome> installPackages(
        const std::vector<std::string>& packages,
        const InstallOptions& options) override;

    [[nodiscard]] PmResult<CommandOutcome> uninstallPackages(
        const std::vector<std::string>& packages,
        const InstallOptions& options) override;

    [[nodiscard]] PmResult<std::vector<PackageInfo>> getInstalledPackages(
        const fs::path& dir) override;

    [[nodiscard]] PmResult<CommandOutcome> createEnvironment(
        const fs::path& dir,
        const std::optional<std::string>& pythonVersion) override;

    [[nodiscard]] PmResult<EnvironmentMap> activateEnvironment(
        const fs::path& dir) override;

    [[nodiscard]] PmResult<CachePaths> getCachePaths() const override;

    [[nodiscard]] ValidationResult validateInstallation(
        const fs::path& dir) override;

    /**
     * @brief True when pyproject.toml in @p dir has a named [project]
     */
    [[nodiscard]] bool isUvProject(const fs::path& dir) const;

protected:
    [[nodiscard]] PmResult<EnvironmentMap> getEnvironmentVariables(
        const EnvironmentMap& overrides, const fs::path& dir) override;

private:
    [[nodiscard]] std::vector<std::string> buildInstallArgs(
        const InstallOptions& options) const;
};

}  // namespace bottles::pm

#endif  // BOTTLES_PM_UV_ADAPTER_HPP
