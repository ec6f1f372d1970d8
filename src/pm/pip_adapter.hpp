/*
 * pip_adapter.hpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/**
 * @file pip_adapter.hpp
 * @brief Adapter for pip with requirements files, setup.py, setup.cfg and
 * PEP 621 pyproject.toml
 * @date 2024
 * @version 1.0.0
 */

#ifndef BOTTLES_PM_PIP_ADAPTER_HPP
#define BOTTLES_PM_PIP_ADAPTER_HPP

#include "adapter.hpp"

namespace bottles::pm {

/**
 * @brief Detection confidence contributed by each pip signal
 */
namespace pip_confidence {
inline constexpr double BASE = 0.4;
inline constexpr double REQUIREMENTS = 0.8;
inline constexpr double SETUP_FILES = 0.7;
inline constexpr double PLAIN_PYPROJECT = 0.6;
inline constexpr double UNREADABLE_PYPROJECT = 0.5;
inline constexpr double COMPETING_TOOL = 0.4;  ///< Upper bound
inline constexpr double LOCK_FILE = 0.9;
inline constexpr double VENV = 0.7;
inline constexpr double THRESHOLD = 0.5;  ///< Detected when strictly above
}  // namespace pip_confidence

class PipAdapter : public PackageManagerAdapter {
public:
    explicit PipAdapter(AdapterContext context);

    [[nodiscard]] std::string_view name() const noexcept override {
        return "pip";
    }
    [[nodiscard]] std::string_view displayName() const noexcept override {
        return "pip";
    }
    [[nodiscard]] volume::PackageManagerId managerId() const noexcept override {
        return volume::PackageManagerId::Pip;
    }

    /**
     * @brief PIP_COMMAND from the environment, default pip3
     */
    [[nodiscard]] std::string executable() const override;

    [[nodiscard]] const std::vector<std::string>& manifestFiles()
        const override;
    [[nodiscard]] const std::vector<std::string>& lockFiles() const override;

    [[nodiscard]] PmResult<DetectionResult> detectProject(
        const fs::path& dir) override;

    /**
     * @brief Merge every manifest found in @p dir
     *
     * Requirements files named *dev* or *test* feed devDependencies. A
     * manifest that fails to parse is logged and skipped.
     */
    [[nodiscard]] PmResult<std::optional<Manifest>> parseManifest(
        const fs::path& dir) override;

    /**
     * @brief pip install the packages, or every requirements file when
     * @p packages is empty
     */
    [[nodiscard]] PmResult<CommandOutcome> installPackages(
        const std::vector<std::string>& packages,
        const InstallOptions& options) override;

    [[nodiscard]] PmResult<CommandOutcome> uninstallPackages(
        const std::vector<std::string>& packages,
        const InstallOptions& options) override;

    /**
     * @brief pip list of the project venv; empty without a venv
     */
    [[nodiscard]] PmResult<std::vector<PackageInfo>> getInstalledPackages(
        const fs::path& dir) override;

    [[nodiscard]] PmResult<CommandOutcome> createEnvironment(
        const fs::path& dir,
        const std::optional<std::string>& pythonVersion) override;

    [[nodiscard]] PmResult<EnvironmentMap> activateEnvironment(
        const fs::path& dir) override;

    [[nodiscard]] PmResult<CachePaths> getCachePaths() const override;

    [[nodiscard]] VersionSpec parseVersionSpec(
        std::string_view spec) const override;

protected:
    [[nodiscard]] PmResult<EnvironmentMap> getEnvironmentVariables(
        const EnvironmentMap& overrides, const fs::path& dir) override;

private:
    [[nodiscard]] std::vector<std::string> buildInstallArgs(
        const InstallOptions& options) const;
    [[nodiscard]] std::vector<fs::path> findRequirementsFiles(
        const fs::path& dir) const;
};

}  // namespace bottles::pm

#endif  // BOTTLES_PM_PIP_ADAPTER_HPP
