/*
 * volume_controller.hpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/**
 * @file volume_controller.hpp
 * @brief Per-bottle package manager cache mounts
 * @date 2024
 * @version 1.0.0
 *
 * A VolumeController gives each package manager of one bottle its own
 * cache directory under a shared base directory:
 * - Mounts are idempotent and never deleted, only deactivated
 * - Environment variables point the managers at their bottle caches
 * - Statistics are computed on demand by walking active mounts
 */

#ifndef BOTTLES_VOLUME_VOLUME_CONTROLLER_HPP
#define BOTTLES_VOLUME_VOLUME_CONTROLLER_HPP

#include <map>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "config/environment_snapshot.hpp"
#include "types.hpp"

namespace bottles::volume {

class VolumeController {
public:
    /**
     * @param bottleId Identifier of the owning bottle
     * @param config Volume options; empty paths are resolved from @p env
     * @param env Environment used for HOME, PWD and BOTTLE_CACHE_ROOT
     */
    explicit VolumeController(std::string bottleId, VolumeConfig config = {},
                              config::EnvironmentSnapshot env =
                                  config::EnvironmentSnapshot::capture());
    ~VolumeController();

    VolumeController(const VolumeController&) = delete;
    VolumeController& operator=(const VolumeController&) = delete;
    VolumeController(VolumeController&&) noexcept;
    VolumeController& operator=(VolumeController&&) noexcept;

    /**
     * @brief Create the base directory and record inactive mounts for the
     * chosen managers
     *
     * No-op when already initialized.
     */
    [[nodiscard]] VolumeResult<void> initialize();

    /**
     * @brief Create or refresh the mount for @p manager and activate it
     * @param customPath Cache directory to use instead of the default
     */
    [[nodiscard]] VolumeResult<VolumeMount> mount(
        PackageManagerId manager,
        const std::optional<fs::path>& customPath = std::nullopt);

    /**
     * @brief Deactivate a mount
     * @return false if no mount exists for @p manager
     */
    bool unmount(PackageManagerId manager);

    /**
     * @brief Empty one cache directory, or every one when @p manager is
     * nullopt
     */
    [[nodiscard]] VolumeResult<void> clear(
        std::optional<PackageManagerId> manager = std::nullopt);

    [[nodiscard]] VolumeStats getStats() const;

    [[nodiscard]] VolumeResult<CacheStats> getCacheStats(
        PackageManagerId manager) const;

    /**
     * @brief Cache variables for every active mount
     */
    [[nodiscard]] std::map<std::string, std::string> getMountEnvVars() const;

    [[nodiscard]] std::optional<VolumeMount> getMount(
        PackageManagerId manager) const;
    [[nodiscard]] std::vector<VolumeMount> getActiveMounts() const;
    [[nodiscard]] std::vector<VolumeMount> getAllMounts() const;

    [[nodiscard]] const std::string& getBottleId() const noexcept;
    [[nodiscard]] bool isInitialized() const noexcept;

    /**
     * @brief Deactivate every mount and forget them
     */
    void cleanup();

    [[nodiscard]] fs::path getSystemCachePath(PackageManagerId manager) const;
    [[nodiscard]] fs::path getBottleCachePath(PackageManagerId manager) const;

    [[nodiscard]] const VolumeConfig& config() const noexcept;

private:
    class Impl;
    std::unique_ptr<Impl> pImpl_;
};

}  // namespace bottles::volume

#endif  // BOTTLES_VOLUME_VOLUME_CONTROLLER_HPP
