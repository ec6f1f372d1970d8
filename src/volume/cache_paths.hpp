/*
 * cache_paths.hpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/**
 * @file cache_paths.hpp
 * @brief Cache locations, mount labels and project-based manager detection
 * @date 2024
 * @version 1.0.0
 */

#ifndef BOTTLES_VOLUME_CACHE_PATHS_HPP
#define BOTTLES_VOLUME_CACHE_PATHS_HPP

#include <filesystem>
#include <string>
#include <string_view>
#include <vector>

#include "types.hpp"

namespace bottles::volume {

/**
 * @brief Host cache directory a package manager uses outside any bottle
 * @param manager Package manager
 * @param home User home directory
 */
[[nodiscard]] fs::path getSystemCachePath(PackageManagerId manager,
                                          const fs::path& home);

/**
 * @brief <baseCacheDir>/<manager>
 */
[[nodiscard]] fs::path getBottleCacheDir(PackageManagerId manager,
                                         const fs::path& baseCacheDir);

/**
 * @brief Abstract mount label, e.g. /bottle/pip-cache
 */
[[nodiscard]] std::string_view getMountPath(PackageManagerId manager) noexcept;

/**
 * @brief Subfolders created inside a freshly mounted cache
 */
[[nodiscard]] std::vector<std::string_view> getCacheSubdirectories(
    PackageManagerId manager);

/**
 * @brief Guess managers from marker files in @p projectDir
 *
 * Only file existence is checked; nothing is parsed.
 */
[[nodiscard]] std::vector<PackageManagerId> detectPackageManagers(
    const fs::path& projectDir);

/**
 * @brief True when @p path is an existing directory we can read and write
 */
[[nodiscard]] bool validateCacheDir(const fs::path& path);

}  // namespace bottles::volume

#endif  // BOTTLES_VOLUME_CACHE_PATHS_HPP
