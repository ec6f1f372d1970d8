/*
 * types.hpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/**
 * @file types.hpp
 * @brief Type definitions for bottle cache volumes
 * @date 2024
 * @version 1.0.0
 */

#ifndef BOTTLES_VOLUME_TYPES_HPP
#define BOTTLES_VOLUME_TYPES_HPP

#include <array>
#include <chrono>
#include <cstdint>
#include <expected>
#include <filesystem>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace bottles::volume {

namespace fs = std::filesystem;

using TimePoint = std::chrono::system_clock::time_point;

/**
 * @brief Package managers whose caches can be mounted into a bottle
 */
enum class PackageManagerId {
    Pip,
    Npm,
    Yarn,
    Pnpm,
    Bun,
    Poetry,
    Uv,
    Pipenv,
    Maven,
    Gradle,
    Cargo,
    Go
};

inline constexpr std::array<PackageManagerId, 12> ALL_PACKAGE_MANAGERS = {
    PackageManagerId::Pip,    PackageManagerId::Npm,    PackageManagerId::Yarn,
    PackageManagerId::Pnpm,   PackageManagerId::Bun,    PackageManagerId::Poetry,
    PackageManagerId::Uv,     PackageManagerId::Pipenv, PackageManagerId::Maven,
    PackageManagerId::Gradle, PackageManagerId::Cargo,  PackageManagerId::Go};

[[nodiscard]] constexpr std::string_view packageManagerToString(
    PackageManagerId manager) noexcept {
    switch (manager) {
        case PackageManagerId::Pip: return "pip";
        case PackageManagerId::Npm: return "npm";
        case PackageManagerId::Yarn: return "yarn";
        case PackageManagerId::Pnpm: return "pnpm";
        case PackageManagerId::Bun: return "bun";
        case PackageManagerId::Poetry: return "poetry";
        case PackageManagerId::Uv: return "uv";
        case PackageManagerId::Pipenv: return "pipenv";
        case PackageManagerId::Maven: return "maven";
        case PackageManagerId::Gradle: return "gradle";
        case PackageManagerId::Cargo: return "cargo";
        case PackageManagerId::Go: return "go";
    }
    return "unknown";
}

[[nodiscard]] constexpr std::optional<PackageManagerId> packageManagerFromString(
    std::string_view name) noexcept {
    for (auto manager : ALL_PACKAGE_MANAGERS) {
        if (packageManagerToString(manager) == name) {
            return manager;
        }
    }
    return std::nullopt;
}

/**
 * @brief Error codes for volume operations
 */
enum class VolumeErrorCode {
    InitFailed,          ///< Base cache directory could not be created
    CacheCreateFailed,   ///< A manager cache directory could not be created
    CacheNotAccessible,  ///< Directory exists but is not readable/writable
    CacheClearFailed,    ///< Removing or recreating a cache failed
    MountNotFound        ///< No mount recorded for the manager
};

[[nodiscard]] constexpr std::string_view volumeErrorCodeToString(
    VolumeErrorCode code) noexcept {
    switch (code) {
        case VolumeErrorCode::InitFailed: return "INIT_FAILED";
        case VolumeErrorCode::CacheCreateFailed: return "CACHE_CREATE_FAILED";
        case VolumeErrorCode::CacheNotAccessible: return "CACHE_NOT_ACCESSIBLE";
        case VolumeErrorCode::CacheClearFailed: return "CACHE_CLEAR_FAILED";
        case VolumeErrorCode::MountNotFound: return "MOUNT_NOT_FOUND";
    }
    return "UNKNOWN";
}

struct VolumeError {
    VolumeErrorCode code;
    std::optional<PackageManagerId> manager;
    std::string message;
};

template <typename T>
using VolumeResult = std::expected<T, VolumeError>;

/**
 * @brief One package manager's cache binding inside a bottle
 */
struct VolumeMount {
    PackageManagerId manager;
    fs::path cachePath;      ///< Absolute host directory
    std::string mountPath;   ///< Label such as /bottle/pip-cache
    bool active{false};
    TimePoint createdAt;
    TimePoint lastAccessed;
};

struct CacheStats {
    PackageManagerId manager;
    std::uintmax_t size{0};       ///< Bytes in regular files
    std::uintmax_t itemCount{0};  ///< Files plus directories
    std::optional<fs::file_time_type> lastModified;
};

struct VolumeStats {
    std::uintmax_t totalSize{0};
    std::uintmax_t totalItems{0};
    std::map<PackageManagerId, CacheStats> managers;
    size_t activeMounts{0};
    TimePoint calculatedAt;
};

/**
 * @brief Construction options for VolumeController
 */
struct VolumeConfig {
    fs::path baseCacheDir;                 ///< Empty = <bottlesDir>/cache
    std::uintmax_t maxCacheSize{0};        ///< MB, 0 = unlimited
    std::chrono::minutes cacheTtl{0};      ///< 0 = never expire
    bool autoCreateDirs{true};
    bool crossPlatform{true};
    std::optional<std::vector<PackageManagerId>> detectedManagers;
    bool skipAutoDetection{false};
    fs::path projectDir;                   ///< Empty = PWD, then cwd
};

}  // namespace bottles::volume

#endif  // BOTTLES_VOLUME_TYPES_HPP
