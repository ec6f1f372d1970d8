/*
 * cache_paths.cpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

#include "cache_paths.hpp"

#include <algorithm>
#include <system_error>

#include <unistd.h>

namespace bottles::volume {

namespace {

bool exists(const fs::path& path) {
    std::error_code ec;
    return fs::exists(path, ec);
}

fs::path userCacheDir(const fs::path& home) {
#ifdef __APPLE__
    return home / "Library" / "Caches";
#else
    return home / ".cache";
#endif
}

}  // namespace

fs::path getSystemCachePath(PackageManagerId manager, const fs::path& home) {
    switch (manager) {
        case PackageManagerId::Npm:
            return home / ".npm";
        case PackageManagerId::Yarn:
#ifdef __APPLE__
            return userCacheDir(home) / "Yarn";
#else
            return userCacheDir(home) / "yarn";
#endif
        case PackageManagerId::Pnpm:
            return userCacheDir(home) / "pnpm";
        case PackageManagerId::Bun:
            return home / ".bun" / "install" / "cache";
        case PackageManagerId::Pip:
            return userCacheDir(home) / "pip";
        case PackageManagerId::Poetry:
            return userCacheDir(home) / "pypoetry";
        case PackageManagerId::Uv:
            return userCacheDir(home) / "uv";
        case PackageManagerId::Pipenv:
            return userCacheDir(home) / "pipenv";
        case PackageManagerId::Maven:
            return home / ".m2" / "repository";
        case PackageManagerId::Gradle:
            return home / ".gradle" / "caches";
        case PackageManagerId::Cargo:
            return home / ".cargo" / "registry";
        case PackageManagerId::Go:
            return home / "go" / "pkg" / "mod";
    }
    return userCacheDir(home) / std::string(packageManagerToString(manager));
}

fs::path getBottleCacheDir(PackageManagerId manager,
                           const fs::path& baseCacheDir) {
    return baseCacheDir / std::string(packageManagerToString(manager));
}

std::string_view getMountPath(PackageManagerId manager) noexcept {
    switch (manager) {
        case PackageManagerId::Npm:
        case PackageManagerId::Yarn:
        case PackageManagerId::Pnpm:
        case PackageManagerId::Bun:
            return "/bottle/npm-cache";
        case PackageManagerId::Pip:
        case PackageManagerId::Poetry:
        case PackageManagerId::Uv:
        case PackageManagerId::Pipenv:
            return "/bottle/pip-cache";
        case PackageManagerId::Maven:
            return "/bottle/m2";
        case PackageManagerId::Gradle:
            return "/bottle/gradle";
        case PackageManagerId::Cargo:
            return "/bottle/cargo";
        case PackageManagerId::Go:
            return "/bottle/go-mod";
    }
    return "/bottle/cache";
}

std::vector<std::string_view> getCacheSubdirectories(PackageManagerId manager) {
    switch (manager) {
        case PackageManagerId::Pip:
            return {"wheels", "http", "selfcheck"};
        case PackageManagerId::Uv:
            return {"builds", "wheels", "git", "pypi-v1", "simple-v1"};
        case PackageManagerId::Npm:
            return {"_cacache", "_logs", "_locks"};
        case PackageManagerId::Yarn:
            return {"v6", "v4", "v1"};
        case PackageManagerId::Pnpm:
            return {"v3", "metadata", "tmp"};
        case PackageManagerId::Poetry:
            return {"cache", "virtualenvs", "artifacts"};
        case PackageManagerId::Maven:
            return {"repository"};
        case PackageManagerId::Gradle:
            return {"caches", "wrapper"};
        case PackageManagerId::Cargo:
            return {"registry", "git"};
        case PackageManagerId::Go:
            return {"mod", "build"};
        default:
            return {"cache", "temp"};
    }
}

std::vector<PackageManagerId> detectPackageManagers(const fs::path& projectDir) {
    std::vector<PackageManagerId> managers;
    auto add = [&managers](PackageManagerId manager) {
        if (std::find(managers.begin(), managers.end(), manager) ==
            managers.end()) {
            managers.push_back(manager);
        }
    };
    auto has = [&projectDir](std::string_view name) {
        return volume::exists(projectDir / name);
    };

    if (has("package.json")) {
        add(PackageManagerId::Npm);
        if (has("yarn.lock")) {
            add(PackageManagerId::Yarn);
        }
        if (has("pnpm-lock.yaml")) {
            add(PackageManagerId::Pnpm);
        }
        if (has("bun.lockb")) {
            add(PackageManagerId::Bun);
        }
    }

    if (has("requirements.txt") || has("setup.py") || has("setup.cfg")) {
        add(PackageManagerId::Pip);
    }
    if (has("pyproject.toml")) {
        add(PackageManagerId::Poetry);
        add(PackageManagerId::Uv);
    }
    if (has("Pipfile")) {
        add(PackageManagerId::Pipenv);
    }

    if (has("pom.xml")) {
        add(PackageManagerId::Maven);
    }
    if (has("build.gradle") || has("build.gradle.kts")) {
        add(PackageManagerId::Gradle);
    }
    if (has("Cargo.toml")) {
        add(PackageManagerId::Cargo);
    }
    if (has("go.mod")) {
        add(PackageManagerId::Go);
    }

    return managers;
}

bool validateCacheDir(const fs::path& path) {
    std::error_code ec;
    if (!fs::is_directory(path, ec)) {
        return false;
    }
    return ::access(path.c_str(), R_OK | W_OK) == 0;
}

}  // namespace bottles::volume
