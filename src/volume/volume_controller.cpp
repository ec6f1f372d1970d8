/*
 * volume_controller.cpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

#include "volume_controller.hpp"

#include "cache_paths.hpp"
#include "config/bottles_config.hpp"

#include <spdlog/spdlog.h>
#include <nlohmann/json.hpp>

#include <ctime>
#include <fstream>
#include <iomanip>
#include <mutex>
#include <sstream>

namespace bottles::volume {

using json = nlohmann::json;

namespace {

std::string formatIso8601(TimePoint time) {
    auto seconds = std::chrono::system_clock::to_time_t(time);
    std::tm tm{};
    gmtime_r(&seconds, &tm);
    std::ostringstream oss;
    oss << std::put_time(&tm, "%Y-%m-%dT%H:%M:%SZ");
    return oss.str();
}

int64_t toEpochMillis(TimePoint time) {
    return std::chrono::duration_cast<std::chrono::milliseconds>(
               time.time_since_epoch())
        .count();
}

VolumeError makeError(VolumeErrorCode code,
                      std::optional<PackageManagerId> manager,
                      std::string message) {
    return VolumeError{code, manager, std::move(message)};
}

bool writeJsonFile(const fs::path& file, const json& content) {
    std::ofstream out(file, std::ios::trunc);
    if (!out) {
        return false;
    }
    out << content.dump(2);
    return static_cast<bool>(out);
}

/**
 * @brief Recursive size and item count; unreadable subtrees are skipped
 */
void accumulateDirectory(const fs::path& dir, CacheStats& stats) {
    std::error_code ec;
    fs::directory_iterator it(
        dir, fs::directory_options::skip_permission_denied, ec);
    if (ec) {
        spdlog::warn("Cannot access {}: {}", dir.string(), ec.message());
        return;
    }

    for (fs::directory_iterator end; it != end; it.increment(ec)) {
        if (ec) {
            spdlog::warn("Cannot access {}: {}", dir.string(), ec.message());
            return;
        }
        const auto status = it->symlink_status(ec);
        if (ec) {
            spdlog::warn("Cannot stat {}: {}", it->path().string(),
                         ec.message());
            ec.clear();
            continue;
        }
        if (fs::is_directory(status)) {
            ++stats.itemCount;
            accumulateDirectory(it->path(), stats);
        } else if (fs::is_regular_file(status)) {
            auto size = it->file_size(ec);
            if (ec) {
                spdlog::warn("Cannot stat {}: {}", it->path().string(),
                             ec.message());
                ec.clear();
                continue;
            }
            stats.size += size;
            ++stats.itemCount;
        }
    }
}

}  // namespace

class VolumeController::Impl {
public:
    Impl(std::string bottleId, VolumeConfig cfg,
         config::EnvironmentSnapshot env)
        : bottleId_(std::move(bottleId)),
          config_(std::move(cfg)),
          env_(std::move(env)) {
        if (config_.baseCacheDir.empty()) {
            config_.baseCacheDir = config::resolveCacheRoot(env_);
        }
        if (config_.projectDir.empty()) {
            if (auto pwd = env_.get("PWD"); pwd && !pwd->empty()) {
                config_.projectDir = *pwd;
            } else {
                std::error_code ec;
                config_.projectDir = fs::current_path(ec);
            }
        }
    }

    VolumeResult<void> initialize() {
        std::lock_guard lock(mutex_);
        return initializeLocked();
    }

    VolumeResult<VolumeMount> mount(PackageManagerId manager,
                                    const std::optional<fs::path>& customPath) {
        std::lock_guard lock(mutex_);
        if (!initialized_) {
            if (auto init = initializeLocked(); !init) {
                return std::unexpected(init.error());
            }
        }

        const auto now = std::chrono::system_clock::now();
        auto it = mounts_.find(manager);

        if (it == mounts_.end() || customPath) {
            fs::path cachePath = customPath ? *customPath
                                 : it != mounts_.end()
                                     ? it->second.cachePath
                                     : getBottleCacheDir(manager,
                                                         config_.baseCacheDir);

            if (config_.autoCreateDirs) {
                if (auto created = createCacheTree(manager, cachePath);
                    !created) {
                    return std::unexpected(created.error());
                }
            }

            VolumeMount updated{manager,
                                cachePath,
                                std::string(getMountPath(manager)),
                                false,
                                it != mounts_.end() ? it->second.createdAt
                                                    : now,
                                now};
            it = mounts_.insert_or_assign(manager, std::move(updated)).first;
        }

        auto& mountEntry = it->second;
        if (!validateCacheDir(mountEntry.cachePath)) {
            if (!config_.autoCreateDirs) {
                return std::unexpected(makeError(
                    VolumeErrorCode::CacheNotAccessible, manager,
                    "Cache directory not accessible: " +
                        mountEntry.cachePath.string()));
            }
            if (auto created = createCacheTree(manager, mountEntry.cachePath);
                !created) {
                return std::unexpected(created.error());
            }
            if (!validateCacheDir(mountEntry.cachePath)) {
                return std::unexpected(makeError(
                    VolumeErrorCode::CacheNotAccessible, manager,
                    "Cache directory not accessible after creation: " +
                        mountEntry.cachePath.string()));
            }
        }

        mountEntry.active = true;
        mountEntry.lastAccessed = now;
        spdlog::debug("[{}] Mounted {} cache at {}", bottleId_,
                      packageManagerToString(manager),
                      mountEntry.cachePath.string());
        return mountEntry;
    }

    bool unmount(PackageManagerId manager) {
        std::lock_guard lock(mutex_);
        return unmountLocked(manager);
    }

    VolumeResult<void> clear(std::optional<PackageManagerId> manager) {
        std::lock_guard lock(mutex_);
        if (manager) {
            auto it = mounts_.find(*manager);
            if (it == mounts_.end()) {
                return {};
            }
            return clearDirectory(it->second);
        }
        for (const auto& [id, entry] : mounts_) {
            if (auto cleared = clearDirectory(entry); !cleared) {
                return cleared;
            }
        }
        return {};
    }

    VolumeStats getStats() const {
        std::lock_guard lock(mutex_);
        VolumeStats stats;
        stats.calculatedAt = std::chrono::system_clock::now();
        for (const auto& [manager, entry] : mounts_) {
            if (!entry.active) {
                continue;
            }
            ++stats.activeMounts;
            auto cacheStats = computeCacheStats(entry);
            stats.totalSize += cacheStats.size;
            stats.totalItems += cacheStats.itemCount;
            stats.managers.emplace(manager, std::move(cacheStats));
        }
        return stats;
    }

    VolumeResult<CacheStats> getCacheStats(PackageManagerId manager) const {
        std::lock_guard lock(mutex_);
        auto it = mounts_.find(manager);
        if (it == mounts_.end()) {
            return std::unexpected(makeError(
                VolumeErrorCode::MountNotFound, manager,
                "No mount for " + std::string(packageManagerToString(manager))));
        }
        return computeCacheStats(it->second);
    }

    std::map<std::string, std::string> getMountEnvVars() const {
        std::lock_guard lock(mutex_);
        std::map<std::string, std::string> vars;
        for (const auto& [manager, entry] : mounts_) {
            if (!entry.active) {
                continue;
            }
            const auto path = entry.cachePath.string();
            switch (manager) {
                case PackageManagerId::Npm:
                    vars["npm_config_cache"] = path;
                    break;
                case PackageManagerId::Yarn:
                    vars["YARN_CACHE_FOLDER"] = path;
                    break;
                case PackageManagerId::Pnpm:
                    vars["PNPM_HOME"] = path;
                    break;
                case PackageManagerId::Bun:
                    vars["BUN_INSTALL_CACHE_DIR"] = path;
                    break;
                case PackageManagerId::Pip:
                    vars["PIP_CACHE_DIR"] = path;
                    break;
                case PackageManagerId::Poetry:
                    vars["POETRY_CACHE_DIR"] = path;
                    break;
                case PackageManagerId::Pipenv:
                    vars["PIPENV_CACHE_DIR"] = path;
                    break;
                case PackageManagerId::Uv:
                    vars["UV_CACHE_DIR"] = path;
                    vars["UV_PROJECT_ENVIRONMENT"] =
                        (config_.projectDir / ".venv").string();
                    vars["UV_PYTHON_PREFERENCE"] = "only-system";
                    break;
                case PackageManagerId::Maven:
                    vars["MAVEN_OPTS"] = "-Dmaven.repo.local=" + path;
                    break;
                case PackageManagerId::Gradle:
                    vars["GRADLE_USER_HOME"] = path;
                    break;
                case PackageManagerId::Cargo:
                    vars["CARGO_HOME"] = path;
                    break;
                case PackageManagerId::Go:
                    vars["GOMODCACHE"] = path;
                    break;
            }
        }
        return vars;
    }

    std::optional<VolumeMount> getMount(PackageManagerId manager) const {
        std::lock_guard lock(mutex_);
        if (auto it = mounts_.find(manager); it != mounts_.end()) {
            return it->second;
        }
        return std::nullopt;
    }

    std::vector<VolumeMount> getMounts(bool activeOnly) const {
        std::lock_guard lock(mutex_);
        std::vector<VolumeMount> result;
        for (const auto& [manager, entry] : mounts_) {
            if (!activeOnly || entry.active) {
                result.push_back(entry);
            }
        }
        return result;
    }

    void cleanup() {
        std::lock_guard lock(mutex_);
        for (const auto& [manager, entry] : mounts_) {
            unmountLocked(manager);
        }
        mounts_.clear();
        spdlog::debug("[{}] Volume controller cleaned up", bottleId_);
    }

    fs::path systemCachePath(PackageManagerId manager) const {
        return volume::getSystemCachePath(manager, env_.homeDirectory());
    }

    fs::path bottleCachePath(PackageManagerId manager) const {
        return getBottleCacheDir(manager, config_.baseCacheDir);
    }

    const std::string& bottleId() const noexcept { return bottleId_; }
    bool isInitialized() const noexcept { return initialized_; }
    const VolumeConfig& config() const noexcept { return config_; }

private:
    VolumeResult<void> initializeLocked() {
        if (initialized_) {
            return {};
        }

        if (config_.autoCreateDirs) {
            std::error_code ec;
            fs::create_directories(config_.baseCacheDir, ec);
            if (ec) {
                spdlog::error("[{}] Cannot create cache base {}: {}",
                              bottleId_, config_.baseCacheDir.string(),
                              ec.message());
                return std::unexpected(makeError(
                    VolumeErrorCode::InitFailed, std::nullopt,
                    "Failed to initialize volume controller: " +
                        ec.message()));
            }
        }

        std::vector<PackageManagerId> managers;
        if (config_.detectedManagers) {
            managers = *config_.detectedManagers;
        } else if (!config_.skipAutoDetection) {
            managers = detectPackageManagers(config_.projectDir);
        }

        for (auto manager : managers) {
            if (auto prepared = initializeManagerCache(manager); !prepared) {
                return prepared;
            }
        }

        initialized_ = true;
        spdlog::info("[{}] Volume controller initialized with {} managers",
                     bottleId_, managers.size());
        return {};
    }

    VolumeResult<void> initializeManagerCache(PackageManagerId manager) {
        const auto cacheDir = getBottleCacheDir(manager, config_.baseCacheDir);

        std::error_code ec;
        fs::create_directories(cacheDir, ec);
        if (ec) {
            return std::unexpected(makeError(
                VolumeErrorCode::InitFailed, manager,
                "Failed to initialize volume controller: cannot create " +
                    cacheDir.string() + ": " + ec.message()));
        }

        const auto systemCache = systemCachePath(manager);
        const auto marker = cacheDir / ".initialized";
        if (fs::exists(systemCache, ec) && !fs::exists(marker, ec)) {
            json content = {
                {"sourceCache", systemCache.string()},
                {"initTime", formatIso8601(std::chrono::system_clock::now())},
                {"manager", std::string(packageManagerToString(manager))},
                {"strategy", "isolated"}};
            if (!writeJsonFile(marker, content)) {
                spdlog::warn("[{}] Failed to write {}", bottleId_,
                             marker.string());
            }
        }

        const auto now = std::chrono::system_clock::now();
        mounts_.insert_or_assign(
            manager, VolumeMount{manager, cacheDir,
                                 std::string(getMountPath(manager)), false,
                                 now, now});
        return {};
    }

    VolumeResult<void> createCacheTree(PackageManagerId manager,
                                       const fs::path& cachePath) {
        std::error_code ec;
        fs::create_directories(cachePath, ec);
        if (ec) {
            return std::unexpected(makeError(
                VolumeErrorCode::CacheCreateFailed, manager,
                "Failed to create cache directory: " + cachePath.string() +
                    ". Check permissions for cache path. Error: " +
                    ec.message()));
        }
        for (auto sub : getCacheSubdirectories(manager)) {
            fs::create_directories(cachePath / sub, ec);
            if (ec) {
                spdlog::warn("[{}] Cannot create {}: {}", bottleId_,
                             (cachePath / sub).string(), ec.message());
                ec.clear();
            }
        }
        return {};
    }

    bool unmountLocked(PackageManagerId manager) {
        auto it = mounts_.find(manager);
        if (it == mounts_.end()) {
            return false;
        }
        auto& entry = it->second;
        entry.active = false;

        json metadata = {
            {"unmountedAt", formatIso8601(std::chrono::system_clock::now())},
            {"manager", std::string(packageManagerToString(manager))},
            {"lastAccessed", toEpochMillis(entry.lastAccessed)}};
        if (!writeJsonFile(entry.cachePath / ".unmount-metadata.json",
                           metadata)) {
            spdlog::warn("[{}] Failed to write unmount metadata for {}",
                         bottleId_, packageManagerToString(manager));
        }
        return true;
    }

    VolumeResult<void> clearDirectory(const VolumeMount& entry) {
        std::error_code ec;
        if (fs::exists(entry.cachePath, ec)) {
            fs::remove_all(entry.cachePath, ec);
            if (ec) {
                return std::unexpected(makeError(
                    VolumeErrorCode::CacheClearFailed, entry.manager,
                    "Failed to clear " + entry.cachePath.string() + ": " +
                        ec.message()));
            }
        }
        if (auto recreated = createCacheTree(entry.manager, entry.cachePath);
            !recreated) {
            return std::unexpected(makeError(
                VolumeErrorCode::CacheClearFailed, entry.manager,
                "Failed to recreate " + entry.cachePath.string() + ": " +
                    recreated.error().message));
        }
        spdlog::info("[{}] Cleared {} cache", bottleId_,
                     packageManagerToString(entry.manager));
        return {};
    }

    static CacheStats computeCacheStats(const VolumeMount& entry) {
        CacheStats stats{entry.manager};
        std::error_code ec;
        if (!fs::exists(entry.cachePath, ec)) {
            return stats;
        }
        auto modified = fs::last_write_time(entry.cachePath, ec);
        if (!ec) {
            stats.lastModified = modified;
        }
        accumulateDirectory(entry.cachePath, stats);
        return stats;
    }

    std::string bottleId_;
    VolumeConfig config_;
    config::EnvironmentSnapshot env_;
    std::map<PackageManagerId, VolumeMount> mounts_;
    bool initialized_{false};
    mutable std::mutex mutex_;
};

VolumeController::VolumeController(std::string bottleId, VolumeConfig config,
                                   config::EnvironmentSnapshot env)
    : pImpl_(std::make_unique<Impl>(std::move(bottleId), std::move(config),
                                    std::move(env))) {}

VolumeController::~VolumeController() = default;

VolumeController::VolumeController(VolumeController&&) noexcept = default;
VolumeController& VolumeController::operator=(VolumeController&&) noexcept =
    default;

VolumeResult<void> VolumeController::initialize() {
    return pImpl_->initialize();
}

VolumeResult<VolumeMount> VolumeController::mount(
    PackageManagerId manager, const std::optional<fs::path>& customPath) {
    return pImpl_->mount(manager, customPath);
}

bool VolumeController::unmount(PackageManagerId manager) {
    return pImpl_->unmount(manager);
}

VolumeResult<void> VolumeController::clear(
    std::optional<PackageManagerId> manager) {
    return pImpl_->clear(manager);
}

VolumeStats VolumeController::getStats() const { return pImpl_->getStats(); }

VolumeResult<CacheStats> VolumeController::getCacheStats(
    PackageManagerId manager) const {
    return pImpl_->getCacheStats(manager);
}

std::map<std::string, std::string> VolumeController::getMountEnvVars() const {
    return pImpl_->getMountEnvVars();
}

std::optional<VolumeMount> VolumeController::getMount(
    PackageManagerId manager) const {
    return pImpl_->getMount(manager);
}

std::vector<VolumeMount> VolumeController::getActiveMounts() const {
    return pImpl_->getMounts(true);
}

std::vector<VolumeMount> VolumeController::getAllMounts() const {
    return pImpl_->getMounts(false);
}

const std::string& VolumeController::getBottleId() const noexcept {
    return pImpl_->bottleId();
}

bool VolumeController::isInitialized() const noexcept {
    return pImpl_->isInitialized();
}

void VolumeController::cleanup() { pImpl_->cleanup(); }

fs::path VolumeController::getSystemCachePath(PackageManagerId manager) const {
    return pImpl_->systemCachePath(manager);
}

fs::path VolumeController::getBottleCachePath(PackageManagerId manager) const {
    return pImpl_->bottleCachePath(manager);
}

const VolumeConfig& VolumeController::config() const noexcept {
    return pImpl_->config();
}

}  // namespace bottles::volume
