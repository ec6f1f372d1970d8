/*
 * shell_pool.hpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/**
 * @file shell_pool.hpp
 * @brief Keyed pool of persistent shell engines
 * @date 2024
 * @version 1.0.0
 *
 * The pool keeps at most one engine per key (usually a package manager
 * name). A busy key or a full pool yields a fresh unpooled engine instead
 * of waiting.
 */

#ifndef BOTTLES_SHELL_SHELL_POOL_HPP
#define BOTTLES_SHELL_SHELL_POOL_HPP

#include <chrono>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>

#include "config/environment_snapshot.hpp"
#include "shell_engine.hpp"
#include "types.hpp"

namespace bottles::shell {

class ShellPool;

/**
 * @brief RAII guard releasing a pooled key on destruction
 */
class ShellLease {
public:
    ShellLease() = default;
    ShellLease(ShellPool& pool, std::string key,
               std::shared_ptr<ShellEngine> engine);
    ShellLease(ShellLease&& other) noexcept;
    ShellLease& operator=(ShellLease&& other) noexcept;
    ~ShellLease();

    ShellLease(const ShellLease&) = delete;
    ShellLease& operator=(const ShellLease&) = delete;

    [[nodiscard]] bool isValid() const noexcept { return engine_ != nullptr; }

    [[nodiscard]] ShellEngine& operator*() const noexcept { return *engine_; }
    [[nodiscard]] ShellEngine* operator->() const noexcept {
        return engine_.get();
    }
    [[nodiscard]] const std::shared_ptr<ShellEngine>& engine() const noexcept {
        return engine_;
    }

    /**
     * @brief Release the key early
     */
    void release();

private:
    ShellPool* pool_{nullptr};
    std::string key_;
    std::shared_ptr<ShellEngine> engine_;
};

/**
 * @brief Process-wide pool of ShellEngine instances
 */
class ShellPool {
public:
    static constexpr size_t DEFAULT_MAX_SIZE = 5;

    [[nodiscard]] static ShellPool& getInstance();

    /**
     * @brief Stand-alone pool, mainly for tests
     */
    explicit ShellPool(
        size_t maxSize = DEFAULT_MAX_SIZE,
        config::EnvironmentSnapshot environment =
            config::EnvironmentSnapshot::capture());

    ~ShellPool();

    ShellPool(const ShellPool&) = delete;
    ShellPool& operator=(const ShellPool&) = delete;

    /**
     * @brief Get an initialized engine for @p key
     *
     * Reuses the idle pooled engine for the key when it is still alive,
     * replaces a dead one, and registers a new one while below the size
     * limit. Otherwise returns an unpooled engine owned by the caller.
     */
    [[nodiscard]] ShellResult<std::shared_ptr<ShellEngine>> acquire(
        const std::string& key, const EngineOptions& options = {});

    /**
     * @brief acquire() wrapped in a ShellLease
     */
    [[nodiscard]] ShellResult<ShellLease> lease(
        const std::string& key, const EngineOptions& options = {});

    /**
     * @brief Mark the pooled engine for @p key as free
     */
    void release(const std::string& key);

    /**
     * @brief Mark @p key free only if @p engine is its pooled instance
     *
     * Unpooled engines handed out for a busy key or a full pool leave the
     * pooled entry untouched.
     */
    void release(const std::string& key, const ShellEngine* engine);

    /**
     * @brief Force-kill and drop every pooled engine
     */
    void clear();

    [[nodiscard]] size_t size() const;
    [[nodiscard]] size_t inUseCount() const;
    [[nodiscard]] size_t maxSize() const;
    void setMaxSize(size_t maxSize);

    /**
     * @brief Environment used for engines created from now on
     */
    void setEnvironment(config::EnvironmentSnapshot environment);

private:
    struct PooledShell {
        std::shared_ptr<ShellEngine> engine;
        bool inUse{false};
        std::chrono::steady_clock::time_point lastUsed;
    };

    ShellResult<std::shared_ptr<ShellEngine>> createEngine(
        const EngineOptions& options) const;

    mutable std::mutex mutex_;
    std::unordered_map<std::string, PooledShell> shells_;
    size_t maxSize_;
    config::EnvironmentSnapshot environment_;
};

}  // namespace bottles::shell

#endif  // BOTTLES_SHELL_SHELL_POOL_HPP
