/*
 * shell_pool.cpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

#include "shell_pool.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>

namespace bottles::shell {

// ============================================================================
// ShellLease
// ============================================================================

ShellLease::ShellLease(ShellPool& pool, std::string key,
                       std::shared_ptr<ShellEngine> engine)
    : pool_(&pool), key_(std::move(key)), engine_(std::move(engine)) {}

ShellLease::ShellLease(ShellLease&& other) noexcept
    : pool_(other.pool_),
      key_(std::move(other.key_)),
      engine_(std::move(other.engine_)) {
    other.pool_ = nullptr;
}

ShellLease& ShellLease::operator=(ShellLease&& other) noexcept {
    if (this != &other) {
        release();
        pool_ = other.pool_;
        key_ = std::move(other.key_);
        engine_ = std::move(other.engine_);
        other.pool_ = nullptr;
    }
    return *this;
}

ShellLease::~ShellLease() { release(); }

void ShellLease::release() {
    if (pool_ != nullptr) {
        pool_->release(key_, engine_.get());
        pool_ = nullptr;
    }
    engine_.reset();
}

// ============================================================================
// ShellPool
// ============================================================================

ShellPool& ShellPool::getInstance() {
    static ShellPool instance;
    return instance;
}

ShellPool::ShellPool(size_t maxSize, config::EnvironmentSnapshot environment)
    : maxSize_(maxSize), environment_(std::move(environment)) {}

ShellPool::~ShellPool() = default;

ShellResult<std::shared_ptr<ShellEngine>> ShellPool::createEngine(
    const EngineOptions& options) const {
    auto engine = std::make_shared<ShellEngine>(options, environment_);
    if (auto init = engine->initialize(); !init) {
        spdlog::error("Failed to initialize shell: {}",
                      shellErrorToString(init.error()));
        return std::unexpected(init.error());
    }
    return engine;
}

ShellResult<std::shared_ptr<ShellEngine>> ShellPool::acquire(
    const std::string& key, const EngineOptions& options) {
    std::lock_guard lock(mutex_);

    if (auto it = shells_.find(key); it != shells_.end()) {
        auto& pooled = it->second;
        if (!pooled.inUse) {
            if (pooled.engine->isAlive()) {
                pooled.inUse = true;
                pooled.lastUsed = std::chrono::steady_clock::now();
                spdlog::debug("Reusing pooled shell '{}' ({})", key,
                              pooled.engine->id());
                return pooled.engine;
            }
            spdlog::info("Discarding dead pooled shell '{}'", key);
            shells_.erase(it);
        } else {
            spdlog::debug("Pooled shell '{}' is busy, creating unpooled one",
                          key);
            return createEngine(options);
        }
    }

    if (shells_.size() >= maxSize_) {
        spdlog::debug("Shell pool full ({}), creating unpooled shell for '{}'",
                      maxSize_, key);
        return createEngine(options);
    }

    auto engine = createEngine(options);
    if (!engine) {
        return engine;
    }
    shells_[key] = PooledShell{*engine, true, std::chrono::steady_clock::now()};
    spdlog::debug("Registered pooled shell '{}' ({})", key, (*engine)->id());
    return engine;
}

ShellResult<ShellLease> ShellPool::lease(const std::string& key,
                                         const EngineOptions& options) {
    auto engine = acquire(key, options);
    if (!engine) {
        return std::unexpected(engine.error());
    }
    return ShellLease(*this, key, std::move(*engine));
}

void ShellPool::release(const std::string& key) {
    std::lock_guard lock(mutex_);
    if (auto it = shells_.find(key); it != shells_.end()) {
        it->second.inUse = false;
        it->second.lastUsed = std::chrono::steady_clock::now();
    }
}

void ShellPool::release(const std::string& key, const ShellEngine* engine) {
    std::lock_guard lock(mutex_);
    auto it = shells_.find(key);
    if (it == shells_.end() || it->second.engine.get() != engine) {
        return;
    }
    it->second.inUse = false;
    it->second.lastUsed = std::chrono::steady_clock::now();
}

void ShellPool::clear() {
    std::lock_guard lock(mutex_);
    for (auto& [key, pooled] : shells_) {
        auto result = pooled.engine->forceKill();
        if (!result.success) {
            spdlog::debug("Pooled shell '{}' already stopped: {}", key,
                          result.error.value_or(""));
        }
    }
    spdlog::info("Cleared {} pooled shells", shells_.size());
    shells_.clear();
}

size_t ShellPool::size() const {
    std::lock_guard lock(mutex_);
    return shells_.size();
}

size_t ShellPool::inUseCount() const {
    std::lock_guard lock(mutex_);
    return static_cast<size_t>(
        std::count_if(shells_.begin(), shells_.end(),
                      [](const auto& entry) { return entry.second.inUse; }));
}

size_t ShellPool::maxSize() const {
    std::lock_guard lock(mutex_);
    return maxSize_;
}

void ShellPool::setMaxSize(size_t maxSize) {
    std::lock_guard lock(mutex_);
    maxSize_ = maxSize;
}

void ShellPool::setEnvironment(config::EnvironmentSnapshot environment) {
    std::lock_guard lock(mutex_);
    environment_ = std::move(environment);
}

}  // namespace bottles::shell
