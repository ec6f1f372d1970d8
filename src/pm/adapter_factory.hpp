/*
 * adapter_factory.hpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/**
 * @file adapter_factory.hpp
 * @brief Registry mapping manager ids to adapter constructors
 * @date 2024
 * @version 1.0.0
 */

#ifndef BOTTLES_PM_ADAPTER_FACTORY_HPP
#define BOTTLES_PM_ADAPTER_FACTORY_HPP

#include <concepts>
#include <functional>
#include <map>
#include <memory>
#include <shared_mutex>
#include <string>
#include <vector>

#include "adapter.hpp"
#include "exception.hpp"

namespace bottles::pm {

/**
 * @brief A detected adapter together with what detection found
 */
struct DetectedAdapter {
    std::unique_ptr<PackageManagerAdapter> adapter;
    DetectionResult detection;
};

class AdapterFactory {
public:
    using Creator =
        std::function<std::unique_ptr<PackageManagerAdapter>(AdapterContext)>;

    AdapterFactory() = default;

    /**
     * @brief Process-wide factory with the built-in adapters registered
     */
    static auto getInstance() -> AdapterFactory&;

    /**
     * @brief Register @p T under @p id
     * @throws InvalidAdapterException if @p id is already registered
     */
    template <typename T>
        requires std::derived_from<T, PackageManagerAdapter>
    void registerAdapter(std::string id) {
        std::unique_lock lock(mutex_);
        if (creators_.contains(id)) {
            THROW_INVALID_ADAPTER("Adapter already registered: " + id);
        }
        creators_.emplace(std::move(id), [](AdapterContext context) {
            return std::unique_ptr<PackageManagerAdapter>(
                std::make_unique<T>(std::move(context)));
        });
    }

    /**
     * @return AdapterNotFound for an unknown id
     */
    [[nodiscard]] PmResult<std::unique_ptr<PackageManagerAdapter>> create(
        const std::string& id, AdapterContext context) const;

    [[nodiscard]] std::vector<std::string> getRegisteredAdapters() const;
    [[nodiscard]] bool isRegistered(const std::string& id) const;

    /**
     * @brief Run every adapter's detection against @p dir
     *
     * Adapters whose detection fails are logged and skipped.
     *
     * @return The adapters that detected the project, most confident first
     */
    [[nodiscard]] std::vector<DetectedAdapter> autoDetect(
        const fs::path& dir, const AdapterContext& context) const;

    /**
     * @brief Register uv and pip
     */
    void registerBuiltinAdapters();

private:
    mutable std::shared_mutex mutex_;
    std::map<std::string, Creator> creators_;
};

}  // namespace bottles::pm

#endif  // BOTTLES_PM_ADAPTER_FACTORY_HPP
