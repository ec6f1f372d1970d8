/*
 * adapter_factory.cpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

#include "adapter_factory.hpp"

#include "pip_adapter.hpp"
#include "uv_adapter.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <format>
#include <mutex>

namespace bottles::pm {

auto AdapterFactory::getInstance() -> AdapterFactory& {
    static AdapterFactory instance;
    static std::once_flag builtins;
    std::call_once(builtins, [] { instance.registerBuiltinAdapters(); });
    return instance;
}

PmResult<std::unique_ptr<PackageManagerAdapter>> AdapterFactory::create(
    const std::string& id, AdapterContext context) const {
    Creator creator;
    {
        std::shared_lock lock(mutex_);
        auto it = creators_.find(id);
        if (it == creators_.end()) {
            std::string available;
            for (const auto& [name, unused] : creators_) {
                available += available.empty() ? name : ", " + name;
            }
            return makeError(ErrorCode::AdapterNotFound,
                             std::format("No adapter registered for '{}'", id),
                             std::format("Available adapters: {}", available));
        }
        creator = it->second;
    }
    return creator(std::move(context));
}

std::vector<std::string> AdapterFactory::getRegisteredAdapters() const {
    std::shared_lock lock(mutex_);
    std::vector<std::string> ids;
    ids.reserve(creators_.size());
    for (const auto& [id, creator] : creators_) {
        ids.push_back(id);
    }
    return ids;
}

bool AdapterFactory::isRegistered(const std::string& id) const {
    std::shared_lock lock(mutex_);
    return creators_.contains(id);
}

std::vector<DetectedAdapter> AdapterFactory::autoDetect(
    const fs::path& dir, const AdapterContext& context) const {
    std::vector<DetectedAdapter> detected;
    for (const auto& id : getRegisteredAdapters()) {
        auto adapterContext = context;
        adapterContext.projectDir = dir;
        auto adapter = create(id, std::move(adapterContext));
        if (!adapter) {
            spdlog::warn("[pm] Skipping adapter {}: {}", id,
                         adapter.error().message);
            continue;
        }
        auto detection = (*adapter)->detectProject(dir);
        if (!detection) {
            spdlog::warn("[pm] Detection by {} failed in {}: {}", id,
                         dir.string(), detection.error().message);
            continue;
        }
        if (!detection->detected) {
            continue;
        }
        spdlog::debug("[pm] {} detected in {} ({:.2f})", id, dir.string(),
                      detection->confidence);
        detected.push_back({std::move(*adapter), std::move(*detection)});
    }
    std::ranges::stable_sort(detected, [](const auto& lhs, const auto& rhs) {
        return lhs.detection.confidence > rhs.detection.confidence;
    });
    return detected;
}

void AdapterFactory::registerBuiltinAdapters() {
    registerAdapter<UvAdapter>("uv");
    registerAdapter<PipAdapter>("pip");
}

}  // namespace bottles::pm
