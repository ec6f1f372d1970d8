/*
 * environment_snapshot.cpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

#include "environment_snapshot.hpp"

#include <algorithm>
#include <cctype>
#include <system_error>

#ifdef _WIN32
#include <cstdlib>
#else
#include <unistd.h>
extern char** environ;
#endif

namespace bottles::config {

namespace {

#ifdef _WIN32
constexpr char PATH_SEPARATOR = ';';
#else
constexpr char PATH_SEPARATOR = ':';
#endif

bool isExecutableFile(const std::filesystem::path& candidate) {
    std::error_code ec;
    if (!std::filesystem::is_regular_file(candidate, ec)) {
        return false;
    }
#ifdef _WIN32
    return true;
#else
    return ::access(candidate.c_str(), X_OK) == 0;
#endif
}

}  // namespace

EnvironmentSnapshot::EnvironmentSnapshot(VariableMap variables)
    : variables_(std::move(variables)) {}

EnvironmentSnapshot EnvironmentSnapshot::capture() {
    VariableMap vars;
#ifdef _WIN32
    for (char** env = _environ; env != nullptr && *env != nullptr; ++env) {
#else
    for (char** env = environ; env != nullptr && *env != nullptr; ++env) {
#endif
        std::string_view entry(*env);
        auto pos = entry.find('=');
        if (pos == std::string_view::npos || pos == 0) {
            continue;
        }
        vars.emplace(std::string(entry.substr(0, pos)),
                     std::string(entry.substr(pos + 1)));
    }
    return EnvironmentSnapshot(std::move(vars));
}

std::optional<std::string> EnvironmentSnapshot::get(
    std::string_view name) const {
    auto it = variables_.find(name);
    if (it == variables_.end()) {
        return std::nullopt;
    }
    return it->second;
}

std::string EnvironmentSnapshot::getOr(std::string_view name,
                                       std::string_view fallback) const {
    auto it = variables_.find(name);
    if (it == variables_.end() || it->second.empty()) {
        return std::string(fallback);
    }
    return it->second;
}

bool EnvironmentSnapshot::has(std::string_view name) const {
    return variables_.find(name) != variables_.end();
}

bool EnvironmentSnapshot::isCI() const {
    auto value = get("CI");
    if (!value || value->empty()) {
        return false;
    }
    std::string lowered = *value;
    std::ranges::transform(lowered, lowered.begin(), [](unsigned char c) {
        return static_cast<char>(std::tolower(c));
    });
    return lowered != "0" && lowered != "false";
}

EnvironmentSnapshot EnvironmentSnapshot::with(
    const VariableMap& overrides) const {
    VariableMap merged = variables_;
    for (const auto& [key, value] : overrides) {
        merged[key] = value;
    }
    return EnvironmentSnapshot(std::move(merged));
}

std::vector<std::filesystem::path> EnvironmentSnapshot::searchPath() const {
    std::vector<std::filesystem::path> dirs;
    auto path = get("PATH");
    if (!path) {
        return dirs;
    }

    std::string_view remaining(*path);
    while (!remaining.empty()) {
        auto pos = remaining.find(PATH_SEPARATOR);
        auto part = remaining.substr(0, pos);
        if (!part.empty()) {
            dirs.emplace_back(part);
        }
        if (pos == std::string_view::npos) {
            break;
        }
        remaining.remove_prefix(pos + 1);
    }
    return dirs;
}

std::optional<std::filesystem::path> EnvironmentSnapshot::findExecutable(
    std::string_view name) const {
    if (name.empty()) {
        return std::nullopt;
    }

    std::filesystem::path direct(name);
    if (direct.has_parent_path()) {
        if (isExecutableFile(direct)) {
            return direct;
        }
        return std::nullopt;
    }

    for (const auto& dir : searchPath()) {
        auto candidate = dir / direct;
        if (isExecutableFile(candidate)) {
            return candidate;
        }
#ifdef _WIN32
        auto withExe = candidate;
        withExe += ".exe";
        if (isExecutableFile(withExe)) {
            return withExe;
        }
#endif
    }
    return std::nullopt;
}

std::filesystem::path EnvironmentSnapshot::homeDirectory() const {
#ifdef _WIN32
    if (auto home = get("USERPROFILE"); home && !home->empty()) {
        return *home;
    }
#endif
    if (auto home = get("HOME"); home && !home->empty()) {
        return *home;
    }
    std::error_code ec;
    auto tmp = std::filesystem::temp_directory_path(ec);
    return ec ? std::filesystem::path("/tmp") : tmp;
}

}  // namespace bottles::config
