/*
 * pyproject.hpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/**
 * @file pyproject.hpp
 * @brief Typed views of pyproject.toml and uv.lock
 * @date 2024
 * @version 1.0.0
 *
 * Both files are read with a real TOML parser. Only the fields the
 * adapters consume are extracted; everything else is ignored.
 */

#ifndef BOTTLES_PM_PYPROJECT_HPP
#define BOTTLES_PM_PYPROJECT_HPP

#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "types.hpp"

namespace bottles::pm {

struct PyprojectAuthor {
    std::string name;
    std::optional<std::string> email;
};

struct Pyproject {
    bool hasProject{false};  ///< A [project] table exists
    std::optional<std::string> name;
    std::optional<std::string> version;
    std::optional<std::string> description;
    std::optional<std::string> license;  ///< String, license.text or license.file
    std::optional<std::string> requiresPython;
    std::vector<std::string> dependencies;
    std::vector<PyprojectAuthor> authors;
    std::map<std::string, std::vector<std::string>> optionalDependencies;

    bool hasDependencyGroups{false};
    std::map<std::string, std::vector<std::string>> dependencyGroups;

    bool hasToolUv{false};
    bool hasUvSources{false};
    bool hasUvIndex{false};
    bool hasUvWorkspace{false};
    std::vector<std::string> uvDevDependencies;  ///< Legacy tool.uv field
    json uvSources = json::object();
    json uvIndex = json::array();

    bool hasPoetry{false};
    bool hasPipenv{false};
};

/**
 * @brief Parse pyproject.toml text
 * @param sourceName Used in error messages
 */
[[nodiscard]] PmResult<Pyproject> parsePyprojectText(
    std::string_view content, std::string_view sourceName = "pyproject.toml");

[[nodiscard]] PmResult<Pyproject> parsePyproject(const fs::path& path);

struct LockSource {
    std::string kind;      ///< registry, url, editable, path, git, virtual
    std::string location;
};

struct LockDependency {
    std::string name;
    std::optional<std::string> marker;
};

struct LockPackage {
    std::string name;
    std::string version;
    std::optional<LockSource> source;
    std::vector<LockDependency> dependencies;
};

struct UvLock {
    std::optional<std::int64_t> version;
    std::optional<std::int64_t> revision;
    std::optional<std::string> requiresPython;
    std::vector<LockPackage> packages;

    /**
     * @brief Pinned entry for @p name, compared case-insensitively
     */
    [[nodiscard]] const LockPackage* find(std::string_view name) const;
};

[[nodiscard]] PmResult<UvLock> parseUvLockText(
    std::string_view content, std::string_view sourceName = "uv.lock");

[[nodiscard]] PmResult<UvLock> parseUvLock(const fs::path& path);

}  // namespace bottles::pm

#endif  // BOTTLES_PM_PYPROJECT_HPP
