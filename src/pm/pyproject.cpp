/*
 * pyproject.cpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

#include "pyproject.hpp"

#include "requirements_parser.hpp"
#include "version_spec.hpp"

#define TOML_EXCEPTIONS 0
#include <toml++/toml.hpp>

#include <format>

namespace bottles::pm {

namespace {

std::optional<std::string> stringAt(const toml::node_view<const toml::node>& node) {
    if (auto value = node.value<std::string>()) {
        return *value;
    }
    return std::nullopt;
}

std::vector<std::string> stringArray(const toml::node_view<const toml::node>& node) {
    std::vector<std::string> values;
    if (const auto* array = node.as_array()) {
        for (const auto& element : *array) {
            if (auto value = element.value<std::string>()) {
                values.push_back(*value);
            }
        }
    }
    return values;
}

/**
 * @brief Convert a TOML node into JSON for metadata storage
 */
json toJson(const toml::node& node) {
    if (const auto* table = node.as_table()) {
        json object = json::object();
        for (auto&& [key, value] : *table) {
            object[std::string(key.str())] = toJson(value);
        }
        return object;
    }
    if (const auto* array = node.as_array()) {
        json list = json::array();
        for (const auto& element : *array) {
            list.push_back(toJson(element));
        }
        return list;
    }
    if (auto value = node.value<std::string>()) {
        return *value;
    }
    if (node.is_integer()) {
        return node.value<std::int64_t>().value_or(0);
    }
    if (node.is_floating_point()) {
        return node.value<double>().value_or(0.0);
    }
    if (node.is_boolean()) {
        return node.value<bool>().value_or(false);
    }
    return nullptr;
}

std::unexpected<PackageManagerError> tomlError(std::string_view sourceName,
                                               const toml::parse_error& error) {
    const auto& begin = error.source().begin;
    return makeError(
        ErrorCode::ManifestParseError,
        std::format("Failed to parse {}", sourceName),
        "Fix the TOML syntax error reported in the cause",
        std::format("{} (line {}, column {})", error.description(), begin.line,
                    begin.column));
}

void readProject(const toml::table& project, Pyproject& out) {
    const toml::node_view<const toml::node> view{project};
    out.hasProject = true;
    out.name = stringAt(view["name"]);
    out.version = stringAt(view["version"]);
    out.description = stringAt(view["description"]);
    out.requiresPython = stringAt(view["requires-python"]);

    if (auto license = stringAt(view["license"])) {
        out.license = std::move(license);
    } else if (auto text = stringAt(view["license"]["text"])) {
        out.license = std::move(text);
    } else if (auto file = stringAt(view["license"]["file"])) {
        out.license = std::move(file);
    }

    out.dependencies = stringArray(view["dependencies"]);

    if (const auto* authors = view["authors"].as_array()) {
        for (const auto& author : *authors) {
            if (auto name = author.value<std::string>()) {
                out.authors.push_back({*name, std::nullopt});
            } else if (const auto* table = author.as_table()) {
                const toml::node_view<const toml::node> entry{*table};
                auto name = stringAt(entry["name"]);
                auto email = stringAt(entry["email"]);
                if (name || email) {
                    out.authors.push_back(
                        {name.value_or(email.value_or("")), email});
                }
            }
        }
    }

    if (const auto* optional = view["optional-dependencies"].as_table()) {
        for (auto&& [group, deps] : *optional) {
            out.optionalDependencies[std::string(group.str())] =
                stringArray(toml::node_view<const toml::node>{deps});
        }
    }
}

}  // namespace

PmResult<Pyproject> parsePyprojectText(std::string_view content,
                                       std::string_view sourceName) {
    toml::parse_result result = toml::parse(content, sourceName);
    if (!result) {
        return tomlError(sourceName, result.error());
    }
    const toml::table& root = result.table();
    const toml::node_view<const toml::node> doc{root};

    Pyproject pyproject;
    if (const auto* project = doc["project"].as_table()) {
        readProject(*project, pyproject);
    }

    if (const auto* groups = doc["dependency-groups"].as_table()) {
        pyproject.hasDependencyGroups = true;
        for (auto&& [group, deps] : *groups) {
            // Non-string entries are {include-group = "..."} references.
            pyproject.dependencyGroups[std::string(group.str())] =
                stringArray(toml::node_view<const toml::node>{deps});
        }
    }

    const auto tool = doc["tool"];
    pyproject.hasPoetry = tool["poetry"].is_table();
    pyproject.hasPipenv = tool["pipenv"].is_table();

    if (const auto* uv = tool["uv"].as_table()) {
        pyproject.hasToolUv = true;
        const toml::node_view<const toml::node> uvView{*uv};
        pyproject.uvDevDependencies = stringArray(uvView["dev-dependencies"]);
        if (const auto* sources = uvView["sources"].node()) {
            pyproject.hasUvSources = true;
            pyproject.uvSources = toJson(*sources);
        }
        if (const auto* index = uvView["index"].node()) {
            pyproject.hasUvIndex = true;
            pyproject.uvIndex = toJson(*index);
        }
        pyproject.hasUvWorkspace = uvView["workspace"].is_table();
    }

    return pyproject;
}

PmResult<Pyproject> parsePyproject(const fs::path& path) {
    auto text = readTextFile(path);
    if (!text) {
        return std::unexpected(text.error());
    }
    return parsePyprojectText(*text, path.string());
}

const LockPackage* UvLock::find(std::string_view name) const {
    const auto wanted = normalizePackageName(name);
    for (const auto& package : packages) {
        if (normalizePackageName(package.name) == wanted) {
            return &package;
        }
    }
    return nullptr;
}

PmResult<UvLock> parseUvLockText(std::string_view content,
                                 std::string_view sourceName) {
    toml::parse_result result = toml::parse(content, sourceName);
    if (!result) {
        return tomlError(sourceName, result.error());
    }
    const toml::node_view<const toml::node> doc{result.table()};

    UvLock lock;
    if (auto version = doc["version"].value<std::int64_t>()) {
        lock.version = *version;
    }
    if (auto revision = doc["revision"].value<std::int64_t>()) {
        lock.revision = *revision;
    }
    lock.requiresPython = stringAt(doc["requires-python"]);

    const auto* packages = doc["package"].as_array();
    if (packages == nullptr) {
        return lock;
    }

    for (const auto& node : *packages) {
        const auto* table = node.as_table();
        if (table == nullptr) {
            continue;
        }
        const toml::node_view<const toml::node> entry{*table};
        LockPackage package;
        package.name = stringAt(entry["name"]).value_or("");
        package.version = stringAt(entry["version"]).value_or("");
        if (package.name.empty()) {
            continue;
        }

        if (const auto* source = entry["source"].as_table()) {
            for (auto&& [kind, location] : *source) {
                package.source = LockSource{
                    std::string(kind.str()),
                    location.value<std::string>().value_or("")};
                break;
            }
        }

        if (const auto* deps = entry["dependencies"].as_array()) {
            for (const auto& dep : *deps) {
                if (auto name = dep.value<std::string>()) {
                    package.dependencies.push_back({*name, std::nullopt});
                } else if (const auto* depTable = dep.as_table()) {
                    const toml::node_view<const toml::node> depView{*depTable};
                    if (auto name = stringAt(depView["name"])) {
                        package.dependencies.push_back(
                            {*name, stringAt(depView["marker"])});
                    }
                }
            }
        }

        lock.packages.push_back(std::move(package));
    }
    return lock;
}

PmResult<UvLock> parseUvLock(const fs::path& path) {
    auto text = readTextFile(path);
    if (!text) {
        return std::unexpected(text.error());
    }
    return parseUvLockText(*text, path.string());
}

}  // namespace bottles::pm
