/*
 * requirements_parser.hpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/**
 * @file requirements_parser.hpp
 * @brief Readers for pip's requirements files, setup.py and setup.cfg
 * @date 2024
 * @version 1.0.0
 *
 * None of these execute Python; setup.py is scanned with regular
 * expressions for the literal keyword arguments most projects use.
 */

#ifndef BOTTLES_PM_REQUIREMENTS_PARSER_HPP
#define BOTTLES_PM_REQUIREMENTS_PARSER_HPP

#include <filesystem>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "types.hpp"

namespace bottles::pm {

/**
 * @brief One dependency line of a requirements file
 */
struct RequirementEntry {
    std::string name;
    std::string version{"*"};  ///< Constraint, or "*"
    bool editable{false};
    std::optional<std::string> url;  ///< VCS or archive source
    std::optional<std::string> markers;
    std::vector<std::string> extras;
    std::string originalLine;
};

/**
 * @brief Parse a single requirements line
 * @return nullopt for blank lines, comments and unnamed sources
 */
[[nodiscard]] std::optional<RequirementEntry> parseRequirementLine(
    std::string_view line);

/**
 * @brief Parse requirements text; includes are resolved against
 * @p baseDir
 */
[[nodiscard]] std::vector<RequirementEntry> parseRequirementsText(
    std::string_view content, const fs::path& baseDir);

/**
 * @brief Parse a requirements file, following -r includes
 *
 * A failing include is logged and skipped; a failing top-level read
 * returns FileReadError.
 */
[[nodiscard]] PmResult<std::vector<RequirementEntry>> parseRequirementsFile(
    const fs::path& path);

/**
 * @brief Metadata common to setup.py and setup.cfg
 */
struct SetupMetadata {
    std::optional<std::string> name;
    std::optional<std::string> version;
    std::optional<std::string> description;
    std::optional<std::string> author;
    std::optional<std::string> license;
    std::optional<std::string> pythonRequires;
    std::vector<std::string> installRequires;
    std::map<std::string, std::vector<std::string>> extrasRequire;
};

[[nodiscard]] SetupMetadata parseSetupPyText(std::string_view content);
[[nodiscard]] SetupMetadata parseSetupCfgText(std::string_view content);

[[nodiscard]] PmResult<SetupMetadata> parseSetupPy(const fs::path& path);
[[nodiscard]] PmResult<SetupMetadata> parseSetupCfg(const fs::path& path);

/**
 * @brief Whole file as a string
 */
[[nodiscard]] PmResult<std::string> readTextFile(const fs::path& path);

}  // namespace bottles::pm

#endif  // BOTTLES_PM_REQUIREMENTS_PARSER_HPP
