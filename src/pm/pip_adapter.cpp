/*
 * pip_adapter.cpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

#include "pip_adapter.hpp"

#include "json_output.hpp"
#include "pyproject.hpp"
#include "requirements_parser.hpp"
#include "version_spec.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <format>
#include <map>
#include <set>

namespace bottles::pm {

namespace {

bool isRequirementsFile(const fs::path& path) {
    auto filename = path.filename().string();
    return filename.find("requirements") != std::string::npos &&
           filename.ends_with(".txt");
}

bool isDevRequirementsFile(const fs::path& path) {
    auto filename = path.filename().string();
    return filename.find("dev") != std::string::npos ||
           filename.find("test") != std::string::npos;
}

template <typename Metadata>
void mergeMetadata(Manifest& manifest, const Metadata& metadata) {
    if (metadata.name) {
        manifest.name = metadata.name;
    }
    if (metadata.version) {
        manifest.version = metadata.version;
    }
    if (metadata.description) {
        manifest.description = metadata.description;
    }
    if (metadata.license) {
        manifest.license = metadata.license;
    }
}

}  // namespace

PipAdapter::PipAdapter(AdapterContext context)
    : PackageManagerAdapter(std::move(context)) {}

std::string PipAdapter::executable() const {
    return environment().getOr("PIP_COMMAND", "pip3");
}

const std::vector<std::string>& PipAdapter::manifestFiles() const {
    static const std::vector<std::string> FILES = {
        "requirements.txt",  "requirements-dev.txt", "requirements-test.txt",
        "dev-requirements.txt", "setup.py",          "setup.cfg",
        "pyproject.toml"};
    return FILES;
}

const std::vector<std::string>& PipAdapter::lockFiles() const {
    static const std::vector<std::string> FILES = {
        "requirements-lock.txt", "requirements.lock", "pip-compile.lock"};
    return FILES;
}

PmResult<DetectionResult> PipAdapter::detectProject(const fs::path& dir) {
    DetectionResult detection;
    detection.manifestFiles = findManifestFiles(dir);
    detection.lockFiles = findLockFiles(dir);
    if (detection.manifestFiles.empty()) {
        detection.lockFiles.clear();
        return detection;
    }

    double confidence = pip_confidence::BASE;
    auto& metadata = detection.metadata;
    const auto& manifests = detection.manifestFiles;

    auto requirementFiles = std::ranges::count_if(manifests, isRequirementsFile);
    if (requirementFiles > 0) {
        confidence = pip_confidence::REQUIREMENTS;
        metadata["hasRequirements"] = true;
        metadata["requirementFiles"] = requirementFiles;
    }

    auto hasFile = [&manifests](std::string_view filename) {
        return std::ranges::any_of(manifests, [filename](const fs::path& p) {
            return p.filename() == filename;
        });
    };

    if (hasFile("setup.py") || hasFile("setup.cfg")) {
        confidence = std::max(confidence, pip_confidence::SETUP_FILES);
        metadata["hasSetupFiles"] = true;
    }

    if (hasFile("pyproject.toml")) {
        auto pyproject = parsePyproject(dir / "pyproject.toml");
        if (!pyproject) {
            spdlog::warn("[pip] Could not read pyproject.toml: {}",
                         pyproject.error().cause);
            confidence =
                std::max(confidence, pip_confidence::UNREADABLE_PYPROJECT);
        } else if (pyproject->hasToolUv || pyproject->hasPoetry ||
                   pyproject->hasPipenv) {
            confidence = std::min(confidence, pip_confidence::COMPETING_TOOL);
            metadata["competingTool"] = pyproject->hasToolUv    ? "uv"
                                        : pyproject->hasPoetry ? "poetry"
                                                               : "pipenv";
        } else {
            confidence = std::max(confidence, pip_confidence::PLAIN_PYPROJECT);
            metadata["hasPyprojectToml"] = true;
        }
    }

    if (!detection.lockFiles.empty()) {
        confidence = std::max(confidence, pip_confidence::LOCK_FILE);
        metadata["hasLockFiles"] = true;
    }

    if (hasVenv(dir)) {
        confidence = std::max(confidence, pip_confidence::VENV);
        metadata["hasVenv"] = true;
    }

    detection.confidence = confidence;
    detection.detected = confidence > pip_confidence::THRESHOLD;
    spdlog::debug("[pip] Detection in {}: confidence {:.2f}", dir.string(),
                  confidence);
    return detection;
}

PmResult<std::optional<Manifest>> PipAdapter::parseManifest(
    const fs::path& dir) {
    const auto manifests = findManifestFiles(dir);
    if (manifests.empty()) {
        return std::optional<Manifest>{};
    }

    Manifest manifest;
    auto addSpecs = [this](DependencyMap& target,
                           const std::vector<std::string>& specs,
                           std::string_view group = {}) {
        for (const auto& spec : specs) {
            auto parsed = parseVersionSpec(spec);
            auto key = group.empty()
                           ? parsed.name
                           : std::format("{}[{}]", parsed.name, group);
            target[key] = parsed.constraint.value_or(parsed.version);
        }
    };

    for (const auto& file : manifests) {
        const auto filename = file.filename().string();

        if (isRequirementsFile(file)) {
            auto entries = parseRequirementsFile(file);
            if (!entries) {
                spdlog::warn("[pip] Failed to parse {}: {}", file.string(),
                             entries.error().message);
                continue;
            }
            auto& target = isDevRequirementsFile(file)
                               ? manifest.devDependencies
                               : manifest.dependencies;
            for (const auto& entry : *entries) {
                target[entry.name] = entry.version;
            }
        } else if (filename == "setup.py" || filename == "setup.cfg") {
            auto setup = filename == "setup.py" ? parseSetupPy(file)
                                                : parseSetupCfg(file);
            if (!setup) {
                spdlog::warn("[pip] Failed to parse {}: {}", file.string(),
                             setup.error().message);
                continue;
            }
            mergeMetadata(manifest, *setup);
            if (setup->author) {
                manifest.author = setup->author;
            }
            if (setup->pythonRequires) {
                manifest.pythonRequires = setup->pythonRequires;
            }
            addSpecs(manifest.dependencies, setup->installRequires);
            for (const auto& [extra, specs] : setup->extrasRequire) {
                addSpecs(manifest.optionalDependencies, specs, extra);
            }
        } else if (filename == "pyproject.toml") {
            auto pyproject = parsePyproject(file);
            if (!pyproject) {
                spdlog::warn("[pip] Failed to parse {}: {}", file.string(),
                             pyproject.error().cause);
                continue;
            }
            mergeMetadata(manifest, *pyproject);
            if (!pyproject->authors.empty()) {
                manifest.author = pyproject->authors.front().name;
            }
            if (pyproject->requiresPython) {
                manifest.pythonRequires = pyproject->requiresPython;
            }
            addSpecs(manifest.dependencies, pyproject->dependencies);
            for (const auto& [group, specs] : pyproject->optionalDependencies) {
                addSpecs(manifest.optionalDependencies, specs, group);
            }
        }
    }

    // Exact pins from lock files win over the ranges declared above.
    const auto locks = findLockFiles(dir);
    std::map<std::string, std::string> pins;
    for (const auto& file : locks) {
        auto entries = parseRequirementsFile(file);
        if (!entries) {
            spdlog::warn("[pip] Failed to parse lock file {}: {}",
                         file.string(), entries.error().message);
            continue;
        }
        for (const auto& entry : *entries) {
            if (entry.version.empty() || entry.version == "*") {
                continue;
            }
            pins[normalizePackageName(entry.name)] =
                entry.version.starts_with("==") ? entry.version
                                                : "==" + entry.version;
        }
    }
    for (auto* deps : {&manifest.dependencies, &manifest.devDependencies}) {
        for (auto& [name, version] : *deps) {
            if (auto it = pins.find(normalizePackageName(name));
                it != pins.end()) {
                version = it->second;
            }
        }
    }

    json names = json::array();
    for (const auto& file : manifests) {
        names.push_back(file.filename().string());
    }
    manifest.metadata["manifestFiles"] = std::move(names);
    manifest.metadata["hasLockFiles"] = !locks.empty();
    manifest.metadata["hasRequirements"] =
        !manifest.dependencies.empty() || !manifest.devDependencies.empty();
    manifest.metadata["hasSetupFiles"] =
        std::ranges::any_of(manifests, [](const fs::path& p) {
            return p.filename() == "setup.py" || p.filename() == "setup.cfg";
        });
    manifest.metadata["hasPyprojectToml"] =
        std::ranges::any_of(manifests, [](const fs::path& p) {
            return p.filename() == "pyproject.toml";
        });
    return std::optional<Manifest>{std::move(manifest)};
}

PmResult<CommandOutcome> PipAdapter::installPackages(
    const std::vector<std::string>& packages, const InstallOptions& options) {
    const auto dir = options.cwd.value_or(projectDir());
    std::string command = getVenvActivationPrefix(dir) + executable() +
                          " install";
    for (const auto& arg : buildInstallArgs(options)) {
        command += " " + arg;
    }

    if (packages.empty()) {
        auto requirementFiles = findRequirementsFiles(dir);
        if (requirementFiles.empty()) {
            return makeError(
                ErrorCode::NoRequirements,
                "No packages specified and no requirements files found",
                "Specify packages to install or create a requirements.txt file");
        }
        for (const auto& file : requirementFiles) {
            command += std::format(" -r \"{}\"", file.string());
        }
    } else {
        command += " " + quoteArguments(packages);
    }

    spdlog::info("[pip] Installing {} in {}",
                 packages.empty() ? std::string("requirements")
                                  : std::to_string(packages.size()) +
                                        " package(s)",
                 dir.string());
    ExecuteOptions exec;
    exec.env = options.env;
    exec.cwd = dir;
    exec.timeout = timeoutFor(TimeoutTier::Standard);
    return executeCommand(command, exec);
}

PmResult<CommandOutcome> PipAdapter::uninstallPackages(
    const std::vector<std::string>& packages, const InstallOptions& options) {
    if (packages.empty()) {
        return makeError(ErrorCode::NoPackages,
                         "No packages specified for uninstall");
    }
    const auto dir = options.cwd.value_or(projectDir());
    std::string command =
        getVenvActivationPrefix(dir) + executable() + " uninstall -y";
    for (const auto& arg : options.extraArgs) {
        command += " " + arg;
    }
    command += " " + quoteArguments(packages);

    ExecuteOptions exec;
    exec.env = options.env;
    exec.cwd = dir;
    exec.timeout = timeoutFor(TimeoutTier::Standard);
    return executeCommand(command, exec);
}

PmResult<std::vector<PackageInfo>> PipAdapter::getInstalledPackages(
    const fs::path& dir) {
    if (!hasVenv(dir)) {
        spdlog::debug("[pip] No virtual environment in {}", dir.string());
        return std::vector<PackageInfo>{};
    }

    ExecuteOptions exec;
    exec.cwd = dir;
    exec.suppressErrors = true;
    exec.timeout = timeoutFor(TimeoutTier::Quick);
    auto outcome = executeCommand(
        getVenvActivationPrefix(dir) + executable() + " list --format json",
        exec);
    if (!outcome) {
        return std::unexpected(outcome.error());
    }
    if (!outcome->result.success()) {
        return makeError(
            ErrorCode::ListFailed, "Failed to list installed packages",
            "Ensure pip is installed and a virtual environment is activated",
            outcome->result.stderrText);
    }

    auto parsed = parseJsonOutput(outcome->result.stdoutText, "pip list");
    if (!parsed) {
        return std::unexpected(parsed.error());
    }
    if (!parsed->is_array()) {
        return makeError(ErrorCode::InvalidJsonOutput,
                         "pip list did not return a JSON array");
    }

    Manifest manifest;
    if (auto loaded = parseManifest(dir); !loaded) {
        spdlog::debug("[pip] Listing without manifest information: {}",
                      loaded.error().message);
    } else if (loaded->has_value()) {
        manifest = std::move(**loaded);
    }
    std::set<std::string> devNames;
    for (const auto& [name, version] : manifest.devDependencies) {
        devNames.insert(normalizePackageName(name));
    }

    std::vector<PackageInfo> packages;
    for (const auto& item : *parsed) {
        if (!item.is_object() || !item.contains("name")) {
            continue;
        }
        PackageInfo info;
        info.name = item.value("name", "");
        info.version = item.value("version", "");
        const auto normalized = normalizePackageName(info.name);
        const bool editable = item.contains("editable_project_location");
        info.location = editable
                            ? item.value("editable_project_location", "")
                            : std::string("site-packages");
        info.isDev = devNames.contains(normalized);
        info.isOptional = std::ranges::any_of(
            manifest.optionalDependencies, [&normalized](const auto& entry) {
                return normalizePackageName(entry.first)
                    .starts_with(normalized + "[");
            });
        info.metadata = {{"editable", editable},
                         {"installer", item.value("installer", "pip")},
                         {"manager", "pip"}};
        packages.push_back(std::move(info));
    }
    return packages;
}

PmResult<CommandOutcome> PipAdapter::createEnvironment(
    const fs::path& dir, const std::optional<std::string>& pythonVersion) {
    std::string python = "python";
    if (pythonVersion) {
        python += *pythonVersion;
    } else if (environment().findExecutable("python3")) {
        python = "python3";
    }

    ExecuteOptions exec;
    exec.cwd = dir;
    exec.timeout = timeoutFor(TimeoutTier::Extended);
    auto created = executeCommand(
        std::format("{} -m venv --clear \"{}\"", python,
                    (dir / ".venv").string()),
        exec);
    if (!created) {
        return created;
    }

    if (!hasVenv(dir)) {
        spdlog::warn("[pip] {} has no virtual environment after creation",
                     dir.string());
        return created;
    }
    exec.timeout = timeoutFor(TimeoutTier::Standard);
    auto upgraded = executeCommand(
        getVenvActivationPrefix(dir) + "pip install --upgrade pip", exec);
    if (!upgraded) {
        spdlog::warn("[pip] Failed to upgrade pip in new environment: {}",
                     upgraded.error().message);
    }
    return created;
}

PmResult<EnvironmentMap> PipAdapter::activateEnvironment(const fs::path& dir) {
    if (!hasVenv(dir)) {
        return makeError(
            ErrorCode::VenvNotFound, "Virtual environment not found",
            std::format("Run 'python -m venv .venv' in {} to create one",
                        dir.string()));
    }
    const auto venv = getVenvPath(dir);
    const auto bin = venv / "bin";
    return EnvironmentMap{
        {"VIRTUAL_ENV", venv.string()},
        {"PATH", bin.string() + ":" + environment().getOr("PATH", "")},
        {"PYTHON", (bin / "python").string()},
        {"PIP_REQUIRE_VIRTUALENV", "true"}};
}

PmResult<CachePaths> PipAdapter::getCachePaths() const {
    auto paths = PackageManagerAdapter::getCachePaths();
    if (paths) {
        paths->additional["wheels"] = paths->global / "wheels";
        paths->additional["http"] = paths->global / "http";
    }
    return paths;
}

VersionSpec PipAdapter::parseVersionSpec(std::string_view spec) const {
    return parsePipVersionSpec(spec);
}

PmResult<EnvironmentMap> PipAdapter::getEnvironmentVariables(
    const EnvironmentMap& overrides, const fs::path& dir) {
    auto env = PackageManagerAdapter::getEnvironmentVariables(overrides, dir);
    if (!env) {
        return env;
    }
    auto& vars = *env;
    if (!vars.contains("PIP_CACHE_DIR")) {
        if (auto paths = getCachePaths()) {
            vars["PIP_CACHE_DIR"] = paths->global.string();
        }
    }
    vars["PIP_DISABLE_PIP_VERSION_CHECK"] = "1";
    vars["PIP_NO_COLOR"] = "1";
    vars["NO_COLOR"] = "1";
    vars["PIP_PROGRESS_BAR"] = "off";
    vars["FORCE_COLOR"] = "0";
    for (const auto& [key, value] : overrides) {
        vars[key] = value;
    }
    return env;
}

std::vector<std::string> PipAdapter::buildInstallArgs(
    const InstallOptions& options) const {
    std::vector<std::string> args;
    if (options.force) {
        args.emplace_back("--force-reinstall");
    }
    if (options.indexUrl) {
        args.emplace_back("--index-url");
        args.push_back(*options.indexUrl);
    }
    args.insert(args.end(), options.extraArgs.begin(), options.extraArgs.end());
    return args;
}

std::vector<fs::path> PipAdapter::findRequirementsFiles(
    const fs::path& dir) const {
    std::vector<fs::path> files;
    for (auto& file : findManifestFiles(dir)) {
        if (isRequirementsFile(file)) {
            files.push_back(std::move(file));
        }
    }
    return files;
}

}  // namespace bottles::pm
