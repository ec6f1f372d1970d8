/*
 * types.hpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/**
 * @file types.hpp
 * @brief Type definitions for package manager adapters
 * @date 2024
 * @version 1.0.0
 *
 * Error codes, detection and manifest structures, install options and the
 * collaborators every adapter is constructed with.
 */

#ifndef BOTTLES_PM_TYPES_HPP
#define BOTTLES_PM_TYPES_HPP

#include <chrono>
#include <expected>
#include <filesystem>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include <nlohmann/json.hpp>

#include "config/environment_snapshot.hpp"
#include "shell/command_runner.hpp"
#include "shell/types.hpp"
#include "volume/volume_controller.hpp"

namespace bottles::pm {

namespace fs = std::filesystem;
using json = nlohmann::json;
using shell::EnvironmentMap;

/**
 * @brief Error codes for package manager operations
 */
enum class ErrorCode {
    ExecutionError,       ///< The command runner could not run the command
    CommandFailed,        ///< The command exited non-zero
    CommandTimedOut,      ///< The command produced no output for too long
    MountCreationFailed,  ///< The manager cache could not be mounted
    MountNotFound,        ///< No cache mount exists for the manager
    JsonParseError,       ///< Output looked like JSON but did not parse
    InvalidJsonOutput,    ///< No JSON value could be found in the output
    ManifestParseError,   ///< A manifest or lock file is malformed
    NoRequirements,       ///< Nothing to install from
    NoPackages,           ///< No packages given outside a project
    ListFailed,           ///< Listing installed packages failed
    VenvNotFound,         ///< No virtual environment in the project
    AdapterNotFound,      ///< No adapter registered under the id
    FileReadError         ///< A file could not be read
};

[[nodiscard]] constexpr std::string_view errorCodeToString(
    ErrorCode code) noexcept {
    switch (code) {
        case ErrorCode::ExecutionError: return "EXECUTION_ERROR";
        case ErrorCode::CommandFailed: return "COMMAND_FAILED";
        case ErrorCode::CommandTimedOut: return "COMMAND_TIMED_OUT";
        case ErrorCode::MountCreationFailed: return "MOUNT_CREATION_FAILED";
        case ErrorCode::MountNotFound: return "MOUNT_NOT_FOUND";
        case ErrorCode::JsonParseError: return "JSON_PARSE_ERROR";
        case ErrorCode::InvalidJsonOutput: return "INVALID_JSON_OUTPUT";
        case ErrorCode::ManifestParseError: return "MANIFEST_PARSE_ERROR";
        case ErrorCode::NoRequirements: return "NO_REQUIREMENTS";
        case ErrorCode::NoPackages: return "NO_PACKAGES";
        case ErrorCode::ListFailed: return "LIST_FAILED";
        case ErrorCode::VenvNotFound: return "VENV_NOT_FOUND";
        case ErrorCode::AdapterNotFound: return "ADAPTER_NOT_FOUND";
        case ErrorCode::FileReadError: return "FILE_READ_ERROR";
    }
    return "UNKNOWN";
}

struct PackageManagerError {
    ErrorCode code;
    std::string message;
    std::string suggestion;  ///< What the user can do about it; may be empty
    std::string cause;       ///< Underlying error text, e.g. stderr
};

template <typename T>
using PmResult = std::expected<T, PackageManagerError>;

/**
 * @brief Build an unexpected PackageManagerError in one expression
 */
[[nodiscard]] inline std::unexpected<PackageManagerError> makeError(
    ErrorCode code, std::string message, std::string suggestion = {},
    std::string cause = {}) {
    return std::unexpected(PackageManagerError{code, std::move(message),
                                               std::move(suggestion),
                                               std::move(cause)});
}

/**
 * @brief Outcome of probing a directory for a manager's project files
 */
struct DetectionResult {
    bool detected{false};
    double confidence{0.0};  ///< 0.0 to 1.0
    std::vector<fs::path> manifestFiles;
    std::vector<fs::path> lockFiles;
    json metadata = json::object();
};

using DependencyMap = std::map<std::string, std::string>;

/**
 * @brief Normalized project description across manifest formats
 */
struct Manifest {
    std::optional<std::string> name;
    std::optional<std::string> version;
    std::optional<std::string> description;
    std::optional<std::string> author;
    std::optional<std::string> license;
    std::optional<std::string> pythonRequires;
    DependencyMap dependencies;          ///< name -> version constraint
    DependencyMap devDependencies;
    DependencyMap optionalDependencies;  ///< "name[group]" -> constraint
    json metadata = json::object();
};

struct InstallOptions {
    bool dev{false};
    bool optional{false};
    bool force{false};  ///< Reinstall even when already satisfied
    std::optional<std::string> indexUrl;
    std::vector<std::string> extraArgs;
    EnvironmentMap env;  ///< Overrides applied last
    std::optional<fs::path> cwd;
};

struct CachePaths {
    fs::path global;
    fs::path local;
    fs::path temp;
    std::map<std::string, fs::path> additional;
};

struct PackageInfo {
    std::string name;
    std::string version;
    std::string location;
    bool isDev{false};
    bool isOptional{false};
    json metadata = json::object();
};

struct ValidationResult {
    bool valid{true};
    std::vector<std::string> errors;
    std::vector<std::string> warnings;
};

/**
 * @brief A command line together with what running it produced
 */
struct CommandOutcome {
    std::string command;
    shell::CommandResult result;
};

struct ExecuteOptions {
    EnvironmentMap env;
    std::optional<std::chrono::milliseconds> timeout;  ///< Default: standard
    bool suppressErrors{false};  ///< Return non-zero exits as outcomes
    std::optional<fs::path> cwd;
};

/**
 * @brief A requirement split into name and version constraint
 */
struct VersionSpec {
    std::string name;
    std::string version{"*"};
    std::optional<std::string> constraint;
    std::vector<std::string> extras;
    std::optional<std::string> markers;
};

/**
 * @brief Collaborators shared by every adapter instance
 */
struct AdapterContext {
    std::shared_ptr<shell::ICommandRunner> runner;
    std::shared_ptr<volume::VolumeController> volumes;
    config::EnvironmentSnapshot environment;
    fs::path projectDir;
};

}  // namespace bottles::pm

#endif  // BOTTLES_PM_TYPES_HPP
