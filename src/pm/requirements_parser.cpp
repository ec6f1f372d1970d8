/*
 * requirements_parser.cpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

#include "requirements_parser.hpp"

#include "version_spec.hpp"

#include <spdlog/spdlog.h>

#include <cctype>
#include <fstream>
#include <regex>
#include <set>
#include <sstream>

namespace bottles::pm {

namespace {

constexpr int MAX_INCLUDE_DEPTH = 16;

std::string_view trimView(std::string_view text) {
    constexpr std::string_view WS = " \t\r\n";
    auto first = text.find_first_not_of(WS);
    if (first == std::string_view::npos) {
        return {};
    }
    auto last = text.find_last_not_of(WS);
    return text.substr(first, last - first + 1);
}

std::vector<std::string_view> splitLines(std::string_view content) {
    std::vector<std::string_view> lines;
    size_t start = 0;
    while (start <= content.size()) {
        auto newline = content.find('\n', start);
        if (newline == std::string_view::npos) {
            lines.push_back(content.substr(start));
            break;
        }
        lines.push_back(content.substr(start, newline - start));
        start = newline + 1;
    }
    return lines;
}

bool startsWithOption(std::string_view line, std::string_view shortForm,
                      std::string_view longForm) {
    auto matches = [&line](std::string_view option) {
        return !option.empty() && line.starts_with(option) &&
               line.size() > option.size() &&
               (line[option.size()] == ' ' || line[option.size()] == '\t' ||
                line[option.size()] == '=');
    };
    return matches(shortForm) || matches(longForm);
}

std::string_view optionValue(std::string_view line) {
    auto sep = line.find_first_of(" \t=");
    return trimView(line.substr(sep + 1));
}

/**
 * @brief Extract every quoted string inside @p text
 */
std::vector<std::string> quotedStrings(const std::string& text) {
    static const std::regex QUOTED(R"(["']([^"']+)["'])");
    std::vector<std::string> values;
    for (auto it = std::sregex_iterator(text.begin(), text.end(), QUOTED);
         it != std::sregex_iterator(); ++it) {
        values.push_back((*it)[1].str());
    }
    return values;
}

void parseInto(std::string_view content, const fs::path& baseDir,
               std::set<fs::path>& visited, int depth,
               std::vector<RequirementEntry>& out) {
    for (auto rawLine : splitLines(content)) {
        auto line = trimView(rawLine);
        if (line.empty() || line.front() == '#') {
            continue;
        }

        if (startsWithOption(line, "-r", "--requirement")) {
            auto includePath =
                (baseDir / std::string(optionValue(line))).lexically_normal();
            if (depth >= MAX_INCLUDE_DEPTH ||
                !visited.insert(includePath).second) {
                spdlog::warn("Skipping recursive requirements include {}",
                             includePath.string());
                continue;
            }
            auto text = readTextFile(includePath);
            if (!text) {
                spdlog::warn("Failed to read included requirements file {}: {}",
                             includePath.string(), text.error().message);
                continue;
            }
            parseInto(*text, includePath.parent_path(), visited, depth + 1,
                      out);
            continue;
        }

        if (startsWithOption(line, "-c", "--constraint") ||
            line.starts_with("--index-url") ||
            line.starts_with("--extra-index-url") ||
            line.starts_with("--find-links") ||
            line.starts_with("--trusted-host")) {
            continue;
        }

        if (auto entry = parseRequirementLine(line)) {
            out.push_back(std::move(*entry));
        }
    }
}

}  // namespace

std::optional<RequirementEntry> parseRequirementLine(std::string_view rawLine) {
    auto line = trimView(rawLine);
    if (auto hash = line.find('#');
        hash != std::string_view::npos &&
        line.find("#egg=") == std::string_view::npos) {
        line = trimView(line.substr(0, hash));
    }
    if (line.empty()) {
        return std::nullopt;
    }

    RequirementEntry entry;
    entry.originalLine = std::string(line);

    if (startsWithOption(line, "-e", "--editable")) {
        entry.editable = true;
        line = optionValue(line);
    }

    if (isVcsSource(line) || isUrlSource(line)) {
        auto spec = parsePipVersionSpec(line);
        if (spec.name == VCS_FALLBACK_NAME || spec.name == URL_FALLBACK_NAME) {
            spdlog::warn("Cannot determine package name for requirement: {}",
                         line);
            return std::nullopt;
        }
        entry.name = normalizePackageName(spec.name);
        entry.url = std::string(line);
        return entry;
    }

    if (line.front() == '.' || line.front() == '/' ||
        (line.size() >= 2 && std::isalpha(static_cast<unsigned char>(line[0])) &&
         line[1] == ':')) {
        auto path = line;
        while (!path.empty() && (path.back() == '/' || path.back() == '\\')) {
            path.remove_suffix(1);
        }
        auto sep = path.find_last_of("/\\");
        auto last = sep == std::string_view::npos ? path : path.substr(sep + 1);
        if (last.empty() || last == "." || last == "..") {
            spdlog::warn("Cannot determine package name from path: {}", line);
            return std::nullopt;
        }
        entry.name = normalizePackageName(last);
        return entry;
    }

    auto spec = parseBasicVersionSpec(line);
    if (spec.name.empty()) {
        return std::nullopt;
    }
    entry.name = std::move(spec.name);
    entry.version = spec.constraint.value_or(spec.version);
    entry.extras = std::move(spec.extras);
    entry.markers = std::move(spec.markers);
    return entry;
}

std::vector<RequirementEntry> parseRequirementsText(std::string_view content,
                                                    const fs::path& baseDir) {
    std::vector<RequirementEntry> entries;
    std::set<fs::path> visited;
    parseInto(content, baseDir, visited, 0, entries);
    return entries;
}

PmResult<std::vector<RequirementEntry>> parseRequirementsFile(
    const fs::path& path) {
    auto text = readTextFile(path);
    if (!text) {
        return std::unexpected(text.error());
    }
    std::vector<RequirementEntry> entries;
    std::set<fs::path> visited{path.lexically_normal()};
    parseInto(*text, path.parent_path(), visited, 0, entries);
    return entries;
}

SetupMetadata parseSetupPyText(std::string_view content) {
    const std::string text(content);
    SetupMetadata metadata;

    auto extract = [&text](const char* pattern) -> std::optional<std::string> {
        std::smatch match;
        if (std::regex_search(text, match, std::regex(pattern))) {
            return match[1].str();
        }
        return std::nullopt;
    };

    metadata.name = extract(R"(\bname\s*=\s*["']([^"']+)["'])");
    metadata.version = extract(R"(\bversion\s*=\s*["']([^"']+)["'])");
    metadata.description = extract(R"(\bdescription\s*=\s*["']([^"']+)["'])");
    metadata.author = extract(R"(\bauthor\s*=\s*["']([^"']+)["'])");
    metadata.license = extract(R"(\blicense\s*=\s*["']([^"']+)["'])");
    metadata.pythonRequires =
        extract(R"(\bpython_requires\s*=\s*["']([^"']+)["'])");

    static const std::regex INSTALL_REQUIRES(
        R"(install_requires\s*=\s*\[([^\]]*)\])");
    std::smatch match;
    if (std::regex_search(text, match, INSTALL_REQUIRES)) {
        metadata.installRequires = quotedStrings(match[1].str());
    }

    static const std::regex EXTRAS_REQUIRE(R"(extras_require\s*=\s*\{([^}]*)\})");
    if (std::regex_search(text, match, EXTRAS_REQUIRE)) {
        const std::string body = match[1].str();
        static const std::regex EXTRA_ENTRY(
            R"(["']([^"']+)["']\s*:\s*\[([^\]]*)\])");
        for (auto it = std::sregex_iterator(body.begin(), body.end(),
                                            EXTRA_ENTRY);
             it != std::sregex_iterator(); ++it) {
            metadata.extrasRequire[(*it)[1].str()] =
                quotedStrings((*it)[2].str());
        }
    }

    return metadata;
}

SetupMetadata parseSetupCfgText(std::string_view content) {
    SetupMetadata metadata;
    auto lines = splitLines(content);
    std::string section;

    for (size_t i = 0; i < lines.size(); ++i) {
        auto line = trimView(lines[i]);
        if (line.empty() || line.front() == '#' || line.front() == ';') {
            continue;
        }
        if (line.front() == '[' && line.back() == ']') {
            section = std::string(trimView(line.substr(1, line.size() - 2)));
            continue;
        }

        auto eq = line.find('=');
        if (eq == std::string_view::npos) {
            continue;
        }
        auto key = trimView(line.substr(0, eq));
        auto value = std::string(trimView(line.substr(eq + 1)));

        if (section == "metadata") {
            if (key == "name") {
                metadata.name = value;
            } else if (key == "version") {
                metadata.version = value;
            } else if (key == "description") {
                metadata.description = value;
            } else if (key == "author") {
                metadata.author = value;
            } else if (key == "license") {
                metadata.license = value;
            } else if (key == "python_requires") {
                metadata.pythonRequires = value;
            }
        } else if (section == "options") {
            if (key == "python_requires") {
                metadata.pythonRequires = value;
            } else if (key == "install_requires") {
                std::vector<std::string> requirements;
                if (!value.empty()) {
                    requirements.push_back(value);
                }
                // Continuation lines are indented.
                while (i + 1 < lines.size()) {
                    auto next = lines[i + 1];
                    if (next.empty() ||
                        (next.front() != ' ' && next.front() != '\t')) {
                        break;
                    }
                    auto item = trimView(next);
                    if (item.empty()) {
                        break;
                    }
                    if (item.front() != '#') {
                        requirements.emplace_back(item);
                    }
                    ++i;
                }
                metadata.installRequires = std::move(requirements);
            }
        }
    }
    return metadata;
}

PmResult<SetupMetadata> parseSetupPy(const fs::path& path) {
    auto text = readTextFile(path);
    if (!text) {
        return std::unexpected(text.error());
    }
    return parseSetupPyText(*text);
}

PmResult<SetupMetadata> parseSetupCfg(const fs::path& path) {
    auto text = readTextFile(path);
    if (!text) {
        return std::unexpected(text.error());
    }
    return parseSetupCfgText(*text);
}

PmResult<std::string> readTextFile(const fs::path& path) {
    std::ifstream file(path, std::ios::binary);
    if (!file) {
        return makeError(ErrorCode::FileReadError,
                         "Failed to open " + path.string(),
                         "Check that the file exists and is readable");
    }
    std::ostringstream buffer;
    buffer << file.rdbuf();
    if (file.bad()) {
        return makeError(ErrorCode::FileReadError,
                         "Failed to read " + path.string());
    }
    return buffer.str();
}

}  // namespace bottles::pm
