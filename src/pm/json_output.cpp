/*
 * json_output.cpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

#include "json_output.hpp"

#include <spdlog/spdlog.h>

#include <format>
#include <regex>

namespace bottles::pm {

namespace {

constexpr size_t PREVIEW_LENGTH = 100;

std::string_view trim(std::string_view text) {
    constexpr std::string_view WS = " \t\r\n";
    auto first = text.find_first_not_of(WS);
    if (first == std::string_view::npos) {
        return {};
    }
    auto last = text.find_last_not_of(WS);
    return text.substr(first, last - first + 1);
}

std::string preview(std::string_view text) {
    if (text.size() <= PREVIEW_LENGTH) {
        return std::string(text);
    }
    return std::string(text.substr(0, PREVIEW_LENGTH)) + "...";
}

}  // namespace

std::string stripTerminalNoise(std::string_view output) {
    static const std::regex ANSI_PATTERN(R"(\x1b\[[0-9;]*[A-Za-z])");
    std::string text =
        std::regex_replace(std::string(output), ANSI_PATTERN, "");

    // A bare \r rewinds the terminal line; keep only what was drawn last.
    std::string cleaned;
    cleaned.reserve(text.size());
    size_t lineStart = 0;
    while (lineStart <= text.size()) {
        auto newline = text.find('\n', lineStart);
        auto lineEnd = newline == std::string::npos ? text.size() : newline;
        std::string_view line(text.data() + lineStart, lineEnd - lineStart);
        if (!line.empty() && line.back() == '\r') {
            line.remove_suffix(1);
        }
        if (auto cr = line.rfind('\r'); cr != std::string_view::npos) {
            line.remove_prefix(cr + 1);
        }
        cleaned.append(line);
        if (newline == std::string::npos) {
            break;
        }
        cleaned.push_back('\n');
        lineStart = newline + 1;
    }
    return cleaned;
}

std::optional<std::string_view> findBalancedJson(std::string_view text,
                                                 size_t from) {
    auto start = text.find_first_of("[{", from);
    if (start == std::string_view::npos) {
        return std::nullopt;
    }

    std::string stack;
    bool inString = false;
    bool escaped = false;
    for (size_t i = start; i < text.size(); ++i) {
        char c = text[i];
        if (inString) {
            if (escaped) {
                escaped = false;
            } else if (c == '\\') {
                escaped = true;
            } else if (c == '"') {
                inString = false;
            }
            continue;
        }
        switch (c) {
            case '"':
                inString = true;
                break;
            case '[':
                stack.push_back(']');
                break;
            case '{':
                stack.push_back('}');
                break;
            case ']':
            case '}':
                if (stack.empty() || stack.back() != c) {
                    return std::nullopt;
                }
                stack.pop_back();
                if (stack.empty()) {
                    return text.substr(start, i - start + 1);
                }
                break;
            default:
                break;
        }
    }
    return std::nullopt;
}

PmResult<json> parseJsonOutput(std::string_view output,
                               std::string_view context) {
    const std::string cleaned = stripTerminalNoise(output);
    const std::string_view text = trim(cleaned);

    if (text.empty() || text == "[]") {
        return json::array();
    }

    if (text.front() == '[' || text.front() == '{') {
        try {
            return json::parse(text);
        } catch (const json::parse_error& e) {
            return makeError(
                ErrorCode::JsonParseError,
                std::format("Failed to parse {} output as JSON", context),
                "Check that the command supports --format json",
                std::format("{} (output: {})", e.what(), preview(text)));
        }
    }

    if (text.find_first_of("[{") == std::string_view::npos) {
        spdlog::debug("{} produced no JSON, treating as empty: {}", context,
                      preview(text));
        return json::array();
    }

    // Banner lines before the payload: try every bracket until one parses.
    size_t from = 0;
    while (from < text.size()) {
        auto next = text.find_first_of("[{", from);
        if (next == std::string_view::npos) {
            break;
        }
        if (auto candidate = findBalancedJson(text, next)) {
            auto parsed = json::parse(*candidate, nullptr, false);
            if (!parsed.is_discarded()) {
                return parsed;
            }
        }
        from = next + 1;
    }

    return makeError(ErrorCode::InvalidJsonOutput,
                     std::format("No valid JSON found in {} output", context),
                     "Run the command manually to inspect its output",
                     preview(text));
}

}  // namespace bottles::pm
