/*
 * json_output.hpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/**
 * @file json_output.hpp
 * @brief Extract JSON from package manager output that may carry banners,
 * colors and progress lines
 */

#ifndef BOTTLES_PM_JSON_OUTPUT_HPP
#define BOTTLES_PM_JSON_OUTPUT_HPP

#include <optional>
#include <string>
#include <string_view>

#include "types.hpp"

namespace bottles::pm {

/**
 * @brief Remove ANSI color sequences and carriage-return progress
 * fragments
 */
[[nodiscard]] std::string stripTerminalNoise(std::string_view output);

/**
 * @brief Find the first balanced [...] or {...} starting at or after
 * @p from
 * @return Substring including the brackets, or nullopt
 */
[[nodiscard]] std::optional<std::string_view> findBalancedJson(
    std::string_view text, size_t from = 0);

/**
 * @brief Parse command output into a JSON value
 *
 * Empty output, a literal [] and output that contains no bracket at all
 * give an empty array. Output that starts like JSON but is malformed gives
 * JsonParseError; brackets that never form a valid value give
 * InvalidJsonOutput.
 *
 * @param output Raw stdout
 * @param context Short label used in error messages, e.g. "pip list"
 */
[[nodiscard]] PmResult<json> parseJsonOutput(std::string_view output,
                                             std::string_view context);

}  // namespace bottles::pm

#endif  // BOTTLES_PM_JSON_OUTPUT_HPP
