/*
 * timeouts.hpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

#ifndef BOTTLES_PM_TIMEOUTS_HPP
#define BOTTLES_PM_TIMEOUTS_HPP

#include <chrono>
#include <string_view>

#include "config/environment_snapshot.hpp"

namespace bottles::pm {

/**
 * @brief Timeout classes for package manager commands
 */
enum class TimeoutTier {
    Immediate,  ///< which, trivial probes
    Quick,      ///< --version
    Standard,   ///< install, list
    Extended    ///< venv creation, sync of large projects
};

[[nodiscard]] constexpr std::string_view timeoutTierToString(
    TimeoutTier tier) noexcept {
    switch (tier) {
        case TimeoutTier::Immediate: return "immediate";
        case TimeoutTier::Quick: return "quick";
        case TimeoutTier::Standard: return "standard";
        case TimeoutTier::Extended: return "extended";
    }
    return "standard";
}

[[nodiscard]] constexpr std::chrono::milliseconds baseTimeout(
    TimeoutTier tier) noexcept {
    switch (tier) {
        case TimeoutTier::Immediate: return std::chrono::milliseconds{1000};
        case TimeoutTier::Quick: return std::chrono::milliseconds{5000};
        case TimeoutTier::Standard: return std::chrono::milliseconds{30000};
        case TimeoutTier::Extended: return std::chrono::milliseconds{60000};
    }
    return std::chrono::milliseconds{30000};
}

/**
 * @brief PKG_LOCAL_TIMEOUT_MULTIPLIER when positive (capped at 100), else 4
 * in CI, else 1
 */
[[nodiscard]] double timeoutMultiplier(const config::EnvironmentSnapshot& env);

/**
 * @brief Base timeout of @p tier scaled by the environment multiplier
 */
[[nodiscard]] std::chrono::milliseconds timeoutFor(
    TimeoutTier tier, const config::EnvironmentSnapshot& env);

}  // namespace bottles::pm

#endif  // BOTTLES_PM_TIMEOUTS_HPP
