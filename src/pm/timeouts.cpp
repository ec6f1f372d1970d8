/*
 * timeouts.cpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

#include "timeouts.hpp"

#include <algorithm>
#include <charconv>
#include <cmath>

namespace bottles::pm {

namespace {
constexpr double CI_MULTIPLIER = 4.0;
// Keeps base * multiplier far inside the range of milliseconds::rep.
constexpr double MAX_MULTIPLIER = 100.0;
}

double timeoutMultiplier(const config::EnvironmentSnapshot& env) {
    if (auto raw = env.get("PKG_LOCAL_TIMEOUT_MULTIPLIER")) {
        double value = 0.0;
        auto [ptr, ec] =
            std::from_chars(raw->data(), raw->data() + raw->size(), value);
        if (ec == std::errc{} && ptr == raw->data() + raw->size() &&
            std::isfinite(value) && value > 0.0) {
            return std::min(value, MAX_MULTIPLIER);
        }
    }
    return env.isCI() ? CI_MULTIPLIER : 1.0;
}

std::chrono::milliseconds timeoutFor(TimeoutTier tier,
                                     const config::EnvironmentSnapshot& env) {
    auto base = static_cast<double>(baseTimeout(tier).count());
    return std::chrono::milliseconds{
        static_cast<std::chrono::milliseconds::rep>(
            std::llround(base * timeoutMultiplier(env)))};
}

}  // namespace bottles::pm
