/*
 * sink_factory.hpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

#ifndef BOTTLES_LOGGING_SINK_FACTORY_HPP
#define BOTTLES_LOGGING_SINK_FACTORY_HPP

#include <string>

#include <spdlog/spdlog.h>

#include "types.hpp"

namespace bottles::logging {

/**
 * @brief Creates spdlog sinks from SinkConfig
 */
class SinkFactory {
public:
    /**
     * @brief Create a sink from configuration
     * @return Sink, or nullptr for unknown types or creation failure
     */
    static auto createSink(const SinkConfig& config) -> spdlog::sink_ptr;

    static auto createConsoleSink(spdlog::level::level_enum level,
                                  const std::string& pattern)
        -> spdlog::sink_ptr;

    static auto createFileSink(const std::string& file_path,
                               spdlog::level::level_enum level,
                               const std::string& pattern)
        -> spdlog::sink_ptr;

    static auto createRotatingFileSink(const std::string& file_path,
                                       size_t max_size, size_t max_files,
                                       spdlog::level::level_enum level,
                                       const std::string& pattern)
        -> spdlog::sink_ptr;

private:
    static void ensureDirectoryExists(const std::string& file_path);
};

}  // namespace bottles::logging

#endif  // BOTTLES_LOGGING_SINK_FACTORY_HPP
