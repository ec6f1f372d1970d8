/*
 * exception.hpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2024-6-4

Description: Bottles configuration exception types

**************************************************/

#ifndef BOTTLES_CONFIG_EXCEPTION_HPP
#define BOTTLES_CONFIG_EXCEPTION_HPP

#include "atom/error/exception.hpp"

namespace bottles::config {

/**
 * @brief Base exception for configuration errors
 */
class BadConfigException : public atom::error::Exception {
    using atom::error::Exception::Exception;
};

#define THROW_BAD_CONFIG_EXCEPTION(...)                                       \
    throw bottles::config::BadConfigException(ATOM_FILE_NAME, ATOM_FILE_LINE, \
                                              ATOM_FUNC_NAME, __VA_ARGS__)

/**
 * @brief A configuration value has the wrong type or range
 */
class InvalidConfigException : public BadConfigException {
    using BadConfigException::BadConfigException;
};

#define THROW_INVALID_CONFIG_EXCEPTION(...)        \
    throw bottles::config::InvalidConfigException( \
        ATOM_FILE_NAME, ATOM_FILE_LINE, ATOM_FUNC_NAME, __VA_ARGS__)

/**
 * @brief Configuration file could not be read
 */
class ConfigIOException : public BadConfigException {
    using BadConfigException::BadConfigException;
};

#define THROW_CONFIG_IO_EXCEPTION(...)                                       \
    throw bottles::config::ConfigIOException(ATOM_FILE_NAME, ATOM_FILE_LINE, \
                                             ATOM_FUNC_NAME, __VA_ARGS__)

}  // namespace bottles::config

#endif  // BOTTLES_CONFIG_EXCEPTION_HPP
