/*
 * exception.hpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

#ifndef BOTTLES_PM_EXCEPTION_HPP
#define BOTTLES_PM_EXCEPTION_HPP

#include "atom/error/exception.hpp"

namespace bottles::pm {

/**
 * @brief Misuse of the adapter registry
 */
class InvalidAdapterException : public atom::error::Exception {
    using atom::error::Exception::Exception;
};

#define THROW_INVALID_ADAPTER(...)                                        \
    throw bottles::pm::InvalidAdapterException(ATOM_FILE_NAME, ATOM_FILE_LINE, \
                                               ATOM_FUNC_NAME, __VA_ARGS__)

}  // namespace bottles::pm

#endif  // BOTTLES_PM_EXCEPTION_HPP
