/**
 * @file
 * @brief Root of the Beacon exception hierarchy
 *
 * @copyright Copyright (c) 2025 DESY and the Beacon authors.
 * This software is distributed under the terms of the EUPL-1.2 License, copied verbatim in the file "LICENSE.md".
 * SPDX-License-Identifier: EUPL-1.2
 */

/**
 * @defgroup Exceptions Exception classes
 * @brief Errors thrown by the configuration, networking and discovery layers
 */

#pragma once

#include <exception>
#include <string>
#include <utility>

#include "beacon/build.hpp"

namespace beacon::utils {

    /**
     * @ingroup Exceptions
     * @brief Common base of every exception thrown by the library
     *
     * Derived exceptions either forward a finished message or assemble it in `error_message_` from their own
     * constructor arguments.
     */
    class BEACON_API Exception : public std::exception {
    public:
        explicit Exception(std::string message) : error_message_(std::move(message)) {}

        const char* what() const noexcept override { return error_message_.c_str(); }

    protected:
        Exception() = default;

        // NOLINTNEXTLINE(misc-non-private-member-variables-in-classes)
        std::string error_message_;
    };

    /**
     * @ingroup Exceptions
     * @brief Failure caused by the environment, e.g. a missing interface, a broken socket or a malformed datagram
     */
    class BEACON_API RuntimeError : public Exception {
    public:
        using Exception::Exception;

    protected:
        RuntimeError() = default;
    };

    /**
     * @ingroup Exceptions
     * @brief Misuse of the API by the caller, e.g. starting a role twice
     */
    class BEACON_API LogicError : public Exception {
    public:
        using Exception::Exception;

    protected:
        LogicError() = default;
    };

} // namespace beacon::utils
