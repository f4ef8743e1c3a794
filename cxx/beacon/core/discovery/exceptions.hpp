/**
 * @file
 * @brief Discovery exceptions
 *
 * @copyright Copyright (c) 2025 DESY and the Beacon authors.
 * This software is distributed under the terms of the EUPL-1.2 License, copied verbatim in the file "LICENSE.md".
 * SPDX-License-Identifier: EUPL-1.2
 */

#pragma once

#include <chrono>
#include <string>
#include <string_view>

#include "beacon/build.hpp"
#include "beacon/core/utils/exceptions.hpp"
#include "beacon/core/utils/string.hpp"

namespace beacon::discovery {

    /**
     * @ingroup Exceptions
     * @brief Starting a publisher or listener which is already running
     */
    class BEACON_API AlreadyRunningError : public utils::LogicError {
    public:
        explicit AlreadyRunningError(std::string_view role) {
            error_message_ = role;
            error_message_ += " is already running";
        }
    };

    /**
     * @ingroup Exceptions
     * @brief Worker of a publisher or listener did not finish in time
     *
     * The role is marked as stopped nevertheless, the socket is closed as soon as the worker finishes.
     */
    class BEACON_API ShutdownTimeoutError : public utils::RuntimeError {
    public:
        explicit ShutdownTimeoutError(std::string_view role, std::chrono::steady_clock::duration timeout) {
            error_message_ = role;
            error_message_ += " did not stop within ";
            error_message_ += utils::to_string(timeout);
        }
    };

    /**
     * @ingroup Exceptions
     * @brief Error when decoding a service descriptor
     */
    class BEACON_API DescriptorDecodingError : public utils::RuntimeError {
    public:
        explicit DescriptorDecodingError(std::string_view reason) {
            error_message_ = "Error decoding service descriptor: ";
            error_message_ += reason;
        }
    };

} // namespace beacon::discovery
