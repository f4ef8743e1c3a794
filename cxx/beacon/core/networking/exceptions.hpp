/**
 * @file
 * @brief Network communication exceptions
 *
 * @copyright Copyright (c) 2025 DESY and the Beacon authors.
 * This software is distributed under the terms of the EUPL-1.2 License, copied verbatim in the file "LICENSE.md".
 * SPDX-License-Identifier: EUPL-1.2
 */

#pragma once

#include <string>
#include <string_view>

#include "beacon/build.hpp"
#include "beacon/core/utils/exceptions.hpp"

namespace beacon::networking {

    /**
     * @ingroup Exceptions
     * @brief Failure to resolve an interface or group, or to open or use a multicast socket
     */
    class BEACON_API NetworkError : public utils::RuntimeError {
    public:
        using RuntimeError::RuntimeError;

    protected:
        NetworkError() = default;
    };

    /**
     * @ingroup Exceptions
     * @brief Transient error when sending a datagram
     */
    class BEACON_API SendError : public NetworkError {
    public:
        explicit SendError(std::string_view reason) {
            error_message_ = "Failed to send datagram: ";
            error_message_ += reason;
        }
    };

    /**
     * @ingroup Exceptions
     * @brief Transient error when receiving a datagram
     */
    class BEACON_API ReceiveError : public NetworkError {
    public:
        explicit ReceiveError(std::string_view reason) {
            error_message_ = "Failed to receive datagram: ";
            error_message_ += reason;
        }
    };

    /**
     * @ingroup Exceptions
     * @brief Error after which a socket can no longer be used
     */
    class BEACON_API SocketFatalError : public NetworkError {
    public:
        explicit SocketFatalError(std::string_view reason) {
            error_message_ = "Socket no longer usable: ";
            error_message_ += reason;
        }
    };

} // namespace beacon::networking
