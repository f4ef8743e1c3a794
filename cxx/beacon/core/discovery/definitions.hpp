/**
 * @file
 * @brief Discovery definitions
 *
 * @copyright Copyright (c) 2025 DESY and the Beacon authors.
 * This software is distributed under the terms of the EUPL-1.2 License, copied verbatim in the file "LICENSE.md".
 * SPDX-License-Identifier: EUPL-1.2
 */

#pragma once

#include <chrono>
#include <cstdint>

namespace beacon::discovery {

    /** Clock used for liveness and timing */
    using Clock = std::chrono::steady_clock;

    /** Status of a publisher or listener */
    enum class RoleStatus : std::uint8_t {
        /** No worker is running and no socket is open */
        STOPPED,
        /** The worker is running and the socket is open */
        RUNNING,
    };

    /** Status of a service for callbacks from the `ServiceRegistry` */
    enum class ServiceStatus : std::uint8_t {
        /** The service is seen for the first time */
        DISCOVERED,
        /** The service was evicted or forgotten */
        DEAD,
    };

    /** Default bound for stopping a publisher or listener */
    constexpr auto DEFAULT_STOP_TIMEOUT = std::chrono::seconds(5);

} // namespace beacon::discovery
