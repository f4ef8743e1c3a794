/**
 * @file
 * @brief Log levels
 *
 * @copyright Copyright (c) 2025 DESY and the Beacon authors.
 * This software is distributed under the terms of the EUPL-1.2 License, copied verbatim in the file "LICENSE.md".
 * SPDX-License-Identifier: EUPL-1.2
 */

#pragma once

#include <spdlog/common.h>

namespace beacon::log {

    /**
     * Log levels, with values identical to the ones of `spdlog::level::level_enum`
     */
    enum class Level : int { // NOLINT(performance-enum-size)
        /** Every datagram and callback */
        TRACE = 0,
        /** State changes of sockets, workers and the registry */
        DEBUG = 1,
        /** Start and stop of roles, discovered and timed out services */
        INFO = 2,
        /** Dropped datagrams, failed sends and exceptions from callbacks */
        WARNING = 3,
        /** Rare messages meant for the end user */
        STATUS = 4,
        /** Failures which stop a role */
        CRITICAL = 5,
        /** No logging */
        OFF = 6,
    };
    using enum Level;

    constexpr spdlog::level::level_enum to_spdlog_level(Level level) {
        return static_cast<spdlog::level::level_enum>(level);
    }

    constexpr Level from_spdlog_level(spdlog::level::level_enum level) {
        return static_cast<Level>(level);
    }

} // namespace beacon::log
