/**
 * @file
 * @brief Log macros
 *
 * @copyright Copyright (c) 2025 DESY and the Beacon authors.
 * This software is distributed under the terms of the EUPL-1.2 License, copied verbatim in the file "LICENSE.md".
 * SPDX-License-Identifier: EUPL-1.2
 */

#pragma once

#include "beacon/core/log/Level.hpp"  // IWYU pragma: export
#include "beacon/core/log/Logger.hpp" // IWYU pragma: keep

using enum beacon::log::Level; // Forward log level enum

// NOLINTBEGIN(cppcoreguidelines-macro-usage)

/// @cond doxygen_suppress
#define LOG_CONCAT(x, y) x##y
#define LOG_CONCAT_NESTED(x, y) LOG_CONCAT(x, y)
#define LOG_COUNTER LOG_CONCAT_NESTED(log_counter_l, __LINE__)
/// @endcond

/**
 * Logs a message with a given level to a logger
 *
 * The stream expression is only evaluated if the level is enabled for the topic of the logger.
 */
#define LOG(logger, level)                                                                                                  \
    if((logger).shouldLog(level))                                                                                           \
    (logger).stream(level)

/**
 * Logs a message at most `count` times per thread
 *
 * Used for errors which can repeat on every datagram. The last message is marked as such.
 */
#define LOG_N(logger, level, count)                                                                                         \
    static thread_local int LOG_COUNTER {count};                                                                            \
    if(LOG_COUNTER > 0 && (logger).shouldLog(level))                                                                        \
    (logger).stream(level) << (--LOG_COUNTER == 0 ? "[further messages suppressed] " : "")

// NOLINTEND(cppcoreguidelines-macro-usage)
