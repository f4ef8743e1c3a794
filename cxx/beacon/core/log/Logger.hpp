/**
 * @file
 * @brief Topic logger
 *
 * @copyright Copyright (c) 2025 DESY and the Beacon authors.
 * This software is distributed under the terms of the EUPL-1.2 License, copied verbatim in the file "LICENSE.md".
 * SPDX-License-Identifier: EUPL-1.2
 */

#pragma once

#include <memory>
#include <source_location>
#include <sstream>
#include <string>
#include <string_view>

#include <spdlog/async_logger.h>

#include "beacon/build.hpp"
#include "beacon/core/log/Level.hpp"

namespace beacon::log {

    /**
     * @brief Logger for one topic of the discovery library, e.g. `PUB` for publishers
     *
     * Loggers with the same topic share one spdlog logger from the `SinkManager`. Messages are written with the `LOG`
     * macros, which only assemble the message if its level is enabled for the topic.
     */
    class Logger {
    public:
        /** Message stream which hands the message to the logger when it goes out of scope */
        class Message final : public std::ostringstream {
        public:
            Message(const Logger& logger, Level level, std::source_location location)
                : logger_(logger), level_(level), location_(location) {}

            ~Message() final { logger_.log(level_, view(), location_); } // NOLINT(bugprone-exception-escape)

            // No copy/move constructor/assignment
            /// @cond doxygen_suppress
            Message(const Message& other) = delete;
            Message& operator=(const Message& other) = delete;
            Message(Message&& other) = delete;
            Message& operator=(Message&& other) = delete;
            /// @endcond

        private:
            const Logger& logger_; // NOLINT(cppcoreguidelines-avoid-const-or-ref-data-members)
            Level level_;
            std::source_location location_;
        };

    public:
        /**
         * @brief Construct a logger
         *
         * @param topic Topic of the logger, compared case-insensitively
         */
        BEACON_API explicit Logger(std::string_view topic);

        ~Logger() = default;

        // No copy/move constructor/assignment
        /// @cond doxygen_suppress
        Logger(const Logger& other) = delete;
        Logger& operator=(const Logger& other) = delete;
        Logger(Logger&& other) = delete;
        Logger& operator=(Logger&& other) = delete;
        /// @endcond

        /** Upper-case topic of the logger */
        const std::string& getTopic() const { return spdlog_logger_->name(); }

        /** Console level currently set for the topic */
        Level getLevel() const { return from_spdlog_level(spdlog_logger_->level()); }

        bool shouldLog(Level level) const { return spdlog_logger_->should_log(to_spdlog_level(level)); }

        /**
         * @brief Start a message
         *
         * @param level Level of the message
         * @param location Source location of the message
         * @return Stream to which the message is written
         */
        Message stream(Level level, std::source_location location = std::source_location::current()) const {
            return {*this, level, location};
        }

        /**
         * @brief Log a complete message
         *
         * @param level Level of the message
         * @param message Message text
         * @param location Source location of the message
         */
        void log(Level level, std::string_view message, std::source_location location = std::source_location::current()) const {
            spdlog_logger_->log({location.file_name(), static_cast<int>(location.line()), location.function_name()},
                                to_spdlog_level(level),
                                message);
        }

    private:
        std::shared_ptr<spdlog::async_logger> spdlog_logger_;
    };

} // namespace beacon::log
