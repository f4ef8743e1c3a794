/**
 * @file
 * @brief Console sink and topic loggers
 *
 * @copyright Copyright (c) 2025 DESY and the Beacon authors.
 * This software is distributed under the terms of the EUPL-1.2 License, copied verbatim in the file "LICENSE.md".
 * SPDX-License-Identifier: EUPL-1.2
 */

#pragma once

#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <string_view>

#include <spdlog/async_logger.h>
#include <spdlog/sinks/stdout_color_sinks.h>

#include "beacon/build.hpp"
#include "beacon/core/log/Level.hpp"

namespace beacon::log {

    /**
     * @brief Process-wide owner of the console sink and of one asynchronous spdlog logger per topic
     *
     * All loggers write to a coloured console sink through a single spdlog worker thread. The library never changes
     * the console levels by itself, this is left to the host program via `setConsoleLevels()`.
     */
    class SinkManager {
    public:
        BEACON_API static SinkManager& getInstance();

        ~SinkManager();

        // No copy/move constructor/assignment
        /// @cond doxygen_suppress
        SinkManager(const SinkManager& other) = delete;
        SinkManager& operator=(const SinkManager& other) = delete;
        SinkManager(SinkManager&& other) = delete;
        SinkManager& operator=(SinkManager&& other) = delete;
        /// @endcond

        /**
         * @brief Get the logger for a topic, creating it on first use
         *
         * @param topic Topic of the logger, compared case-insensitively
         */
        BEACON_API std::shared_ptr<spdlog::async_logger> getLogger(std::string_view topic);

        /**
         * @brief Set the console levels of all current and future loggers
         *
         * @param global_level Level for topics without override
         * @param topic_levels Level overrides per topic, compared case-insensitively
         */
        BEACON_API void setConsoleLevels(Level global_level, const std::map<std::string, Level>& topic_levels = {});

    private:
        SinkManager();

        // Requires mutex_ to be held
        Level level_for(const std::string& topic) const;

    private:
        std::shared_ptr<spdlog::sinks::stdout_color_sink_mt> console_sink_;

        std::mutex mutex_;
        std::map<std::string, std::shared_ptr<spdlog::async_logger>> loggers_;
        Level global_level_ {INFO};
        std::map<std::string, Level> topic_levels_;
    };

} // namespace beacon::log
