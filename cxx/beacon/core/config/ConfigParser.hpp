/**
 * @file
 * @brief Configuration parser
 *
 * @copyright Copyright (c) 2025 DESY and the Beacon authors.
 * This software is distributed under the terms of the EUPL-1.2 License, copied verbatim in the file "LICENSE.md".
 * SPDX-License-Identifier: EUPL-1.2
 */

#pragma once

#include <filesystem>
#include <string>
#include <string_view>

#include "beacon/build.hpp"
#include "beacon/core/config/DiscoveryConfig.hpp"
#include "beacon/core/log/Logger.hpp"

namespace beacon::config {

    /**
     * @brief Configuration parser to read TOML files and emit the configuration of the discovery roles
     *
     * The configuration file contains the optional tables `[publisher]`, `[listener]` and `[registry]`. Table names and
     * keys are matched case-insensitively since the TOML format itself is case-sensitive. Missing tables or keys keep
     * their default values, unknown keys are ignored with a warning.
     */
    class BEACON_API ConfigParser {
    public:
        /// @cond doxygen_suppress
        ConfigParser() = default;
        ~ConfigParser() = default;
        ConfigParser(const ConfigParser& other) = delete;
        ConfigParser& operator=(const ConfigParser& other) = delete;
        ConfigParser(ConfigParser&& other) noexcept = delete;
        ConfigParser& operator=(ConfigParser&& other) = delete;
        /// @endcond

        /**
         * @brief Parse a configuration
         *
         * @param toml String view of the TOML configuration contents
         * @return Validated configuration
         * @throws ConfigFileParseError if the configuration could not be parsed into valid TOML
         * @throws ConfigFileTypeError if the configuration contained invalid value types
         * @throws ConfigValueError if the configuration contained unusable values
         */
        static DiscoveryConfig parse(std::string_view toml);

        /**
         * @brief Parse a configuration file
         *
         * @param file Input file path of the TOML configuration file
         * @return Validated configuration
         * @throws ConfigFileNotFoundError if the configuration file could not be found or opened
         * @throws ConfigFileParseError if the configuration file could not be parsed into valid TOML
         * @throws ConfigFileTypeError if the configuration file contained invalid value types
         * @throws ConfigValueError if the configuration file contained unusable values
         */
        static DiscoveryConfig parseFile(const std::filesystem::path& file);

    private:
        static std::string read_file(const std::filesystem::path& file);

        /* Logger */
        static log::Logger config_parser_logger_;
    };

} // namespace beacon::config
