/**
 * @file
 * @brief Implementation of configuration parser
 *
 * @copyright Copyright (c) 2025 DESY and the Beacon authors.
 * This software is distributed under the terms of the EUPL-1.2 License, copied verbatim in the file "LICENSE.md".
 * SPDX-License-Identifier: EUPL-1.2
 */

#include "ConfigParser.hpp"

#include <cctype>
#include <chrono>
#include <cmath>
#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <fstream>
#include <iomanip>
#include <limits>
#include <sstream>
#include <string>
#include <string_view>

#include <toml++/toml.hpp>

#include "beacon/core/config/DiscoveryConfig.hpp"
#include "beacon/core/config/exceptions.hpp"
#include "beacon/core/log/log.hpp"
#include "beacon/core/networking/Port.hpp"
#include "beacon/core/utils/casts.hpp"
#include "beacon/core/utils/enum.hpp"
#include "beacon/core/utils/string.hpp"

using namespace beacon::config;
using namespace beacon::log;
using namespace beacon::utils;

Logger ConfigParser::config_parser_logger_("CFG");

namespace {

    std::string type_error(const toml::node& node, std::string_view expected) {
        std::string error {"expected "};
        error += expected;
        error += " but got ";
        error += enum_name(node.type());
        return error;
    }

    std::string get_string(const std::string& key, const toml::node& node) {
        if(const auto* value = node.as_string()) {
            return value->get();
        }
        throw ConfigFileTypeError(key, type_error(node, "string"));
    }

    bool get_bool(const std::string& key, const toml::node& node) {
        if(const auto* value = node.as_boolean()) {
            return value->get();
        }
        throw ConfigFileTypeError(key, type_error(node, "boolean"));
    }

    std::int64_t get_integer(const std::string& key, const toml::node& node, std::int64_t min, std::int64_t max) {
        const auto* value = node.as_integer();
        if(value == nullptr) {
            throw ConfigFileTypeError(key, type_error(node, "integer"));
        }
        const auto integer = value->get();
        if(integer < min || integer > max) {
            throw ConfigValueError(key, "value " + to_string(integer) + " outside of range [" + to_string(min) + ", " +
                                            to_string(max) + "]");
        }
        return integer;
    }

    networking::Port get_port(const std::string& key, const toml::node& node) {
        return static_cast<networking::Port>(get_integer(key, node, 1, std::numeric_limits<networking::Port>::max()));
    }

    // Durations are given in seconds, either as integer or as floating point number
    std::chrono::steady_clock::duration get_duration(const std::string& key, const toml::node& node) {
        double seconds {};
        if(const auto* integer = node.as_integer()) {
            seconds = static_cast<double>(integer->get());
        } else if(const auto* floating = node.as_floating_point()) {
            seconds = floating->get();
        } else {
            throw ConfigFileTypeError(key, type_error(node, "number of seconds"));
        }
        if(!std::isfinite(seconds)) {
            throw ConfigValueError(key, "duration must be finite");
        }
        if(seconds <= 0.) {
            throw ConfigValueError(key, "duration must be positive");
        }

        // Range check in clock ticks, the largest tick count is not exactly representable as double
        using DoubleTicks = std::chrono::duration<double, std::chrono::steady_clock::period>;
        const DoubleTicks ticks {std::chrono::duration<double>(seconds)};
        if(ticks.count() >= static_cast<double>(std::chrono::steady_clock::duration::max().count())) {
            throw ConfigValueError(key, "duration of " + to_string(seconds) + " seconds is too long");
        }
        return std::chrono::duration_cast<std::chrono::steady_clock::duration>(ticks);
    }

    const toml::table& get_table(const std::string& key, const toml::node& node) {
        if(const auto* table = node.as_table()) {
            return *table;
        }
        throw ConfigFileTypeError(key, type_error(node, "table"));
    }

    void parse_publisher(const toml::table& table, PublisherConfig& config, const Logger& logger) {
        for(auto&& [toml_key, node] : table) {
            const auto key = transform(toml_key.str(), ::tolower);
            const auto full_key = "publisher." + key;
            if(key == "group") {
                config.group = get_string(full_key, node);
            } else if(key == "port") {
                config.port = get_port(full_key, node);
            } else if(key == "ttl") {
                config.ttl = static_cast<int>(get_integer(full_key, node, 0, 255));
            } else if(key == "interval") {
                config.interval = get_duration(full_key, node);
            } else if(key == "message") {
                const auto message = get_string(full_key, node);
                const auto bytes = to_byte_span(message);
                config.message.assign(bytes.begin(), bytes.end());
            } else if(key == "interface") {
                config.interface = get_string(full_key, node);
            } else {
                LOG(logger, WARNING) << "Ignoring unknown key " << std::quoted(full_key);
            }
        }
    }

    void parse_listener(const toml::table& table, ListenerConfig& config, const Logger& logger) {
        for(auto&& [toml_key, node] : table) {
            const auto key = transform(toml_key.str(), ::tolower);
            const auto full_key = "listener." + key;
            if(key == "group") {
                config.group = get_string(full_key, node);
            } else if(key == "port") {
                config.port = get_port(full_key, node);
            } else if(key == "timeout") {
                config.timeout = get_duration(full_key, node);
            } else if(key == "buffer_size") {
                config.buffer_size =
                    static_cast<std::size_t>(get_integer(full_key, node, 1, std::numeric_limits<std::uint16_t>::max()));
            } else if(key == "type_filter") {
                config.type_filter = get_string(full_key, node);
            } else if(key == "interface") {
                config.interface = get_string(full_key, node);
            } else if(key == "loopback") {
                config.loopback = get_bool(full_key, node);
            } else {
                LOG(logger, WARNING) << "Ignoring unknown key " << std::quoted(full_key);
            }
        }
    }

    void parse_registry(const toml::table& table, RegistryConfig& config, const Logger& logger) {
        for(auto&& [toml_key, node] : table) {
            const auto key = transform(toml_key.str(), ::tolower);
            const auto full_key = "registry." + key;
            if(key == "service_timeout") {
                config.service_timeout = get_duration(full_key, node);
            } else {
                LOG(logger, WARNING) << "Ignoring unknown key " << std::quoted(full_key);
            }
        }
    }

} // namespace

std::string ConfigParser::read_file(const std::filesystem::path& filepath) {
    std::error_code ec {};
    const auto file_path_abs = std::filesystem::canonical(filepath, ec);
    if(ec || !std::filesystem::is_regular_file(file_path_abs)) {
        throw ConfigFileNotFoundError(filepath);
    }
    LOG(config_parser_logger_, DEBUG) << "Parsing configuration file " << std::quoted(file_path_abs.string());

    std::ifstream file(file_path_abs);
    if(!file) {
        throw ConfigFileNotFoundError(file_path_abs);
    }

    std::ostringstream buffer;
    buffer << file.rdbuf();
    return buffer.str();
}

DiscoveryConfig ConfigParser::parseFile(const std::filesystem::path& file) {
    const auto buffer = read_file(file);
    return parse(buffer);
}

DiscoveryConfig ConfigParser::parse(std::string_view toml) {

    toml::table tbl {};
    try {
        tbl = toml::parse(toml);
    } catch(const toml::parse_error& err) {
        std::stringstream s;
        s << err;
        throw ConfigFileParseError(s.str());
    }

    DiscoveryConfig config {};
    for(auto&& [toml_key, node] : tbl) {
        const auto key = transform(toml_key.str(), ::tolower);
        if(key == "publisher") {
            LOG(config_parser_logger_, DEBUG) << "Reading publisher table";
            parse_publisher(get_table(key, node), config.publisher, config_parser_logger_);
        } else if(key == "listener") {
            LOG(config_parser_logger_, DEBUG) << "Reading listener table";
            parse_listener(get_table(key, node), config.listener, config_parser_logger_);
        } else if(key == "registry") {
            LOG(config_parser_logger_, DEBUG) << "Reading registry table";
            parse_registry(get_table(key, node), config.registry, config_parser_logger_);
        } else {
            LOG(config_parser_logger_, WARNING) << "Ignoring unknown key " << std::quoted(key);
        }
    }

    config.publisher.validate();
    config.listener.validate();
    config.registry.validate();

    return config;
}
