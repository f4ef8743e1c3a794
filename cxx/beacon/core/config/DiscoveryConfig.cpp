/**
 * @file
 * @brief Implementation of the discovery configuration
 *
 * @copyright Copyright (c) 2025 DESY and the Beacon authors.
 * This software is distributed under the terms of the EUPL-1.2 License, copied verbatim in the file "LICENSE.md".
 * SPDX-License-Identifier: EUPL-1.2
 */

#include "DiscoveryConfig.hpp"

#include <chrono>
#include <string_view>

#include "beacon/core/config/exceptions.hpp"
#include "beacon/core/networking/asio_helpers.hpp"
#include "beacon/core/networking/exceptions.hpp"

using namespace beacon::config;
using namespace beacon::networking;

namespace {
    void validate_group(std::string_view key, std::string_view group) {
        try {
            parse_multicast_group(group);
        } catch(const NetworkError& error) {
            throw ConfigValueError(key, error.what());
        }
    }

    void validate_port(std::string_view key, Port port) {
        if(port == 0) {
            throw ConfigValueError(key, "port must not be zero");
        }
    }

    void validate_duration(std::string_view key, std::chrono::steady_clock::duration duration) {
        if(duration <= std::chrono::steady_clock::duration::zero()) {
            throw ConfigValueError(key, "duration must be positive");
        }
    }
} // namespace

void PublisherConfig::validate() const {
    validate_group("publisher.group", group);
    validate_port("publisher.port", port);
    if(ttl < 0 || ttl > 255) {
        throw ConfigValueError("publisher.ttl", "ttl must be between 0 and 255");
    }
    validate_duration("publisher.interval", interval);
}

void ListenerConfig::validate() const {
    validate_group("listener.group", group);
    validate_port("listener.port", port);
    validate_duration("listener.timeout", timeout);
    if(buffer_size == 0) {
        throw ConfigValueError("listener.buffer_size", "buffer size must not be zero");
    }
}

void RegistryConfig::validate() const {
    validate_duration("registry.service_timeout", service_timeout);
}
