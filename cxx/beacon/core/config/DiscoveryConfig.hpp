/**
 * @file
 * @brief Configuration of publishers, listeners and service registries
 *
 * @copyright Copyright (c) 2025 DESY and the Beacon authors.
 * This software is distributed under the terms of the EUPL-1.2 License, copied verbatim in the file "LICENSE.md".
 * SPDX-License-Identifier: EUPL-1.2
 */

#pragma once

#include <chrono>
#include <cstddef>
#include <string>
#include <vector>

#include "beacon/build.hpp"
#include "beacon/core/networking/Port.hpp"

namespace beacon::config {

    /** Default multicast group */
    constexpr const char* DEFAULT_GROUP = "224.1.1.1";

    /** Default UDP port */
    constexpr networking::Port DEFAULT_PORT = 5004;

    /**
     * @brief Configuration of a publisher
     */
    struct BEACON_API PublisherConfig {
        /** Multicast group to which the descriptor is sent */
        std::string group {DEFAULT_GROUP};

        /** UDP port */
        networking::Port port {DEFAULT_PORT};

        /** Multicast hop limit */
        int ttl {2};

        /** Time between two broadcasts */
        std::chrono::steady_clock::duration interval {std::chrono::seconds(2)};

        /** Initial message, sent as datagram body without envelope */
        std::vector<std::byte> message {};

        /** Name or address of the outgoing interface, empty to let the system choose */
        std::string interface {};

        /**
         * @brief Check that all values are usable
         *
         * @throw ConfigValueError If a value is invalid
         */
        void validate() const;
    };

    /**
     * @brief Configuration of a listener
     */
    struct BEACON_API ListenerConfig {
        /** Multicast group to join */
        std::string group {DEFAULT_GROUP};

        /** UDP port to bind */
        networking::Port port {DEFAULT_PORT};

        /** Bound of a single receive wait, also the stop latency */
        std::chrono::steady_clock::duration timeout {std::chrono::seconds(2)};

        /** Maximum datagram size, larger datagrams are dropped */
        std::size_t buffer_size {1400};

        /** Only descriptors whose type contains this string are accepted, empty to accept all */
        std::string type_filter {};

        /** Name or address of the interface on which the group is joined, empty for any */
        std::string interface {};

        /** Whether datagrams sent from this host are received */
        bool loopback {true};

        /**
         * @brief Check that all values are usable
         *
         * @throw ConfigValueError If a value is invalid
         */
        void validate() const;
    };

    /**
     * @brief Configuration of a service registry
     */
    struct BEACON_API RegistryConfig {
        /** Time after the last sighting at which a service is no longer considered active */
        std::chrono::steady_clock::duration service_timeout {std::chrono::seconds(30)};

        /**
         * @brief Check that all values are usable
         *
         * @throw ConfigValueError If a value is invalid
         */
        void validate() const;
    };

    /**
     * @brief Complete configuration as read from a configuration file
     */
    struct DiscoveryConfig {
        PublisherConfig publisher {};
        ListenerConfig listener {};
        RegistryConfig registry {};
    };

} // namespace beacon::config
