/**
 * @file
 * @brief Asio helper functions
 *
 * @copyright Copyright (c) 2025 DESY and the Beacon authors.
 * This software is distributed under the terms of the EUPL-1.2 License, copied verbatim in the file "LICENSE.md".
 * SPDX-License-Identifier: EUPL-1.2
 */

#pragma once

#include <string>
#include <string_view>
#include <vector>

#include <asio/ip/address_v4.hpp>

#include "beacon/build.hpp"
#include "beacon/core/networking/Port.hpp"

namespace beacon::networking {

    /**
     * @brief Interface containing its name and address
     */
    struct Interface {
        /** Interface name */
        std::string name;

        /** Interface address */
        asio::ip::address_v4 address;
    };

    /**
     * @brief Get all running IPv4 interfaces which are able to send and receive multicast
     *
     * @return List with all interfaces
     * @throw NetworkError If the interfaces could not be listed
     */
    BEACON_API std::vector<Interface> get_interfaces();

    /**
     * @brief Resolve the address of an interface given either by its name or by its IPv4 address
     *
     * An IPv4 address is returned as is, a name is looked up in the list of multicast capable interfaces.
     *
     * @param name_or_address Interface name (e.g. `eth0`) or address (e.g. `192.168.1.10`)
     * @return Address of the interface
     * @throw NetworkError If no suitable interface matches the name
     */
    BEACON_API asio::ip::address_v4 resolve_interface_address(std::string_view name_or_address);

    /**
     * @brief Parse an IPv4 multicast group address
     *
     * @param group Address in dotted notation
     * @return Parsed address
     * @throw NetworkError If the address cannot be parsed or is not in the multicast range
     */
    BEACON_API asio::ip::address_v4 parse_multicast_group(std::string_view group);

    /**
     * @brief Format an endpoint as `address:port`
     */
    BEACON_API std::string to_endpoint_string(const asio::ip::address_v4& address, Port port);

} // namespace beacon::networking
