/**
 * @file
 * @brief Implementation of Asio helper functions
 *
 * @copyright Copyright (c) 2025 DESY and the Beacon authors.
 * This software is distributed under the terms of the EUPL-1.2 License, copied verbatim in the file "LICENSE.md".
 * SPDX-License-Identifier: EUPL-1.2
 */

#include "asio_helpers.hpp"

#include <algorithm>
#include <string>
#include <string_view>
#include <system_error>
#include <vector>

#include <asio/ip/address_v4.hpp>
#include <ifaddrs.h>
#include <net/if.h> // NOLINT(misc-include-cleaner) bug used for IFF_RUNNING etc
#include <netdb.h>
#include <netinet/in.h>
#include <sys/socket.h>

#include "beacon/core/networking/exceptions.hpp"
#include "beacon/core/networking/Port.hpp"
#include "beacon/core/utils/string.hpp"

using namespace beacon::networking;
using namespace beacon::utils;

std::vector<Interface> beacon::networking::get_interfaces() {
    std::vector<Interface> interfaces {};

    // Obtain linked list of all local network interfaces
    struct ifaddrs* addrs = nullptr;
    if(getifaddrs(&addrs) != 0) {
        throw NetworkError("Unable to get list of interfaces");
    }

    for(auto* ifa = addrs; ifa != nullptr; ifa = ifa->ifa_next) {

        // Select only running interfaces providing IPv4
        if(ifa->ifa_addr == nullptr || ifa->ifa_name == nullptr || (ifa->ifa_flags & IFF_RUNNING) == 0U ||
           ifa->ifa_addr->sa_family != AF_INET) {
            continue;
        }

        // Loopback interfaces are accepted even without the multicast flag
        if((ifa->ifa_flags & IFF_MULTICAST) == 0U && (ifa->ifa_flags & IFF_LOOPBACK) == 0U) {
            continue;
        }

        char buffer[NI_MAXHOST];      // NOLINT(modernize-avoid-c-arrays)
        if(getnameinfo(ifa->ifa_addr, // NOLINT(cppcoreguidelines-pro-type-union-access)
                       sizeof(struct sockaddr_in),
                       buffer, // NOLINT(cppcoreguidelines-pro-bounds-array-to-pointer-decay)
                       sizeof(buffer),
                       nullptr,
                       0,
                       NI_NUMERICHOST) == 0) {
            std::error_code ec {};
            // NOLINTNEXTLINE(cppcoreguidelines-pro-bounds-array-to-pointer-decay)
            const auto address = asio::ip::make_address_v4(buffer, ec);
            if(!ec) {
                interfaces.emplace_back(ifa->ifa_name, address);
            }
        }
    }

    freeifaddrs(addrs);

    return interfaces;
}

asio::ip::address_v4 beacon::networking::resolve_interface_address(std::string_view name_or_address) {
    std::error_code ec {};
    const auto address = asio::ip::make_address_v4(name_or_address, ec);
    if(!ec) {
        return address;
    }

    const auto all_interfaces = get_interfaces();
    const auto interface_it =
        std::ranges::find(all_interfaces, name_or_address, [](const auto& if_s) -> std::string_view { return if_s.name; });
    if(interface_it == all_interfaces.end()) {
        throw NetworkError("Interface " + quote(name_or_address) +
                           " does not exist or is not suitable for multicast discovery");
    }
    return interface_it->address;
}

asio::ip::address_v4 beacon::networking::parse_multicast_group(std::string_view group) {
    std::error_code ec {};
    const auto address = asio::ip::make_address_v4(group, ec);
    if(ec) {
        throw NetworkError(quote(group) + " is not a valid IPv4 address");
    }
    if(!address.is_multicast()) {
        throw NetworkError(quote(group) + " is not a multicast address");
    }
    return address;
}

std::string beacon::networking::to_endpoint_string(const asio::ip::address_v4& address, Port port) {
    return address.to_string() + ":" + to_string(port);
}
