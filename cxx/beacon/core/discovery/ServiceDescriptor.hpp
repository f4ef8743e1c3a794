/**
 * @file
 * @brief Service descriptor broadcast by publishers
 *
 * @copyright Copyright (c) 2025 DESY and the Beacon authors.
 * This software is distributed under the terms of the EUPL-1.2 License, copied verbatim in the file "LICENSE.md".
 * SPDX-License-Identifier: EUPL-1.2
 */

#pragma once

#include <cstddef>
#include <optional>
#include <span>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "beacon/build.hpp"

namespace beacon::discovery {

    /**
     * @brief Descriptor of a service as carried in the body of a discovery datagram
     *
     * The descriptor is a JSON object. Only the `type` and the address of the service are interpreted, all other keys
     * are kept unchanged. The address is read from the `addr` key, or from the `address` key if `addr` is absent.
     */
    class ServiceDescriptor {
    public:
        /**
         * @brief Construct a new descriptor
         *
         * @param type Service type
         * @param address Service address, used as identity of the service
         * @param name Optional human-readable service name
         * @param version Optional service version
         * @param timestamp Optional creation time in seconds since the epoch
         */
        BEACON_API ServiceDescriptor(std::string type,
                                     std::string address,
                                     std::optional<std::string> name = std::nullopt,
                                     std::optional<std::string> version = std::nullopt,
                                     std::optional<double> timestamp = std::nullopt);

        /** Service type */
        const std::string& getType() const { return type_; }

        /** Service address */
        const std::string& getAddress() const { return address_; }

        /** Service name if present as string */
        BEACON_API std::optional<std::string> getName() const;

        /** Service version if present as string */
        BEACON_API std::optional<std::string> getVersion() const;

        /** Creation timestamp if present as number */
        BEACON_API std::optional<double> getTimestamp() const;

        /** Full JSON object including keys that are not interpreted */
        const nlohmann::json& getData() const { return data_; }

        /**
         * @brief Assemble the descriptor into the datagram body
         *
         * @return JSON document encoded as UTF-8
         */
        BEACON_API std::vector<std::byte> assemble() const;

        /**
         * @brief Disassemble a descriptor from a datagram body
         *
         * @param bytes Datagram body
         * @return Decoded descriptor
         * @throw DescriptorDecodingError If the body is not a JSON object or required keys are missing
         */
        BEACON_API static ServiceDescriptor disassemble(std::span<const std::byte> bytes);

        /** Descriptors are equal if their JSON objects are equal */
        BEACON_API bool operator==(const ServiceDescriptor& other) const;

    private:
        explicit ServiceDescriptor(nlohmann::json data);

    private:
        nlohmann::json data_;
        std::string type_;
        std::string address_;
    };

} // namespace beacon::discovery
