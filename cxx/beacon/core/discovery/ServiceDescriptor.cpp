/**
 * @file
 * @brief Implementation of the service descriptor
 *
 * @copyright Copyright (c) 2025 DESY and the Beacon authors.
 * This software is distributed under the terms of the EUPL-1.2 License, copied verbatim in the file "LICENSE.md".
 * SPDX-License-Identifier: EUPL-1.2
 */

#include "ServiceDescriptor.hpp"

#include <cstddef>
#include <optional>
#include <span>
#include <string>
#include <utility>
#include <vector>

#include <nlohmann/json.hpp>

#include "beacon/core/discovery/exceptions.hpp"
#include "beacon/core/utils/casts.hpp"

using namespace beacon::discovery;
using namespace beacon::utils;

namespace {
    constexpr const char* TYPE_KEY = "type";
    constexpr const char* ADDRESS_KEY = "addr";
    constexpr const char* ADDRESS_KEY_ALT = "address";
    constexpr const char* NAME_KEY = "name";
    constexpr const char* VERSION_KEY = "version";
    constexpr const char* TIMESTAMP_KEY = "timestamp";

    std::optional<std::string> get_string(const nlohmann::json& data, const char* key) {
        const auto it = data.find(key);
        if(it == data.end() || !it->is_string()) {
            return std::nullopt;
        }
        return it->get<std::string>();
    }

    std::optional<std::string> get_address(const nlohmann::json& data) {
        if(data.contains(ADDRESS_KEY)) {
            return get_string(data, ADDRESS_KEY);
        }
        return get_string(data, ADDRESS_KEY_ALT);
    }
} // namespace

ServiceDescriptor::ServiceDescriptor(std::string type,
                                     std::string address,
                                     std::optional<std::string> name,
                                     std::optional<std::string> version,
                                     std::optional<double> timestamp)
    : data_(nlohmann::json::object()), type_(std::move(type)), address_(std::move(address)) {
    data_[TYPE_KEY] = type_;
    data_[ADDRESS_KEY] = address_;
    if(name.has_value()) {
        data_[NAME_KEY] = std::move(name.value());
    }
    if(version.has_value()) {
        data_[VERSION_KEY] = std::move(version.value());
    }
    if(timestamp.has_value()) {
        data_[TIMESTAMP_KEY] = timestamp.value();
    }
}

ServiceDescriptor::ServiceDescriptor(nlohmann::json data)
    : data_(std::move(data)), type_(get_string(data_, TYPE_KEY).value_or("")), address_(get_address(data_).value_or("")) {}

std::optional<std::string> ServiceDescriptor::getName() const {
    return get_string(data_, NAME_KEY);
}

std::optional<std::string> ServiceDescriptor::getVersion() const {
    return get_string(data_, VERSION_KEY);
}

std::optional<double> ServiceDescriptor::getTimestamp() const {
    const auto it = data_.find(TIMESTAMP_KEY);
    if(it == data_.end() || !it->is_number()) {
        return std::nullopt;
    }
    return it->get<double>();
}

std::vector<std::byte> ServiceDescriptor::assemble() const {
    const auto text = data_.dump();
    const auto bytes = to_byte_span(text);
    return {bytes.begin(), bytes.end()};
}

ServiceDescriptor ServiceDescriptor::disassemble(std::span<const std::byte> bytes) {
    nlohmann::json data {};
    try {
        const auto text = to_string_view(bytes);
        data = nlohmann::json::parse(text.begin(), text.end());
    } catch(const nlohmann::json::parse_error& error) {
        throw DescriptorDecodingError(error.what());
    }

    if(!data.is_object()) {
        throw DescriptorDecodingError("payload is not a JSON object");
    }

    if(!get_string(data, TYPE_KEY).has_value()) {
        throw DescriptorDecodingError("missing string value for key `type`");
    }

    const auto address = get_address(data);
    if(!address.has_value() || address->empty()) {
        throw DescriptorDecodingError("missing string value for key `addr`");
    }

    return ServiceDescriptor(std::move(data));
}

bool ServiceDescriptor::operator==(const ServiceDescriptor& other) const {
    return data_ == other.data_;
}
