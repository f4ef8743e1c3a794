/**
 * @file
 * @brief Compatibility casts for std::byte
 *
 * @copyright Copyright (c) 2025 DESY and the Beacon authors.
 * This software is distributed under the terms of the EUPL-1.2 License, copied verbatim in the file "LICENSE.md".
 * SPDX-License-Identifier: EUPL-1.2
 */

#pragma once

#include <cstddef>
#include <ranges>
#include <span>
#include <string_view>

namespace beacon::utils {

    template <typename T> inline const char* to_char_ptr(const T* data) {
        // NOLINTNEXTLINE(cppcoreguidelines-pro-type-reinterpret-cast)
        return reinterpret_cast<const char*>(data);
    }

    template <typename R>
        requires std::ranges::contiguous_range<R>
    inline std::span<const std::byte> to_byte_span(const R& range) {
        return std::as_bytes(
            std::span<const std::ranges::range_value_t<R>>(std::ranges::cdata(range), std::ranges::size(range)));
    }

    /** View a byte span as characters */
    inline std::string_view to_string_view(std::span<const std::byte> bytes) {
        return {to_char_ptr(bytes.data()), bytes.size()};
    }

} // namespace beacon::utils
