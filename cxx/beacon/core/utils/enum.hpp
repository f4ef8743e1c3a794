/**
 * @file
 * @brief Enums functions
 *
 * @copyright Copyright (c) 2025 DESY and the Beacon authors.
 * This software is distributed under the terms of the EUPL-1.2 License, copied verbatim in the file "LICENSE.md".
 * SPDX-License-Identifier: EUPL-1.2
 */

#pragma once

#include <concepts>
#include <ios>
#include <string_view>
#include <type_traits>
#include <utility>

#include <magic_enum/magic_enum.hpp>

namespace beacon::utils {

    template <typename E>
        requires std::is_enum_v<E>
    constexpr std::string_view enum_name(E enum_val) noexcept {
        return magic_enum::enum_name<E>(enum_val);
    }

} // namespace beacon::utils

// Stream operator<< for enums
template <typename S, typename E>
    requires std::derived_from<std::remove_cvref_t<S>, std::ios_base> && std::is_enum_v<E>
inline S&& operator<<(S&& os, E value) {
    os << beacon::utils::enum_name(value);
    return std::forward<S>(os);
}
