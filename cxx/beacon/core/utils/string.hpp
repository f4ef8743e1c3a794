/**
 * @file
 * @brief String helpers for log and error messages
 *
 * @copyright Copyright (c) 2025 DESY and the Beacon authors.
 * This software is distributed under the terms of the EUPL-1.2 License, copied verbatim in the file "LICENSE.md".
 * SPDX-License-Identifier: EUPL-1.2
 */

#pragma once

#include <array>
#include <cctype> // IWYU pragma: export
#include <charconv>
#include <chrono>
#include <string>
#include <string_view>
#include <type_traits>

namespace beacon::utils {

    /** Apply a character operation like `::toupper` to every character of a string */
    template <typename F> inline std::string transform(std::string_view string, F operation) {
        std::string out {};
        out.reserve(string.size());
        for(auto character : string) {
            out += static_cast<char>(operation(static_cast<unsigned char>(character)));
        }
        return out;
    }

    /** Locale-independent conversion of a number, doubles use the shortest exact representation */
    template <typename A>
        requires std::is_arithmetic_v<A> && (!std::is_same_v<A, bool>)
    inline std::string to_string(A value) {
        std::array<char, 32> buffer {};
        const auto result = std::to_chars(buffer.data(), buffer.data() + buffer.size(), value);
        return {buffer.data(), result.ptr};
    }

    /** Duration in whole milliseconds, e.g. `1500ms` */
    template <typename Rep, typename Period> inline std::string to_string(std::chrono::duration<Rep, Period> duration) {
        return to_string(std::chrono::duration_cast<std::chrono::milliseconds>(duration).count()) + "ms";
    }

    inline std::string quote(std::string_view string) {
        std::string out {};
        out.reserve(string.size() + 2);
        out += '"';
        out += string;
        out += '"';
        return out;
    }

} // namespace beacon::utils
