/**
 * @file
 * @brief Naming of worker threads
 *
 * @copyright Copyright (c) 2025 DESY and the Beacon authors.
 * This software is distributed under the terms of the EUPL-1.2 License, copied verbatim in the file "LICENSE.md".
 * SPDX-License-Identifier: EUPL-1.2
 */

#pragma once

#include <string_view>
#include <thread>

#ifdef __linux__
#include <array>
#include <cstddef>

#include <pthread.h>
#endif

namespace beacon::utils {

    /**
     * @brief Label a worker thread so it can be told apart in `top -H` and debuggers
     *
     * Linux limits thread names to 15 characters, longer names are truncated. On other platforms this is a no-op.
     */
    inline void set_thread_name([[maybe_unused]] std::jthread& thread, [[maybe_unused]] std::string_view name) {
#ifdef __linux__
        constexpr std::size_t max_length = 15;
        std::array<char, max_length + 1> buffer {};
        name.copy(buffer.data(), max_length);
        pthread_setname_np(thread.native_handle(), buffer.data());
#endif
    }

} // namespace beacon::utils
