/**
 * @file
 * @brief Network port definition
 *
 * @copyright Copyright (c) 2025 DESY and the Beacon authors.
 * This software is distributed under the terms of the EUPL-1.2 License, copied verbatim in the file "LICENSE.md".
 * SPDX-License-Identifier: EUPL-1.2
 */

#pragma once

#include <cstdint>

namespace beacon::networking {

    /**
     * @brief UDP port of a multicast group
     *
     * Port 0 is not a valid discovery port since publishers and listeners need to agree on a fixed port.
     */
    using Port = std::uint16_t;

} // namespace beacon::networking
