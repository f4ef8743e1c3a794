/**
 * @copyright Copyright (c) 2025 DESY and the Beacon authors.
 * This software is distributed under the terms of the EUPL-1.2 License, copied verbatim in the file "LICENSE.md".
 * SPDX-License-Identifier: EUPL-1.2
 */

#include <chrono>
#include <cstdint>
#include <string>
#include <thread>

#include <asio/ip/address_v4.hpp>
#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_string.hpp>

#include "beacon/core/discovery/exceptions.hpp"
#include "beacon/core/networking/asio_helpers.hpp"
#include "beacon/core/networking/exceptions.hpp"
#include "beacon/core/utils/casts.hpp"
#include "beacon/core/utils/exceptions.hpp"
#include "beacon/core/utils/string.hpp"
#include "beacon/core/utils/thread.hpp"

using namespace Catch::Matchers;
using namespace beacon::utils;
using namespace std::chrono_literals;

// NOLINTBEGIN(cert-err58-cpp,misc-use-anonymous-namespace)

TEST_CASE("Transform string", "[utils]") {
    REQUIRE(transform("Pub_1", ::toupper) == "PUB_1");
    REQUIRE(transform("Publisher", ::tolower) == "publisher");
    REQUIRE(transform("", ::toupper).empty());
}

TEST_CASE("Numbers to string", "[utils]") {
    REQUIRE(to_string(std::uint16_t(5004)) == "5004");
    REQUIRE(to_string(std::int64_t(-3)) == "-3");
    REQUIRE(to_string(0.25) == "0.25");
    REQUIRE(to_string(1e12) == "1e+12");
}

TEST_CASE("Durations to string", "[utils]") {
    REQUIRE(to_string(1500ms) == "1500ms");
    REQUIRE(to_string(2s) == "2000ms");
    REQUIRE(to_string(std::chrono::steady_clock::duration(2500us)) == "2ms");
}

TEST_CASE("Quote string", "[utils]") {
    REQUIRE(quote("LSTN") == "\"LSTN\"");
    REQUIRE(quote("") == "\"\"");
}

TEST_CASE("Byte span as string view", "[utils]") {
    const std::string text {"descriptor"};
    const auto bytes = to_byte_span(text);
    REQUIRE(bytes.size() == text.size());
    REQUIRE(to_string_view(bytes) == text);
}

TEST_CASE("Endpoint string", "[utils]") {
    const auto group = asio::ip::make_address_v4("224.1.1.1");
    REQUIRE(beacon::networking::to_endpoint_string(group, 5004) == "224.1.1.1:5004");
}

TEST_CASE("Exception messages", "[utils]") {
    const RuntimeError runtime_error {"socket closed"};
    REQUIRE_THAT(runtime_error.what(), Equals("socket closed"));

    const beacon::networking::NetworkError network_error {"no route"};
    REQUIRE_THAT(network_error.what(), Equals("no route"));
    const RuntimeError& as_runtime_error = network_error;
    REQUIRE_THAT(as_runtime_error.what(), Equals("no route"));

    const beacon::networking::SocketFatalError fatal_error {"bad descriptor"};
    REQUIRE_THAT(fatal_error.what(), Equals("Socket no longer usable: bad descriptor"));

    const beacon::discovery::ShutdownTimeoutError timeout_error {"Listener", 50ms};
    REQUIRE_THAT(timeout_error.what(), Equals("Listener did not stop within 50ms"));

    const beacon::discovery::AlreadyRunningError running_error {"Publisher"};
    const LogicError& as_logic_error = running_error;
    REQUIRE_THAT(as_logic_error.what(), Equals("Publisher is already running"));
}

TEST_CASE("Thread name", "[utils]") {
    std::jthread thread {[](const std::stop_token& stop_token) {
        while(!stop_token.stop_requested()) {
            std::this_thread::sleep_for(1ms);
        }
    }};
    // Names longer than the platform limit are truncated instead of rejected
    REQUIRE_NOTHROW(set_thread_name(thread, "BeaconPublisherWorker"));
    REQUIRE_NOTHROW(set_thread_name(thread, "Listener"));
}

// NOLINTEND(cert-err58-cpp,misc-use-anonymous-namespace)
