/**
 * @copyright Copyright (c) 2025 DESY and the Beacon authors.
 * This software is distributed under the terms of the EUPL-1.2 License, copied verbatim in the file "LICENSE.md".
 * SPDX-License-Identifier: EUPL-1.2
 */

#include <atomic>
#include <chrono>
#include <cstddef>
#include <memory>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

#include <catch2/catch_test_macros.hpp>

#include "beacon/core/config/DiscoveryConfig.hpp"
#include "beacon/core/config/exceptions.hpp"
#include "beacon/core/discovery/definitions.hpp"
#include "beacon/core/discovery/exceptions.hpp"
#include "beacon/core/discovery/Listener.hpp"
#include "beacon/core/discovery/Publisher.hpp"
#include "beacon/core/discovery/ServiceDescriptor.hpp"
#include "beacon/core/discovery/ServiceRegistry.hpp"

#include "discovery_mock.hpp"

using namespace beacon::config;
using namespace beacon::discovery;
using namespace std::chrono_literals;

namespace {
    std::vector<std::byte> descriptor_bytes(const std::string& address, const std::string& type = "VaultLibrary") {
        return ServiceDescriptor(type, address, "service " + address).assemble();
    }
} // namespace

// NOLINTBEGIN(cert-err58-cpp,misc-use-anonymous-namespace)

TEST_CASE("Construction does not start", "[listener]") {
    Listener listener {loopback_listener_config(49340)};
    REQUIRE(listener.getStatus() == RoleStatus::STOPPED);
    REQUIRE(listener.getMetrics().packets_received == 0);
    REQUIRE(listener.getRegistry().size() == 0);
}

TEST_CASE("Invalid configuration", "[listener]") {
    auto config = loopback_listener_config(49340);
    config.buffer_size = 0;
    REQUIRE_THROWS_AS(Listener(config), ConfigValueError);

    RegistryConfig registry_config {};
    registry_config.service_timeout = 0s;
    REQUIRE_THROWS_AS(Listener(loopback_listener_config(49340), registry_config), ConfigValueError);
}

TEST_CASE("Start and stop", "[listener]") {
    Listener listener {loopback_listener_config(49341)};

    listener.start();
    REQUIRE(listener.isRunning());
    REQUIRE_THROWS_AS(listener.start(), AlreadyRunningError);

    const auto start = std::chrono::steady_clock::now();
    listener.stop(1s);
    REQUIRE(std::chrono::steady_clock::now() - start < 1s);
    REQUIRE(listener.getStatus() == RoleStatus::STOPPED);

    // Stopping a stopped listener does nothing
    REQUIRE_NOTHROW(listener.stop());

    listener.start();
    REQUIRE(listener.isRunning());
    listener.stop();
}

TEST_CASE("Stop interrupts long receive timeout", "[listener]") {
    auto config = loopback_listener_config(49342);
    config.timeout = 10s;
    Listener listener {config};
    listener.start();
    std::this_thread::sleep_for(50ms);

    const auto start = std::chrono::steady_clock::now();
    listener.stop(5s);
    REQUIRE(std::chrono::steady_clock::now() - start < 5s);
}

TEST_CASE("Repeated service counted once", "[listener]") {
    Listener listener {loopback_listener_config(49343)};
    listener.start();

    auto sender = create_loopback_sender(49343);
    sender.sendMessage(descriptor_bytes("A"));
    sender.sendMessage(descriptor_bytes("B"));
    sender.sendMessage(descriptor_bytes("A"));

    REQUIRE(wait_for_condition([&]() { return listener.getMetrics().packets_received == 3; }));
    listener.stop();

    const auto metrics = listener.getMetrics();
    REQUIRE(metrics.active_services == 2);
    REQUIRE(metrics.errors == 0);
    REQUIRE(listener.getRegistry().activeCount() == 2);
    REQUIRE(listener.getRegistry().contains("A"));
    REQUIRE(listener.getRegistry().contains("B"));
}

TEST_CASE("Malformed datagram", "[listener]") {
    Listener listener {loopback_listener_config(49344)};
    listener.start();

    auto sender = create_loopback_sender(49344);
    sender.sendMessage(to_bytes("this is not a descriptor"));

    REQUIRE(wait_for_condition([&]() { return listener.getMetrics().packets_received == 1; }));
    listener.stop();

    const auto metrics = listener.getMetrics();
    REQUIRE(metrics.errors == 1);
    REQUIRE(metrics.active_services == 0);
    REQUIRE(metrics.bytes_received == to_bytes("this is not a descriptor").size());
}

TEST_CASE("Missing required keys", "[listener]") {
    Listener listener {loopback_listener_config(49345)};
    listener.start();

    auto sender = create_loopback_sender(49345);
    sender.sendMessage(to_bytes(R"({"type": "VaultLibrary"})"));
    sender.sendMessage(to_bytes(R"({"addr": "10.0.0.1"})"));

    REQUIRE(wait_for_condition([&]() { return listener.getMetrics().errors == 2; }));
    listener.stop();
    REQUIRE(listener.getRegistry().size() == 0);
}

TEST_CASE("Oversized datagram", "[listener]") {
    auto config = loopback_listener_config(49346);
    config.buffer_size = 32;
    Listener listener {config};
    listener.start();

    auto sender = create_loopback_sender(49346);
    const auto large = descriptor_bytes("a-very-long-address-which-exceeds-the-buffer-size");
    REQUIRE(large.size() > 32);
    sender.sendMessage(large);

    REQUIRE(wait_for_condition([&]() { return listener.getMetrics().errors == 1; }));
    listener.stop();
    REQUIRE(listener.getRegistry().size() == 0);
}

TEST_CASE("Sink receives descriptors", "[listener]") {
    DescriptorCollector collector {};
    Listener listener {loopback_listener_config(49347), {}, [&](const ServiceDescriptor& descriptor) { collector(descriptor); }};
    listener.start();

    auto sender = create_loopback_sender(49347);
    const ServiceDescriptor descriptor {"VaultLibrary", "10.0.0.5:9000", "library", "1.2", 1700000000.};
    sender.sendMessage(descriptor.assemble());

    REQUIRE(wait_for_condition([&]() { return collector.size() == 1; }));
    listener.stop();
    REQUIRE(collector.getDescriptors().front() == descriptor);
}

TEST_CASE("Sink exceptions are counted as errors", "[listener]") {
    Listener listener {loopback_listener_config(49348), {}, [](const ServiceDescriptor& /*descriptor*/) {
                           throw std::runtime_error("sink failure");
                       }};
    listener.start();

    auto sender = create_loopback_sender(49348);
    sender.sendMessage(descriptor_bytes("A"));
    sender.sendMessage(descriptor_bytes("B"));

    REQUIRE(wait_for_condition([&]() { return listener.getMetrics().errors == 2; }));
    REQUIRE(listener.isRunning());
    listener.stop();

    // Services are registered before the sink is called
    REQUIRE(listener.getRegistry().size() == 2);
}

TEST_CASE("Type filter", "[listener]") {
    auto config = loopback_listener_config(49349);
    config.type_filter = "VaultLibrary";
    DescriptorCollector collector {};
    Listener listener {config, {}, [&](const ServiceDescriptor& descriptor) { collector(descriptor); }};
    listener.start();

    auto sender = create_loopback_sender(49349);
    sender.sendMessage(descriptor_bytes("A", "OtherService"));
    sender.sendMessage(descriptor_bytes("B", "MyVaultLibraryV2"));

    REQUIRE(wait_for_condition([&]() { return listener.getMetrics().packets_received == 2; }));
    REQUIRE(wait_for_condition([&]() { return collector.size() == 1; }));
    listener.stop();

    const auto metrics = listener.getMetrics();
    REQUIRE(metrics.errors == 0);
    REQUIRE(metrics.active_services == 1);
    REQUIRE(collector.getDescriptors().front().getAddress() == "B");
}

TEST_CASE("Registry callback from listener", "[listener]") {
    Listener listener {loopback_listener_config(49350)};
    std::atomic_int discovered {0};
    listener.getRegistry().setCallback([&](const ServiceEntry& /*entry*/, ServiceStatus status) {
        if(status == ServiceStatus::DISCOVERED) {
            ++discovered;
        }
    });
    listener.start();

    auto sender = create_loopback_sender(49350);
    sender.sendMessage(descriptor_bytes("A"));
    sender.sendMessage(descriptor_bytes("A"));

    REQUIRE(wait_for_condition([&]() { return listener.getMetrics().packets_received == 2; }));
    listener.stop();
    REQUIRE(discovered == 1);
}

TEST_CASE("Registry callback throwing unknown exception", "[listener]") {
    DescriptorCollector collector {};
    Listener listener {loopback_listener_config(49354), {}, [&](const ServiceDescriptor& descriptor) { collector(descriptor); }};
    listener.getRegistry().setCallback([](const ServiceEntry& /*entry*/, ServiceStatus /*status*/) { throw 42; });
    listener.start();

    auto sender = create_loopback_sender(49354);
    sender.sendMessage(descriptor_bytes("A"));
    sender.sendMessage(descriptor_bytes("B"));

    REQUIRE(wait_for_condition([&]() { return listener.getMetrics().errors == 2; }));
    REQUIRE(listener.isRunning());

    // Descriptors are still registered and forwarded
    REQUIRE(wait_for_condition([&]() { return collector.size() == 2; }));
    listener.stop();
    REQUIRE(listener.getRegistry().size() == 2);
}

TEST_CASE("Stop times out on blocking sink", "[listener]") {
    std::atomic_bool sink_entered {false};
    Listener listener {loopback_listener_config(49355), {}, [&](const ServiceDescriptor& /*descriptor*/) {
                           sink_entered = true;
                           std::this_thread::sleep_for(500ms);
                       }};
    listener.start();

    auto sender = create_loopback_sender(49355);
    sender.sendMessage(descriptor_bytes("A"));
    REQUIRE(wait_for_condition([&]() { return sink_entered.load(); }));

    REQUIRE_THROWS_AS(listener.stop(50ms), ShutdownTimeoutError);
    REQUIRE(listener.getStatus() == RoleStatus::STOPPED);
    REQUIRE_FALSE(listener.isRunning());

    // Lingering worker is collected on restart
    listener.start();
    REQUIRE(listener.isRunning());
    listener.stop();
}

TEST_CASE("Broken socket stops listener", "[listener]") {
    BrokenListener listener {loopback_listener_config(49356)};
    listener.start();

    REQUIRE(wait_for_condition([&]() { return !listener.isRunning(); }));
    REQUIRE(listener.getStatus() == RoleStatus::STOPPED);
    REQUIRE(listener.getMetrics().errors == 1);
    REQUIRE_NOTHROW(listener.stop());
}

TEST_CASE("Reset services", "[listener]") {
    Listener listener {loopback_listener_config(49351)};
    listener.start();

    auto sender = create_loopback_sender(49351);
    sender.sendMessage(descriptor_bytes("A"));
    REQUIRE(wait_for_condition([&]() { return listener.getRegistry().size() == 1; }));
    listener.stop();

    listener.resetServices();
    const auto metrics = listener.getMetrics();
    REQUIRE(listener.getRegistry().size() == 0);
    REQUIRE(metrics.packets_received == 0);
    REQUIRE(metrics.active_services == 0);
    REQUIRE(metrics.uptime_seconds < 0.1);
}

TEST_CASE("Round trip from publisher to listener", "[listener]") {
    DescriptorCollector collector {};
    Listener listener {loopback_listener_config(49352), {}, [&](const ServiceDescriptor& descriptor) { collector(descriptor); }};
    listener.start();

    const ServiceDescriptor descriptor {"vault-test", "127.0.0.1:8000", "round trip", "0.1", 1234.5};
    auto publisher_config = loopback_publisher_config(49352, 50ms);
    publisher_config.message = descriptor.assemble();
    Publisher publisher {publisher_config};
    publisher.start();

    REQUIRE(wait_for_condition([&]() { return collector.size() >= 2; }));
    publisher.stop();
    listener.stop();

    for(const auto& received : collector.getDescriptors()) {
        REQUIRE(received == descriptor);
        REQUIRE(received == ServiceDescriptor::disassemble(publisher_config.message));
    }
    REQUIRE(listener.getMetrics().active_services == 1);
    REQUIRE(listener.getMetrics().bytes_received == listener.getMetrics().packets_received * publisher_config.message.size());
}

TEST_CASE("Destructor stops listener", "[listener]") {
    auto listener = std::make_unique<Listener>(loopback_listener_config(49353));
    listener->start();
    REQUIRE_NOTHROW(listener.reset());
}

// NOLINTEND(cert-err58-cpp,misc-use-anonymous-namespace)
