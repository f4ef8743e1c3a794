/**
 * @copyright Copyright (c) 2025 DESY and the Beacon authors.
 * This software is distributed under the terms of the EUPL-1.2 License, copied verbatim in the file "LICENSE.md".
 * SPDX-License-Identifier: EUPL-1.2
 */

#pragma once

#include <atomic>
#include <chrono>
#include <cstddef>
#include <memory>
#include <mutex>
#include <optional>
#include <span>
#include <string_view>
#include <thread>
#include <utility>
#include <vector>

#include <asio/ip/address_v4.hpp>

#include "beacon/core/config/DiscoveryConfig.hpp"
#include "beacon/core/discovery/Listener.hpp"
#include "beacon/core/discovery/MulticastSocket.hpp"
#include "beacon/core/discovery/Publisher.hpp"
#include "beacon/core/discovery/ServiceDescriptor.hpp"
#include "beacon/core/networking/exceptions.hpp"
#include "beacon/core/networking/Port.hpp"
#include "beacon/core/utils/casts.hpp"

inline asio::ip::address_v4 get_loopback_address() {
    return asio::ip::make_address_v4("127.0.0.1");
}

inline std::vector<std::byte> to_bytes(std::string_view string) {
    const auto bytes = beacon::utils::to_byte_span(string);
    return {bytes.begin(), bytes.end()};
}

inline beacon::config::PublisherConfig loopback_publisher_config(beacon::networking::Port port,
                                                                 std::chrono::steady_clock::duration interval) {
    beacon::config::PublisherConfig config {};
    config.port = port;
    config.interval = interval;
    config.interface = "127.0.0.1";
    return config;
}

inline beacon::config::ListenerConfig loopback_listener_config(beacon::networking::Port port) {
    using namespace std::chrono_literals;
    beacon::config::ListenerConfig config {};
    config.port = port;
    config.timeout = 50ms;
    config.interface = "127.0.0.1";
    return config;
}

/** Sender to inject datagrams into the default multicast group on the loopback interface */
inline beacon::discovery::MulticastSender create_loopback_sender(beacon::networking::Port port) {
    return {asio::ip::make_address_v4(beacon::config::DEFAULT_GROUP), port, 1, get_loopback_address()};
}

/** Poll a condition until it is true or the timeout expired */
template <typename P> inline bool wait_for_condition(P predicate, std::chrono::milliseconds timeout = std::chrono::seconds(3)) {
    using namespace std::chrono_literals;
    const auto deadline = std::chrono::steady_clock::now() + timeout;
    while(std::chrono::steady_clock::now() < deadline) {
        if(predicate()) {
            return true;
        }
        std::this_thread::sleep_for(10ms);
    }
    return predicate();
}

/** Sink collecting all received descriptors */
class DescriptorCollector {
public:
    void operator()(const beacon::discovery::ServiceDescriptor& descriptor) {
        const std::lock_guard descriptors_lock {mutex_};
        descriptors_.emplace_back(descriptor);
    }

    std::vector<beacon::discovery::ServiceDescriptor> getDescriptors() const {
        const std::lock_guard descriptors_lock {mutex_};
        return descriptors_;
    }

    std::size_t size() const {
        const std::lock_guard descriptors_lock {mutex_};
        return descriptors_.size();
    }

private:
    mutable std::mutex mutex_;
    std::vector<beacon::discovery::ServiceDescriptor> descriptors_;
};

/** Sender whose socket is no longer usable */
class BrokenSender : public beacon::discovery::MulticastSender {
public:
    using MulticastSender::MulticastSender;

    std::size_t sendMessage(std::span<const std::byte> /*message*/) override {
        throw beacon::networking::SocketFatalError("socket broken");
    }
};

/** Receiver whose socket is no longer usable */
class BrokenReceiver : public beacon::discovery::MulticastReceiver {
public:
    using MulticastReceiver::MulticastReceiver;

    std::optional<beacon::discovery::MulticastMessage> recvMessage(std::chrono::steady_clock::duration /*timeout*/) override {
        throw beacon::networking::SocketFatalError("socket broken");
    }
};

/** Publisher starting with a number of broken sockets and failing to open more than a maximum number of sockets */
class FlakyPublisher : public beacon::discovery::Publisher {
public:
    FlakyPublisher(beacon::config::PublisherConfig config, std::size_t broken_sockets, std::size_t max_sockets)
        : Publisher(config), port_(config.port), broken_sockets_(broken_sockets), max_sockets_(max_sockets) {}

    ~FlakyPublisher() override { stop(); }

    // No copy/move constructor/assignment
    /// @cond doxygen_suppress
    FlakyPublisher(const FlakyPublisher& other) = delete;
    FlakyPublisher& operator=(const FlakyPublisher& other) = delete;
    FlakyPublisher(FlakyPublisher&& other) = delete;
    FlakyPublisher& operator=(FlakyPublisher&& other) = delete;
    /// @endcond

    std::size_t getOpenedSockets() const { return opened_sockets_.load(); }

protected:
    std::unique_ptr<beacon::discovery::MulticastSender> open_socket() override {
        const auto count = ++opened_sockets_;
        if(count > max_sockets_) {
            throw beacon::networking::NetworkError("no socket available");
        }
        if(count <= broken_sockets_) {
            return std::make_unique<BrokenSender>(
                asio::ip::make_address_v4(beacon::config::DEFAULT_GROUP), port_, 1, get_loopback_address());
        }
        return Publisher::open_socket();
    }

private:
    beacon::networking::Port port_;
    std::size_t broken_sockets_;
    std::size_t max_sockets_;
    std::atomic_size_t opened_sockets_ {0};
};

/** Listener receiving on a broken socket */
class BrokenListener : public beacon::discovery::Listener {
public:
    explicit BrokenListener(beacon::config::ListenerConfig config) : Listener(config), port_(config.port) {}

    ~BrokenListener() override { stop(); }

    // No copy/move constructor/assignment
    /// @cond doxygen_suppress
    BrokenListener(const BrokenListener& other) = delete;
    BrokenListener& operator=(const BrokenListener& other) = delete;
    BrokenListener(BrokenListener&& other) = delete;
    BrokenListener& operator=(BrokenListener&& other) = delete;
    /// @endcond

protected:
    std::unique_ptr<beacon::discovery::MulticastReceiver> open_socket() override {
        return std::make_unique<BrokenReceiver>(
            asio::ip::make_address_v4(beacon::config::DEFAULT_GROUP), port_, 1400, get_loopback_address());
    }

private:
    beacon::networking::Port port_;
};
