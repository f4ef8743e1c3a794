/**
 * @file
 * @brief Implementation of the multicast sockets
 *
 * @copyright Copyright (c) 2025 DESY and the Beacon authors.
 * This software is distributed under the terms of the EUPL-1.2 License, copied verbatim in the file "LICENSE.md".
 * SPDX-License-Identifier: EUPL-1.2
 */

#include "MulticastSocket.hpp"

#include <chrono>
#include <cstddef>
#include <future>
#include <optional>
#include <span>
#include <string>
#include <system_error>

#include <asio.hpp>

#include "beacon/core/networking/exceptions.hpp"
#include "beacon/core/networking/Port.hpp"

using namespace beacon::discovery;
using namespace beacon::networking;

namespace {
    // Errors after which a socket can not be used anymore
    bool is_fatal(const std::error_code& ec) {
        return ec == asio::error::bad_descriptor || ec == asio::error::not_socket || ec == asio::error::shut_down;
    }
} // namespace

MulticastSender::MulticastSender(const asio::ip::address_v4& multicast_address,
                                 Port multicast_port,
                                 int ttl,
                                 std::optional<asio::ip::address_v4> interface_address)
    : socket_(io_context_), multicast_endpoint_(multicast_address, multicast_port) {
    try {
        // Open socket to set protocol
        socket_.open(multicast_endpoint_.protocol());

        // Set Multicast TTL (aka network hops)
        socket_.set_option(asio::ip::multicast::hops(ttl));

        // Allow listeners on the same host
        socket_.set_option(asio::ip::multicast::enable_loopback(true));

        if(interface_address.has_value()) {
            socket_.set_option(asio::ip::multicast::outbound_interface(interface_address.value()));
        }
    } catch(const asio::system_error& error) {
        throw NetworkError("Failed to open multicast send socket: " + std::string(error.what()));
    }
}

std::size_t MulticastSender::sendMessage(std::span<const std::byte> message) {
    if(!socket_.is_open()) {
        throw SocketFatalError("socket is closed");
    }

    std::error_code ec {};
    const auto length = socket_.send_to(asio::const_buffer(message.data(), message.size()), multicast_endpoint_, 0, ec);
    if(ec) {
        if(is_fatal(ec)) {
            throw SocketFatalError(ec.message());
        }
        throw SendError(ec.message());
    }
    return length;
}

void MulticastSender::close() {
    std::error_code ec {};
    // Error on close can be ignored since the descriptor is released either way
    socket_.close(ec);
}

MulticastReceiver::MulticastReceiver(const asio::ip::address_v4& multicast_address,
                                     Port multicast_port,
                                     std::size_t buffer_size,
                                     std::optional<asio::ip::address_v4> interface_address,
                                     bool loopback)
    : socket_(io_context_), multicast_address_(multicast_address), interface_address_(interface_address),
      buffer_size_(buffer_size) {

    // Receive endpoint using any address and multicast port
    const asio::ip::udp::endpoint recv_endpoint {asio::ip::address_v4::any(), multicast_port};

    try {
        // Open socket to set protocol
        socket_.open(recv_endpoint.protocol());

        // Ensure socket can be bound by other programs
        socket_.set_option(asio::ip::udp::socket::reuse_address(true));

        socket_.set_option(asio::ip::multicast::enable_loopback(loopback));

        // Bind socket
        socket_.bind(recv_endpoint);

        // Join multicast group
        if(interface_address_.has_value()) {
            socket_.set_option(asio::ip::multicast::join_group(multicast_address_, interface_address_.value()));
        } else {
            socket_.set_option(asio::ip::multicast::join_group(multicast_address_));
        }
    } catch(const asio::system_error& error) {
        throw NetworkError("Failed to open multicast receive socket: " + std::string(error.what()));
    }
}

std::optional<MulticastMessage> MulticastReceiver::recvMessage(std::chrono::steady_clock::duration timeout) {
    if(!socket_.is_open()) {
        throw SocketFatalError("socket is closed");
    }

    // One additional byte to detect datagrams exceeding the buffer size
    MulticastMessage message {};
    message.content.resize(buffer_size_ + 1);
    asio::ip::udp::endpoint sender_endpoint {};

    // Restarting clears a stop of the IO context, thus check for an interrupt afterwards
    io_context_.restart();
    if(interrupted_.load()) {
        return std::nullopt;
    }

    // Receive as future
    auto length_future = socket_.async_receive_from(asio::buffer(message.content), sender_endpoint, asio::use_future);

    // Run IO context for timeout
    io_context_.run_for(timeout);

    // If receive not completed, either timed out or interrupted
    if(length_future.wait_for(std::chrono::seconds(0)) != std::future_status::ready) {
        // Cancel async operations and run handler of the cancelled operation
        std::error_code ec {};
        socket_.cancel(ec);
        io_context_.restart();
        io_context_.run();
        return std::nullopt;
    }

    std::size_t length {};
    try {
        length = length_future.get();
    } catch(const std::system_error& error) {
        if(is_fatal(error.code()) || !socket_.is_open()) {
            throw SocketFatalError(error.code().message());
        }
        throw ReceiveError(error.code().message());
    }

    message.address = sender_endpoint.address().to_v4();
    message.content.resize(length);
    return message;
}

void MulticastReceiver::interrupt() {
    interrupted_.store(true);
    io_context_.stop();
}

void MulticastReceiver::close() {
    if(!socket_.is_open()) {
        return;
    }

    // Errors on leaving and closing can be ignored since the descriptor is released either way
    std::error_code ec {};
    if(interface_address_.has_value()) {
        socket_.set_option(asio::ip::multicast::leave_group(multicast_address_, interface_address_.value()), ec);
    } else {
        socket_.set_option(asio::ip::multicast::leave_group(multicast_address_), ec);
    }
    socket_.close(ec);
}
