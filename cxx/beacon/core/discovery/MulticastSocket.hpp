/**
 * @file
 * @brief Multicast sockets for sending and receiving discovery datagrams
 *
 * @copyright Copyright (c) 2025 DESY and the Beacon authors.
 * This software is distributed under the terms of the EUPL-1.2 License, copied verbatim in the file "LICENSE.md".
 * SPDX-License-Identifier: EUPL-1.2
 */

#pragma once

#include <atomic>
#include <chrono>
#include <cstddef>
#include <optional>
#include <span>
#include <vector>

#include <asio/io_context.hpp>
#include <asio/ip/address_v4.hpp>
#include <asio/ip/udp.hpp>

#include "beacon/build.hpp"
#include "beacon/core/networking/Port.hpp"

namespace beacon::discovery {

    /** Incoming multicast datagram */
    struct MulticastMessage {
        /** Content of the datagram in bytes */
        std::vector<std::byte> content;

        /** Address from which the datagram was received */
        asio::ip::address_v4 address;
    };

    /** Socket sending datagrams to a multicast group */
    class BEACON_API MulticastSender {
    public:
        /**
         * Open a socket for sending to a multicast group
         *
         * @param multicast_address Multicast group address
         * @param multicast_port Multicast port
         * @param ttl Multicast hop limit
         * @param interface_address Address of the outgoing interface, system default if not given
         * @throw NetworkError If the socket cannot be opened or configured
         */
        MulticastSender(const asio::ip::address_v4& multicast_address,
                        networking::Port multicast_port,
                        int ttl,
                        std::optional<asio::ip::address_v4> interface_address = std::nullopt);

        virtual ~MulticastSender() = default;

        // No copy/move constructor/assignment
        /// @cond doxygen_suppress
        MulticastSender(const MulticastSender& other) = delete;
        MulticastSender& operator=(const MulticastSender& other) = delete;
        MulticastSender(MulticastSender&& other) = delete;
        MulticastSender& operator=(MulticastSender&& other) = delete;
        /// @endcond

        /**
         * Send a datagram to the multicast group
         *
         * @param message Datagram body in bytes
         * @return Number of bytes sent
         * @throw SendError If sending failed but the socket remains usable
         * @throw SocketFatalError If the socket is no longer usable
         */
        virtual std::size_t sendMessage(std::span<const std::byte> message);

        /** Close the socket */
        void close();

        bool isOpen() const { return socket_.is_open(); }

    private:
        asio::io_context io_context_;
        asio::ip::udp::socket socket_;
        asio::ip::udp::endpoint multicast_endpoint_;
    };

    /** Socket receiving datagrams from a multicast group */
    class BEACON_API MulticastReceiver {
    public:
        /**
         * Open a socket, bind the multicast port and join the multicast group
         *
         * The socket allows address reuse so that several receivers on one host can share the port.
         *
         * @param multicast_address Multicast group address
         * @param multicast_port Multicast port
         * @param buffer_size Maximum accepted datagram size
         * @param interface_address Address of the interface on which to join the group, any if not given
         * @param loopback Whether datagrams sent from this host are received
         * @throw NetworkError If the socket cannot be opened, bound or joined to the group
         */
        MulticastReceiver(const asio::ip::address_v4& multicast_address,
                          networking::Port multicast_port,
                          std::size_t buffer_size,
                          std::optional<asio::ip::address_v4> interface_address = std::nullopt,
                          bool loopback = true);

        virtual ~MulticastReceiver() = default;

        // No copy/move constructor/assignment
        /// @cond doxygen_suppress
        MulticastReceiver(const MulticastReceiver& other) = delete;
        MulticastReceiver& operator=(const MulticastReceiver& other) = delete;
        MulticastReceiver(MulticastReceiver&& other) = delete;
        MulticastReceiver& operator=(MulticastReceiver&& other) = delete;
        /// @endcond

        /**
         * Receive a datagram within a timeout
         *
         * Datagrams larger than the buffer size are returned with a content one byte larger than the buffer size. After
         * the receiver has been interrupted, the call returns immediately without a datagram.
         *
         * @param timeout Duration for which to block function call
         * @return Datagram if received
         * @throw ReceiveError If receiving failed but the socket remains usable
         * @throw SocketFatalError If the socket is no longer usable
         */
        virtual std::optional<MulticastMessage> recvMessage(std::chrono::steady_clock::duration timeout);

        /**
         * Interrupt a pending `recvMessage()` call and all following ones
         *
         * This is the only method which may be called from a different thread than the receiving one.
         */
        void interrupt();

        /** Leave the multicast group and close the socket */
        void close();

        bool isOpen() const { return socket_.is_open(); }

    private:
        asio::io_context io_context_;
        asio::ip::udp::socket socket_;
        asio::ip::address_v4 multicast_address_;
        std::optional<asio::ip::address_v4> interface_address_;
        std::size_t buffer_size_;
        std::atomic_bool interrupted_ {false};
    };

} // namespace beacon::discovery
