/**
 * @file
 * @brief Publisher broadcasting a service descriptor in regular intervals
 *
 * @copyright Copyright (c) 2025 DESY and the Beacon authors.
 * This software is distributed under the terms of the EUPL-1.2 License, copied verbatim in the file "LICENSE.md".
 * SPDX-License-Identifier: EUPL-1.2
 */

#pragma once

#include <atomic>
#include <condition_variable>
#include <cstddef>
#include <memory>
#include <mutex>
#include <stop_token>
#include <thread>
#include <vector>

#include "beacon/build.hpp"
#include "beacon/core/config/DiscoveryConfig.hpp"
#include "beacon/core/discovery/definitions.hpp"
#include "beacon/core/discovery/MulticastSocket.hpp"
#include "beacon/core/log/Logger.hpp"
#include "beacon/core/metrics/MetricsCollector.hpp"

namespace beacon::discovery {

    /**
     * @brief Publisher sending the current message as one datagram to the multicast group in regular intervals
     *
     * Construction does not open any socket. The socket is opened by `start()` and owned by the worker thread, which
     * closes it when it finishes. The first datagram is sent one full interval after the start. Failed sends are counted
     * as errors, and a socket which is no longer usable is replaced by a new one. The publisher only stops by itself if
     * no new socket can be opened.
     */
    class BEACON_API Publisher {
    public:
        /**
         * @brief Construct a publisher
         *
         * @param config Publisher configuration
         * @throw ConfigValueError If the configuration is invalid
         */
        explicit Publisher(config::PublisherConfig config);

        /** Destructor which stops the publisher */
        virtual ~Publisher();

        // No copy/move constructor/assignment
        /// @cond doxygen_suppress
        Publisher(const Publisher& other) = delete;
        Publisher& operator=(const Publisher& other) = delete;
        Publisher(Publisher&& other) = delete;
        Publisher& operator=(Publisher&& other) = delete;
        /// @endcond

        /**
         * @brief Open the socket and start the broadcast worker
         *
         * @throw AlreadyRunningError If the publisher is already running
         * @throw NetworkError If the socket cannot be opened
         */
        void start();

        /**
         * @brief Stop the broadcast worker
         *
         * Stopping a publisher which is not running does nothing. The publisher is marked as stopped even if the worker
         * does not finish in time, in which case the socket is closed as soon as the worker finishes.
         *
         * @param timeout Time to wait for the worker to finish
         * @throw ShutdownTimeoutError If the worker did not finish within the timeout
         */
        void stop(Clock::duration timeout = DEFAULT_STOP_TIMEOUT);

        /**
         * @brief Replace the message used for the next datagram
         *
         * @param message Datagram body
         */
        void updateMessage(std::vector<std::byte> message);

        /**
         * @brief Get the current message
         */
        std::vector<std::byte> getMessage() const;

        /**
         * @brief Get the metrics of this publisher
         */
        metrics::MetricsSnapshot getMetrics() const { return metrics_.snapshot(0); }

        /**
         * @brief Reset the metrics of this publisher
         */
        void resetMetrics() { metrics_.reset(); }

        RoleStatus getStatus() const { return status_.load(); }

        bool isRunning() const { return getStatus() == RoleStatus::RUNNING; }

    protected:
        /**
         * @brief Open the socket used for sending
         *
         * Derived classes overriding this method need to stop the publisher in their destructor.
         *
         * @throw NetworkError If the socket cannot be opened
         */
        virtual std::unique_ptr<MulticastSender> open_socket();

    private:
        void loop(const std::stop_token& stop_token);

        void send_message();

        bool reopen_socket();

    private:
        log::Logger logger_;
        config::PublisherConfig config_;
        metrics::MetricsCollector metrics_;

        std::atomic<RoleStatus> status_ {RoleStatus::STOPPED};
        std::mutex state_mutex_;

        mutable std::mutex message_mutex_;
        std::condition_variable cv_;
        std::vector<std::byte> message_;

        std::unique_ptr<MulticastSender> socket_;

        std::mutex worker_mutex_;
        std::condition_variable worker_cv_;
        bool worker_done_ {true};

        std::jthread send_thread_;
    };

} // namespace beacon::discovery
