/**
 * @file
 * @brief Listener receiving service descriptors from a multicast group
 *
 * @copyright Copyright (c) 2025 DESY and the Beacon authors.
 * This software is distributed under the terms of the EUPL-1.2 License, copied verbatim in the file "LICENSE.md".
 * SPDX-License-Identifier: EUPL-1.2
 */

#pragma once

#include <atomic>
#include <condition_variable>
#include <functional>
#include <memory>
#include <mutex>
#include <stop_token>
#include <thread>

#include "beacon/build.hpp"
#include "beacon/core/config/DiscoveryConfig.hpp"
#include "beacon/core/discovery/definitions.hpp"
#include "beacon/core/discovery/MulticastSocket.hpp"
#include "beacon/core/discovery/ServiceDescriptor.hpp"
#include "beacon/core/discovery/ServiceRegistry.hpp"
#include "beacon/core/log/Logger.hpp"
#include "beacon/core/metrics/MetricsCollector.hpp"

namespace beacon::discovery {

    /**
     * Function signature for the consumer of received descriptors
     *
     * The sink is called from the receive thread and should return quickly. Exceptions thrown by the sink are counted as
     * errors and do not stop the listener.
     */
    using DescriptorSink = std::function<void(const ServiceDescriptor&)>;

    /**
     * @brief Listener joining a multicast group and keeping track of the services it receives descriptors from
     *
     * Each received datagram is decoded as service descriptor and refreshes the corresponding entry in the service
     * registry before it is forwarded to the sink. Datagrams which cannot be decoded are counted as errors and dropped.
     */
    class BEACON_API Listener {
    public:
        /**
         * @brief Construct a listener
         *
         * @param config Listener configuration
         * @param registry_config Configuration of the service registry
         * @param sink Optional consumer of received descriptors
         * @throw ConfigValueError If the configuration is invalid
         */
        explicit Listener(config::ListenerConfig config,
                          config::RegistryConfig registry_config = {},
                          DescriptorSink sink = {});

        /** Destructor which stops the listener */
        virtual ~Listener();

        // No copy/move constructor/assignment
        /// @cond doxygen_suppress
        Listener(const Listener& other) = delete;
        Listener& operator=(const Listener& other) = delete;
        Listener(Listener&& other) = delete;
        Listener& operator=(Listener&& other) = delete;
        /// @endcond

        /**
         * @brief Open the socket, join the multicast group and start the receive worker
         *
         * @throw AlreadyRunningError If the listener is already running
         * @throw NetworkError If the socket cannot be opened, bound or joined to the group
         */
        void start();

        /**
         * @brief Stop the receive worker
         *
         * Stopping a listener which is not running does nothing. The listener is marked as stopped even if the worker
         * does not finish in time, in which case the group is left and the socket closed as soon as the worker finishes.
         *
         * @param timeout Time to wait for the worker to finish
         * @throw ShutdownTimeoutError If the worker did not finish within the timeout
         */
        void stop(Clock::duration timeout = DEFAULT_STOP_TIMEOUT);

        /**
         * @brief Get the metrics of this listener
         *
         * The number of active services is taken from the service registry at the time of the call.
         */
        metrics::MetricsSnapshot getMetrics() const { return metrics_.snapshot(registry_.activeCount()); }

        /**
         * @brief Reset the metrics of this listener
         */
        void resetMetrics() { metrics_.reset(); }

        /**
         * @brief Forget all services and reset the metrics of this listener
         */
        void resetServices();

        /**
         * @brief Get the service registry
         */
        ServiceRegistry& getRegistry() { return registry_; }

        RoleStatus getStatus() const { return status_.load(); }

        bool isRunning() const { return getStatus() == RoleStatus::RUNNING; }

    protected:
        /**
         * @brief Open the socket used for receiving and join the multicast group
         *
         * Derived classes overriding this method need to stop the listener in their destructor.
         *
         * @throw NetworkError If the socket cannot be opened, bound or joined to the group
         */
        virtual std::unique_ptr<MulticastReceiver> open_socket();

    private:
        void loop(const std::stop_token& stop_token);

        void handle_message(const MulticastMessage& message);

        void forward(const ServiceDescriptor& descriptor);

    private:
        log::Logger logger_;
        config::ListenerConfig config_;
        ServiceRegistry registry_;
        DescriptorSink sink_;
        metrics::MetricsCollector metrics_;

        std::atomic<RoleStatus> status_ {RoleStatus::STOPPED};
        std::mutex state_mutex_;

        std::unique_ptr<MulticastReceiver> socket_;

        std::mutex worker_mutex_;
        std::condition_variable worker_cv_;
        bool worker_done_ {true};

        std::jthread recv_thread_;
    };

} // namespace beacon::discovery
