/**
 * @file
 * @brief Registry of services seen by a listener
 *
 * @copyright Copyright (c) 2025 DESY and the Beacon authors.
 * This software is distributed under the terms of the EUPL-1.2 License, copied verbatim in the file "LICENSE.md".
 * SPDX-License-Identifier: EUPL-1.2
 */

#pragma once

#include <cstddef>
#include <functional>
#include <map>
#include <mutex>
#include <string>
#include <vector>

#include "beacon/build.hpp"
#include "beacon/core/config/DiscoveryConfig.hpp"
#include "beacon/core/discovery/definitions.hpp"
#include "beacon/core/discovery/ServiceDescriptor.hpp"
#include "beacon/core/log/Logger.hpp"

namespace beacon::discovery {

    /** Service known to the registry */
    struct ServiceEntry {
        /** Identity of the service, the address of its descriptor */
        std::string identity;

        /** Latest descriptor received for this service */
        ServiceDescriptor descriptor;

        /** Time of the latest sighting */
        Clock::time_point last_seen;
    };

    /**
     * Function signature for registry change callbacks
     *
     * The callback is invoked with `ServiceStatus::DISCOVERED` on the first sighting of an identity and with
     * `ServiceStatus::DEAD` when the entry is swept or forgotten. It is never invoked while the registry is locked, and may
     * thus query the registry. If the callback throws, the remaining entries are still notified and the first exception is
     * rethrown to the caller of the registry method afterwards.
     */
    using ServiceCallback = std::function<void(const ServiceEntry&, ServiceStatus)>;

    /**
     * @brief Store of observed services with timeout-based liveness
     *
     * A service is active while less than the service timeout has passed since its latest sighting. Inactive entries are
     * only removed by an explicit `sweep()`, which can be called by any periodic driver.
     */
    class ServiceRegistry {
    public:
        /**
         * @brief Construct an empty registry
         *
         * @param config Registry configuration
         * @param callback Optional callback for registry changes
         */
        BEACON_API explicit ServiceRegistry(config::RegistryConfig config = {}, ServiceCallback callback = {});

        /**
         * @brief Insert a new service or refresh a known one
         *
         * The latest descriptor replaces the stored one. The time of the latest sighting never moves backwards.
         *
         * @param identity Identity of the service
         * @param descriptor Descriptor of the service
         * @param now Time of the sighting
         */
        BEACON_API void refresh(const std::string& identity, ServiceDescriptor descriptor, Clock::time_point now);

        /**
         * @brief Number of active services at a given time
         */
        BEACON_API std::size_t activeCount(Clock::time_point now) const;

        /**
         * @brief Number of services active now
         */
        std::size_t activeCount() const { return activeCount(Clock::now()); }

        /**
         * @brief Copy of all services active at a given time, ordered by identity
         */
        BEACON_API std::vector<ServiceEntry> activeSnapshot(Clock::time_point now) const;

        /**
         * @brief Copy of all services active now, ordered by identity
         */
        std::vector<ServiceEntry> activeSnapshot() const { return activeSnapshot(Clock::now()); }

        /**
         * @brief Remove all services which are not active at a given time
         *
         * @param now Time against which the liveness is evaluated
         * @return Number of removed services
         */
        BEACON_API std::size_t sweep(Clock::time_point now);

        /**
         * @brief Remove a single service
         *
         * @param identity Identity of the service
         * @return True if the service was known
         */
        BEACON_API bool forget(const std::string& identity);

        /**
         * @brief Remove all services without invoking the callback
         */
        BEACON_API void reset();

        /**
         * @brief Number of stored services, including the ones which are no longer active
         */
        BEACON_API std::size_t size() const;

        /**
         * @brief Check if a service is stored, regardless of its liveness
         */
        BEACON_API bool contains(const std::string& identity) const;

        /**
         * @brief Replace the callback for registry changes
         */
        BEACON_API void setCallback(ServiceCallback callback);

        Clock::duration getServiceTimeout() const { return config_.service_timeout; }

    private:
        bool is_active(const ServiceEntry& entry, Clock::time_point now) const {
            return now - entry.last_seen < config_.service_timeout;
        }

        void notify(const std::vector<ServiceEntry>& entries, ServiceStatus status) const;

    private:
        log::Logger logger_;
        config::RegistryConfig config_;

        mutable std::mutex mutex_;
        std::map<std::string, ServiceEntry> services_;
        ServiceCallback callback_;
    };

} // namespace beacon::discovery
