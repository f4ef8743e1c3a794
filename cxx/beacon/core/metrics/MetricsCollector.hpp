/**
 * @file
 * @brief Metrics collector for discovery roles
 *
 * @copyright Copyright (c) 2025 DESY and the Beacon authors.
 * This software is distributed under the terms of the EUPL-1.2 License, copied verbatim in the file "LICENSE.md".
 * SPDX-License-Identifier: EUPL-1.2
 */

#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <mutex>
#include <string>

#include <nlohmann/json.hpp>

#include "beacon/build.hpp"

namespace beacon::metrics {

    /**
     * @brief Point-in-time view of the metrics of a publisher or listener
     */
    struct BEACON_API MetricsSnapshot {
        std::uint64_t packets_sent {};
        std::uint64_t packets_received {};
        std::uint64_t bytes_sent {};
        std::uint64_t bytes_received {};
        std::uint64_t errors {};
        std::size_t active_services {};

        /** Time since creation or last reset of the collector */
        double uptime_seconds {};

        /** Sent plus received packets divided by the uptime */
        double packets_per_second {};

        /** Single line representation for log messages */
        std::string to_string() const;

        /** JSON object with the field names of this struct */
        nlohmann::json to_json() const;
    };

    /**
     * @brief Thread-safe packet, byte and error counters
     *
     * All counters are guarded by a single mutex, one producer thread and any number of readers may use the collector
     * concurrently. The start time used for the uptime is taken at construction and at each reset.
     */
    class BEACON_API MetricsCollector {
    public:
        MetricsCollector();

        /**
         * @brief Record a sent datagram
         *
         * @param bytes Size of the datagram
         */
        void recordSent(std::size_t bytes);

        /**
         * @brief Record a received datagram
         *
         * @param bytes Size of the datagram
         */
        void recordReceived(std::size_t bytes);

        /**
         * @brief Record a send, receive, decode or consumer error
         */
        void recordError();

        /**
         * @brief Take a consistent snapshot of all counters
         *
         * @param active_services Number of active services reported in the snapshot
         * @return Metrics snapshot
         */
        MetricsSnapshot snapshot(std::size_t active_services) const;

        /**
         * @brief Reset all counters to zero and restart the uptime
         */
        void reset();

    private:
        mutable std::mutex mutex_;
        std::chrono::steady_clock::time_point start_time_;
        std::uint64_t packets_sent_ {};
        std::uint64_t packets_received_ {};
        std::uint64_t bytes_sent_ {};
        std::uint64_t bytes_received_ {};
        std::uint64_t errors_ {};
    };

} // namespace beacon::metrics
