/**
 * @file
 * @brief Implementation of the metrics collector
 *
 * @copyright Copyright (c) 2025 DESY and the Beacon authors.
 * This software is distributed under the terms of the EUPL-1.2 License, copied verbatim in the file "LICENSE.md".
 * SPDX-License-Identifier: EUPL-1.2
 */

#include "MetricsCollector.hpp"

#include <algorithm>
#include <chrono>
#include <cstddef>
#include <iomanip>
#include <mutex>
#include <sstream>
#include <string>

#include <nlohmann/json.hpp>

using namespace beacon::metrics;

namespace {
    // Lower bound for the uptime when deriving the packet rate
    constexpr double UPTIME_EPSILON = 1e-9;
} // namespace

std::string MetricsSnapshot::to_string() const {
    std::ostringstream out {};
    out << "sent " << packets_sent << " packets (" << bytes_sent << " bytes), received " << packets_received
        << " packets (" << bytes_received << " bytes), " << errors << " errors, " << active_services
        << " active services, uptime " << std::fixed << std::setprecision(3) << uptime_seconds << "s, "
        << std::setprecision(2) << packets_per_second << " packets/s";
    return out.str();
}

nlohmann::json MetricsSnapshot::to_json() const {
    return nlohmann::json {
        {"packets_sent", packets_sent},
        {"packets_received", packets_received},
        {"bytes_sent", bytes_sent},
        {"bytes_received", bytes_received},
        {"errors", errors},
        {"active_services", active_services},
        {"uptime_seconds", uptime_seconds},
        {"packets_per_second", packets_per_second},
    };
}

MetricsCollector::MetricsCollector() : start_time_(std::chrono::steady_clock::now()) {}

void MetricsCollector::recordSent(std::size_t bytes) {
    const std::lock_guard counter_lock {mutex_};
    ++packets_sent_;
    bytes_sent_ += bytes;
}

void MetricsCollector::recordReceived(std::size_t bytes) {
    const std::lock_guard counter_lock {mutex_};
    ++packets_received_;
    bytes_received_ += bytes;
}

void MetricsCollector::recordError() {
    const std::lock_guard counter_lock {mutex_};
    ++errors_;
}

MetricsSnapshot MetricsCollector::snapshot(std::size_t active_services) const {
    const std::lock_guard counter_lock {mutex_};

    MetricsSnapshot snapshot {};
    snapshot.packets_sent = packets_sent_;
    snapshot.packets_received = packets_received_;
    snapshot.bytes_sent = bytes_sent_;
    snapshot.bytes_received = bytes_received_;
    snapshot.errors = errors_;
    snapshot.active_services = active_services;
    snapshot.uptime_seconds = std::chrono::duration<double>(std::chrono::steady_clock::now() - start_time_).count();
    snapshot.packets_per_second = static_cast<double>(packets_sent_ + packets_received_) /
                                  std::max(snapshot.uptime_seconds, UPTIME_EPSILON);
    return snapshot;
}

void MetricsCollector::reset() {
    const std::lock_guard counter_lock {mutex_};
    start_time_ = std::chrono::steady_clock::now();
    packets_sent_ = 0;
    packets_received_ = 0;
    bytes_sent_ = 0;
    bytes_received_ = 0;
    errors_ = 0;
}
