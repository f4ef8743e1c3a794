/**
 * @file
 * @brief Implementation of the service registry
 *
 * @copyright Copyright (c) 2025 DESY and the Beacon authors.
 * This software is distributed under the terms of the EUPL-1.2 License, copied verbatim in the file "LICENSE.md".
 * SPDX-License-Identifier: EUPL-1.2
 */

#include "ServiceRegistry.hpp"

#include <algorithm>
#include <cstddef>
#include <exception>
#include <iterator>
#include <mutex>
#include <string>
#include <utility>
#include <vector>

#include "beacon/core/config/DiscoveryConfig.hpp"
#include "beacon/core/discovery/definitions.hpp"
#include "beacon/core/discovery/ServiceDescriptor.hpp"
#include "beacon/core/log/log.hpp"
#include "beacon/core/utils/enum.hpp"
#include "beacon/core/utils/string.hpp"

using namespace beacon::discovery;
using namespace beacon::utils;

ServiceRegistry::ServiceRegistry(config::RegistryConfig config, ServiceCallback callback)
    : logger_("REG"), config_(std::move(config)), callback_(std::move(callback)) {
    config_.validate();
}

void ServiceRegistry::refresh(const std::string& identity, ServiceDescriptor descriptor, Clock::time_point now) {
    std::vector<ServiceEntry> discovered {};
    {
        const std::lock_guard services_lock {mutex_};
        auto service_it = services_.find(identity);
        if(service_it == services_.end()) {
            service_it = services_.emplace(identity, ServiceEntry {identity, std::move(descriptor), now}).first;
            LOG(logger_, INFO) << "Service " << quote(identity) << " of type " << quote(service_it->second.descriptor.getType())
                               << " discovered";
            discovered.emplace_back(service_it->second);
        } else {
            auto& entry = service_it->second;
            entry.descriptor = std::move(descriptor);
            entry.last_seen = std::max(entry.last_seen, now);
            LOG(logger_, TRACE) << "Service " << quote(identity) << " refreshed";
        }
    }
    notify(discovered, ServiceStatus::DISCOVERED);
}

std::size_t ServiceRegistry::activeCount(Clock::time_point now) const {
    const std::lock_guard services_lock {mutex_};
    return static_cast<std::size_t>(
        std::ranges::count_if(services_, [&](const auto& service) { return is_active(service.second, now); }));
}

std::vector<ServiceEntry> ServiceRegistry::activeSnapshot(Clock::time_point now) const {
    std::vector<ServiceEntry> snapshot {};
    const std::lock_guard services_lock {mutex_};
    for(const auto& [identity, entry] : services_) {
        if(is_active(entry, now)) {
            snapshot.emplace_back(entry);
        }
    }
    return snapshot;
}

std::size_t ServiceRegistry::sweep(Clock::time_point now) {
    std::vector<ServiceEntry> dead {};
    {
        const std::lock_guard services_lock {mutex_};
        for(auto service_it = services_.begin(); service_it != services_.end();) {
            if(is_active(service_it->second, now)) {
                ++service_it;
                continue;
            }
            LOG(logger_, INFO) << "Service " << quote(service_it->first) << " timed out";
            dead.emplace_back(std::move(service_it->second));
            service_it = services_.erase(service_it);
        }
    }
    notify(dead, ServiceStatus::DEAD);
    return dead.size();
}

bool ServiceRegistry::forget(const std::string& identity) {
    std::vector<ServiceEntry> dead {};
    {
        const std::lock_guard services_lock {mutex_};
        auto node = services_.extract(identity);
        if(node.empty()) {
            return false;
        }
        LOG(logger_, DEBUG) << "Forgetting service " << quote(identity);
        dead.emplace_back(std::move(node.mapped()));
    }
    notify(dead, ServiceStatus::DEAD);
    return true;
}

void ServiceRegistry::reset() {
    const std::lock_guard services_lock {mutex_};
    LOG(logger_, DEBUG) << "Clearing " << services_.size() << " services";
    services_.clear();
}

std::size_t ServiceRegistry::size() const {
    const std::lock_guard services_lock {mutex_};
    return services_.size();
}

bool ServiceRegistry::contains(const std::string& identity) const {
    const std::lock_guard services_lock {mutex_};
    return services_.contains(identity);
}

void ServiceRegistry::setCallback(ServiceCallback callback) {
    const std::lock_guard services_lock {mutex_};
    callback_ = std::move(callback);
}

void ServiceRegistry::notify(const std::vector<ServiceEntry>& entries, ServiceStatus status) const {
    if(entries.empty()) {
        return;
    }

    // Copy callback so that it can be replaced from within the callback
    ServiceCallback callback {};
    {
        const std::lock_guard services_lock {mutex_};
        callback = callback_;
    }
    if(!callback) {
        return;
    }

    // Deliver all notifications before passing on the first exception thrown by the callback
    std::exception_ptr exception_ptr {nullptr};
    for(const auto& entry : entries) {
        LOG(logger_, TRACE) << "Calling callback for service " << quote(entry.identity) << " with status " << status;
        try {
            callback(entry, status);
        } catch(const std::exception& error) {
            LOG(logger_, WARNING) << "Caught exception in callback for service " << quote(entry.identity) << ": "
                                  << error.what();
            if(!exception_ptr) {
                exception_ptr = std::current_exception();
            }
        } catch(...) {
            LOG(logger_, WARNING) << "Caught unknown exception in callback for service " << quote(entry.identity);
            if(!exception_ptr) {
                exception_ptr = std::current_exception();
            }
        }
    }

    if(exception_ptr) {
        std::rethrow_exception(exception_ptr);
    }
}
