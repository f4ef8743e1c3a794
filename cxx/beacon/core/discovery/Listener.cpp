/**
 * @file
 * @brief Implementation of the listener
 *
 * @copyright Copyright (c) 2025 DESY and the Beacon authors.
 * This software is distributed under the terms of the EUPL-1.2 License, copied verbatim in the file "LICENSE.md".
 * SPDX-License-Identifier: EUPL-1.2
 */

#include "Listener.hpp"

#include <exception>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <stop_token>
#include <string>
#include <thread>
#include <utility>

#include "beacon/core/config/DiscoveryConfig.hpp"
#include "beacon/core/discovery/definitions.hpp"
#include "beacon/core/discovery/exceptions.hpp"
#include "beacon/core/discovery/MulticastSocket.hpp"
#include "beacon/core/discovery/ServiceDescriptor.hpp"
#include "beacon/core/log/log.hpp"
#include "beacon/core/networking/asio_helpers.hpp"
#include "beacon/core/networking/exceptions.hpp"
#include "beacon/core/utils/string.hpp"
#include "beacon/core/utils/thread.hpp"

using namespace beacon::discovery;
using namespace beacon::networking;
using namespace beacon::utils;

Listener::Listener(config::ListenerConfig config, config::RegistryConfig registry_config, DescriptorSink sink)
    : logger_("LSTN"), config_(std::move(config)), registry_(std::move(registry_config)), sink_(std::move(sink)) {
    config_.validate();
}

Listener::~Listener() {
    try {
        stop();
    } catch(const ShutdownTimeoutError& error) {
        LOG(logger_, WARNING) << error.what();
    } catch(const std::exception& error) {
        LOG(logger_, CRITICAL) << "Failed to stop listener: " << error.what();
    }
}

void Listener::start() {
    const std::lock_guard state_lock {state_mutex_};
    if(status_ == RoleStatus::RUNNING) {
        throw AlreadyRunningError("Listener");
    }

    // Collect worker which failed or did not stop in time
    if(recv_thread_.joinable()) {
        recv_thread_.join();
    }

    socket_ = open_socket();

    {
        const std::lock_guard worker_lock {worker_mutex_};
        worker_done_ = false;
    }
    status_ = RoleStatus::RUNNING;
    recv_thread_ = std::jthread(std::bind_front(&Listener::loop, this));
    set_thread_name(recv_thread_, "Listener");

    LOG(logger_, INFO) << "Listening on " << to_endpoint_string(parse_multicast_group(config_.group), config_.port)
                       << (config_.type_filter.empty() ? "" : " for services of type " + quote(config_.type_filter));
}

void Listener::stop(Clock::duration timeout) {
    const std::lock_guard state_lock {state_mutex_};
    if(!recv_thread_.joinable()) {
        return;
    }

    recv_thread_.request_stop();

    std::unique_lock worker_lock {worker_mutex_};
    const auto finished = worker_cv_.wait_for(worker_lock, timeout, [this]() { return worker_done_; });
    worker_lock.unlock();

    status_ = RoleStatus::STOPPED;
    if(!finished) {
        throw ShutdownTimeoutError("Listener", timeout);
    }

    recv_thread_.join();
    LOG(logger_, DEBUG) << "Listener stopped";
}

std::unique_ptr<MulticastReceiver> Listener::open_socket() {
    const auto group = parse_multicast_group(config_.group);
    std::optional<asio::ip::address_v4> interface_address {};
    if(!config_.interface.empty()) {
        interface_address = resolve_interface_address(config_.interface);
    }
    return std::make_unique<MulticastReceiver>(
        group, config_.port, config_.buffer_size, interface_address, config_.loopback);
}

void Listener::resetServices() {
    registry_.reset();
    metrics_.reset();
    LOG(logger_, INFO) << "Services and metrics reset";
}

void Listener::forward(const ServiceDescriptor& descriptor) {
    if(!sink_) {
        return;
    }
    try {
        sink_(descriptor);
    } catch(const std::exception& error) {
        metrics_.recordError();
        LOG_N(logger_, WARNING, 5) << "Caught exception in descriptor sink: " << error.what();
    } catch(...) {
        metrics_.recordError();
        LOG_N(logger_, WARNING, 5) << "Caught unknown exception in descriptor sink";
    }
}

void Listener::handle_message(const MulticastMessage& message) {
    metrics_.recordReceived(message.content.size());

    if(message.content.size() > config_.buffer_size) {
        metrics_.recordError();
        LOG_N(logger_, WARNING, 5) << "Dropping datagram from " << message.address.to_string() << " exceeding "
                                   << config_.buffer_size << " bytes";
        return;
    }

    std::optional<ServiceDescriptor> descriptor {};
    try {
        descriptor = ServiceDescriptor::disassemble(message.content);
    } catch(const DescriptorDecodingError& error) {
        metrics_.recordError();
        LOG_N(logger_, WARNING, 5) << "Dropping datagram from " << message.address.to_string() << ": " << error.what();
        return;
    }

    if(!config_.type_filter.empty() && descriptor->getType().find(config_.type_filter) == std::string::npos) {
        LOG(logger_, TRACE) << "Ignoring service " << quote(descriptor->getAddress()) << " of type "
                            << quote(descriptor->getType());
        return;
    }

    LOG(logger_, DEBUG) << "Received descriptor of service " << quote(descriptor->getAddress()) << " from "
                        << message.address.to_string();

    try {
        registry_.refresh(descriptor->getAddress(), descriptor.value(), Clock::now());
    } catch(const std::exception& error) {
        metrics_.recordError();
        LOG_N(logger_, WARNING, 5) << "Caught exception in service callback: " << error.what();
    } catch(...) {
        metrics_.recordError();
        LOG_N(logger_, WARNING, 5) << "Caught unknown exception in service callback";
    }

    forward(descriptor.value());
}

void Listener::loop(const std::stop_token& stop_token) {
    {
        // Interrupt pending receive when stop is requested
        const std::stop_callback stop_callback {stop_token, [this]() { socket_->interrupt(); }};

        while(!stop_token.stop_requested()) {
            try {
                const auto message = socket_->recvMessage(config_.timeout);
                if(message.has_value()) {
                    handle_message(message.value());
                }
            } catch(const SocketFatalError& error) {
                metrics_.recordError();
                LOG(logger_, CRITICAL) << error.what() << ", stopping listener";
                break;
            } catch(const ReceiveError& error) {
                metrics_.recordError();
                LOG_N(logger_, WARNING, 5) << error.what();
            }
        }
    }

    socket_->close();
    status_ = RoleStatus::STOPPED;

    const std::lock_guard worker_lock {worker_mutex_};
    worker_done_ = true;
    worker_cv_.notify_all();
}
