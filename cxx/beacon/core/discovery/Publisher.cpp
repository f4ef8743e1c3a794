/**
 * @file
 * @brief Implementation of the publisher
 *
 * @copyright Copyright (c) 2025 DESY and the Beacon authors.
 * This software is distributed under the terms of the EUPL-1.2 License, copied verbatim in the file "LICENSE.md".
 * SPDX-License-Identifier: EUPL-1.2
 */

#include "Publisher.hpp"

#include <chrono>
#include <cstddef>
#include <exception>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <stop_token>
#include <thread>
#include <utility>
#include <vector>

#include "beacon/core/config/DiscoveryConfig.hpp"
#include "beacon/core/discovery/definitions.hpp"
#include "beacon/core/discovery/exceptions.hpp"
#include "beacon/core/discovery/MulticastSocket.hpp"
#include "beacon/core/log/log.hpp"
#include "beacon/core/networking/asio_helpers.hpp"
#include "beacon/core/networking/exceptions.hpp"
#include "beacon/core/utils/string.hpp"
#include "beacon/core/utils/thread.hpp"

using namespace beacon::discovery;
using namespace beacon::networking;
using namespace beacon::utils;

Publisher::Publisher(config::PublisherConfig config)
    : logger_("PUB"), config_(std::move(config)), message_(config_.message) {
    config_.validate();
}

Publisher::~Publisher() {
    try {
        stop();
    } catch(const ShutdownTimeoutError& error) {
        LOG(logger_, WARNING) << error.what();
    } catch(const std::exception& error) {
        LOG(logger_, CRITICAL) << "Failed to stop publisher: " << error.what();
    }
}

void Publisher::start() {
    const std::lock_guard state_lock {state_mutex_};
    if(status_ == RoleStatus::RUNNING) {
        throw AlreadyRunningError("Publisher");
    }

    // Collect worker which failed or did not stop in time
    if(send_thread_.joinable()) {
        send_thread_.join();
    }

    socket_ = open_socket();

    {
        const std::lock_guard worker_lock {worker_mutex_};
        worker_done_ = false;
    }
    status_ = RoleStatus::RUNNING;
    send_thread_ = std::jthread(std::bind_front(&Publisher::loop, this));
    set_thread_name(send_thread_, "Publisher");

    LOG(logger_, INFO) << "Publishing to " << to_endpoint_string(parse_multicast_group(config_.group), config_.port)
                       << " every " << to_string(config_.interval);
}

void Publisher::stop(Clock::duration timeout) {
    const std::lock_guard state_lock {state_mutex_};
    if(!send_thread_.joinable()) {
        return;
    }

    send_thread_.request_stop();

    std::unique_lock worker_lock {worker_mutex_};
    const auto finished = worker_cv_.wait_for(worker_lock, timeout, [this]() { return worker_done_; });
    worker_lock.unlock();

    status_ = RoleStatus::STOPPED;
    if(!finished) {
        throw ShutdownTimeoutError("Publisher", timeout);
    }

    send_thread_.join();
    LOG(logger_, DEBUG) << "Publisher stopped";
}

std::unique_ptr<MulticastSender> Publisher::open_socket() {
    const auto group = parse_multicast_group(config_.group);
    std::optional<asio::ip::address_v4> interface_address {};
    if(!config_.interface.empty()) {
        interface_address = resolve_interface_address(config_.interface);
    }
    return std::make_unique<MulticastSender>(group, config_.port, config_.ttl, interface_address);
}

bool Publisher::reopen_socket() {
    socket_->close();
    try {
        socket_ = open_socket();
    } catch(const NetworkError& error) {
        metrics_.recordError();
        LOG(logger_, CRITICAL) << "Failed to reopen socket: " << error.what() << ", stopping publisher";
        return false;
    }
    LOG(logger_, INFO) << "Socket reopened";
    return true;
}

void Publisher::updateMessage(std::vector<std::byte> message) {
    const std::lock_guard message_lock {message_mutex_};
    message_ = std::move(message);
}

std::vector<std::byte> Publisher::getMessage() const {
    const std::lock_guard message_lock {message_mutex_};
    return message_;
}

void Publisher::send_message() {
    const auto message = getMessage();
    try {
        const auto length = socket_->sendMessage(message);
        metrics_.recordSent(length);
        LOG(logger_, TRACE) << "Sent " << length << " bytes";
    } catch(const SendError& error) {
        metrics_.recordError();
        LOG_N(logger_, WARNING, 5) << error.what();
    }
}

void Publisher::loop(const std::stop_token& stop_token) {
    {
        // Notify condition variable when stop is requested
        const auto wake_up = [&]() {
            const std::lock_guard message_lock {message_mutex_};
            cv_.notify_all();
        };
        const std::stop_callback stop_callback {stop_token, wake_up};

        auto next_send = Clock::now() + config_.interval;

        while(!stop_token.stop_requested()) {
            {
                std::unique_lock message_lock {message_mutex_};
                // Wait until the next send is due or stop is requested
                cv_.wait_until(message_lock, next_send, [&]() { return stop_token.stop_requested(); });
            }
            if(stop_token.stop_requested()) {
                break;
            }

            try {
                send_message();
            } catch(const SocketFatalError& error) {
                metrics_.recordError();
                LOG(logger_, WARNING) << error.what() << ", reopening socket";
                if(!reopen_socket()) {
                    break;
                }
            }

            // Keep a fixed cadence but do not burst after falling behind
            next_send += config_.interval;
            const auto now = Clock::now();
            if(next_send < now) {
                next_send = now + config_.interval;
            }
        }
    }

    socket_->close();
    status_ = RoleStatus::STOPPED;

    const std::lock_guard worker_lock {worker_mutex_};
    worker_done_ = true;
    worker_cv_.notify_all();
}
