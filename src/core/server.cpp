/*
 * Copyright 2025 Switchyard Contributors
 *
 * Licensed under the Apache License, Version 2.0 (the "License");
 * you may not use this file except in compliance with the License.
 * You may obtain a copy of the License at
 *
 *     http://www.apache.org/licenses/LICENSE-2.0
 *
 * Unless required by applicable law or agreed to in writing, software
 * distributed under the License is distributed on an "AS IS" BASIS,
 * WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
 * See the License for the specific language governing permissions and
 * limitations under the License.
 */

// Switchyard Server - Implementation

#include "server.hpp"

#include <quill/LogMacros.h>

#include <sys/socket.h>

#include <cerrno>
#include <exception>
#include <thread>
#include <utility>

#include "socket.hpp"

namespace switchyard::core {

Server::Server(ServerOptions options, ConnectionHandler handler, quill::Logger* logger)
    : options_(std::move(options)), handler_(std::move(handler)), logger_(logger) {}

Server::~Server() {
    stop();
    wait_for_handlers();
    close_fd(listen_fd_);
}

std::error_code Server::start() {
    if (running_.load(std::memory_order_relaxed)) {
        return std::make_error_code(std::errc::operation_in_progress);
    }

    listen_fd_ = create_listening_socket(options_.address, options_.port, options_.backlog);
    if (listen_fd_ < 0) {
        return std::error_code(errno, std::generic_category());
    }

    running_.store(true, std::memory_order_relaxed);
    LOG_INFO(logger_, "Listening on {}:{}", options_.address, port());
    return {};
}

void Server::stop() {
    if (!running_.exchange(false)) {
        return;
    }
    // Wakes the accept() in run(); the fd is released by the destructor
    shutdown_fd(listen_fd_);
}

void Server::run() {
    while (running_.load(std::memory_order_relaxed)) {
        int client_fd = ::accept(listen_fd_, nullptr, nullptr);
        if (client_fd < 0) {
            if (errno == EINTR) {
                continue;
            }
            if (!running_.load(std::memory_order_relaxed)) {
                break;
            }
            LOG_WARNING(logger_, "accept failed: {}",
                        std::error_code(errno, std::generic_category()).message());
            continue;
        }

        std::string remote = peer_address(client_fd);
        handlers_.add();
        try {
            std::thread(&Server::serve, this, client_fd, std::move(remote)).detach();
        } catch (const std::system_error& e) {
            LOG_ERROR(logger_, "Failed to start connection handler: {}", e.what());
            handlers_.done();
            close_fd(client_fd);
        }
    }
}

void Server::serve(int client_fd, std::string remote_address) {
    try {
        handler_(client_fd, std::move(remote_address));
    } catch (const std::exception& e) {
        LOG_ERROR(logger_, "Connection handler failed: {}", e.what());
    }
    handlers_.done();
}

void Server::wait_for_handlers() {
    handlers_.wait();
}

uint16_t Server::port() const noexcept {
    return listen_fd_ >= 0 ? local_port(listen_fd_) : 0;
}

}  // namespace switchyard::core
