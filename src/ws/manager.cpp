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

// Switchyard Connection Manager - Implementation

#include "manager.hpp"

#include <thread>

#include "../core/errors.hpp"
#include "../core/logging.hpp"
#include "../http/websocket.hpp"

namespace switchyard::ws {

using http::WebSocketCloseCode::GOING_AWAY;
using http::WebSocketCloseCode::NORMAL_CLOSURE;

Manager::Manager(ManagerConfig config, quill::Logger* logger)
    : config_(config), logger_(logger) {
    LOG_INFO(logger_,
             "Connection manager initialized: max_connections={}, heartbeat_interval_ms={}, "
             "heartbeat_timeout_ms={}",
             config_.max_connections, config_.heartbeat_interval.count(),
             config_.heartbeat_timeout.count());
}

Manager::~Manager() {
    shutdown();
}

ConnectionPtr Manager::register_connection(std::string_view gateway_id,
                                           std::unique_ptr<Transport>& transport,
                                           std::string_view auth_token,
                                           std::error_code& error_out) {
    error_out.clear();
    ConnectionPtr connection;
    size_t count = 0;

    {
        std::unique_lock lock(mutex_);

        if (shutting_down_.load(std::memory_order_acquire)) {
            error_out = core::Errc::shutting_down;
            return nullptr;
        }

        if (connection_count_ >= config_.max_connections) {
            LOG_WARNING(logger_,
                        "Connection rejected: max connections reached: gateway_id={}, max={}",
                        gateway_id, config_.max_connections);
            error_out = core::Errc::capacity_exceeded;
            return nullptr;
        }

        connection = std::make_shared<Connection>(std::string(gateway_id), logging::generate_uuid(),
                                                  std::move(transport), std::string(auth_token));

        connections_[std::string(gateway_id)].push_back(connection);
        count = ++connection_count_;

        // Registered under the lock so shutdown() always waits for this task
        heartbeats_.add();
    }

    // Weak reference: the transport (owned by the connection) holds the handler
    std::weak_ptr<Connection> weak = connection;
    connection->transport().set_pong_handler([weak] {
        if (auto conn = weak.lock()) {
            conn->update_heartbeat();
        }
    });

    try {
        std::thread(&Manager::run_heartbeat, this, connection).detach();
    } catch (const std::system_error& e) {
        heartbeats_.done();
        LOG_ERROR(logger_, "Failed to start heartbeat: gateway_id={}, connection_id={}, error={}",
                  gateway_id, connection->connection_id(), e.what());
        unregister_connection(gateway_id, connection->connection_id());
        error_out = e.code();
        return nullptr;
    }

    LOG_INFO(logger_, "Gateway connection registered: gateway_id={}, connection_id={}, total={}",
             gateway_id, connection->connection_id(), count);
    return connection;
}

void Manager::unregister_connection(std::string_view gateway_id, std::string_view connection_id) {
    ConnectionPtr removed;
    size_t remaining = 0;

    {
        std::unique_lock lock(mutex_);

        auto it = connections_.find(std::string(gateway_id));
        if (it == connections_.end()) {
            return;
        }

        auto& list = it->second;
        for (auto conn_it = list.begin(); conn_it != list.end(); ++conn_it) {
            if ((*conn_it)->connection_id() == connection_id) {
                removed = std::move(*conn_it);
                list.erase(conn_it);
                break;
            }
        }

        if (!removed) {
            return;
        }

        if (list.empty()) {
            connections_.erase(it);
        }
        remaining = --connection_count_;
    }

    // Close outside the registry lock
    if (auto ec = removed->close(NORMAL_CLOSURE, "normal closure")) {
        LOG_DEBUG(logger_, "Close after unregister failed: connection_id={}, error={}",
                  connection_id, ec.message());
    }
    notify_heartbeats();

    LOG_INFO(logger_, "Gateway connection unregistered: gateway_id={}, connection_id={}, total={}",
             gateway_id, connection_id, remaining);
}

std::vector<ConnectionPtr> Manager::get_connections(std::string_view gateway_id) const {
    std::shared_lock lock(mutex_);
    auto it = connections_.find(std::string(gateway_id));
    if (it == connections_.end()) {
        return {};
    }
    return it->second;
}

size_t Manager::get_connection_count() const {
    std::shared_lock lock(mutex_);
    return connection_count_;
}

std::vector<std::string> Manager::get_all_gateway_ids() const {
    std::shared_lock lock(mutex_);
    std::vector<std::string> ids;
    ids.reserve(connections_.size());
    for (const auto& [gateway_id, list] : connections_) {
        ids.push_back(gateway_id);
    }
    return ids;
}

ManagerStats Manager::get_stats() const {
    std::shared_lock lock(mutex_);
    ManagerStats stats;
    stats.total_connections = connection_count_;
    stats.total_gateways = connections_.size();
    for (const auto& [gateway_id, list] : connections_) {
        for (const auto& conn : list) {
            stats.total_events_sent += conn->stats().total_sent();
            stats.total_failed_events += conn->stats().failed_deliveries();
        }
    }
    return stats;
}

void Manager::shutdown() {
    if (shutting_down_.exchange(true, std::memory_order_acq_rel)) {
        return;
    }

    LOG_INFO(logger_, "Shutting down connection manager");
    notify_heartbeats();

    std::vector<ConnectionPtr> all;
    {
        std::unique_lock lock(mutex_);
        for (auto& [gateway_id, list] : connections_) {
            all.insert(all.end(), list.begin(), list.end());
        }
        connections_.clear();
        connection_count_ = 0;
    }

    for (const auto& conn : all) {
        if (auto ec = conn->close(GOING_AWAY, "server shutdown")) {
            LOG_DEBUG(logger_, "Close during shutdown failed: connection_id={}, error={}",
                      conn->connection_id(), ec.message());
        }
    }

    heartbeats_.wait();
    LOG_INFO(logger_, "Connection manager stopped: closed_connections={}", all.size());
}

void Manager::notify_heartbeats() {
    {
        // Empty critical section orders the notify after any waiter's predicate check
        std::lock_guard lock(heartbeat_mutex_);
    }
    heartbeat_cv_.notify_all();
}

bool Manager::wait_for_tick(const Connection& connection) {
    // is_closed() is lock-free; no connection lock nests under heartbeat_mutex_
    std::unique_lock lock(heartbeat_mutex_);
    bool stopped = heartbeat_cv_.wait_for(lock, config_.heartbeat_interval, [&] {
        return shutting_down_.load(std::memory_order_acquire) || connection.is_closed();
    });
    return !stopped;
}

void Manager::run_heartbeat(ConnectionPtr connection) {
    const auto& gateway_id = connection->gateway_id();
    const auto& connection_id = connection->connection_id();

    while (wait_for_tick(*connection)) {
        auto silence = std::chrono::steady_clock::now() - connection->last_heartbeat();
        if (silence > config_.heartbeat_timeout) {
            LOG_WARNING(logger_,
                        "Heartbeat timeout: gateway_id={}, connection_id={}, silence_ms={}",
                        gateway_id, connection_id,
                        std::chrono::duration_cast<std::chrono::milliseconds>(silence).count());
            unregister_connection(gateway_id, connection_id);
            break;
        }

        if (auto ec = connection->send_ping()) {
            LOG_ERROR(logger_, "Failed to send ping: gateway_id={}, connection_id={}, error={}",
                      gateway_id, connection_id, ec.message());
            unregister_connection(gateway_id, connection_id);
            break;
        }
    }

    heartbeats_.done();
}

}  // namespace switchyard::ws
