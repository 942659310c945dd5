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

// Switchyard Connection Manager - Header
// Registry of live gateway connections with per-connection heartbeat supervision

#pragma once

#include <quill/Logger.h>

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <mutex>
#include <nlohmann/json.hpp>
#include <shared_mutex>
#include <string>
#include <string_view>
#include <system_error>
#include <vector>

#include "../core/containers.hpp"
#include "../core/wait_group.hpp"
#include "connection.hpp"
#include "transport.hpp"

namespace switchyard::ws {

struct ManagerConfig {
    size_t max_connections = 1000;
    std::chrono::milliseconds heartbeat_interval{20000};
    std::chrono::milliseconds heartbeat_timeout{30000};
};

struct ManagerStats {
    size_t total_connections = 0;
    size_t total_gateways = 0;
    uint64_t total_events_sent = 0;
    uint64_t total_failed_events = 0;
};

inline void to_json(nlohmann::json& j, const ManagerStats& s) {
    j = nlohmann::json{{"totalConnections", s.total_connections},
                       {"totalGateways", s.total_gateways},
                       {"totalEventsSent", s.total_events_sent},
                       {"totalFailedEvents", s.total_failed_events}};
}

/// Connection registry keyed by gateway ID.
///
/// A gateway may hold several connections (one per instance). Every
/// registered connection gets a heartbeat thread which pings it each
/// interval and unregisters it once no pong arrived within the timeout.
class Manager {
public:
    Manager(ManagerConfig config, quill::Logger* logger);
    ~Manager();

    // Non-copyable, non-movable
    Manager(const Manager&) = delete;
    Manager& operator=(const Manager&) = delete;

    /// Register a new connection and start its heartbeat.
    /// On capacity_exceeded / shutting_down the transport is left with the
    /// caller, who must close it.
    [[nodiscard]] ConnectionPtr register_connection(std::string_view gateway_id,
                                                    std::unique_ptr<Transport>& transport,
                                                    std::string_view auth_token,
                                                    std::error_code& error_out);

    /// Remove one connection and close it with 1000. No-op if absent.
    void unregister_connection(std::string_view gateway_id, std::string_view connection_id);

    /// Snapshot of a gateway's connections (empty if none)
    [[nodiscard]] std::vector<ConnectionPtr> get_connections(std::string_view gateway_id) const;

    [[nodiscard]] size_t get_connection_count() const;

    [[nodiscard]] std::vector<std::string> get_all_gateway_ids() const;

    [[nodiscard]] ManagerStats get_stats() const;

    /// Close every connection with 1001 and wait for all heartbeat threads.
    /// Idempotent.
    void shutdown();

    [[nodiscard]] bool is_shutting_down() const noexcept {
        return shutting_down_.load(std::memory_order_acquire);
    }

    [[nodiscard]] const ManagerConfig& config() const noexcept { return config_; }

private:
    void run_heartbeat(ConnectionPtr connection);

    /// Sleep one heartbeat interval.
    /// @return false if the manager is shutting down or the connection closed
    bool wait_for_tick(const Connection& connection);

    /// Wake every heartbeat thread
    void notify_heartbeats();

    const ManagerConfig config_;
    quill::Logger* logger_;

    mutable std::shared_mutex mutex_;
    core::fast_map<std::string, std::vector<ConnectionPtr>> connections_;
    size_t connection_count_ = 0;

    std::atomic<bool> shutting_down_{false};
    std::mutex heartbeat_mutex_;
    std::condition_variable heartbeat_cv_;
    core::WaitGroup heartbeats_;
};

}  // namespace switchyard::ws
