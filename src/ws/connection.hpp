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

// Switchyard Connection - Header
// One authenticated channel to one gateway instance

#pragma once

#include <atomic>
#include <chrono>
#include <cstdint>
#include <memory>
#include <nlohmann/json.hpp>
#include <shared_mutex>
#include <string>
#include <string_view>
#include <system_error>

#include "delivery_stats.hpp"
#include "transport.hpp"

namespace switchyard::ws {

/// A live gateway connection.
///
/// Owns its transport exclusively. Sends hold the reader/writer lock shared for
/// the whole transport call and close takes it exclusively, so a send never
/// interleaves with close. The closed flag is written under that lock but read
/// without it, so is_closed() never waits behind a slow transport close.
class Connection {
public:
    Connection(std::string gateway_id, std::string connection_id,
               std::unique_ptr<Transport> transport, std::string auth_token);
    ~Connection() = default;

    // Non-copyable, non-movable
    Connection(const Connection&) = delete;
    Connection& operator=(const Connection&) = delete;

    /// Send one text message. Does not touch DeliveryStats.
    /// @return connection_closed if closed, otherwise the transport's result
    [[nodiscard]] std::error_code send(std::string_view message);

    /// Send a ping through the transport (connection_closed if closed)
    [[nodiscard]] std::error_code send_ping();

    /// Close the transport with a status code. Idempotent: later calls return success.
    std::error_code close(uint16_t code, std::string_view reason);

    void update_heartbeat();

    [[nodiscard]] std::chrono::steady_clock::time_point last_heartbeat() const;

    /// True once close() has started. Lock-free; safe under other locks.
    [[nodiscard]] bool is_closed() const noexcept;

    [[nodiscard]] const std::string& gateway_id() const noexcept { return gateway_id_; }
    [[nodiscard]] const std::string& connection_id() const noexcept { return connection_id_; }
    [[nodiscard]] const std::string& auth_token() const noexcept { return auth_token_; }

    [[nodiscard]] std::chrono::system_clock::time_point connected_at() const noexcept {
        return connected_at_;
    }

    [[nodiscard]] DeliveryStats& stats() noexcept { return stats_; }
    [[nodiscard]] const DeliveryStats& stats() const noexcept { return stats_; }

    /// Reader-side access (read loop, pong handler installation)
    [[nodiscard]] Transport& transport() noexcept { return *transport_; }

    /// Snapshot for logs and the admin API
    [[nodiscard]] nlohmann::json info() const;

    /// "Connection{gateway=..., id=..., closed=...}"
    [[nodiscard]] std::string to_string() const;

private:
    const std::string gateway_id_;
    const std::string connection_id_;
    const std::string auth_token_;
    const std::chrono::system_clock::time_point connected_at_;
    const std::unique_ptr<Transport> transport_;

    mutable std::shared_mutex mutex_;
    std::chrono::steady_clock::time_point last_heartbeat_;
    std::atomic<bool> closed_{false};

    DeliveryStats stats_;
};

using ConnectionPtr = std::shared_ptr<Connection>;

}  // namespace switchyard::ws
