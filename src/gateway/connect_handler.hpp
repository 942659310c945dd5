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

// Switchyard Connect Handler - Header
// Gateway WebSocket endpoint: admission, upgrade, registration and read loop

#pragma once

#include <quill/Logger.h>

#include <chrono>
#include <cstddef>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "../http/http.hpp"
#include "../store/gateway_store.hpp"
#include "../ws/connection.hpp"
#include "../ws/transport.hpp"

namespace switchyard::ws {
class Manager;
}

namespace switchyard::gateway {

class SlidingWindowRateLimiter;

struct ConnectHandlerConfig {
    std::string ws_path = "/api/internal/v1/ws/gateways/connect";
    std::chrono::milliseconds handshake_timeout{10000};  // Also bounds each later socket write
    size_t max_handshake_bytes = 16384;
    size_t max_message_size = 1024 * 1024;
};

/// HTTP answer for a refused connect attempt
struct ConnectRejection {
    http::StatusCode status = http::StatusCode::BadRequest;
    std::string error;
    std::string message;
};

/// Serves one gateway socket from the upgrade request until the channel closes.
///
/// Runs on a dedicated handler thread; handle() blocks for the lifetime of
/// the connection.
class ConnectHandler {
public:
    ConnectHandler(ConnectHandlerConfig config, ws::Manager& manager,
                   std::shared_ptr<store::GatewayStore> store,
                   SlidingWindowRateLimiter& rate_limiter, quill::Logger* logger);

    /// Take ownership of an accepted socket and serve it to completion
    void handle(int client_fd, std::string_view remote_address);

    /// Admission checks, in order: path, method, rate limit, api-key
    /// presence, api-key validity, upgrade headers.
    /// @return the authenticated gateway, or nullopt with rejection filled in
    [[nodiscard]] std::optional<store::GatewayRecord> authorize(const http::Request& request,
                                                                std::string_view remote_address,
                                                                ConnectRejection& rejection);

    /// Register an upgraded transport, acknowledge it, mark the gateway
    /// active and read until the channel closes. Unregisters and marks the
    /// gateway inactive afterwards.
    void run_session(const std::string& gateway_id, std::unique_ptr<ws::Transport> transport,
                     std::string_view api_key);

    [[nodiscard]] const ConnectHandlerConfig& config() const noexcept { return config_; }

private:
    /// Read until the request headers are complete.
    /// @return false if the socket was answered or dropped already
    bool read_upgrade_request(int fd, std::vector<uint8_t>& buffer);

    /// Drain inbound messages; returns when the channel closes
    void read_loop(ws::Connection& connection);

    void reject(int fd, const ConnectRejection& rejection);

    void set_active(const std::string& gateway_id, bool active);

    const ConnectHandlerConfig config_;
    ws::Manager& manager_;
    std::shared_ptr<store::GatewayStore> store_;
    SlidingWindowRateLimiter& rate_limiter_;
    quill::Logger* logger_;
};

}  // namespace switchyard::gateway
