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

// Switchyard Admin Server - Header
// Lightweight HTTP server for operator endpoints (health, stats, event push)
// Binds to loopback only, NOT exposed to gateways

#pragma once

#include <quill/Logger.h>

#include <atomic>
#include <cstddef>
#include <cstdint>
#include <string>
#include <system_error>

#include "../control/config.hpp"
#include "../http/http.hpp"

namespace switchyard::ws {
class Manager;
}

namespace switchyard::events {
class EventBroadcaster;
}

namespace switchyard::core {

/// Response produced by the admin routes
struct AdminResponse {
    http::StatusCode status = http::StatusCode::OK;
    std::string content_type = "application/json";
    std::string body;
};

/// Serves /health, /stats and POST /_admin/events.
/// Uses simple blocking I/O, one request at a time (not performance-critical)
class AdminServer {
public:
    static constexpr size_t MAX_REQUEST_SIZE = 2 * 1024 * 1024;

    AdminServer(const control::AdminConfig& config, ws::Manager& manager,
                events::EventBroadcaster& broadcaster, quill::Logger* logger);
    ~AdminServer();

    // Non-copyable, non-movable
    AdminServer(const AdminServer&) = delete;
    AdminServer& operator=(const AdminServer&) = delete;

    /// Bind 127.0.0.1:<admin.port> and listen
    [[nodiscard]] std::error_code start();

    void stop();

    /// Run accept loop (blocking, call in separate thread)
    void run();

    [[nodiscard]] bool is_running() const noexcept {
        return running_.load(std::memory_order_relaxed);
    }

    [[nodiscard]] uint16_t port() const noexcept;

    /// Route one parsed request
    [[nodiscard]] AdminResponse handle_request(const http::Request& request);

private:
    void handle_connection(int client_fd);

    AdminResponse handle_publish_event(const http::Request& request);

    const control::AdminConfig config_;
    ws::Manager& manager_;
    events::EventBroadcaster& broadcaster_;
    quill::Logger* logger_;

    int listen_fd_ = -1;
    std::atomic<bool> running_{false};
};

}  // namespace switchyard::core
