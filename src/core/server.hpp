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

// Switchyard Server - Header
// Blocking accept loop with one handler thread per connection

#pragma once

#include <quill/Logger.h>

#include <atomic>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <string>
#include <system_error>

#include "wait_group.hpp"

namespace switchyard::core {

struct ServerOptions {
    std::string address = "0.0.0.0";
    uint16_t port = 9243;  // 0 picks an ephemeral port
    int backlog = 128;
};

/// Takes ownership of the accepted fd
using ConnectionHandler = std::function<void(int client_fd, std::string remote_address)>;

class Server {
public:
    Server(ServerOptions options, ConnectionHandler handler, quill::Logger* logger);
    ~Server();

    // Non-copyable, non-movable
    Server(const Server&) = delete;
    Server& operator=(const Server&) = delete;

    /// Bind and listen
    [[nodiscard]] std::error_code start();

    /// Accept until stop() (blocking, call in separate thread)
    void run();

    /// Stop accepting; handlers already running are not interrupted
    void stop();

    /// Block until every handler thread has returned
    void wait_for_handlers();

    [[nodiscard]] bool is_running() const noexcept {
        return running_.load(std::memory_order_relaxed);
    }

    /// Bound port (useful when started with port 0)
    [[nodiscard]] uint16_t port() const noexcept;

    [[nodiscard]] size_t active_handlers() const { return handlers_.pending(); }

private:
    void serve(int client_fd, std::string remote_address);

    const ServerOptions options_;
    ConnectionHandler handler_;
    quill::Logger* logger_;

    int listen_fd_ = -1;
    std::atomic<bool> running_{false};
    WaitGroup handlers_;
};

}  // namespace switchyard::core
