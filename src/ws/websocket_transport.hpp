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

// Switchyard WebSocket Transport - Header
// Blocking RFC 6455 transport over an upgraded TCP socket

#pragma once

#include <atomic>
#include <cstddef>
#include <cstdint>
#include <mutex>
#include <span>
#include <string_view>
#include <vector>

#include "../http/websocket.hpp"
#include "transport.hpp"

namespace switchyard::ws {

class WebSocketTransport final : public Transport {
public:
    /// Take ownership of an upgraded socket
    /// @param fd Connected socket (closed by the destructor)
    /// @param max_message_size Largest accepted (reassembled) message
    /// @param buffered Bytes read past the handshake, parsed before the socket
    WebSocketTransport(int fd, size_t max_message_size, std::vector<uint8_t> buffered = {});
    ~WebSocketTransport() override;

    // Non-copyable, non-movable
    WebSocketTransport(const WebSocketTransport&) = delete;
    WebSocketTransport& operator=(const WebSocketTransport&) = delete;

    [[nodiscard]] std::error_code send(std::string_view message) override;
    std::error_code close(uint16_t code, std::string_view reason) override;
    [[nodiscard]] std::error_code set_read_timeout(std::chrono::milliseconds timeout) override;
    [[nodiscard]] std::error_code set_write_timeout(std::chrono::milliseconds timeout) override;
    void set_pong_handler(std::function<void()> handler) override;
    [[nodiscard]] std::error_code send_ping() override;
    [[nodiscard]] std::error_code read_message(MessageType& type, std::string& payload) override;

    [[nodiscard]] int native_handle() const noexcept { return fd_; }

private:
    /// Serialize whole frames onto the socket (broadcasts, pings, control replies).
    /// connection_closed once the close frame is out: nothing may follow it.
    std::error_code write_frame(std::span<const uint8_t> frame);

    /// Write the one close frame this side sends
    std::error_code write_close_frame(uint16_t code, std::string_view reason);

    /// Read the next frame into current_; Incomplete never escapes
    std::error_code read_frame(http::WebSocketFrame& frame);

    /// Error to report once the socket is gone
    std::error_code closed_error() const noexcept;

    int fd_;
    const size_t max_message_size_;

    std::mutex write_mutex_;
    bool close_written_ = false;  // Guarded by write_mutex_
    std::atomic<bool> close_sent_{false};
    std::atomic<uint16_t> close_code_{http::WebSocketCloseCode::ABNORMAL_CLOSURE};

    std::mutex handler_mutex_;
    std::function<void()> pong_handler_;

    // Reader state (reader thread only)
    http::WebSocketFrameParser parser_;
    std::vector<uint8_t> pending_;  // Received, not yet parsed
};

}  // namespace switchyard::ws
