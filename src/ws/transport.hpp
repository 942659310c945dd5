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

// Switchyard Transport - Header
// Message-oriented duplex channel to one gateway instance

#pragma once

#include <chrono>
#include <cstdint>
#include <functional>
#include <string>
#include <string_view>
#include <system_error>

namespace switchyard::ws {

enum class MessageType : uint8_t { Text, Binary };

/// Abstract duplex channel. Production uses WebSocketTransport; tests use fakes.
///
/// Thread-safety contract: send/send_ping/close may be called from any thread
/// concurrently with a single reader calling read_message.
class Transport {
public:
    virtual ~Transport() = default;

    /// Send one text message
    [[nodiscard]] virtual std::error_code send(std::string_view message) = 0;

    /// Send a close frame (code + reason) and tear the channel down. Idempotent.
    virtual std::error_code close(uint16_t code, std::string_view reason) = 0;

    /// Bound the time a read_message call may block (zero disables)
    [[nodiscard]] virtual std::error_code set_read_timeout(std::chrono::milliseconds timeout) = 0;

    /// Bound the time a send may block (zero disables)
    [[nodiscard]] virtual std::error_code set_write_timeout(std::chrono::milliseconds timeout) = 0;

    /// Callback invoked (on the reader thread) whenever a pong arrives
    virtual void set_pong_handler(std::function<void()> handler) = 0;

    [[nodiscard]] virtual std::error_code send_ping() = 0;

    /// Block until the next complete data message.
    /// Errors: websocket_close_category (peer or local close, value = close code),
    /// Errc::protocol_error / Errc::payload_too_large, or a system error.
    [[nodiscard]] virtual std::error_code read_message(MessageType& type, std::string& payload) = 0;
};

}  // namespace switchyard::ws
