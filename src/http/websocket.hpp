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

// Switchyard WebSocket - Header
// WebSocket handshake and framing (RFC 6455), server side

#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace switchyard::http {

struct Request;

/// WebSocket frame opcodes (RFC 6455 §5.2)
namespace WebSocketOpcode {
constexpr uint8_t CONTINUATION = 0x0;
constexpr uint8_t TEXT = 0x1;
constexpr uint8_t BINARY = 0x2;
constexpr uint8_t CLOSE = 0x8;
constexpr uint8_t PING = 0x9;
constexpr uint8_t PONG = 0xA;
}  // namespace WebSocketOpcode

/// WebSocket close status codes (RFC 6455 §7.4)
namespace WebSocketCloseCode {
constexpr uint16_t NORMAL_CLOSURE = 1000;
constexpr uint16_t GOING_AWAY = 1001;             // Server shutdown
constexpr uint16_t PROTOCOL_ERROR = 1002;
constexpr uint16_t UNSUPPORTED_DATA = 1003;
constexpr uint16_t NO_STATUS_RECEIVED = 1005;     // Reserved, never sent
constexpr uint16_t ABNORMAL_CLOSURE = 1006;       // Reserved, never sent
constexpr uint16_t INVALID_FRAME_PAYLOAD = 1007;
constexpr uint16_t POLICY_VIOLATION = 1008;
constexpr uint16_t MESSAGE_TOO_BIG = 1009;
constexpr uint16_t INTERNAL_SERVER_ERROR = 1011;
constexpr uint16_t TRY_AGAIN_LATER = 1013;        // Capacity exhausted
}  // namespace WebSocketCloseCode

/// Decoded WebSocket frame (payload already unmasked)
struct WebSocketFrame {
    bool fin = false;
    uint8_t opcode = 0;
    bool masked = false;
    uint64_t payload_length = 0;
    std::span<const uint8_t> payload;  // View into the parser's buffer

    [[nodiscard]] constexpr bool is_control_frame() const noexcept {
        return opcode >= 0x8;
    }
};

/// Close frame payload (status code + UTF-8 reason)
struct ClosePayload {
    uint16_t code = WebSocketCloseCode::NO_STATUS_RECEIVED;
    std::string reason;
};

/// WebSocket handshake validation and frame builders
class WebSocketUtils {
public:
    /// Compute Sec-WebSocket-Accept header value (RFC 6455 §4.2.2)
    /// Accept-Value = Base64(SHA1(Key + "258EAFA5-E914-47DA-95CA-C5AB0DC85B11"))
    [[nodiscard]] static std::string compute_accept_key(std::string_view sec_websocket_key);

    /// Validate WebSocket upgrade request headers
    [[nodiscard]] static bool is_valid_upgrade_request(const Request& request);

    /// Create 101 Switching Protocols response
    [[nodiscard]] static std::string create_upgrade_response(std::string_view accept_key);

    /// Unmask WebSocket payload in place (client→server frames)
    static void unmask_payload(std::span<uint8_t> payload, uint32_t masking_key);

    /// Server frames are never masked
    [[nodiscard]] static std::vector<uint8_t> create_text_frame(std::string_view text);

    [[nodiscard]] static std::vector<uint8_t> create_close_frame(uint16_t status_code,
                                                                 std::string_view reason);

    /// Create WebSocket pong frame (echoes the ping payload)
    [[nodiscard]] static std::vector<uint8_t> create_pong_frame(
        std::span<const uint8_t> ping_payload);

    [[nodiscard]] static std::vector<uint8_t> create_ping_frame(
        std::span<const uint8_t> payload = {});

    /// Decode a close frame payload; nullopt if it is 1 byte long (invalid)
    [[nodiscard]] static std::optional<ClosePayload> parse_close_payload(
        std::span<const uint8_t> payload);

    /// Encode WebSocket frame header
    static void encode_frame_header(std::vector<uint8_t>& buffer, bool fin, uint8_t opcode,
                                    bool mask, uint64_t payload_length, uint32_t masking_key = 0);
};

/// Incremental WebSocket frame parser
///
/// Feed bytes as they arrive; a Complete result hands out one frame whose
/// payload stays valid until the next call to reset().
class WebSocketFrameParser {
public:
    enum class ParseResult {
        Complete,    // Full frame parsed successfully
        Incomplete,  // Need more data (partial frame)
        Error        // Protocol violation (close connection)
    };

    /// Reasons for an Error result
    enum class ParseError : uint8_t {
        None,
        ReservedOpcode,
        ReservedBits,
        FragmentedControl,
        ControlTooLarge,
        InvalidLength,
        UnmaskedFrame,
        FrameTooLarge,
    };

    /// @param max_payload Largest accepted frame payload
    /// @param require_mask Reject unmasked frames (server side, RFC 6455 §5.1)
    explicit WebSocketFrameParser(uint64_t max_payload = 1024 * 1024, bool require_mask = true);
    ~WebSocketFrameParser() = default;

    /// Parse WebSocket frame from data
    /// @param data Input data buffer
    /// @param out_frame Parsed frame (only valid if result is Complete)
    /// @param consumed Number of bytes consumed from input
    [[nodiscard]] ParseResult parse(std::span<const uint8_t> data, WebSocketFrame& out_frame,
                                    size_t& consumed);

    /// Reset parser state (after each Complete frame)
    void reset();

    [[nodiscard]] ParseError last_error() const noexcept { return error_; }

    [[nodiscard]] const char* state_name() const noexcept;

private:
    enum class State {
        ReadHeader,         // Initial 2 bytes
        ReadExtendedLength, // 16- or 64-bit extended length
        ReadMaskingKey,     // 4-byte masking key
        ReadPayload,
        Complete
    };

    /// Copy bytes from data into buffer_ until it holds 'target' bytes
    /// @return true once buffer_ is filled to target
    bool fill_to(size_t target, std::span<const uint8_t> data, size_t& offset);

    ParseResult fail(ParseError error) noexcept;

    /// Validate the first two header bytes and pick the next state
    ParseResult decode_base_header();

    const uint64_t max_payload_;
    const bool require_mask_;

    State state_ = State::ReadHeader;
    ParseError error_ = ParseError::None;
    std::vector<uint8_t> buffer_;

    bool fin_ = false;
    uint8_t opcode_ = 0;
    bool masked_ = false;
    uint64_t payload_length_ = 0;
    uint32_t masking_key_ = 0;
    size_t header_size_ = 0;
};

}  // namespace switchyard::http
