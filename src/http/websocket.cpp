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

// Switchyard WebSocket - Implementation

#include "websocket.hpp"

#include <openssl/sha.h>

#include <algorithm>
#include <cctype>

#include "../crypto/credential_vault.hpp"
#include "http.hpp"

namespace switchyard::http {

namespace {

/// Magic GUID for WebSocket handshake (RFC 6455 §4.2.2)
constexpr std::string_view WEBSOCKET_GUID = "258EAFA5-E914-47DA-95CA-C5AB0DC85B11";

/// Case-insensitive substring search (Connection may list several tokens)
bool contains_ci(std::string_view haystack, std::string_view needle) {
    auto it = std::search(haystack.begin(), haystack.end(), needle.begin(), needle.end(),
                          [](char ch1, char ch2) {
                              return std::tolower(static_cast<unsigned char>(ch1)) ==
                                     std::tolower(static_cast<unsigned char>(ch2));
                          });
    return it != haystack.end();
}

bool equals_ci(std::string_view a, std::string_view b) {
    return header_name_equals(a, b);
}

}  // namespace

// ========================================
// WebSocketUtils Implementation
// ========================================

std::string WebSocketUtils::compute_accept_key(std::string_view sec_websocket_key) {
    std::string concat;
    concat.reserve(sec_websocket_key.size() + WEBSOCKET_GUID.size());
    concat.append(sec_websocket_key);
    concat.append(WEBSOCKET_GUID);

    unsigned char hash[SHA_DIGEST_LENGTH];
    SHA1(reinterpret_cast<const unsigned char*>(concat.data()), concat.size(), hash);

    return crypto::base64_encode(std::span<const uint8_t>(hash, SHA_DIGEST_LENGTH));
}

bool WebSocketUtils::is_valid_upgrade_request(const Request& request) {
    // RFC 6455 §4.2.1: Client handshake requirements
    if (request.method != Method::GET) {
        return false;
    }

    if (!equals_ci(request.get_header("Upgrade"), "websocket")) {
        return false;
    }

    if (!contains_ci(request.get_header("Connection"), "upgrade")) {
        return false;
    }

    if (request.get_header("Sec-WebSocket-Key").empty()) {
        return false;
    }

    // Only version 13 is supported (RFC 6455)
    return request.get_header("Sec-WebSocket-Version") == "13";
}

std::string WebSocketUtils::create_upgrade_response(std::string_view accept_key) {
    std::string response;
    response.reserve(160);

    response += "HTTP/1.1 101 Switching Protocols\r\n";
    response += "Upgrade: websocket\r\n";
    response += "Connection: Upgrade\r\n";
    response += "Sec-WebSocket-Accept: ";
    response += accept_key;
    response += "\r\n\r\n";

    return response;
}

void WebSocketUtils::unmask_payload(std::span<uint8_t> payload, uint32_t masking_key) {
    // RFC 6455 §5.3: transformed-octet-i = original-octet-i XOR masking-key-octet-(i % 4)
    const uint8_t key[4] = {
        static_cast<uint8_t>(masking_key >> 24), static_cast<uint8_t>(masking_key >> 16),
        static_cast<uint8_t>(masking_key >> 8), static_cast<uint8_t>(masking_key)};

    for (size_t i = 0; i < payload.size(); ++i) {
        payload[i] ^= key[i & 3];
    }
}

std::vector<uint8_t> WebSocketUtils::create_text_frame(std::string_view text) {
    std::vector<uint8_t> frame;
    frame.reserve(text.size() + 10);

    encode_frame_header(frame, true, WebSocketOpcode::TEXT, false, text.size(), 0);
    frame.insert(frame.end(), text.begin(), text.end());

    return frame;
}

std::vector<uint8_t> WebSocketUtils::create_close_frame(uint16_t status_code,
                                                        std::string_view reason) {
    // Control frame payloads are capped at 125 bytes
    if (reason.size() > 123) {
        reason = reason.substr(0, 123);
    }

    std::vector<uint8_t> frame;
    encode_frame_header(frame, true, WebSocketOpcode::CLOSE, false, 2 + reason.size(), 0);

    frame.push_back(static_cast<uint8_t>(status_code >> 8));
    frame.push_back(static_cast<uint8_t>(status_code & 0xFF));
    frame.insert(frame.end(), reason.begin(), reason.end());

    return frame;
}

std::vector<uint8_t> WebSocketUtils::create_pong_frame(std::span<const uint8_t> ping_payload) {
    std::vector<uint8_t> frame;

    encode_frame_header(frame, true, WebSocketOpcode::PONG, false, ping_payload.size(), 0);
    frame.insert(frame.end(), ping_payload.begin(), ping_payload.end());

    return frame;
}

std::vector<uint8_t> WebSocketUtils::create_ping_frame(std::span<const uint8_t> payload) {
    std::vector<uint8_t> frame;

    encode_frame_header(frame, true, WebSocketOpcode::PING, false, payload.size(), 0);
    frame.insert(frame.end(), payload.begin(), payload.end());

    return frame;
}

std::optional<ClosePayload> WebSocketUtils::parse_close_payload(
    std::span<const uint8_t> payload) {
    ClosePayload result;
    if (payload.empty()) {
        return result;  // 1005: no status code present
    }
    if (payload.size() == 1) {
        return std::nullopt;
    }

    result.code = static_cast<uint16_t>((payload[0] << 8) | payload[1]);
    result.reason.assign(reinterpret_cast<const char*>(payload.data()) + 2, payload.size() - 2);
    return result;
}

void WebSocketUtils::encode_frame_header(std::vector<uint8_t>& buffer, bool fin, uint8_t opcode,
                                         bool mask, uint64_t payload_length, uint32_t masking_key) {
    // Byte 0: FIN (1 bit) + RSV1-3 (3 bits) + Opcode (4 bits)
    buffer.push_back(static_cast<uint8_t>((fin ? 0x80 : 0x00) | (opcode & 0x0F)));

    // Byte 1: MASK (1 bit) + Payload length (7 bits)
    uint8_t byte1 = mask ? 0x80 : 0x00;

    if (payload_length <= 125) {
        buffer.push_back(static_cast<uint8_t>(byte1 | payload_length));
    } else if (payload_length <= 0xFFFF) {
        buffer.push_back(static_cast<uint8_t>(byte1 | 126));
        buffer.push_back(static_cast<uint8_t>(payload_length >> 8));
        buffer.push_back(static_cast<uint8_t>(payload_length & 0xFF));
    } else {
        buffer.push_back(static_cast<uint8_t>(byte1 | 127));
        for (int i = 7; i >= 0; --i) {
            buffer.push_back(static_cast<uint8_t>((payload_length >> (i * 8)) & 0xFF));
        }
    }

    if (mask) {
        buffer.push_back(static_cast<uint8_t>(masking_key >> 24));
        buffer.push_back(static_cast<uint8_t>(masking_key >> 16));
        buffer.push_back(static_cast<uint8_t>(masking_key >> 8));
        buffer.push_back(static_cast<uint8_t>(masking_key));
    }
}

// ========================================
// WebSocketFrameParser Implementation
// ========================================

WebSocketFrameParser::WebSocketFrameParser(uint64_t max_payload, bool require_mask)
    : max_payload_(max_payload), require_mask_(require_mask) {}

bool WebSocketFrameParser::fill_to(size_t target, std::span<const uint8_t> data, size_t& offset) {
    if (buffer_.size() < target) {
        size_t needed = target - buffer_.size();
        size_t take = std::min(needed, data.size() - offset);
        buffer_.insert(buffer_.end(), data.begin() + static_cast<std::ptrdiff_t>(offset),
                       data.begin() + static_cast<std::ptrdiff_t>(offset + take));
        offset += take;
    }
    return buffer_.size() >= target;
}

WebSocketFrameParser::ParseResult WebSocketFrameParser::fail(ParseError error) noexcept {
    error_ = error;
    return ParseResult::Error;
}

WebSocketFrameParser::ParseResult WebSocketFrameParser::decode_base_header() {
    uint8_t byte0 = buffer_[0];
    uint8_t byte1 = buffer_[1];

    fin_ = (byte0 & 0x80) != 0;
    opcode_ = byte0 & 0x0F;
    masked_ = (byte1 & 0x80) != 0;
    uint8_t length7 = byte1 & 0x7F;

    // No extensions are negotiated, so RSV1-3 must be clear
    if ((byte0 & 0x70) != 0) {
        return fail(ParseError::ReservedBits);
    }
    if ((opcode_ > WebSocketOpcode::BINARY && opcode_ < WebSocketOpcode::CLOSE) ||
        opcode_ > WebSocketOpcode::PONG) {
        return fail(ParseError::ReservedOpcode);
    }

    bool control = opcode_ >= WebSocketOpcode::CLOSE;
    if (control && !fin_) {
        return fail(ParseError::FragmentedControl);
    }
    if (control && length7 > 125) {
        return fail(ParseError::ControlTooLarge);
    }
    if (require_mask_ && !masked_) {
        return fail(ParseError::UnmaskedFrame);
    }

    if (length7 <= 125) {
        payload_length_ = length7;
        if (payload_length_ > max_payload_) {
            return fail(ParseError::FrameTooLarge);
        }
        header_size_ = 2;
        state_ = masked_ ? State::ReadMaskingKey : State::ReadPayload;
    } else {
        header_size_ = length7 == 126 ? 4 : 10;
        state_ = State::ReadExtendedLength;
    }
    return ParseResult::Incomplete;
}

WebSocketFrameParser::ParseResult WebSocketFrameParser::parse(std::span<const uint8_t> data,
                                                              WebSocketFrame& out_frame,
                                                              size_t& consumed) {
    size_t offset = 0;
    consumed = 0;

    while (true) {
        switch (state_) {
            case State::ReadHeader: {
                if (!fill_to(2, data, offset)) {
                    consumed = offset;
                    return ParseResult::Incomplete;
                }
                if (decode_base_header() == ParseResult::Error) {
                    consumed = offset;
                    return ParseResult::Error;
                }
                break;
            }

            case State::ReadExtendedLength: {
                if (!fill_to(header_size_, data, offset)) {
                    consumed = offset;
                    return ParseResult::Incomplete;
                }

                // Big-endian 16- or 64-bit length
                payload_length_ = 0;
                for (size_t i = 2; i < header_size_; ++i) {
                    payload_length_ = (payload_length_ << 8) | buffer_[i];
                }

                consumed = offset;
                if (payload_length_ & (1ULL << 63)) {
                    return fail(ParseError::InvalidLength);
                }
                if (payload_length_ > max_payload_) {
                    return fail(ParseError::FrameTooLarge);
                }
                state_ = masked_ ? State::ReadMaskingKey : State::ReadPayload;
                break;
            }

            case State::ReadMaskingKey: {
                if (!fill_to(header_size_ + 4, data, offset)) {
                    consumed = offset;
                    return ParseResult::Incomplete;
                }

                const uint8_t* key = buffer_.data() + header_size_;
                masking_key_ = (static_cast<uint32_t>(key[0]) << 24) |
                               (static_cast<uint32_t>(key[1]) << 16) |
                               (static_cast<uint32_t>(key[2]) << 8) | key[3];
                header_size_ += 4;
                state_ = State::ReadPayload;
                break;
            }

            case State::ReadPayload: {
                size_t frame_size = header_size_ + static_cast<size_t>(payload_length_);
                if (!fill_to(frame_size, data, offset)) {
                    consumed = offset;
                    return ParseResult::Incomplete;
                }

                std::span<uint8_t> payload(buffer_.data() + header_size_,
                                           static_cast<size_t>(payload_length_));
                if (masked_) {
                    WebSocketUtils::unmask_payload(payload, masking_key_);
                }

                out_frame.fin = fin_;
                out_frame.opcode = opcode_;
                out_frame.masked = masked_;
                out_frame.payload_length = payload_length_;
                out_frame.payload = payload;

                consumed = offset;
                state_ = State::Complete;
                return ParseResult::Complete;
            }

            case State::Complete:
                // Caller must reset() after consuming a frame
                consumed = offset;
                return ParseResult::Error;
        }
    }
}

void WebSocketFrameParser::reset() {
    state_ = State::ReadHeader;
    error_ = ParseError::None;
    buffer_.clear();
    fin_ = false;
    opcode_ = 0;
    masked_ = false;
    payload_length_ = 0;
    masking_key_ = 0;
    header_size_ = 0;
}

const char* WebSocketFrameParser::state_name() const noexcept {
    switch (state_) {
        case State::ReadHeader:
            return "ReadHeader";
        case State::ReadExtendedLength:
            return "ReadExtendedLength";
        case State::ReadMaskingKey:
            return "ReadMaskingKey";
        case State::ReadPayload:
            return "ReadPayload";
        case State::Complete:
            return "Complete";
    }
    return "Unknown";
}

}  // namespace switchyard::http
