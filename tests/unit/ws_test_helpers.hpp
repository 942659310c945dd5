// Client-side frame builders for WebSocket tests

#pragma once

#include <cstdint>
#include <span>
#include <string_view>
#include <vector>

#include "../../src/http/websocket.hpp"

namespace switchyard::testing {

/// Build a masked (client to server) frame
inline std::vector<uint8_t> masked_frame(uint8_t opcode, std::span<const uint8_t> payload,
                                         bool fin = true, uint32_t masking_key = 0x37FA213D) {
    std::vector<uint8_t> frame;
    http::WebSocketUtils::encode_frame_header(frame, fin, opcode, true, payload.size(),
                                              masking_key);
    size_t start = frame.size();
    frame.insert(frame.end(), payload.begin(), payload.end());
    // XOR masking is its own inverse
    http::WebSocketUtils::unmask_payload(std::span<uint8_t>(frame.data() + start, payload.size()),
                                         masking_key);
    return frame;
}

inline std::vector<uint8_t> masked_text(std::string_view text, bool fin = true) {
    return masked_frame(http::WebSocketOpcode::TEXT,
                        std::span<const uint8_t>(reinterpret_cast<const uint8_t*>(text.data()),
                                                 text.size()),
                        fin);
}

inline std::vector<uint8_t> masked_close(uint16_t code, std::string_view reason = {}) {
    std::vector<uint8_t> payload{static_cast<uint8_t>(code >> 8),
                                 static_cast<uint8_t>(code & 0xFF)};
    payload.insert(payload.end(), reason.begin(), reason.end());
    return masked_frame(http::WebSocketOpcode::CLOSE, payload);
}

}  // namespace switchyard::testing
