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

// Switchyard Errors - Implementation

#include "errors.hpp"

#include <fmt/format.h>

namespace switchyard::core {

std::string SwitchyardErrorCategory::message(int ev) const {
    switch (static_cast<Errc>(ev)) {
        case Errc::capacity_exceeded:
            return "maximum connection limit reached";
        case Errc::shutting_down:
            return "connection manager is shutting down";
        case Errc::connection_closed:
            return "connection is closed";
        case Errc::gateway_not_found:
            return "gateway not found";
        case Errc::provider_not_found:
            return "provider not found";
        case Errc::gateway_unreachable:
            return "gateway endpoint unreachable";
        case Errc::gateway_request_failed:
            return "gateway request failed";
        case Errc::invalid_response:
            return "failed to decode gateway response";
        case Errc::unsupported_adapter_type:
            return "unsupported adapter type";
        case Errc::adapter_failure:
            return "mock adapter failure";
        case Errc::configuration_error:
            return "invalid gateway configuration";
        case Errc::invalid_ciphertext:
            return "invalid ciphertext";
        case Errc::invalid_key_size:
            return "invalid key size: must be 32 bytes for AES-256";
        case Errc::missing_credentials:
            return "gateway has no credentials stored";
        case Errc::invalid_credentials:
            return "credentials cannot be serialized";
        case Errc::payload_too_large:
            return "event payload exceeds maximum size";
        case Errc::invalid_payload:
            return "failed to serialize event payload";
        case Errc::protocol_error:
            return "websocket protocol violation";
    }
    return "unknown switchyard error";
}

const SwitchyardErrorCategory& switchyard_category() noexcept {
    static SwitchyardErrorCategory instance;
    return instance;
}

std::error_code make_error_code(Errc e) noexcept {
    return std::error_code(static_cast<int>(e), switchyard_category());
}

std::string WebSocketCloseCategory::message(int ev) const {
    switch (ev) {
        case 1000:
            return "normal closure";
        case 1001:
            return "going away";
        case 1002:
            return "protocol error";
        case 1005:
            return "no status received";
        case 1006:
            return "abnormal closure";
        case 1009:
            return "message too big";
        case 1011:
            return "internal server error";
        case 1013:
            return "try again later";
        default:
            return fmt::format("websocket closed with status {}", ev);
    }
}

const WebSocketCloseCategory& websocket_close_category() noexcept {
    static WebSocketCloseCategory instance;
    return instance;
}

std::error_code make_close_error(uint16_t close_code) noexcept {
    return std::error_code(close_code, websocket_close_category());
}

bool is_normal_closure(const std::error_code& ec) noexcept {
    return ec.category() == websocket_close_category() && (ec.value() == 1000 || ec.value() == 1001);
}

}  // namespace switchyard::core
