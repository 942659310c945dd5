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

// Switchyard Errors - Header
// Error taxonomy shared by the registry, broadcaster, adapters and vault

#pragma once

#include <cstdint>
#include <string>
#include <system_error>

namespace switchyard::core {

/// Control-plane error conditions
enum class Errc : int {
    // Registry
    capacity_exceeded = 1,  // max_connections reached
    shutting_down,          // Manager no longer accepts registrations
    connection_closed,      // Send/close on a closed connection

    // Gateway store / adapters
    gateway_not_found,
    provider_not_found,
    gateway_unreachable,     // Transport failure talking to a gateway
    gateway_request_failed,  // Gateway answered with an unexpected status
    invalid_response,        // Gateway answered with malformed JSON
    unsupported_adapter_type,
    adapter_failure,  // Mock adapter configured to fail
    configuration_error,

    // Credentials
    invalid_ciphertext,
    invalid_key_size,
    missing_credentials,
    invalid_credentials,

    // Events / protocol
    payload_too_large,
    invalid_payload,
    protocol_error,
};

/// Error category for Errc values
class SwitchyardErrorCategory : public std::error_category {
public:
    [[nodiscard]] const char* name() const noexcept override {
        return "switchyard";
    }

    [[nodiscard]] std::string message(int ev) const override;
};

/// Get the control-plane error category instance
[[nodiscard]] const SwitchyardErrorCategory& switchyard_category() noexcept;

[[nodiscard]] std::error_code make_error_code(Errc e) noexcept;

/// WebSocket close category: error value is the close status code (RFC 6455 §7.4)
class WebSocketCloseCategory : public std::error_category {
public:
    [[nodiscard]] const char* name() const noexcept override {
        return "websocket_close";
    }

    [[nodiscard]] std::string message(int ev) const override;
};

[[nodiscard]] const WebSocketCloseCategory& websocket_close_category() noexcept;

/// Create error_code describing a closed WebSocket with the given status code
[[nodiscard]] std::error_code make_close_error(uint16_t close_code) noexcept;

/// True for 1000 (normal closure) and 1001 (going away)
[[nodiscard]] bool is_normal_closure(const std::error_code& ec) noexcept;

}  // namespace switchyard::core

namespace std {
template <>
struct is_error_code_enum<switchyard::core::Errc> : true_type {};
}  // namespace std
