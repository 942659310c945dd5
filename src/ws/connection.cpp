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

// Switchyard Connection - Implementation

#include "connection.hpp"

#include <fmt/format.h>

#include <mutex>

#include "../core/errors.hpp"
#include "../core/logging.hpp"

namespace switchyard::ws {

Connection::Connection(std::string gateway_id, std::string connection_id,
                       std::unique_ptr<Transport> transport, std::string auth_token)
    : gateway_id_(std::move(gateway_id)),
      connection_id_(std::move(connection_id)),
      auth_token_(std::move(auth_token)),
      connected_at_(std::chrono::system_clock::now()),
      transport_(std::move(transport)),
      last_heartbeat_(std::chrono::steady_clock::now()) {}

std::error_code Connection::send(std::string_view message) {
    std::shared_lock lock(mutex_);
    if (closed_.load(std::memory_order_relaxed)) {
        return core::Errc::connection_closed;
    }
    return transport_->send(message);
}

std::error_code Connection::send_ping() {
    std::shared_lock lock(mutex_);
    if (closed_.load(std::memory_order_relaxed)) {
        return core::Errc::connection_closed;
    }
    return transport_->send_ping();
}

std::error_code Connection::close(uint16_t code, std::string_view reason) {
    std::unique_lock lock(mutex_);
    if (closed_.exchange(true, std::memory_order_acq_rel)) {
        return {};
    }
    return transport_->close(code, reason);
}

void Connection::update_heartbeat() {
    std::unique_lock lock(mutex_);
    last_heartbeat_ = std::chrono::steady_clock::now();
}

std::chrono::steady_clock::time_point Connection::last_heartbeat() const {
    std::shared_lock lock(mutex_);
    return last_heartbeat_;
}

bool Connection::is_closed() const noexcept {
    return closed_.load(std::memory_order_acquire);
}

nlohmann::json Connection::info() const {
    auto heartbeat_age = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - last_heartbeat());

    return nlohmann::json{{"gatewayId", gateway_id_},
                          {"connectionId", connection_id_},
                          {"connectedAt", logging::format_rfc3339(connected_at_)},
                          {"lastHeartbeatAgeMs", heartbeat_age.count()},
                          {"closed", is_closed()},
                          {"stats", stats_.to_json()}};
}

std::string Connection::to_string() const {
    return fmt::format("Connection{{gateway={}, id={}, closed={}}}", gateway_id_, connection_id_,
                       is_closed());
}

}  // namespace switchyard::ws
