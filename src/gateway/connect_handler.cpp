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

// Switchyard Connect Handler - Implementation

#include "connect_handler.hpp"

#include <sys/socket.h>

#include <algorithm>
#include <cerrno>
#include <chrono>
#include <exception>
#include <nlohmann/json.hpp>

#include "../core/errors.hpp"
#include "../core/logging.hpp"
#include "../core/socket.hpp"
#include "../events/event_types.hpp"
#include "../http/parser.hpp"
#include "../http/websocket.hpp"
#include "../ws/manager.hpp"
#include "../ws/websocket_transport.hpp"
#include "rate_limit.hpp"

namespace switchyard::gateway {

namespace {
constexpr size_t READ_CHUNK_SIZE = 4096;
}  // namespace

ConnectHandler::ConnectHandler(ConnectHandlerConfig config, ws::Manager& manager,
                               std::shared_ptr<store::GatewayStore> store,
                               SlidingWindowRateLimiter& rate_limiter, quill::Logger* logger)
    : config_(std::move(config)),
      manager_(manager),
      store_(std::move(store)),
      rate_limiter_(rate_limiter),
      logger_(logger) {}

void ConnectHandler::handle(int client_fd, std::string_view remote_address) {
    if (auto ec = core::set_recv_timeout(client_fd, config_.handshake_timeout)) {
        LOG_WARNING(logger_, "Failed to set handshake timeout: address={}, error={}",
                    remote_address, ec.message());
    }
    if (auto ec = core::set_send_timeout(client_fd, config_.handshake_timeout)) {
        LOG_WARNING(logger_, "Failed to set send timeout: address={}, error={}", remote_address,
                    ec.message());
    }

    std::vector<uint8_t> buffer;
    if (!read_upgrade_request(client_fd, buffer)) {
        core::close_fd(client_fd);
        return;
    }

    // Views into buffer; buffer is not modified until the transport takes the remainder
    http::Request request;
    http::Parser parser;
    auto [result, used] = parser.parse_request(buffer, request);
    if (result != http::ParseResult::Complete) {
        reject(client_fd, {http::StatusCode::BadRequest, "Bad Request", "Malformed request"});
        core::close_fd(client_fd);
        return;
    }

    ConnectRejection rejection;
    auto gateway = authorize(request, remote_address, rejection);
    if (!gateway) {
        reject(client_fd, rejection);
        core::close_fd(client_fd);
        return;
    }

    std::string api_key(request.get_header("api-key"));
    auto accept_key =
        http::WebSocketUtils::compute_accept_key(request.get_header("Sec-WebSocket-Key"));
    auto upgrade_response = http::WebSocketUtils::create_upgrade_response(accept_key);
    if (auto ec = core::send_all(client_fd, upgrade_response)) {
        LOG_ERROR(logger_, "WebSocket upgrade failed: gateway_id={}, error={}", gateway->id,
                  ec.message());
        core::close_fd(client_fd);
        return;
    }

    // Frames the client pipelined behind the handshake
    std::vector<uint8_t> leftover(buffer.begin() + static_cast<std::ptrdiff_t>(used),
                                  buffer.end());
    auto transport = std::make_unique<ws::WebSocketTransport>(client_fd, config_.max_message_size,
                                                              std::move(leftover));

    // Liveness is the heartbeat's job from here on
    if (auto ec = transport->set_read_timeout(std::chrono::milliseconds(0))) {
        LOG_WARNING(logger_, "Failed to clear read timeout: gateway_id={}, error={}", gateway->id,
                    ec.message());
    }

    LOG_INFO(logger_, "WebSocket upgrade complete: gateway_id={}, address={}", gateway->id,
             remote_address);
    run_session(gateway->id, std::move(transport), api_key);
}

bool ConnectHandler::read_upgrade_request(int fd, std::vector<uint8_t>& buffer) {
    buffer.reserve(READ_CHUNK_SIZE);
    uint8_t chunk[READ_CHUNK_SIZE];

    while (true) {
        if (buffer.size() >= config_.max_handshake_bytes) {
            reject(fd, {http::StatusCode::RequestHeaderFieldsTooLarge,
                        "Request Header Fields Too Large", "Upgrade request too large"});
            return false;
        }

        size_t want = std::min(sizeof(chunk), config_.max_handshake_bytes - buffer.size());
        ssize_t n = ::recv(fd, chunk, want, 0);
        if (n == 0) {
            return false;  // Peer went away before finishing the request
        }
        if (n < 0) {
            if (errno == EINTR) {
                continue;
            }
            if (errno == EAGAIN || errno == EWOULDBLOCK) {
                reject(fd, {http::StatusCode::RequestTimeout, "Request Timeout",
                            "Upgrade request not received in time"});
            }
            return false;
        }

        buffer.insert(buffer.end(), chunk, chunk + n);

        // Reparse from the start: earlier views would dangle after the insert
        http::Parser parser;
        http::Request request;
        auto [result, used] = parser.parse_request(buffer, request);
        if (result == http::ParseResult::Complete) {
            return true;
        }
        if (result == http::ParseResult::Error) {
            reject(fd, {http::StatusCode::BadRequest, "Bad Request",
                        std::string(parser.error_message())});
            return false;
        }
    }
}

std::optional<store::GatewayRecord> ConnectHandler::authorize(const http::Request& request,
                                                              std::string_view remote_address,
                                                              ConnectRejection& rejection) {
    if (request.path != config_.ws_path) {
        rejection = {http::StatusCode::NotFound, "Not Found", "Unknown path"};
        return std::nullopt;
    }

    if (request.method != http::Method::GET) {
        rejection = {http::StatusCode::MethodNotAllowed, "Method Not Allowed",
                     "Only GET is supported"};
        return std::nullopt;
    }

    if (!rate_limiter_.allow(remote_address)) {
        LOG_WARNING(logger_, "Rate limit exceeded: address={}", remote_address);
        rejection = {http::StatusCode::TooManyRequests, "Too Many Requests",
                     "Connection rate limit exceeded. Please try again later."};
        return std::nullopt;
    }

    auto api_key = request.get_header("api-key");
    if (api_key.empty()) {
        LOG_WARNING(logger_, "WebSocket connection attempt without API key: address={}",
                    remote_address);
        rejection = {http::StatusCode::Unauthorized, "Unauthorized",
                     "API key is required. Provide 'api-key' header."};
        return std::nullopt;
    }

    auto gateway = store_->verify_api_key(api_key);
    if (!gateway) {
        LOG_WARNING(logger_, "WebSocket authentication failed: address={}", remote_address);
        rejection = {http::StatusCode::Unauthorized, "Unauthorized", "Invalid API key"};
        return std::nullopt;
    }

    if (!http::WebSocketUtils::is_valid_upgrade_request(request)) {
        LOG_WARNING(logger_, "Invalid WebSocket upgrade request: gateway_id={}, address={}",
                    gateway->id, remote_address);
        rejection = {http::StatusCode::BadRequest, "Bad Request", "Invalid WebSocket upgrade"};
        return std::nullopt;
    }

    return gateway;
}

void ConnectHandler::reject(int fd, const ConnectRejection& rejection) {
    auto response =
        http::build_error_response(rejection.status, rejection.error, rejection.message);
    if (auto ec = core::send_all(fd, response)) {
        LOG_DEBUG(logger_, "Failed to send rejection: status={}, error={}",
                  static_cast<int>(rejection.status), ec.message());
    }
}

void ConnectHandler::run_session(const std::string& gateway_id,
                                 std::unique_ptr<ws::Transport> transport,
                                 std::string_view api_key) {
    std::error_code ec;
    auto connection = manager_.register_connection(gateway_id, transport, api_key, ec);
    if (!connection) {
        LOG_ERROR(logger_, "Connection registration failed: gateway_id={}, error={}", gateway_id,
                  ec.message());
        if (!transport) {
            return;  // Consumed by a registration that failed after taking it
        }

        nlohmann::json error_message{{"type", "error"}, {"message", ec.message()}};
        if (auto send_ec = transport->send(error_message.dump())) {
            LOG_ERROR(logger_, "Failed to send error message: gateway_id={}, error={}", gateway_id,
                      send_ec.message());
        }

        uint16_t code = (ec == core::Errc::capacity_exceeded)
                            ? http::WebSocketCloseCode::TRY_AGAIN_LATER
                            : http::WebSocketCloseCode::GOING_AWAY;
        if (auto close_ec = transport->close(code, ec.message())) {
            LOG_ERROR(logger_, "Failed to close connection: gateway_id={}, error={}", gateway_id,
                      close_ec.message());
        }
        return;
    }

    events::ConnectionAck ack{gateway_id, connection->connection_id(),
                              logging::format_rfc3339(std::chrono::system_clock::now())};
    if (auto send_ec = connection->send(nlohmann::json(ack).dump())) {
        LOG_ERROR(logger_,
                  "Failed to send connection ACK: gateway_id={}, connection_id={}, error={}",
                  gateway_id, connection->connection_id(), send_ec.message());
    }

    LOG_CONNECTION(logger_, "established", gateway_id, connection->connection_id());
    set_active(gateway_id, true);

    read_loop(*connection);

    LOG_CONNECTION(logger_, "closed", gateway_id, connection->connection_id());
    manager_.unregister_connection(gateway_id, connection->connection_id());
    set_active(gateway_id, false);
}

void ConnectHandler::read_loop(ws::Connection& connection) {
    try {
        ws::MessageType type = ws::MessageType::Text;
        std::string payload;

        while (!connection.is_closed()) {
            auto ec = connection.transport().read_message(type, payload);
            if (!ec) {
                // Gateways only send heartbeats today; data messages are ignored
                LOG_DEBUG(logger_, "Message from gateway ignored: gateway_id={}, size={}",
                          connection.gateway_id(), payload.size());
                continue;
            }

            if (core::is_normal_closure(ec)) {
                LOG_DEBUG(logger_, "WebSocket closed: gateway_id={}, connection_id={}, code={}",
                          connection.gateway_id(), connection.connection_id(), ec.value());
            } else {
                LOG_ERROR(logger_,
                          "WebSocket read error: gateway_id={}, connection_id={}, error={}",
                          connection.gateway_id(), connection.connection_id(), ec.message());
            }
            return;
        }
    } catch (const std::exception& e) {
        LOG_ERROR(logger_,
                  "Exception in WebSocket read loop: gateway_id={}, connection_id={}, error={}",
                  connection.gateway_id(), connection.connection_id(), e.what());
    }
}

void ConnectHandler::set_active(const std::string& gateway_id, bool active) {
    if (auto ec = store_->update_active_status(gateway_id, active)) {
        LOG_ERROR(logger_,
                  "Failed to update gateway active status: gateway_id={}, status={}, error={}",
                  gateway_id, active ? "active" : "inactive", ec.message());
    }
}

}  // namespace switchyard::gateway
