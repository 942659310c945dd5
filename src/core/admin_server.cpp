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

// Switchyard Admin Server - Implementation

#include "admin_server.hpp"

#include <fmt/format.h>
#include <quill/LogMacros.h>

#include <sys/socket.h>

#include <cerrno>
#include <chrono>
#include <cstring>
#include <exception>
#include <nlohmann/json.hpp>
#include <thread>
#include <vector>

#include "../events/event_broadcaster.hpp"
#include "../http/parser.hpp"
#include "../ws/manager.hpp"
#include "logging.hpp"
#include "socket.hpp"

namespace switchyard::core {

namespace {

constexpr std::chrono::milliseconds CLIENT_TIMEOUT{5000};
constexpr size_t READ_CHUNK_SIZE = 4096;
constexpr std::chrono::milliseconds ACCEPT_RETRY_DELAY{100};

AdminResponse json_error(http::StatusCode status, std::string_view error,
                         std::string_view message) {
    // Messages may quote request bytes; never let a bad byte abort the reply
    nlohmann::json body = {{"error", error}, {"message", message}};
    return {status, "application/json",
            body.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace)};
}

}  // namespace

AdminServer::AdminServer(const control::AdminConfig& config, ws::Manager& manager,
                         events::EventBroadcaster& broadcaster, quill::Logger* logger)
    : config_(config), manager_(manager), broadcaster_(broadcaster), logger_(logger) {}

AdminServer::~AdminServer() {
    stop();
    close_fd(listen_fd_);
}

std::error_code AdminServer::start() {
    if (running_.load(std::memory_order_relaxed)) {
        return std::make_error_code(std::errc::operation_in_progress);
    }

    // Loopback only: the admin surface can push events to the whole fleet
    listen_fd_ = create_listening_socket("127.0.0.1", config_.port, 32);
    if (listen_fd_ < 0) {
        return std::error_code(errno, std::generic_category());
    }

    running_.store(true, std::memory_order_relaxed);
    LOG_INFO(logger_, "Admin server listening on 127.0.0.1:{}", port());
    return {};
}

void AdminServer::stop() {
    if (!running_.exchange(false)) {
        return;
    }
    shutdown_fd(listen_fd_);
}

uint16_t AdminServer::port() const noexcept {
    return listen_fd_ >= 0 ? local_port(listen_fd_) : 0;
}

void AdminServer::run() {
    while (running_.load(std::memory_order_relaxed)) {
        int client_fd = ::accept(listen_fd_, nullptr, nullptr);
        if (client_fd < 0) {
            if (errno == EINTR) {
                continue;
            }
            if (!running_.load(std::memory_order_relaxed)) {
                break;
            }
            LOG_ERROR(logger_, "Admin: accept failed: {}", std::strerror(errno));
            std::this_thread::sleep_for(ACCEPT_RETRY_DELAY);
            continue;
        }

        try {
            handle_connection(client_fd);
        } catch (const std::exception& e) {
            LOG_ERROR(logger_, "Admin: request handling failed: {}", e.what());
        }
        close_fd(client_fd);
    }
}

void AdminServer::handle_connection(int client_fd) {
    if (auto ec = set_recv_timeout(client_fd, CLIENT_TIMEOUT)) {
        LOG_WARNING(logger_, "Admin: failed to set read timeout: {}", ec.message());
    }
    if (auto ec = set_send_timeout(client_fd, CLIENT_TIMEOUT)) {
        LOG_WARNING(logger_, "Admin: failed to set write timeout: {}", ec.message());
    }

    std::vector<uint8_t> buffer;
    uint8_t chunk[READ_CHUNK_SIZE];

    while (true) {
        if (buffer.size() >= MAX_REQUEST_SIZE) {
            auto response = json_error(http::StatusCode::PayloadTooLarge, "payload_too_large",
                                       "Request too large");
            if (auto ec = send_all(client_fd, http::build_response(response.status,
                                                                    response.content_type,
                                                                    response.body))) {
                LOG_DEBUG(logger_, "Admin: response not delivered: {}", ec.message());
            }
            return;
        }

        ssize_t n = ::recv(client_fd, chunk, sizeof(chunk), 0);
        if (n < 0 && errno == EINTR) {
            continue;
        }
        if (n <= 0) {
            return;  // Peer closed or timed out before a full request
        }
        buffer.insert(buffer.end(), chunk, chunk + n);

        // Reparse from scratch so every view points into the current buffer
        http::Parser parser;
        http::Request request;
        auto [result, used] = parser.parse_request(buffer, request);
        if (result == http::ParseResult::Incomplete) {
            continue;
        }

        AdminResponse response =
            result == http::ParseResult::Complete
                ? handle_request(request)
                : json_error(http::StatusCode::BadRequest, "bad_request",
                             parser.error_message());
        if (auto ec = send_all(client_fd, http::build_response(response.status,
                                                                response.content_type,
                                                                response.body))) {
            LOG_DEBUG(logger_, "Admin: response not delivered: {}", ec.message());
        }
        return;
    }
}

AdminResponse AdminServer::handle_request(const http::Request& request) {
    if (request.method == http::Method::GET) {
        if (request.path == "/health" || request.path == "/_health") {
            nlohmann::json body = {{"status", manager_.is_shutting_down() ? "draining" : "healthy"},
                                   {"connections", manager_.get_connection_count()},
                                   {"timestamp",
                                    logging::format_rfc3339(std::chrono::system_clock::now())}};
            return {http::StatusCode::OK, "application/json", body.dump()};
        }

        if (request.path == "/stats") {
            nlohmann::json stats = manager_.get_stats();
            return {http::StatusCode::OK, "application/json", stats.dump()};
        }
    }

    if (request.path == "/_admin/events") {
        if (request.method != http::Method::POST) {
            return json_error(http::StatusCode::MethodNotAllowed, "method_not_allowed",
                              "Use POST");
        }
        return handle_publish_event(request);
    }

    return json_error(http::StatusCode::NotFound, "not_found", "Not Found");
}

AdminResponse AdminServer::handle_publish_event(const http::Request& request) {
    nlohmann::json body;
    try {
        body = nlohmann::json::parse(request.body.begin(), request.body.end());
    } catch (const nlohmann::json::parse_error& e) {
        return json_error(http::StatusCode::BadRequest, "bad_request",
                          fmt::format("Invalid JSON at byte {}", e.byte));
    }

    if (!body.is_object() || !body.contains("type") || !body["type"].is_string() ||
        body["type"].get_ref<const std::string&>().empty()) {
        return json_error(http::StatusCode::BadRequest, "bad_request",
                          "Missing or invalid 'type' field");
    }
    if (!body.contains("payload")) {
        return json_error(http::StatusCode::BadRequest, "bad_request", "Missing 'payload' field");
    }
    if (body.contains("gatewayId") && !body["gatewayId"].is_string()) {
        return json_error(http::StatusCode::BadRequest, "bad_request",
                          "Invalid 'gatewayId' field");
    }

    const auto& type = body["type"].get_ref<const std::string&>();
    std::string gateway_id = body.value("gatewayId", "");

    std::error_code ec = gateway_id.empty()
                             ? broadcaster_.broadcast_to_all_gateways(type, body["payload"])
                             : broadcaster_.broadcast_event(gateway_id, type, body["payload"]);
    if (ec == Errc::payload_too_large) {
        return json_error(http::StatusCode::PayloadTooLarge, "payload_too_large", ec.message());
    }
    if (ec == Errc::invalid_payload) {
        return json_error(http::StatusCode::BadRequest, "bad_request", ec.message());
    }
    if (ec) {
        LOG_ERROR(logger_, "Admin: event publish failed: type={}, error={}", type, ec.message());
        return json_error(http::StatusCode::InternalServerError, "internal_error", ec.message());
    }

    nlohmann::json accepted = {{"status", "accepted"}, {"type", type}};
    if (!gateway_id.empty()) {
        accepted["gatewayId"] = gateway_id;
    }
    return {http::StatusCode::Accepted, "application/json", accepted.dump()};
}

}  // namespace switchyard::core
