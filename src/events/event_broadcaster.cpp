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

// Switchyard Event Broadcaster - Implementation

#include "event_broadcaster.hpp"

#include <fmt/format.h>

#include <chrono>

#include "../core/errors.hpp"
#include "../core/logging.hpp"
#include "../ws/manager.hpp"

namespace switchyard::events {

EventBroadcaster::EventBroadcaster(ws::Manager& manager, quill::Logger* logger)
    : manager_(manager), logger_(logger) {}

std::optional<std::string> EventBroadcaster::build_message(std::string_view event_type,
                                                           const nlohmann::json& payload,
                                                           std::string_view user_id,
                                                           std::string& correlation_id,
                                                           std::error_code& error_out) const {
    error_out.clear();

    try {
        auto payload_size = payload.dump().size();
        if (payload_size > MAX_EVENT_PAYLOAD_SIZE) {
            LOG_WARNING(logger_, "Event payload too large: event_type={}, size={}, max={}",
                        event_type, payload_size, MAX_EVENT_PAYLOAD_SIZE);
            error_out = core::Errc::payload_too_large;
            return std::nullopt;
        }

        EventEnvelope envelope;
        envelope.type = std::string(event_type);
        envelope.payload = payload;
        envelope.timestamp = logging::format_rfc3339(std::chrono::system_clock::now());
        envelope.correlation_id = logging::generate_uuid();
        envelope.user_id = std::string(user_id);

        correlation_id = envelope.correlation_id;
        return nlohmann::json(envelope).dump();
    } catch (const nlohmann::json::type_error& e) {
        // Invalid UTF-8 in a payload string
        LOG_ERROR(logger_, "Failed to serialize event: event_type={}, error={}", event_type,
                  e.what());
        error_out = core::Errc::invalid_payload;
        return std::nullopt;
    }
}

std::pair<size_t, size_t> EventBroadcaster::deliver(std::string_view gateway_id,
                                                    std::string_view event_type,
                                                    std::string_view message,
                                                    std::string_view correlation_id) {
    size_t sent = 0;
    size_t failed = 0;

    for (const auto& conn : manager_.get_connections(gateway_id)) {
        if (auto ec = conn->send(message)) {
            ++failed;
            conn->stats().record_failure(fmt::format("send error: {}", ec.message()));
            LOG_ERROR(logger_,
                      "Failed to send event to gateway connection: gateway_id={}, "
                      "connection_id={}, event_type={}, error={}",
                      gateway_id, conn->connection_id(), event_type, ec.message());
        } else {
            ++sent;
            conn->stats().record_success();
            LOG_DEBUG(logger_,
                      "Event sent: event_type={}, gateway_id={}, connection_id={}, "
                      "correlation_id={}",
                      event_type, gateway_id, conn->connection_id(), correlation_id);
        }
    }

    return {sent, failed};
}

std::error_code EventBroadcaster::broadcast_event(std::string_view gateway_id,
                                                  std::string_view event_type,
                                                  const nlohmann::json& payload,
                                                  std::string_view user_id) {
    std::error_code ec;
    std::string correlation_id;
    auto message = build_message(event_type, payload, user_id, correlation_id, ec);
    if (!message) {
        return ec;
    }

    if (manager_.get_connections(gateway_id).empty()) {
        LOG_WARNING(logger_, "No active connections for gateway: gateway_id={}, event_type={}",
                    gateway_id, event_type);
        return {};
    }

    auto [sent, failed] = deliver(gateway_id, event_type, *message, correlation_id);

    LOG_INFO(logger_,
             "Event broadcast completed: event_type={}, gateway_id={}, sent={}, failed={}, "
             "correlation_id={}",
             event_type, gateway_id, sent, failed, correlation_id);
    return {};
}

std::error_code EventBroadcaster::broadcast_to_all_gateways(std::string_view event_type,
                                                            const nlohmann::json& payload) {
    std::error_code ec;
    std::string correlation_id;
    auto message = build_message(event_type, payload, {}, correlation_id, ec);
    if (!message) {
        return ec;
    }

    auto gateway_ids = manager_.get_all_gateway_ids();
    size_t total_sent = 0;
    size_t total_failed = 0;

    for (const auto& gateway_id : gateway_ids) {
        auto [sent, failed] = deliver(gateway_id, event_type, *message, correlation_id);
        total_sent += sent;
        total_failed += failed;
    }

    LOG_INFO(logger_,
             "Broadcast to all gateways completed: event_type={}, gateways={}, sent={}, "
             "failed={}, correlation_id={}",
             event_type, gateway_ids.size(), total_sent, total_failed, correlation_id);
    return {};
}

std::error_code EventBroadcaster::broadcast_agent_deployed(std::string_view gateway_id,
                                                           const AgentDeploymentEvent& event) {
    return broadcast_event(gateway_id, EventType::AGENT_DEPLOYED, event);
}

std::error_code EventBroadcaster::broadcast_agent_undeployed(std::string_view gateway_id,
                                                             const AgentUndeploymentEvent& event) {
    return broadcast_event(gateway_id, EventType::AGENT_UNDEPLOYED, event);
}

std::error_code EventBroadcaster::broadcast_config_updated(std::string_view gateway_id,
                                                           const nlohmann::json& config) {
    return broadcast_event(gateway_id, EventType::CONFIG_UPDATED, config);
}

}  // namespace switchyard::events
