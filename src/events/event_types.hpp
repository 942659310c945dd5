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

// Switchyard Events - Header
// Event envelope and payload types pushed to gateways

#pragma once

#include <cstddef>
#include <nlohmann/json.hpp>
#include <string>
#include <string_view>

namespace switchyard::events {

namespace EventType {
constexpr std::string_view AGENT_DEPLOYED = "agent.deployed";
constexpr std::string_view AGENT_UNDEPLOYED = "agent.undeployed";
constexpr std::string_view CONFIG_UPDATED = "config.updated";
}  // namespace EventType

/// Largest serialized payload accepted for one event
constexpr size_t MAX_EVENT_PAYLOAD_SIZE = 1024 * 1024;

/// Agent deployed to an environment (deployment_id travels as revisionId)
struct AgentDeploymentEvent {
    std::string agent_id;
    std::string deployment_id;
    std::string environment;
};

struct AgentUndeploymentEvent {
    std::string agent_id;
    std::string environment;
};

/// Payload of config.updated events
struct GatewayConfigEvent {
    std::string config_type;
    std::string action;
};

/// Wire envelope: {type, payload, timestamp, correlationId, userId?}
struct EventEnvelope {
    std::string type;
    nlohmann::json payload;
    std::string timestamp;
    std::string correlation_id;
    std::string user_id;  // Omitted when empty
};

/// Sent once after a gateway connection is registered
struct ConnectionAck {
    std::string gateway_id;
    std::string connection_id;
    std::string timestamp;
};

inline void to_json(nlohmann::json& j, const AgentDeploymentEvent& e) {
    j = nlohmann::json{
        {"agentId", e.agent_id}, {"environment", e.environment}, {"revisionId", e.deployment_id}};
}

inline void from_json(const nlohmann::json& j, AgentDeploymentEvent& e) {
    e.agent_id = j.value("agentId", "");
    e.environment = j.value("environment", "");
    e.deployment_id = j.value("revisionId", "");
}

inline void to_json(nlohmann::json& j, const AgentUndeploymentEvent& e) {
    j = nlohmann::json{{"agentId", e.agent_id}, {"environment", e.environment}};
}

inline void from_json(const nlohmann::json& j, AgentUndeploymentEvent& e) {
    e.agent_id = j.value("agentId", "");
    e.environment = j.value("environment", "");
}

inline void to_json(nlohmann::json& j, const GatewayConfigEvent& e) {
    j = nlohmann::json{{"configType", e.config_type}, {"action", e.action}};
}

inline void from_json(const nlohmann::json& j, GatewayConfigEvent& e) {
    e.config_type = j.value("configType", "");
    e.action = j.value("action", "");
}

inline void to_json(nlohmann::json& j, const EventEnvelope& e) {
    j = nlohmann::json{{"type", e.type},
                       {"payload", e.payload},
                       {"timestamp", e.timestamp},
                       {"correlationId", e.correlation_id}};
    if (!e.user_id.empty()) {
        j["userId"] = e.user_id;
    }
}

inline void from_json(const nlohmann::json& j, EventEnvelope& e) {
    e.type = j.value("type", "");
    e.payload = j.value("payload", nlohmann::json{});
    e.timestamp = j.value("timestamp", "");
    e.correlation_id = j.value("correlationId", "");
    e.user_id = j.value("userId", "");
}

inline void to_json(nlohmann::json& j, const ConnectionAck& a) {
    j = nlohmann::json{{"type", "connection.ack"},
                       {"gatewayId", a.gateway_id},
                       {"connectionId", a.connection_id},
                       {"timestamp", a.timestamp}};
}

}  // namespace switchyard::events
