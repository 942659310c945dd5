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

// Switchyard Event Broadcaster - Header
// Best-effort, at-most-once delivery of events to connected gateways

#pragma once

#include <quill/Logger.h>

#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <string_view>
#include <system_error>
#include <utility>

#include "event_types.hpp"

namespace switchyard::ws {
class Manager;
}

namespace switchyard::events {

/// Pushes events over the live connections held by the manager.
///
/// Per-connection send failures are recorded in that connection's
/// DeliveryStats and logged; they never fail the broadcast. Gateways that are
/// not connected simply miss the event.
class EventBroadcaster {
public:
    EventBroadcaster(ws::Manager& manager, quill::Logger* logger);

    /// Send an event to every connection of one gateway.
    /// @return payload_too_large / invalid_payload, otherwise success
    [[nodiscard]] std::error_code broadcast_event(std::string_view gateway_id,
                                                  std::string_view event_type,
                                                  const nlohmann::json& payload,
                                                  std::string_view user_id = {});

    /// Send an event to every connection of every connected gateway
    [[nodiscard]] std::error_code broadcast_to_all_gateways(std::string_view event_type,
                                                            const nlohmann::json& payload);

    [[nodiscard]] std::error_code broadcast_agent_deployed(std::string_view gateway_id,
                                                           const AgentDeploymentEvent& event);

    [[nodiscard]] std::error_code broadcast_agent_undeployed(std::string_view gateway_id,
                                                             const AgentUndeploymentEvent& event);

    [[nodiscard]] std::error_code broadcast_config_updated(std::string_view gateway_id,
                                                           const nlohmann::json& config);

private:
    /// Serialize the envelope once, after the payload size check
    std::optional<std::string> build_message(std::string_view event_type,
                                             const nlohmann::json& payload,
                                             std::string_view user_id,
                                             std::string& correlation_id,
                                             std::error_code& error_out) const;

    /// @return {sent, failed}
    std::pair<size_t, size_t> deliver(std::string_view gateway_id, std::string_view event_type,
                                      std::string_view message,
                                      std::string_view correlation_id);

    ws::Manager& manager_;
    quill::Logger* logger_;
};

}  // namespace switchyard::events
