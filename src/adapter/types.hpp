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

// Switchyard Adapter Types - Header
// Value types shared by every gateway adapter

#pragma once

#include <chrono>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>

#include "../core/logging.hpp"

namespace switchyard::adapter {

/// Selects and parameterizes an adapter implementation
struct AdapterConfig {
    std::string type;                                     // "on-premise", "mock", ...
    nlohmann::json parameters = nlohmann::json::object();  // Adapter-specific options
};

/// LLM provider configuration to push to a gateway
struct ProviderDeploymentConfig {
    std::string handle;
    nlohmann::json configuration = nlohmann::json::object();
};

struct ProviderDeploymentResult {
    std::string deployment_id;
    std::string status;
    std::chrono::system_clock::time_point deployed_at;
};

/// Provider as reported by the gateway
struct ProviderStatus {
    std::string id;
    std::string name;
    std::string kind;
    std::string status;
    std::optional<std::string> deployed_at;  // Gateway-side timestamp, verbatim
    nlohmann::json spec = nlohmann::json::object();
};

namespace HealthState {
constexpr const char* ACTIVE = "ACTIVE";
constexpr const char* ERROR = "ERROR";
}  // namespace HealthState

struct HealthStatus {
    std::string status;
    std::chrono::milliseconds response_time{0};
    std::string error_message;  // Set when status is ERROR
    std::chrono::system_clock::time_point checked_at;

    [[nodiscard]] bool is_active() const noexcept { return status == HealthState::ACTIVE; }
};

struct PolicyInfo {
    std::string name;
    std::string version;
    std::string description;
    nlohmann::json parameters = nlohmann::json::object();
};

inline void from_json(const nlohmann::json& j, AdapterConfig& c) {
    c.type = j.value("type", "");
    c.parameters = j.value("parameters", nlohmann::json::object());
}

inline void to_json(nlohmann::json& j, const AdapterConfig& c) {
    j = nlohmann::json{{"type", c.type}, {"parameters", c.parameters}};
}

inline void to_json(nlohmann::json& j, const ProviderDeploymentResult& r) {
    j = nlohmann::json{{"deploymentId", r.deployment_id},
                       {"status", r.status},
                       {"deployedAt", logging::format_rfc3339(r.deployed_at)}};
}

inline void to_json(nlohmann::json& j, const ProviderStatus& s) {
    j = nlohmann::json{
        {"id", s.id}, {"name", s.name}, {"kind", s.kind}, {"status", s.status}, {"spec", s.spec}};
    if (s.deployed_at) {
        j["deployedAt"] = *s.deployed_at;
    }
}

inline void to_json(nlohmann::json& j, const HealthStatus& h) {
    j = nlohmann::json{{"status", h.status},
                       {"responseTimeMs", h.response_time.count()},
                       {"checkedAt", logging::format_rfc3339(h.checked_at)}};
    if (!h.error_message.empty()) {
        j["errorMessage"] = h.error_message;
    }
}

inline void to_json(nlohmann::json& j, const PolicyInfo& p) {
    j = nlohmann::json{{"name", p.name},
                       {"version", p.version},
                       {"description", p.description},
                       {"parameters", p.parameters}};
}

}  // namespace switchyard::adapter
