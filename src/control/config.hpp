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

// Switchyard Configuration - Header
// JSON configuration schema using nlohmann/json for serialization

#pragma once

#include <cstdint>
#include <memory>
#include <nlohmann/json.hpp>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <system_error>
#include <vector>

#include "../crypto/credential_vault.hpp"

namespace switchyard::store {
struct GatewayRecord;
}

namespace switchyard::control {

/// Gateway-facing listener
struct ServerConfig {
    std::string listen_address = "0.0.0.0";
    uint16_t listen_port = 9243;
    uint32_t backlog = 128;

    uint32_t handshake_timeout_ms = 10000;  // Upgrade request must arrive within this
    uint32_t max_handshake_bytes = 16384;   // 16KB (request line + headers)
    std::string ws_path = "/api/internal/v1/ws/gateways/connect";
};

/// Connection registry and heartbeat settings
struct WebSocketConfig {
    uint32_t max_connections = 1000;
    uint32_t heartbeat_interval_ms = 20000;
    uint32_t heartbeat_timeout_ms = 30000;    // Must exceed heartbeat_interval_ms
    uint32_t rate_limit_per_minute = 10;      // Connect attempts per client address (0 = off)
    uint32_t max_message_size = 1048576;      // 1MB inbound message limit
};

struct AdaptersConfig {
    std::string default_type = "on-premise";  // For gateway seeds without adapter_type
};

/// Credential vault key source (inline base64 wins over the environment)
struct CredentialsConfig {
    std::string encryption_key;                                 // Base64, 32 bytes decoded
    std::string encryption_key_env = "SWITCHYARD_ENCRYPTION_KEY";
};

/// Loopback-only operator endpoint
struct AdminConfig {
    bool enabled = true;
    uint16_t port = 9244;
};

/// Logging configuration
struct LogConfig {
    std::string level = "info";                  // debug, info, warning, error
    std::string format = "json";                 // json, text
    std::string output = "/var/log/switchyard";  // Log directory, or "stdout"

    struct RotationConfig {
        uint32_t max_size_mb = 100;
        uint32_t max_files = 10;
    } rotation;
};

/// Gateway record seeded into the in-memory store at startup.
/// Credentials are given in plaintext here and sealed while loading.
struct GatewaySeedConfig {
    std::string id;
    std::string name;
    std::string api_key;
    std::string adapter_type;  // Empty = adapters.default_type
    nlohmann::json adapter_config = nlohmann::json::object();
    std::optional<crypto::GatewayCredentials> credentials;
};

/// Full Switchyard configuration
struct Config {
    ServerConfig server;
    WebSocketConfig websocket;
    AdaptersConfig adapters;
    CredentialsConfig credentials;
    AdminConfig admin;
    LogConfig logging;
    std::vector<GatewaySeedConfig> gateways;

    // Metadata
    std::string version = "1.0";
    std::optional<std::string> description;
};

// Custom from_json/to_json (missing fields keep their defaults)

inline void from_json(const nlohmann::json& j, ServerConfig& s) {
    s.listen_address = j.value("listen_address", std::string("0.0.0.0"));
    s.listen_port = j.value("listen_port", uint16_t(9243));
    s.backlog = j.value("backlog", 128u);
    s.handshake_timeout_ms = j.value("handshake_timeout_ms", 10000u);
    s.max_handshake_bytes = j.value("max_handshake_bytes", 16384u);
    s.ws_path = j.value("ws_path", std::string("/api/internal/v1/ws/gateways/connect"));
}

inline void from_json(const nlohmann::json& j, WebSocketConfig& w) {
    w.max_connections = j.value("max_connections", 1000u);
    w.heartbeat_interval_ms = j.value("heartbeat_interval_ms", 20000u);
    w.heartbeat_timeout_ms = j.value("heartbeat_timeout_ms", 30000u);
    w.rate_limit_per_minute = j.value("rate_limit_per_minute", 10u);
    w.max_message_size = j.value("max_message_size", 1048576u);
}

inline void from_json(const nlohmann::json& j, AdaptersConfig& a) {
    a.default_type = j.value("default_type", std::string("on-premise"));
}

inline void from_json(const nlohmann::json& j, CredentialsConfig& c) {
    c.encryption_key = j.value("encryption_key", std::string());
    c.encryption_key_env = j.value("encryption_key_env", std::string("SWITCHYARD_ENCRYPTION_KEY"));
}

inline void from_json(const nlohmann::json& j, AdminConfig& a) {
    a.enabled = j.value("enabled", true);
    a.port = j.value("port", uint16_t(9244));
}

inline void from_json(const nlohmann::json& j, LogConfig::RotationConfig& r) {
    r.max_size_mb = j.value("max_size_mb", 100u);
    r.max_files = j.value("max_files", 10u);
}

inline void from_json(const nlohmann::json& j, LogConfig& l) {
    l.level = j.value("level", std::string("info"));
    l.format = j.value("format", std::string("json"));
    l.output = j.value("output", std::string("/var/log/switchyard"));
    if (j.contains("rotation")) {
        j.at("rotation").get_to(l.rotation);
    }
}

inline void from_json(const nlohmann::json& j, GatewaySeedConfig& g) {
    g.id = j.value("id", std::string());
    g.name = j.value("name", std::string());
    g.api_key = j.value("api_key", std::string());
    g.adapter_type = j.value("adapter_type", std::string());
    g.adapter_config = j.value("adapter_config", nlohmann::json::object());
    if (j.contains("credentials")) {
        g.credentials = j.at("credentials").get<crypto::GatewayCredentials>();
    }
}

inline void from_json(const nlohmann::json& j, Config& c) {
    // contains() + get_to() keeps defaults for absent sections
    if (j.contains("server")) {
        j.at("server").get_to(c.server);
    }
    if (j.contains("websocket")) {
        j.at("websocket").get_to(c.websocket);
    }
    if (j.contains("adapters")) {
        j.at("adapters").get_to(c.adapters);
    }
    if (j.contains("credentials")) {
        j.at("credentials").get_to(c.credentials);
    }
    if (j.contains("admin")) {
        j.at("admin").get_to(c.admin);
    }
    if (j.contains("logging")) {
        j.at("logging").get_to(c.logging);
    }
    if (j.contains("gateways")) {
        j.at("gateways").get_to(c.gateways);
    }
    c.version = j.value("version", std::string("1.0"));
    if (j.contains("description") && j.at("description").is_string()) {
        c.description = j.at("description").get<std::string>();
    }
}

inline void to_json(nlohmann::json& j, const ServerConfig& s) {
    j = nlohmann::json{{"listen_address", s.listen_address},
                       {"listen_port", s.listen_port},
                       {"backlog", s.backlog},
                       {"handshake_timeout_ms", s.handshake_timeout_ms},
                       {"max_handshake_bytes", s.max_handshake_bytes},
                       {"ws_path", s.ws_path}};
}

inline void to_json(nlohmann::json& j, const WebSocketConfig& w) {
    j = nlohmann::json{{"max_connections", w.max_connections},
                       {"heartbeat_interval_ms", w.heartbeat_interval_ms},
                       {"heartbeat_timeout_ms", w.heartbeat_timeout_ms},
                       {"rate_limit_per_minute", w.rate_limit_per_minute},
                       {"max_message_size", w.max_message_size}};
}

inline void to_json(nlohmann::json& j, const AdaptersConfig& a) {
    j = nlohmann::json{{"default_type", a.default_type}};
}

// The inline key is never written back out
inline void to_json(nlohmann::json& j, const CredentialsConfig& c) {
    j = nlohmann::json{{"encryption_key_env", c.encryption_key_env}};
}

inline void to_json(nlohmann::json& j, const AdminConfig& a) {
    j = nlohmann::json{{"enabled", a.enabled}, {"port", a.port}};
}

inline void to_json(nlohmann::json& j, const LogConfig::RotationConfig& r) {
    j = nlohmann::json{{"max_size_mb", r.max_size_mb}, {"max_files", r.max_files}};
}

inline void to_json(nlohmann::json& j, const LogConfig& l) {
    j = nlohmann::json{
        {"level", l.level}, {"format", l.format}, {"output", l.output}, {"rotation", l.rotation}};
}

// Secrets (api_key, credentials) are omitted
inline void to_json(nlohmann::json& j, const GatewaySeedConfig& g) {
    j = nlohmann::json{{"id", g.id},
                       {"name", g.name},
                       {"adapter_type", g.adapter_type},
                       {"adapter_config", g.adapter_config}};
}

inline void to_json(nlohmann::json& j, const Config& c) {
    j["server"] = c.server;
    j["websocket"] = c.websocket;
    j["adapters"] = c.adapters;
    j["credentials"] = c.credentials;
    j["admin"] = c.admin;
    j["logging"] = c.logging;
    j["gateways"] = c.gateways;
    j["version"] = c.version;
    if (c.description) {
        j["description"] = *c.description;
    }
}

/// Configuration validation result
struct ValidationResult {
    bool valid = true;
    std::vector<std::string> errors;
    std::vector<std::string> warnings;

    void add_error(std::string error) {
        valid = false;
        errors.push_back(std::move(error));
    }

    void add_warning(std::string warning) { warnings.push_back(std::move(warning)); }

    [[nodiscard]] bool has_errors() const noexcept { return !valid || !errors.empty(); }
};

/// Configuration loader
class ConfigLoader {
public:
    /// Load configuration from JSON file
    [[nodiscard]] static std::optional<Config> load_from_file(std::string_view path);

    /// Load configuration from JSON string
    [[nodiscard]] static std::optional<Config> load_from_json(std::string_view json);

    /// Validate configuration
    [[nodiscard]] static ValidationResult validate(const Config& config);

    /// Save configuration to JSON file (secrets omitted)
    [[nodiscard]] static bool save_to_file(const Config& config, std::string_view path);

    /// Convert configuration to JSON string
    [[nodiscard]] static std::string to_json(const Config& config);
};

/// Resolve the credential encryption key: inline base64 first, then the
/// environment variable named by encryption_key_env.
/// @return nullopt with empty error_out when no key is configured at all,
///         nullopt with invalid_key_size when a key is present but malformed
[[nodiscard]] std::optional<std::vector<uint8_t>> resolve_encryption_key(
    const CredentialsConfig& credentials, std::error_code& error_out);

/// Turn gateway seeds into store records, sealing credentials with key
[[nodiscard]] std::optional<std::vector<store::GatewayRecord>> build_gateway_records(
    const Config& config, std::span<const uint8_t> key, std::error_code& error_out);

/// Configuration manager with hot-reload support (RCU pattern)
class ConfigManager {
public:
    ConfigManager() = default;
    ~ConfigManager() = default;

    // Non-copyable, non-movable
    ConfigManager(const ConfigManager&) = delete;
    ConfigManager& operator=(const ConfigManager&) = delete;

    /// Load initial configuration
    [[nodiscard]] bool load(std::string_view path);

    /// Reload configuration (hot-reload with RCU)
    [[nodiscard]] bool reload();

    /// Get current configuration (thread-safe read)
    [[nodiscard]] std::shared_ptr<const Config> get() const noexcept;

    [[nodiscard]] std::string_view config_path() const noexcept { return config_path_; }

    [[nodiscard]] bool is_loaded() const noexcept { return current_config_ != nullptr; }

    [[nodiscard]] const ValidationResult& last_validation() const noexcept {
        return last_validation_;
    }

private:
    std::string config_path_;
    std::shared_ptr<const Config> current_config_;
    ValidationResult last_validation_;
};

}  // namespace switchyard::control
