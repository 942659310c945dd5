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

// Switchyard Configuration - Implementation

#include "config.hpp"

#include <atomic>
#include <cstdio>
#include <cstdlib>
#include <fstream>
#include <nlohmann/json.hpp>
#include <set>
#include <sstream>

#include "../core/errors.hpp"
#include "../store/gateway_store.hpp"

namespace switchyard::control {

namespace {

bool is_known_adapter_type(const std::string& type) {
    return type == "on-premise" || type == "mock";
}

}  // namespace

// ConfigLoader implementation

std::optional<Config> ConfigLoader::load_from_file(std::string_view path) {
    std::string path_str{path};
    std::ifstream file{path_str};
    if (!file.is_open()) {
        return std::nullopt;
    }

    std::stringstream buffer;
    buffer << file.rdbuf();
    std::string json = buffer.str();

    return load_from_json(json);
}

std::optional<Config> ConfigLoader::load_from_json(std::string_view json) {
    Config config;

    try {
        auto j = nlohmann::json::parse(json);
        config = j.get<Config>();
    } catch (const nlohmann::json::exception& e) {
        fprintf(stderr, "JSON parsing error: %s\n", e.what());
        return std::nullopt;
    }

    auto validation = validate(config);
    if (validation.has_errors()) {
        for (const auto& error : validation.errors) {
            fprintf(stderr, "Configuration error: %s\n", error.c_str());
        }
        return std::nullopt;
    }

    return config;
}

ValidationResult ConfigLoader::validate(const Config& config) {
    ValidationResult result;

    // Server
    if (config.server.listen_port == 0) {
        result.add_error("Server listen_port must be > 0");
    }

    if (config.server.backlog == 0) {
        result.add_error("Server backlog must be > 0");
    }

    if (config.server.max_handshake_bytes == 0) {
        result.add_error("Server max_handshake_bytes must be > 0");
    }

    if (config.server.handshake_timeout_ms == 0) {
        result.add_warning("Server handshake_timeout_ms is 0 (slow clients can hold handler threads)");
    }

    if (config.server.ws_path.empty() || config.server.ws_path.front() != '/') {
        result.add_error("Server ws_path must start with '/'");
    }

    // WebSocket registry
    const auto& ws = config.websocket;
    if (ws.max_connections == 0) {
        result.add_error("WebSocket max_connections must be > 0");
    }

    if (ws.heartbeat_interval_ms == 0) {
        result.add_error("WebSocket heartbeat_interval_ms must be > 0");
    }

    if (ws.heartbeat_interval_ms >= ws.heartbeat_timeout_ms) {
        result.add_error("WebSocket heartbeat_interval_ms must be < heartbeat_timeout_ms");
    }

    if (ws.max_message_size == 0) {
        result.add_error("WebSocket max_message_size must be > 0");
    }

    if (ws.rate_limit_per_minute == 0) {
        result.add_warning("WebSocket rate_limit_per_minute is 0 (connect rate limiting disabled)");
    }

    // Adapters
    if (!is_known_adapter_type(config.adapters.default_type)) {
        result.add_error("Unknown adapters default_type '" + config.adapters.default_type + "'");
    }

    // Credentials
    if (!config.credentials.encryption_key.empty()) {
        auto key = crypto::base64_decode(config.credentials.encryption_key);
        if (!key || key->size() != crypto::KEY_SIZE) {
            result.add_error("Credentials encryption_key must be base64 of exactly " +
                             std::to_string(crypto::KEY_SIZE) + " bytes");
        }
    } else if (config.credentials.encryption_key_env.empty()) {
        result.add_warning(
            "No credentials encryption key configured (an ephemeral key will be generated)");
    }

    // Admin
    if (config.admin.enabled) {
        if (config.admin.port == 0) {
            result.add_error("Admin port must be > 0");
        } else if (config.admin.port == config.server.listen_port) {
            result.add_error("Admin port must differ from server listen_port");
        }
    }

    // Logging
    if (config.logging.level != "debug" && config.logging.level != "info" &&
        config.logging.level != "warning" && config.logging.level != "error") {
        result.add_error("Unknown logging level '" + config.logging.level + "'");
    }

    if (config.logging.format != "json" && config.logging.format != "text") {
        result.add_error("Unknown logging format '" + config.logging.format + "'");
    }

    // Gateway seeds
    std::set<std::string> ids;
    std::set<std::string> api_keys;
    for (const auto& gateway : config.gateways) {
        if (gateway.id.empty()) {
            result.add_error("Gateway id cannot be empty");
            continue;
        }

        if (!ids.insert(gateway.id).second) {
            result.add_error("Duplicate gateway id '" + gateway.id + "'");
        }

        if (gateway.api_key.empty()) {
            result.add_error("Gateway '" + gateway.id + "' has no api_key");
        } else if (!api_keys.insert(gateway.api_key).second) {
            result.add_error("Gateway '" + gateway.id + "' reuses another gateway's api_key");
        }

        if (!gateway.adapter_type.empty() && !is_known_adapter_type(gateway.adapter_type)) {
            result.add_error("Unknown adapter_type '" + gateway.adapter_type + "' in gateway '" +
                             gateway.id + "'");
        }

        if (!gateway.adapter_config.is_object()) {
            result.add_error("Gateway '" + gateway.id + "' adapter_config must be an object");
        }

        const auto& type =
            gateway.adapter_type.empty() ? config.adapters.default_type : gateway.adapter_type;
        if (type == "on-premise") {
            if (gateway.adapter_config.is_object() &&
                !gateway.adapter_config.contains("controlPlaneUrl")) {
                result.add_warning("Gateway '" + gateway.id +
                                   "' has no controlPlaneUrl (management calls will fail)");
            }
            if (!gateway.credentials) {
                result.add_warning("Gateway '" + gateway.id +
                                   "' has no credentials (management calls will fail)");
            }
        }
    }

    return result;
}

bool ConfigLoader::save_to_file(const Config& config, std::string_view path) {
    std::string json = to_json(config);
    if (json.empty()) {
        return false;
    }

    std::string path_str{path};
    std::ofstream file{path_str};
    if (!file.is_open()) {
        return false;
    }

    file << json;
    return file.good();
}

std::string ConfigLoader::to_json(const Config& config) {
    try {
        nlohmann::json j = config;
        return j.dump(2);
    } catch (const nlohmann::json::exception&) {
        return "";
    }
}

// Key and seed helpers

std::optional<std::vector<uint8_t>> resolve_encryption_key(const CredentialsConfig& credentials,
                                                           std::error_code& error_out) {
    error_out.clear();

    std::string encoded = credentials.encryption_key;
    if (encoded.empty() && !credentials.encryption_key_env.empty()) {
        if (const char* env = std::getenv(credentials.encryption_key_env.c_str())) {
            encoded = env;
        }
    }

    if (encoded.empty()) {
        return std::nullopt;
    }

    auto key = crypto::base64_decode(encoded);
    if (!key || key->size() != crypto::KEY_SIZE) {
        error_out = core::Errc::invalid_key_size;
        return std::nullopt;
    }
    return key;
}

std::optional<std::vector<store::GatewayRecord>> build_gateway_records(
    const Config& config, std::span<const uint8_t> key, std::error_code& error_out) {
    error_out.clear();

    std::vector<store::GatewayRecord> records;
    records.reserve(config.gateways.size());

    for (const auto& seed : config.gateways) {
        store::GatewayRecord record;
        record.id = seed.id;
        record.name = seed.name.empty() ? seed.id : seed.name;
        record.adapter_type =
            seed.adapter_type.empty() ? config.adapters.default_type : seed.adapter_type;
        record.adapter_config = seed.adapter_config;
        record.api_key_hash = store::hash_api_key(seed.api_key);

        if (seed.credentials) {
            auto sealed = crypto::encrypt_credentials(*seed.credentials, key, error_out);
            if (!sealed) {
                return std::nullopt;
            }
            record.encrypted_credentials = std::move(*sealed);
        }

        records.push_back(std::move(record));
    }

    return records;
}

// ConfigManager implementation

bool ConfigManager::load(std::string_view path) {
    config_path_ = path;

    auto maybe_config = ConfigLoader::load_from_file(path);
    if (!maybe_config.has_value()) {
        return false;
    }

    last_validation_ = ConfigLoader::validate(*maybe_config);
    if (last_validation_.has_errors()) {
        return false;
    }

    current_config_ = std::make_shared<const Config>(std::move(*maybe_config));

    return true;
}

bool ConfigManager::reload() {
    if (config_path_.empty()) {
        return false;
    }

    auto maybe_config = ConfigLoader::load_from_file(config_path_);
    if (!maybe_config.has_value()) {
        return false;
    }

    last_validation_ = ConfigLoader::validate(*maybe_config);
    if (last_validation_.has_errors()) {
        return false;
    }

    // Readers holding the old config keep it alive until they release it
    auto new_config = std::make_shared<const Config>(std::move(*maybe_config));
    std::atomic_store(&current_config_, new_config);

    return true;
}

std::shared_ptr<const Config> ConfigManager::get() const noexcept {
    return std::atomic_load(&current_config_);
}

}  // namespace switchyard::control
