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

// Switchyard Gateway Store - Header
// Gateway records: identity, adapter settings and sealed credentials

#pragma once

#include <cstdint>
#include <nlohmann/json.hpp>
#include <optional>
#include <shared_mutex>
#include <string>
#include <string_view>
#include <system_error>
#include <vector>

#include "../core/containers.hpp"

namespace switchyard::store {

struct GatewayRecord {
    std::string id;
    std::string name;
    std::string adapter_type;
    nlohmann::json adapter_config = nlohmann::json::object();  // Holds controlPlaneUrl
    std::vector<uint8_t> encrypted_credentials;                // Credential vault blob
    std::string api_key_hash;                                  // Hex SHA-256 of the API key
    bool is_active = false;
};

/// Hex-encoded SHA-256 of an API key (keys are never stored in plaintext)
[[nodiscard]] std::string hash_api_key(std::string_view api_key);

/// Persistence boundary for gateway records
class GatewayStore {
public:
    virtual ~GatewayStore() = default;

    [[nodiscard]] virtual std::optional<GatewayRecord> find_by_id(std::string_view id) const = 0;

    /// Resolve the gateway that owns an API key (nullopt if unknown)
    [[nodiscard]] virtual std::optional<GatewayRecord> verify_api_key(
        std::string_view api_key) const = 0;

    /// @return gateway_not_found if the record does not exist
    [[nodiscard]] virtual std::error_code update_active_status(std::string_view id,
                                                               bool active) = 0;
};

/// Thread-safe in-process store
class InMemoryGatewayStore final : public GatewayStore {
public:
    InMemoryGatewayStore() = default;

    /// Insert or replace a record
    void upsert(GatewayRecord record);

    /// @return false if the id was unknown
    bool remove(std::string_view id);

    [[nodiscard]] std::optional<GatewayRecord> find_by_id(std::string_view id) const override;

    [[nodiscard]] std::optional<GatewayRecord> verify_api_key(
        std::string_view api_key) const override;

    [[nodiscard]] std::error_code update_active_status(std::string_view id, bool active) override;

    [[nodiscard]] std::vector<GatewayRecord> list() const;

    [[nodiscard]] size_t size() const;

private:
    mutable std::shared_mutex mutex_;
    core::fast_map<std::string, GatewayRecord> records_;
    core::fast_map<std::string, std::string> id_by_key_hash_;
};

}  // namespace switchyard::store
