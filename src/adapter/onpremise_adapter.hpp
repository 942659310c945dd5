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

// Switchyard On-Premise Adapter - Header
// Manages self-hosted gateways through their REST management API

#pragma once

#include <quill/Logger.h>

#include <chrono>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <system_error>
#include <vector>

#include "../crypto/credential_vault.hpp"
#include "gateway_adapter.hpp"
#include "types.hpp"

namespace httplib {
class Client;
}

namespace switchyard::store {
class GatewayStore;
}

namespace switchyard::adapter {

constexpr std::string_view ONPREMISE_ADAPTER_TYPE = "on-premise";

struct OnPremiseOptions {
    std::chrono::milliseconds timeout{30000};
    std::chrono::milliseconds health_check_timeout{5000};

    /// Read timeoutMs / healthCheckTimeoutMs (missing keys keep defaults)
    [[nodiscard]] static OnPremiseOptions from_parameters(const nlohmann::json& parameters);
};

/// Adapter for gateways reachable at the controlPlaneUrl of their record.
///
/// Each call loads the gateway record, decrypts its credentials and talks to
/// the gateway with a client created for that call only.
class OnPremiseAdapter final : public GatewayAdapter {
public:
    OnPremiseAdapter(OnPremiseOptions options, std::shared_ptr<store::GatewayStore> store,
                     std::vector<uint8_t> encryption_key, quill::Logger* logger);
    ~OnPremiseAdapter() override;

    [[nodiscard]] std::error_code validate_gateway_endpoint(
        std::string_view control_plane_url) override;

    [[nodiscard]] HealthStatus check_health(std::string_view control_plane_url) override;

    [[nodiscard]] std::optional<ProviderDeploymentResult> deploy_provider(
        std::string_view gateway_id, const ProviderDeploymentConfig& config,
        std::error_code& error_out) override;

    [[nodiscard]] std::optional<ProviderDeploymentResult> update_provider(
        std::string_view gateway_id, std::string_view provider_id,
        const ProviderDeploymentConfig& config, std::error_code& error_out) override;

    [[nodiscard]] std::error_code undeploy_provider(std::string_view gateway_id,
                                                    std::string_view provider_id) override;

    [[nodiscard]] std::optional<ProviderStatus> get_provider_status(
        std::string_view gateway_id, std::string_view provider_id,
        std::error_code& error_out) override;

    [[nodiscard]] std::optional<std::vector<ProviderStatus>> list_providers(
        std::string_view gateway_id, std::error_code& error_out) override;

    [[nodiscard]] std::optional<std::vector<PolicyInfo>> get_policies(
        std::string_view gateway_id, std::error_code& error_out) override;

    [[nodiscard]] std::string adapter_type() const override {
        return std::string(ONPREMISE_ADAPTER_TYPE);
    }

    std::error_code close() override { return {}; }

    [[nodiscard]] const OnPremiseOptions& options() const noexcept { return options_; }

private:
    /// Resolved target of one management call
    struct GatewayTarget {
        std::string base_url;     // scheme://host[:port]
        std::string path_prefix;  // Path part of controlPlaneUrl, no trailing '/'
        crypto::GatewayCredentials credentials;
    };

    /// Load record, decrypt credentials, read controlPlaneUrl
    std::optional<GatewayTarget> resolve_target(std::string_view gateway_id,
                                                std::error_code& error_out) const;

    /// Fresh client with timeouts and authentication applied
    std::unique_ptr<httplib::Client> make_client(const GatewayTarget& target,
                                                 std::chrono::milliseconds timeout) const;

    OnPremiseOptions options_;
    std::shared_ptr<store::GatewayStore> store_;
    std::vector<uint8_t> encryption_key_;
    quill::Logger* logger_;
};

}  // namespace switchyard::adapter
