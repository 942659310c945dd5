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

// Switchyard Gateway Adapter - Header
// Capability interface for remotely managing one kind of gateway deployment

#pragma once

#include <optional>
#include <string>
#include <string_view>
#include <system_error>
#include <vector>

#include "types.hpp"

namespace switchyard::adapter {

/// Remote management of gateways of one deployment kind.
///
/// Calls are synchronous and may block on network I/O. Implementations must
/// be safe to call from several threads at once.
class GatewayAdapter {
public:
    virtual ~GatewayAdapter() = default;

    /// Check that a gateway management endpoint is reachable and healthy
    [[nodiscard]] virtual std::error_code validate_gateway_endpoint(
        std::string_view control_plane_url) = 0;

    /// Probe a gateway. Never fails: an unhealthy or unreachable endpoint is
    /// reported as HealthState::ERROR.
    [[nodiscard]] virtual HealthStatus check_health(std::string_view control_plane_url) = 0;

    [[nodiscard]] virtual std::optional<ProviderDeploymentResult> deploy_provider(
        std::string_view gateway_id, const ProviderDeploymentConfig& config,
        std::error_code& error_out) = 0;

    [[nodiscard]] virtual std::optional<ProviderDeploymentResult> update_provider(
        std::string_view gateway_id, std::string_view provider_id,
        const ProviderDeploymentConfig& config, std::error_code& error_out) = 0;

    [[nodiscard]] virtual std::error_code undeploy_provider(std::string_view gateway_id,
                                                            std::string_view provider_id) = 0;

    [[nodiscard]] virtual std::optional<ProviderStatus> get_provider_status(
        std::string_view gateway_id, std::string_view provider_id, std::error_code& error_out) = 0;

    [[nodiscard]] virtual std::optional<std::vector<ProviderStatus>> list_providers(
        std::string_view gateway_id, std::error_code& error_out) = 0;

    [[nodiscard]] virtual std::optional<std::vector<PolicyInfo>> get_policies(
        std::string_view gateway_id, std::error_code& error_out) = 0;

    [[nodiscard]] virtual std::string adapter_type() const = 0;

    /// Release adapter resources
    virtual std::error_code close() = 0;
};

}  // namespace switchyard::adapter
