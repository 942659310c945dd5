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

// Switchyard Mock Adapter - Header
// Deterministic in-memory adapter for tests and local development

#pragma once

#include <quill/Logger.h>

#include <chrono>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <system_error>
#include <vector>

#include "../core/containers.hpp"
#include "gateway_adapter.hpp"
#include "types.hpp"

namespace switchyard::adapter {

constexpr std::string_view MOCK_ADAPTER_TYPE = "mock";

struct MockAdapterOptions {
    std::string adapter_type;  // Reported type; empty means "mock"
    bool should_fail = false;
    std::string fail_message = "mock adapter failure";
    std::chrono::milliseconds response_time{10};  // Reported by check_health

    /// Read shouldFail / adapterType / failMessage / responseTimeMs
    [[nodiscard]] static MockAdapterOptions from_parameters(const nlohmann::json& parameters);
};

/// Records deployed providers per gateway in memory.
/// With should_fail set every operation fails with Errc::adapter_failure.
class MockAdapter final : public GatewayAdapter {
public:
    MockAdapter(MockAdapterOptions options, quill::Logger* logger);

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

    [[nodiscard]] std::string adapter_type() const override;

    std::error_code close() override;

    [[nodiscard]] const MockAdapterOptions& options() const noexcept { return options_; }

private:
    /// Log and report the configured failure
    std::error_code fail(std::string_view operation, std::string_view subject) const;

    /// configuration_error when kind or spec has the wrong JSON type
    std::optional<ProviderStatus> make_status(std::string id,
                                              const ProviderDeploymentConfig& config,
                                              std::error_code& error_out) const;

    MockAdapterOptions options_;
    quill::Logger* logger_;

    mutable std::mutex mutex_;
    // gateway id -> provider id -> status (ordered for stable listings)
    core::fast_map<std::string, std::map<std::string, ProviderStatus>> providers_;
};

}  // namespace switchyard::adapter
