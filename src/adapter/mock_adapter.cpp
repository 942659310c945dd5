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

// Switchyard Mock Adapter - Implementation

#include "mock_adapter.hpp"

#include "../core/errors.hpp"
#include "../core/logging.hpp"

namespace switchyard::adapter {

MockAdapterOptions MockAdapterOptions::from_parameters(const nlohmann::json& parameters) {
    MockAdapterOptions options;
    if (!parameters.is_object()) {
        return options;
    }

    options.should_fail = parameters.value("shouldFail", false);
    options.adapter_type = parameters.value("adapterType", "");
    options.fail_message = parameters.value("failMessage", options.fail_message);
    options.response_time =
        std::chrono::milliseconds(parameters.value("responseTimeMs", options.response_time.count()));
    return options;
}

MockAdapter::MockAdapter(MockAdapterOptions options, quill::Logger* logger)
    : options_(std::move(options)), logger_(logger) {}

std::string MockAdapter::adapter_type() const {
    if (!options_.adapter_type.empty()) {
        return options_.adapter_type;
    }
    return std::string(MOCK_ADAPTER_TYPE);
}

std::error_code MockAdapter::close() {
    LOG_DEBUG(logger_, "Mock adapter closed");
    return {};
}

std::error_code MockAdapter::fail(std::string_view operation, std::string_view subject) const {
    LOG_DEBUG(logger_, "Mock adapter failing: operation={}, subject={}, message={}", operation,
              subject, options_.fail_message);
    return core::Errc::adapter_failure;
}

std::error_code MockAdapter::validate_gateway_endpoint(std::string_view control_plane_url) {
    if (options_.should_fail) {
        return fail("validate_gateway_endpoint", control_plane_url);
    }
    LOG_DEBUG(logger_, "Mock gateway validation successful: url={}", control_plane_url);
    return {};
}

HealthStatus MockAdapter::check_health(std::string_view control_plane_url) {
    auto start = std::chrono::steady_clock::now();
    auto ec = validate_gateway_endpoint(control_plane_url);

    HealthStatus status;
    status.response_time = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - start);
    if (options_.response_time.count() > 0) {
        status.response_time = options_.response_time;
    }
    status.checked_at = std::chrono::system_clock::now();

    if (ec) {
        status.status = HealthState::ERROR;
        status.error_message = options_.fail_message + ": " + std::string(control_plane_url);
    } else {
        status.status = HealthState::ACTIVE;
    }
    return status;
}

std::optional<ProviderStatus> MockAdapter::make_status(std::string id,
                                                      const ProviderDeploymentConfig& config,
                                                      std::error_code& error_out) const {
    ProviderStatus status;
    status.id = std::move(id);
    status.name = config.handle;
    status.kind = "LlmProvider";
    status.status = "deployed";
    status.deployed_at = logging::format_rfc3339(std::chrono::system_clock::now());
    if (config.configuration.is_object()) {
        try {
            status.kind = config.configuration.value("kind", status.kind);
            status.spec = config.configuration.value("spec", nlohmann::json::object());
        } catch (const nlohmann::json::exception& e) {
            LOG_WARNING(logger_, "Mock provider configuration rejected: handle={}, error={}",
                        config.handle, e.what());
            error_out = core::Errc::configuration_error;
            return std::nullopt;
        }
    }
    return status;
}

std::optional<ProviderDeploymentResult> MockAdapter::deploy_provider(
    std::string_view gateway_id, const ProviderDeploymentConfig& config,
    std::error_code& error_out) {
    error_out.clear();
    if (options_.should_fail) {
        error_out = fail("deploy_provider", gateway_id);
        return std::nullopt;
    }

    auto id = "mock-" + config.handle;
    auto status = make_status(id, config, error_out);
    if (!status) {
        return std::nullopt;
    }
    {
        std::lock_guard lock(mutex_);
        providers_[std::string(gateway_id)][id] = std::move(*status);
    }

    LOG_DEBUG(logger_, "Mock provider deployed: gateway_id={}, provider_id={}", gateway_id, id);
    return ProviderDeploymentResult{id, "deployed", std::chrono::system_clock::now()};
}

std::optional<ProviderDeploymentResult> MockAdapter::update_provider(
    std::string_view gateway_id, std::string_view provider_id,
    const ProviderDeploymentConfig& config, std::error_code& error_out) {
    error_out.clear();
    if (options_.should_fail) {
        error_out = fail("update_provider", gateway_id);
        return std::nullopt;
    }

    auto status = make_status(std::string(provider_id), config, error_out);
    if (!status) {
        return std::nullopt;
    }

    std::lock_guard lock(mutex_);
    auto gw_it = providers_.find(std::string(gateway_id));
    if (gw_it == providers_.end()) {
        error_out = core::Errc::provider_not_found;
        return std::nullopt;
    }
    auto it = gw_it->second.find(std::string(provider_id));
    if (it == gw_it->second.end()) {
        error_out = core::Errc::provider_not_found;
        return std::nullopt;
    }

    it->second = std::move(*status);
    return ProviderDeploymentResult{std::string(provider_id), "deployed",
                                    std::chrono::system_clock::now()};
}

std::error_code MockAdapter::undeploy_provider(std::string_view gateway_id,
                                               std::string_view provider_id) {
    if (options_.should_fail) {
        return fail("undeploy_provider", gateway_id);
    }

    std::lock_guard lock(mutex_);
    auto gw_it = providers_.find(std::string(gateway_id));
    if (gw_it == providers_.end() || gw_it->second.erase(std::string(provider_id)) == 0) {
        return core::Errc::provider_not_found;
    }
    if (gw_it->second.empty()) {
        providers_.erase(gw_it);
    }
    return {};
}

std::optional<ProviderStatus> MockAdapter::get_provider_status(std::string_view gateway_id,
                                                               std::string_view provider_id,
                                                               std::error_code& error_out) {
    error_out.clear();
    if (options_.should_fail) {
        error_out = fail("get_provider_status", gateway_id);
        return std::nullopt;
    }

    std::lock_guard lock(mutex_);
    auto gw_it = providers_.find(std::string(gateway_id));
    if (gw_it != providers_.end()) {
        auto it = gw_it->second.find(std::string(provider_id));
        if (it != gw_it->second.end()) {
            return it->second;
        }
    }
    error_out = core::Errc::provider_not_found;
    return std::nullopt;
}

std::optional<std::vector<ProviderStatus>> MockAdapter::list_providers(
    std::string_view gateway_id, std::error_code& error_out) {
    error_out.clear();
    if (options_.should_fail) {
        error_out = fail("list_providers", gateway_id);
        return std::nullopt;
    }

    std::vector<ProviderStatus> out;
    std::lock_guard lock(mutex_);
    auto gw_it = providers_.find(std::string(gateway_id));
    if (gw_it != providers_.end()) {
        for (const auto& [id, status] : gw_it->second) {
            out.push_back(status);
        }
    }
    return out;
}

std::optional<std::vector<PolicyInfo>> MockAdapter::get_policies(std::string_view gateway_id,
                                                                 std::error_code& error_out) {
    error_out.clear();
    if (options_.should_fail) {
        error_out = fail("get_policies", gateway_id);
        return std::nullopt;
    }

    return std::vector<PolicyInfo>{
        {"api-key-auth", "v1.0.0", "Validates API keys on incoming requests",
         nlohmann::json{{"header", "api-key"}}},
        {"rate-limit", "v1.0.0", "Limits requests per client",
         nlohmann::json{{"requestsPerMinute", 60}}},
    };
}

}  // namespace switchyard::adapter
