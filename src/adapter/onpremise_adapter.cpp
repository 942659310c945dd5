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

// Switchyard On-Premise Adapter - Implementation

#include "onpremise_adapter.hpp"

#include <httplib.h>
#include <openssl/crypto.h>

#include <fmt/format.h>

#include <optional>
#include <string>
#include <utility>

#include "../core/errors.hpp"
#include "../core/logging.hpp"
#include "../store/gateway_store.hpp"

namespace switchyard::adapter {

namespace {

constexpr const char* JSON_CONTENT_TYPE = "application/json";

/// Split "scheme://host:port/prefix/" into base URL and path prefix
std::pair<std::string, std::string> split_url(std::string_view url) {
    while (!url.empty() && url.back() == '/') {
        url.remove_suffix(1);
    }

    size_t host_start = url.find("://");
    host_start = (host_start == std::string_view::npos) ? 0 : host_start + 3;

    size_t path_start = url.find('/', host_start);
    if (path_start == std::string_view::npos) {
        return {std::string(url), std::string()};
    }
    return {std::string(url.substr(0, path_start)), std::string(url.substr(path_start))};
}

/// Serialize a provider configuration for the request body
/// @return nullopt with invalid_payload when it holds invalid UTF-8
std::optional<std::string> serialize_configuration(const nlohmann::json& configuration,
                                                   std::error_code& error_out) {
    try {
        return configuration.dump();
    } catch (const nlohmann::json::type_error&) {
        error_out = core::Errc::invalid_payload;
        return std::nullopt;
    }
}

std::string string_field(const nlohmann::json& j, const char* key) {
    if (!j.is_object()) {
        return {};
    }
    auto it = j.find(key);
    if (it == j.end() || !it->is_string()) {
        return {};
    }
    return it->get<std::string>();
}

const nlohmann::json* object_field(const nlohmann::json& j, const char* key) {
    if (!j.is_object()) {
        return nullptr;
    }
    auto it = j.find(key);
    if (it == j.end() || !it->is_object()) {
        return nullptr;
    }
    return &*it;
}

/// Parse a JSON object body (invalid_response otherwise)
std::optional<nlohmann::json> parse_object(const std::string& body, std::error_code& error_out) {
    auto parsed = nlohmann::json::parse(body, nullptr, false);
    if (parsed.is_discarded() || !parsed.is_object()) {
        error_out = core::Errc::invalid_response;
        return std::nullopt;
    }
    return parsed;
}

ProviderDeploymentResult to_deployment_result(const nlohmann::json& body) {
    ProviderDeploymentResult result;
    result.deployment_id = string_field(body, "id");
    result.status = string_field(body, "status");
    result.deployed_at = std::chrono::system_clock::now();
    return result;
}

}  // namespace

OnPremiseOptions OnPremiseOptions::from_parameters(const nlohmann::json& parameters) {
    OnPremiseOptions options;
    if (!parameters.is_object()) {
        return options;
    }

    if (auto it = parameters.find("timeoutMs"); it != parameters.end() && it->is_number_integer()) {
        options.timeout = std::chrono::milliseconds(it->get<int64_t>());
    }
    if (auto it = parameters.find("healthCheckTimeoutMs");
        it != parameters.end() && it->is_number_integer()) {
        options.health_check_timeout = std::chrono::milliseconds(it->get<int64_t>());
    }
    return options;
}

OnPremiseAdapter::OnPremiseAdapter(OnPremiseOptions options,
                                   std::shared_ptr<store::GatewayStore> store,
                                   std::vector<uint8_t> encryption_key, quill::Logger* logger)
    : options_(options),
      store_(std::move(store)),
      encryption_key_(std::move(encryption_key)),
      logger_(logger) {}

OnPremiseAdapter::~OnPremiseAdapter() {
    if (!encryption_key_.empty()) {
        OPENSSL_cleanse(encryption_key_.data(), encryption_key_.size());
    }
}

std::optional<OnPremiseAdapter::GatewayTarget> OnPremiseAdapter::resolve_target(
    std::string_view gateway_id, std::error_code& error_out) const {
    auto record = store_->find_by_id(gateway_id);
    if (!record) {
        error_out = core::Errc::gateway_not_found;
        return std::nullopt;
    }

    if (record->encrypted_credentials.empty()) {
        LOG_WARNING(logger_, "Gateway has no credentials stored: gateway_id={}", gateway_id);
        error_out = core::Errc::missing_credentials;
        return std::nullopt;
    }

    auto credentials =
        crypto::decrypt_credentials(record->encrypted_credentials, encryption_key_, error_out);
    if (!credentials) {
        LOG_ERROR(logger_, "Failed to decrypt gateway credentials: gateway_id={}, error={}",
                  gateway_id, error_out.message());
        return std::nullopt;
    }

    auto control_plane_url = string_field(record->adapter_config, "controlPlaneUrl");
    if (control_plane_url.empty()) {
        LOG_ERROR(logger_, "controlPlaneUrl not found in gateway adapter config: gateway_id={}",
                  gateway_id);
        error_out = core::Errc::configuration_error;
        return std::nullopt;
    }

    auto [base_url, prefix] = split_url(control_plane_url);
    return GatewayTarget{std::move(base_url), std::move(prefix), std::move(*credentials)};
}

std::unique_ptr<httplib::Client> OnPremiseAdapter::make_client(
    const GatewayTarget& target, std::chrono::milliseconds timeout) const {
    auto client = std::make_unique<httplib::Client>(target.base_url);
    client->set_connection_timeout(timeout);
    client->set_read_timeout(timeout);
    client->set_write_timeout(timeout);

    if (!target.credentials.username.empty()) {
        client->set_basic_auth(target.credentials.username, target.credentials.password);
    } else if (!target.credentials.token.empty()) {
        client->set_bearer_token_auth(target.credentials.token);
    }
    return client;
}

std::error_code OnPremiseAdapter::validate_gateway_endpoint(std::string_view control_plane_url) {
    auto [base_url, prefix] = split_url(control_plane_url);

    httplib::Client client(base_url);
    client.set_connection_timeout(options_.timeout);
    client.set_read_timeout(options_.timeout);

    auto res = client.Get(prefix + "/health");
    if (!res) {
        LOG_WARNING(logger_, "Gateway endpoint unreachable: url={}, error={}", control_plane_url,
                    httplib::to_string(res.error()));
        return core::Errc::gateway_unreachable;
    }
    if (res->status != 200) {
        LOG_WARNING(logger_, "Gateway health check failed: url={}, status={}", control_plane_url,
                    res->status);
        return core::Errc::gateway_request_failed;
    }
    return {};
}

HealthStatus OnPremiseAdapter::check_health(std::string_view control_plane_url) {
    auto [base_url, prefix] = split_url(control_plane_url);

    httplib::Client client(base_url);
    client.set_connection_timeout(options_.health_check_timeout);
    client.set_read_timeout(options_.health_check_timeout);

    auto start = std::chrono::steady_clock::now();
    auto res = client.Get(prefix + "/health");

    HealthStatus status;
    status.response_time = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - start);
    status.checked_at = std::chrono::system_clock::now();
    status.status = HealthState::ACTIVE;

    if (!res) {
        status.status = HealthState::ERROR;
        status.error_message =
            fmt::format("gateway endpoint unreachable: {}", httplib::to_string(res.error()));
    } else if (res->status != 200) {
        status.status = HealthState::ERROR;
        status.error_message = fmt::format("gateway health check failed with status {}",
                                           res->status);
    }
    return status;
}

std::optional<ProviderDeploymentResult> OnPremiseAdapter::deploy_provider(
    std::string_view gateway_id, const ProviderDeploymentConfig& config,
    std::error_code& error_out) {
    error_out.clear();
    LOG_INFO(logger_, "Deploying provider to gateway: gateway_id={}, handle={}", gateway_id,
             config.handle);

    auto target = resolve_target(gateway_id, error_out);
    if (!target) {
        return std::nullopt;
    }

    auto payload = serialize_configuration(config.configuration, error_out);
    if (!payload) {
        LOG_ERROR(logger_, "Provider configuration is not serializable: gateway_id={}, handle={}",
                  gateway_id, config.handle);
        return std::nullopt;
    }

    auto client = make_client(*target, options_.timeout);
    auto res = client->Post(target->path_prefix + "/llm-providers", *payload, JSON_CONTENT_TYPE);
    if (!res) {
        LOG_ERROR(logger_, "Failed to create provider on gateway: gateway_id={}, error={}",
                  gateway_id, httplib::to_string(res.error()));
        error_out = core::Errc::gateway_unreachable;
        return std::nullopt;
    }
    if (res->status != 200 && res->status != 201) {
        LOG_ERROR(logger_, "Create provider failed: gateway_id={}, status={}", gateway_id,
                  res->status);
        error_out = core::Errc::gateway_request_failed;
        return std::nullopt;
    }

    auto body = parse_object(res->body, error_out);
    if (!body) {
        return std::nullopt;
    }
    return to_deployment_result(*body);
}

std::optional<ProviderDeploymentResult> OnPremiseAdapter::update_provider(
    std::string_view gateway_id, std::string_view provider_id,
    const ProviderDeploymentConfig& config, std::error_code& error_out) {
    error_out.clear();
    LOG_INFO(logger_, "Updating provider on gateway: gateway_id={}, provider_id={}", gateway_id,
             provider_id);

    auto target = resolve_target(gateway_id, error_out);
    if (!target) {
        return std::nullopt;
    }

    auto payload = serialize_configuration(config.configuration, error_out);
    if (!payload) {
        LOG_ERROR(logger_,
                  "Provider configuration is not serializable: gateway_id={}, provider_id={}",
                  gateway_id, provider_id);
        return std::nullopt;
    }

    auto client = make_client(*target, options_.timeout);
    auto res = client->Put(fmt::format("{}/llm-providers/{}", target->path_prefix, provider_id),
                           *payload, JSON_CONTENT_TYPE);
    if (!res) {
        LOG_ERROR(logger_, "Failed to update provider on gateway: gateway_id={}, error={}",
                  gateway_id, httplib::to_string(res.error()));
        error_out = core::Errc::gateway_unreachable;
        return std::nullopt;
    }
    if (res->status == 404) {
        error_out = core::Errc::provider_not_found;
        return std::nullopt;
    }
    if (res->status != 200) {
        LOG_ERROR(logger_, "Update provider failed: gateway_id={}, provider_id={}, status={}",
                  gateway_id, provider_id, res->status);
        error_out = core::Errc::gateway_request_failed;
        return std::nullopt;
    }

    auto body = parse_object(res->body, error_out);
    if (!body) {
        return std::nullopt;
    }
    return to_deployment_result(*body);
}

std::error_code OnPremiseAdapter::undeploy_provider(std::string_view gateway_id,
                                                    std::string_view provider_id) {
    LOG_INFO(logger_, "Undeploying provider from gateway: gateway_id={}, provider_id={}",
             gateway_id, provider_id);

    std::error_code ec;
    auto target = resolve_target(gateway_id, ec);
    if (!target) {
        return ec;
    }

    auto client = make_client(*target, options_.timeout);
    auto res = client->Delete(fmt::format("{}/llm-providers/{}", target->path_prefix, provider_id));
    if (!res) {
        LOG_ERROR(logger_, "Failed to delete provider on gateway: gateway_id={}, error={}",
                  gateway_id, httplib::to_string(res.error()));
        return core::Errc::gateway_unreachable;
    }
    if (res->status == 404) {
        return core::Errc::provider_not_found;
    }
    if (res->status != 200 && res->status != 204) {
        LOG_ERROR(logger_, "Delete provider failed: gateway_id={}, provider_id={}, status={}",
                  gateway_id, provider_id, res->status);
        return core::Errc::gateway_request_failed;
    }
    return {};
}

std::optional<ProviderStatus> OnPremiseAdapter::get_provider_status(std::string_view gateway_id,
                                                                    std::string_view provider_id,
                                                                    std::error_code& error_out) {
    error_out.clear();

    auto target = resolve_target(gateway_id, error_out);
    if (!target) {
        return std::nullopt;
    }

    auto client = make_client(*target, options_.timeout);
    auto res = client->Get(fmt::format("{}/llm-providers/{}", target->path_prefix, provider_id));
    if (!res) {
        LOG_ERROR(logger_, "Failed to get provider status: gateway_id={}, error={}", gateway_id,
                  httplib::to_string(res.error()));
        error_out = core::Errc::gateway_unreachable;
        return std::nullopt;
    }
    if (res->status == 404) {
        error_out = core::Errc::provider_not_found;
        return std::nullopt;
    }
    if (res->status != 200) {
        error_out = core::Errc::gateway_request_failed;
        return std::nullopt;
    }

    auto body = parse_object(res->body, error_out);
    if (!body) {
        return std::nullopt;
    }

    const auto* provider = object_field(*body, "provider");
    if (!provider) {
        LOG_ERROR(logger_, "Provider data not found in response: gateway_id={}, provider_id={}",
                  gateway_id, provider_id);
        error_out = core::Errc::invalid_response;
        return std::nullopt;
    }

    ProviderStatus status;
    status.id = string_field(*provider, "id");
    status.status = string_field(*provider, "deploymentStatus");

    if (const auto* configuration = object_field(*provider, "configuration")) {
        if (const auto* metadata = object_field(*configuration, "metadata")) {
            status.name = string_field(*metadata, "name");
        }
        status.kind = string_field(*configuration, "kind");
        if (const auto* spec = object_field(*configuration, "spec")) {
            status.spec = *spec;
        }
    }

    if (const auto* metadata = object_field(*provider, "metadata")) {
        auto deployed_at = string_field(*metadata, "deployedAt");
        if (!deployed_at.empty()) {
            status.deployed_at = std::move(deployed_at);
        }
    }
    return status;
}

std::optional<std::vector<ProviderStatus>> OnPremiseAdapter::list_providers(
    std::string_view gateway_id, std::error_code& error_out) {
    error_out.clear();

    auto target = resolve_target(gateway_id, error_out);
    if (!target) {
        return std::nullopt;
    }

    auto client = make_client(*target, options_.timeout);
    auto res = client->Get(target->path_prefix + "/llm-providers");
    if (!res) {
        LOG_ERROR(logger_, "Failed to list providers: gateway_id={}, error={}", gateway_id,
                  httplib::to_string(res.error()));
        error_out = core::Errc::gateway_unreachable;
        return std::nullopt;
    }
    if (res->status != 200) {
        LOG_ERROR(logger_, "List providers failed: gateway_id={}, status={}", gateway_id,
                  res->status);
        error_out = core::Errc::gateway_request_failed;
        return std::nullopt;
    }

    auto body = parse_object(res->body, error_out);
    if (!body) {
        return std::nullopt;
    }

    std::vector<ProviderStatus> providers;
    auto it = body->find("providers");
    if (it == body->end() || !it->is_array()) {
        return providers;
    }

    for (const auto& item : *it) {
        ProviderStatus status;
        status.id = string_field(item, "id");
        status.name = string_field(item, "displayName");
        status.kind = string_field(item, "template");
        status.status = string_field(item, "status");
        auto created_at = string_field(item, "createdAt");
        if (!created_at.empty()) {
            status.deployed_at = std::move(created_at);
        }
        providers.push_back(std::move(status));
    }
    return providers;
}

std::optional<std::vector<PolicyInfo>> OnPremiseAdapter::get_policies(
    std::string_view gateway_id, std::error_code& error_out) {
    error_out.clear();

    auto target = resolve_target(gateway_id, error_out);
    if (!target) {
        return std::nullopt;
    }

    auto client = make_client(*target, options_.timeout);
    auto res = client->Get(target->path_prefix + "/policies");
    if (!res) {
        LOG_ERROR(logger_, "Failed to list policies: gateway_id={}, error={}", gateway_id,
                  httplib::to_string(res.error()));
        error_out = core::Errc::gateway_unreachable;
        return std::nullopt;
    }
    if (res->status != 200) {
        LOG_ERROR(logger_, "List policies failed: gateway_id={}, status={}", gateway_id,
                  res->status);
        error_out = core::Errc::gateway_request_failed;
        return std::nullopt;
    }

    auto body = parse_object(res->body, error_out);
    if (!body) {
        return std::nullopt;
    }

    std::vector<PolicyInfo> policies;
    auto it = body->find("policies");
    if (it == body->end() || !it->is_array()) {
        return policies;
    }

    for (const auto& item : *it) {
        PolicyInfo policy;
        policy.name = string_field(item, "name");
        policy.description = string_field(item, "description");  // No version in list responses
        if (const auto* parameters = object_field(item, "parameters")) {
            policy.parameters = *parameters;
        }
        policies.push_back(std::move(policy));
    }
    return policies;
}

}  // namespace switchyard::adapter
