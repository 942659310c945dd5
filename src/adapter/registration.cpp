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

// Switchyard Adapter Registration - Implementation

#include "registration.hpp"

#include <vector>

#include "../core/errors.hpp"
#include "../crypto/credential_vault.hpp"
#include "mock_adapter.hpp"
#include "onpremise_adapter.hpp"

namespace switchyard::adapter {

void register_builtin_adapters(AdapterFactory& factory,
                               std::shared_ptr<store::GatewayStore> store,
                               std::span<const uint8_t> encryption_key) {
    std::vector<uint8_t> key(encryption_key.begin(), encryption_key.end());

    factory.register_adapter(
        std::string(ONPREMISE_ADAPTER_TYPE),
        [store = std::move(store), key = std::move(key)](
            const AdapterConfig& config, quill::Logger* logger,
            std::error_code& error_out) -> std::unique_ptr<GatewayAdapter> {
            error_out.clear();
            if (key.size() != crypto::KEY_SIZE) {
                error_out = core::Errc::invalid_key_size;
                return nullptr;
            }
            return std::make_unique<OnPremiseAdapter>(
                OnPremiseOptions::from_parameters(config.parameters), store, key, logger);
        });

    factory.register_adapter(
        std::string(MOCK_ADAPTER_TYPE),
        [](const AdapterConfig& config, quill::Logger* logger,
           std::error_code& error_out) -> std::unique_ptr<GatewayAdapter> {
            error_out.clear();
            try {
                return std::make_unique<MockAdapter>(
                    MockAdapterOptions::from_parameters(config.parameters), logger);
            } catch (const nlohmann::json::type_error&) {
                // Parameter present with the wrong JSON type
                error_out = core::Errc::configuration_error;
                return nullptr;
            }
        });
}

}  // namespace switchyard::adapter
