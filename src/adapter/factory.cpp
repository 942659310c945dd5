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

// Switchyard Adapter Factory - Implementation

#include "factory.hpp"

#include <algorithm>

#include "../core/errors.hpp"
#include "../core/logging.hpp"

namespace switchyard::adapter {

AdapterFactory::AdapterFactory(quill::Logger* logger) : logger_(logger) {}

void AdapterFactory::register_adapter(std::string type, AdapterConstructor constructor) {
    LOG_DEBUG(logger_, "Registering gateway adapter: type={}", type);
    constructors_[std::move(type)] = std::move(constructor);
}

std::unique_ptr<GatewayAdapter> AdapterFactory::create_adapter(const AdapterConfig& config,
                                                               std::error_code& error_out) const {
    error_out.clear();

    auto it = constructors_.find(config.type);
    if (it == constructors_.end()) {
        LOG_WARNING(logger_, "Unsupported adapter type: type={}", config.type);
        error_out = core::Errc::unsupported_adapter_type;
        return nullptr;
    }

    auto adapter = it->second(config, logger_, error_out);
    if (!adapter && !error_out) {
        error_out = core::Errc::adapter_failure;
    }
    if (error_out) {
        LOG_ERROR(logger_, "Failed to create adapter: type={}, error={}", config.type,
                  error_out.message());
        return nullptr;
    }
    return adapter;
}

std::vector<std::string> AdapterFactory::supported_types() const {
    std::vector<std::string> types;
    types.reserve(constructors_.size());
    for (const auto& [type, constructor] : constructors_) {
        types.push_back(type);
    }
    std::sort(types.begin(), types.end());
    return types;
}

bool AdapterFactory::supports(std::string_view type) const {
    return constructors_.contains(std::string(type));
}

}  // namespace switchyard::adapter
