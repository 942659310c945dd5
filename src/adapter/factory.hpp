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

// Switchyard Adapter Factory - Header
// Builds gateway adapters by type name

#pragma once

#include <quill/Logger.h>

#include <functional>
#include <memory>
#include <string>
#include <string_view>
#include <system_error>
#include <vector>

#include "../core/containers.hpp"
#include "gateway_adapter.hpp"
#include "types.hpp"

namespace switchyard::adapter {

/// Named constructor. Reports failures through error_out and returns nullptr.
using AdapterConstructor = std::function<std::unique_ptr<GatewayAdapter>(
    const AdapterConfig& config, quill::Logger* logger, std::error_code& error_out)>;

/// Registry of adapter constructors.
///
/// Populate it during startup; create_adapter may then be called from any
/// thread as long as nothing registers concurrently.
class AdapterFactory {
public:
    explicit AdapterFactory(quill::Logger* logger);

    /// Register (or replace) the constructor for a type
    void register_adapter(std::string type, AdapterConstructor constructor);

    /// Build an adapter for config.type
    /// @param error_out unsupported_adapter_type, or the constructor's error
    [[nodiscard]] std::unique_ptr<GatewayAdapter> create_adapter(const AdapterConfig& config,
                                                                 std::error_code& error_out) const;

    /// Registered type names, sorted
    [[nodiscard]] std::vector<std::string> supported_types() const;

    [[nodiscard]] bool supports(std::string_view type) const;

private:
    core::fast_map<std::string, AdapterConstructor> constructors_;
    quill::Logger* logger_;
};

}  // namespace switchyard::adapter
