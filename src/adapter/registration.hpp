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

// Switchyard Adapter Registration - Header
// Registers the built-in adapter types with a factory

#pragma once

#include <cstdint>
#include <memory>
#include <span>

#include "factory.hpp"

namespace switchyard::store {
class GatewayStore;
}

namespace switchyard::adapter {

/// Register "on-premise" (backed by the store and credential key) and "mock"
void register_builtin_adapters(AdapterFactory& factory,
                               std::shared_ptr<store::GatewayStore> store,
                               std::span<const uint8_t> encryption_key);

}  // namespace switchyard::adapter
