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

// Switchyard Gateway Store - Implementation

#include "gateway_store.hpp"

#include <openssl/evp.h>

#include <fmt/format.h>

#include <iterator>
#include <mutex>

#include "../core/errors.hpp"

namespace switchyard::store {

std::string hash_api_key(std::string_view api_key) {
    unsigned char digest[EVP_MAX_MD_SIZE];
    unsigned int digest_len = 0;

    if (EVP_Digest(api_key.data(), api_key.size(), digest, &digest_len, EVP_sha256(), nullptr) !=
        1) {
        return {};
    }

    std::string hex;
    hex.reserve(digest_len * 2);
    for (unsigned int i = 0; i < digest_len; ++i) {
        fmt::format_to(std::back_inserter(hex), "{:02x}", digest[i]);
    }
    return hex;
}

void InMemoryGatewayStore::upsert(GatewayRecord record) {
    std::unique_lock lock(mutex_);

    auto existing = records_.find(record.id);
    if (existing != records_.end()) {
        auto key_it = id_by_key_hash_.find(existing->second.api_key_hash);
        if (key_it != id_by_key_hash_.end() && key_it->second == record.id) {
            id_by_key_hash_.erase(key_it);
        }
    }
    if (!record.api_key_hash.empty()) {
        id_by_key_hash_[record.api_key_hash] = record.id;
    }
    records_[record.id] = std::move(record);
}

bool InMemoryGatewayStore::remove(std::string_view id) {
    std::unique_lock lock(mutex_);

    auto it = records_.find(std::string(id));
    if (it == records_.end()) {
        return false;
    }
    id_by_key_hash_.erase(it->second.api_key_hash);
    records_.erase(it);
    return true;
}

std::optional<GatewayRecord> InMemoryGatewayStore::find_by_id(std::string_view id) const {
    std::shared_lock lock(mutex_);

    auto it = records_.find(std::string(id));
    if (it == records_.end()) {
        return std::nullopt;
    }
    return it->second;
}

std::optional<GatewayRecord> InMemoryGatewayStore::verify_api_key(std::string_view api_key) const {
    if (api_key.empty()) {
        return std::nullopt;
    }

    auto key_hash = hash_api_key(api_key);
    if (key_hash.empty()) {
        return std::nullopt;
    }

    std::shared_lock lock(mutex_);
    auto key_it = id_by_key_hash_.find(key_hash);
    if (key_it == id_by_key_hash_.end()) {
        return std::nullopt;
    }

    auto it = records_.find(key_it->second);
    if (it == records_.end()) {
        return std::nullopt;
    }
    return it->second;
}

std::error_code InMemoryGatewayStore::update_active_status(std::string_view id, bool active) {
    std::unique_lock lock(mutex_);

    auto it = records_.find(std::string(id));
    if (it == records_.end()) {
        return core::Errc::gateway_not_found;
    }
    it->second.is_active = active;
    return {};
}

std::vector<GatewayRecord> InMemoryGatewayStore::list() const {
    std::shared_lock lock(mutex_);

    std::vector<GatewayRecord> out;
    out.reserve(records_.size());
    for (const auto& [id, record] : records_) {
        out.push_back(record);
    }
    return out;
}

size_t InMemoryGatewayStore::size() const {
    std::shared_lock lock(mutex_);
    return records_.size();
}

}  // namespace switchyard::store
