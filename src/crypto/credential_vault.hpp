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

// Switchyard Credential Vault - Header
// AES-256-GCM sealing of gateway credentials at rest
//
// Blob layout: nonce (12 bytes) || ciphertext || tag (16 bytes)

#pragma once

#include <openssl/evp.h>

#include <cstddef>
#include <cstdint>
#include <memory>
#include <nlohmann/json.hpp>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <system_error>
#include <vector>

namespace switchyard::crypto {

constexpr size_t KEY_SIZE = 32;    // AES-256
constexpr size_t NONCE_SIZE = 12;  // GCM standard nonce
constexpr size_t TAG_SIZE = 16;

/// Secrets used to authenticate against a gateway's management API.
/// Plaintext only lives for the duration of one outbound call.
struct GatewayCredentials {
    std::string username;
    std::string password;
    std::string token;  // Optional bearer token (used when username is empty)
};

inline void from_json(const nlohmann::json& j, GatewayCredentials& c) {
    c.username = j.value("username", std::string());
    c.password = j.value("password", std::string());
    c.token = j.value("token", std::string());
}

inline void to_json(nlohmann::json& j, const GatewayCredentials& c) {
    j = nlohmann::json{{"username", c.username}, {"password", c.password}};
    if (!c.token.empty()) {
        j["token"] = c.token;
    }
}

/// EVP_CIPHER_CTX deleter for std::unique_ptr
struct CipherCtxDeleter {
    void operator()(EVP_CIPHER_CTX* ctx) const noexcept {
        if (ctx) {
            EVP_CIPHER_CTX_free(ctx);
        }
    }
};

using CipherCtxPtr = std::unique_ptr<EVP_CIPHER_CTX, CipherCtxDeleter>;

/// Encrypt credentials with a 32-byte key
/// @param credentials Credentials to seal (serialized as JSON)
/// @param key AES-256 key
/// @param error_out invalid_key_size, invalid_credentials or an OpenSSL failure
/// @return nonce || ciphertext || tag, or nullopt on error
[[nodiscard]] std::optional<std::vector<uint8_t>> encrypt_credentials(
    const GatewayCredentials& credentials,
    std::span<const uint8_t> key,
    std::error_code& error_out);

/// Decrypt a blob produced by encrypt_credentials
/// Any malformed, truncated or forged blob (or wrong key) yields invalid_ciphertext.
[[nodiscard]] std::optional<GatewayCredentials> decrypt_credentials(
    std::span<const uint8_t> blob,
    std::span<const uint8_t> key,
    std::error_code& error_out);

/// Generate a random AES-256 key
[[nodiscard]] std::optional<std::vector<uint8_t>> generate_encryption_key(
    std::error_code& error_out);

/// Standard base64 (with padding), used for keys in configuration files
[[nodiscard]] std::string base64_encode(std::span<const uint8_t> data);

/// Decode standard base64; nullopt on malformed input
[[nodiscard]] std::optional<std::vector<uint8_t>> base64_decode(std::string_view encoded);

}  // namespace switchyard::crypto
