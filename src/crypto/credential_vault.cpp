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

// Switchyard Credential Vault - Implementation

#include "credential_vault.hpp"

#include <openssl/bio.h>
#include <openssl/buffer.h>
#include <openssl/crypto.h>
#include <openssl/rand.h>

#include "../core/errors.hpp"

namespace switchyard::crypto {

namespace {

/// Wipes a plaintext buffer when it leaves scope
struct SecureWipe {
    std::string& data;
    ~SecureWipe() {
        if (!data.empty()) {
            OPENSSL_cleanse(data.data(), data.size());
        }
    }
};

std::error_code openssl_failure() {
    return std::make_error_code(std::errc::io_error);
}

}  // namespace

std::optional<std::vector<uint8_t>> encrypt_credentials(const GatewayCredentials& credentials,
                                                        std::span<const uint8_t> key,
                                                        std::error_code& error_out) {
    if (key.size() != KEY_SIZE) {
        error_out = core::Errc::invalid_key_size;
        return std::nullopt;
    }

    std::string plaintext;
    SecureWipe wipe{plaintext};
    try {
        plaintext = nlohmann::json(credentials).dump();
    } catch (const nlohmann::json::exception&) {
        // Invalid UTF-8 in a credential field
        error_out = core::Errc::invalid_credentials;
        return std::nullopt;
    }

    std::vector<uint8_t> blob(NONCE_SIZE + plaintext.size() + TAG_SIZE);
    uint8_t* nonce = blob.data();
    uint8_t* ciphertext = blob.data() + NONCE_SIZE;
    uint8_t* tag = ciphertext + plaintext.size();

    if (RAND_bytes(nonce, static_cast<int>(NONCE_SIZE)) != 1) {
        error_out = openssl_failure();
        return std::nullopt;
    }

    CipherCtxPtr ctx(EVP_CIPHER_CTX_new());
    if (!ctx) {
        error_out = std::make_error_code(std::errc::not_enough_memory);
        return std::nullopt;
    }

    int len = 0;
    if (EVP_EncryptInit_ex(ctx.get(), EVP_aes_256_gcm(), nullptr, nullptr, nullptr) != 1 ||
        EVP_CIPHER_CTX_ctrl(ctx.get(), EVP_CTRL_GCM_SET_IVLEN, static_cast<int>(NONCE_SIZE),
                            nullptr) != 1 ||
        EVP_EncryptInit_ex(ctx.get(), nullptr, nullptr, key.data(), nonce) != 1) {
        error_out = openssl_failure();
        return std::nullopt;
    }

    if (EVP_EncryptUpdate(ctx.get(), ciphertext, &len,
                          reinterpret_cast<const unsigned char*>(plaintext.data()),
                          static_cast<int>(plaintext.size())) != 1) {
        error_out = openssl_failure();
        return std::nullopt;
    }

    int final_len = 0;
    if (EVP_EncryptFinal_ex(ctx.get(), ciphertext + len, &final_len) != 1 ||
        EVP_CIPHER_CTX_ctrl(ctx.get(), EVP_CTRL_GCM_GET_TAG, static_cast<int>(TAG_SIZE), tag) !=
            1) {
        error_out = openssl_failure();
        return std::nullopt;
    }

    error_out.clear();
    return blob;
}

std::optional<GatewayCredentials> decrypt_credentials(std::span<const uint8_t> blob,
                                                      std::span<const uint8_t> key,
                                                      std::error_code& error_out) {
    if (key.size() != KEY_SIZE) {
        error_out = core::Errc::invalid_key_size;
        return std::nullopt;
    }

    if (blob.size() < NONCE_SIZE + TAG_SIZE) {
        error_out = core::Errc::invalid_ciphertext;
        return std::nullopt;
    }

    const uint8_t* nonce = blob.data();
    const uint8_t* ciphertext = blob.data() + NONCE_SIZE;
    size_t ciphertext_len = blob.size() - NONCE_SIZE - TAG_SIZE;
    const uint8_t* tag = ciphertext + ciphertext_len;

    CipherCtxPtr ctx(EVP_CIPHER_CTX_new());
    if (!ctx) {
        error_out = std::make_error_code(std::errc::not_enough_memory);
        return std::nullopt;
    }

    std::string plaintext(ciphertext_len, '\0');
    SecureWipe wipe{plaintext};

    int len = 0;
    int final_len = 0;
    bool ok =
        EVP_DecryptInit_ex(ctx.get(), EVP_aes_256_gcm(), nullptr, nullptr, nullptr) == 1 &&
        EVP_CIPHER_CTX_ctrl(ctx.get(), EVP_CTRL_GCM_SET_IVLEN, static_cast<int>(NONCE_SIZE),
                            nullptr) == 1 &&
        EVP_DecryptInit_ex(ctx.get(), nullptr, nullptr, key.data(), nonce) == 1 &&
        EVP_DecryptUpdate(ctx.get(), reinterpret_cast<unsigned char*>(plaintext.data()), &len,
                          ciphertext, static_cast<int>(ciphertext_len)) == 1 &&
        EVP_CIPHER_CTX_ctrl(ctx.get(), EVP_CTRL_GCM_SET_TAG, static_cast<int>(TAG_SIZE),
                            const_cast<uint8_t*>(tag)) == 1 &&
        EVP_DecryptFinal_ex(ctx.get(), reinterpret_cast<unsigned char*>(plaintext.data()) + len,
                            &final_len) == 1;

    if (!ok) {
        // Tag mismatch and every other failure look the same to the caller
        error_out = core::Errc::invalid_ciphertext;
        return std::nullopt;
    }

    GatewayCredentials credentials;
    try {
        credentials = nlohmann::json::parse(plaintext).get<GatewayCredentials>();
    } catch (const nlohmann::json::exception&) {
        error_out = core::Errc::invalid_ciphertext;
        return std::nullopt;
    }

    error_out.clear();
    return credentials;
}

std::optional<std::vector<uint8_t>> generate_encryption_key(std::error_code& error_out) {
    std::vector<uint8_t> key(KEY_SIZE);
    if (RAND_bytes(key.data(), static_cast<int>(key.size())) != 1) {
        error_out = openssl_failure();
        return std::nullopt;
    }
    error_out.clear();
    return key;
}

std::string base64_encode(std::span<const uint8_t> data) {
    BIO *bio, *b64;

    b64 = BIO_new(BIO_f_base64());
    bio = BIO_new(BIO_s_mem());
    bio = BIO_push(b64, bio);

    BIO_set_flags(bio, BIO_FLAGS_BASE64_NO_NL);  // No newlines
    BIO_write(bio, data.data(), static_cast<int>(data.size()));
    BIO_flush(bio);

    char* encoded_data;
    long encoded_length = BIO_get_mem_data(bio, &encoded_data);

    std::string result(encoded_data, static_cast<size_t>(encoded_length));

    BIO_free_all(bio);

    return result;
}

std::optional<std::vector<uint8_t>> base64_decode(std::string_view encoded) {
    if (encoded.empty()) {
        return std::vector<uint8_t>{};
    }
    if (encoded.size() % 4 != 0) {
        return std::nullopt;
    }

    std::vector<uint8_t> out(encoded.size() / 4 * 3);
    int decoded = EVP_DecodeBlock(out.data(), reinterpret_cast<const unsigned char*>(encoded.data()),
                                  static_cast<int>(encoded.size()));
    if (decoded < 0) {
        return std::nullopt;
    }

    // EVP_DecodeBlock counts padding as zero bytes
    size_t padding = 0;
    if (encoded.back() == '=') {
        ++padding;
        if (encoded[encoded.size() - 2] == '=') {
            ++padding;
        }
    }
    out.resize(static_cast<size_t>(decoded) - padding);
    return out;
}

}  // namespace switchyard::crypto
