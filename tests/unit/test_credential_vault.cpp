// Switchyard Credential Vault Tests

#include <catch2/catch_test_macros.hpp>

#include <cstdint>
#include <string>
#include <vector>

#include "../../src/core/errors.hpp"
#include "../../src/crypto/credential_vault.hpp"

using namespace switchyard::crypto;
using switchyard::core::Errc;

namespace {

std::vector<uint8_t> make_key(uint8_t fill) {
    return std::vector<uint8_t>(KEY_SIZE, fill);
}

GatewayCredentials sample_credentials() {
    return {"admin", "s3cr3t-p@ss", ""};
}

}  // namespace

TEST_CASE("Credential encryption round trip", "[crypto]") {
    auto key = make_key(0x42);
    std::error_code ec;

    auto blob = encrypt_credentials(sample_credentials(), key, ec);
    REQUIRE(blob.has_value());
    REQUIRE_FALSE(ec);
    REQUIRE(blob->size() > NONCE_SIZE + TAG_SIZE);

    auto decrypted = decrypt_credentials(*blob, key, ec);
    REQUIRE(decrypted.has_value());
    REQUIRE_FALSE(ec);
    REQUIRE(decrypted->username == "admin");
    REQUIRE(decrypted->password == "s3cr3t-p@ss");
    REQUIRE(decrypted->token.empty());
}

TEST_CASE("Bearer token survives encryption", "[crypto]") {
    auto key = make_key(0x01);
    std::error_code ec;

    auto blob = encrypt_credentials({"", "", "tok-123"}, key, ec);
    REQUIRE(blob.has_value());

    auto decrypted = decrypt_credentials(*blob, key, ec);
    REQUIRE(decrypted.has_value());
    REQUIRE(decrypted->token == "tok-123");
}

TEST_CASE("Nonce is fresh per encryption", "[crypto]") {
    auto key = make_key(0x42);
    std::error_code ec;

    auto first = encrypt_credentials(sample_credentials(), key, ec);
    auto second = encrypt_credentials(sample_credentials(), key, ec);
    REQUIRE(first.has_value());
    REQUIRE(second.has_value());
    REQUIRE(*first != *second);

    std::vector<uint8_t> nonce1(first->begin(), first->begin() + NONCE_SIZE);
    std::vector<uint8_t> nonce2(second->begin(), second->begin() + NONCE_SIZE);
    REQUIRE(nonce1 != nonce2);
}

TEST_CASE("Decryption failures", "[crypto]") {
    auto key = make_key(0x42);
    std::error_code ec;
    auto blob = encrypt_credentials(sample_credentials(), key, ec);
    REQUIRE(blob.has_value());

    SECTION("wrong key") {
        auto other = make_key(0x43);
        auto result = decrypt_credentials(*blob, other, ec);
        REQUIRE_FALSE(result.has_value());
        REQUIRE(ec == Errc::invalid_ciphertext);
    }

    SECTION("tampered ciphertext") {
        auto tampered = *blob;
        tampered[NONCE_SIZE] ^= 0x01;
        auto result = decrypt_credentials(tampered, key, ec);
        REQUIRE_FALSE(result.has_value());
        REQUIRE(ec == Errc::invalid_ciphertext);
    }

    SECTION("tampered tag") {
        auto tampered = *blob;
        tampered.back() ^= 0x80;
        auto result = decrypt_credentials(tampered, key, ec);
        REQUIRE_FALSE(result.has_value());
        REQUIRE(ec == Errc::invalid_ciphertext);
    }

    SECTION("blob shorter than the nonce") {
        std::vector<uint8_t> short_blob(NONCE_SIZE - 1, 0);
        auto result = decrypt_credentials(short_blob, key, ec);
        REQUIRE_FALSE(result.has_value());
        REQUIRE(ec == Errc::invalid_ciphertext);
    }

    SECTION("empty blob") {
        auto result = decrypt_credentials({}, key, ec);
        REQUIRE_FALSE(result.has_value());
        REQUIRE(ec == Errc::invalid_ciphertext);
    }
}

TEST_CASE("Key size is enforced", "[crypto]") {
    std::error_code ec;
    std::vector<uint8_t> short_key(16, 0x42);

    SECTION("encrypt") {
        auto blob = encrypt_credentials(sample_credentials(), short_key, ec);
        REQUIRE_FALSE(blob.has_value());
        REQUIRE(ec == Errc::invalid_key_size);
    }

    SECTION("decrypt") {
        std::vector<uint8_t> blob(64, 0);
        auto result = decrypt_credentials(blob, short_key, ec);
        REQUIRE_FALSE(result.has_value());
        REQUIRE(ec == Errc::invalid_key_size);
    }
}

TEST_CASE("Key generation", "[crypto]") {
    std::error_code ec;
    auto a = generate_encryption_key(ec);
    auto b = generate_encryption_key(ec);
    REQUIRE(a.has_value());
    REQUIRE(b.has_value());
    REQUIRE(a->size() == KEY_SIZE);
    REQUIRE(*a != *b);

    // A generated key is usable right away
    auto blob = encrypt_credentials(sample_credentials(), *a, ec);
    REQUIRE(blob.has_value());
    REQUIRE(decrypt_credentials(*blob, *a, ec).has_value());
}

TEST_CASE("Base64 key encoding", "[crypto]") {
    SECTION("RFC 4648 vectors") {
        auto encode = [](std::string_view s) {
            return base64_encode(std::span<const uint8_t>(
                reinterpret_cast<const uint8_t*>(s.data()), s.size()));
        };
        REQUIRE(encode("") == "");
        REQUIRE(encode("f") == "Zg==");
        REQUIRE(encode("fo") == "Zm8=");
        REQUIRE(encode("foo") == "Zm9v");
        REQUIRE(encode("foobar") == "Zm9vYmFy");
    }

    SECTION("decode strips padding") {
        auto decoded = base64_decode("Zm8=");
        REQUIRE(decoded.has_value());
        REQUIRE(decoded->size() == 2);
        REQUIRE((*decoded)[0] == 'f');
        REQUIRE((*decoded)[1] == 'o');
    }

    SECTION("32-byte key survives the trip") {
        auto key = make_key(0xAB);
        auto decoded = base64_decode(base64_encode(key));
        REQUIRE(decoded.has_value());
        REQUIRE(*decoded == key);
    }

    SECTION("malformed input") {
        REQUIRE_FALSE(base64_decode("abc").has_value());
        REQUIRE_FALSE(base64_decode("!!!!").has_value());
    }
}
