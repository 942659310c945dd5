// Switchyard Gateway Store Tests

#include <catch2/catch_test_macros.hpp>

#include <atomic>
#include <string>
#include <thread>
#include <vector>

#include "../../src/core/errors.hpp"
#include "../../src/store/gateway_store.hpp"

using namespace switchyard;
using store::GatewayRecord;
using store::InMemoryGatewayStore;

namespace {

GatewayRecord make_record(std::string id, std::string_view api_key) {
    GatewayRecord record;
    record.id = std::move(id);
    record.name = "Gateway " + record.id;
    record.adapter_type = "on-premise";
    record.adapter_config = {{"controlPlaneUrl", "http://gw.local:9090/api/v1"}};
    record.api_key_hash = store::hash_api_key(api_key);
    return record;
}

}  // namespace

TEST_CASE("API key hashing", "[store]") {
    // SHA-256 test vector (FIPS 180-2)
    REQUIRE(store::hash_api_key("abc") ==
            "ba7816bf8f01cfea414140de5dae2223b00361a396177a9cb410ff61f20015ad");
    REQUIRE(store::hash_api_key("key-1") != store::hash_api_key("key-2"));
    REQUIRE(store::hash_api_key("key-1").size() == 64);
}

TEST_CASE("InMemoryGatewayStore - Lookup", "[store]") {
    InMemoryGatewayStore gateways;
    gateways.upsert(make_record("gw-1", "key-1"));
    gateways.upsert(make_record("gw-2", "key-2"));

    REQUIRE(gateways.size() == 2);

    SECTION("by id") {
        auto record = gateways.find_by_id("gw-1");
        REQUIRE(record.has_value());
        REQUIRE(record->name == "Gateway gw-1");
        REQUIRE_FALSE(gateways.find_by_id("gw-unknown").has_value());
    }

    SECTION("by API key") {
        auto record = gateways.verify_api_key("key-2");
        REQUIRE(record.has_value());
        REQUIRE(record->id == "gw-2");

        REQUIRE_FALSE(gateways.verify_api_key("key-3").has_value());
        REQUIRE_FALSE(gateways.verify_api_key("").has_value());
        // The stored hash is not itself a key
        REQUIRE_FALSE(gateways.verify_api_key(store::hash_api_key("key-1")).has_value());
    }
}

TEST_CASE("InMemoryGatewayStore - Updates", "[store]") {
    InMemoryGatewayStore gateways;
    gateways.upsert(make_record("gw-1", "key-1"));

    SECTION("active status") {
        REQUIRE_FALSE(gateways.find_by_id("gw-1")->is_active);
        REQUIRE_FALSE(gateways.update_active_status("gw-1", true));
        REQUIRE(gateways.find_by_id("gw-1")->is_active);
        REQUIRE_FALSE(gateways.update_active_status("gw-1", false));
        REQUIRE_FALSE(gateways.find_by_id("gw-1")->is_active);
    }

    SECTION("active status of an unknown gateway") {
        REQUIRE(gateways.update_active_status("gw-unknown", true) ==
                core::Errc::gateway_not_found);
    }

    SECTION("key rotation drops the old key") {
        gateways.upsert(make_record("gw-1", "key-1b"));
        REQUIRE(gateways.size() == 1);
        REQUIRE_FALSE(gateways.verify_api_key("key-1").has_value());
        REQUIRE(gateways.verify_api_key("key-1b")->id == "gw-1");
    }

    SECTION("remove") {
        REQUIRE(gateways.remove("gw-1"));
        REQUIRE_FALSE(gateways.remove("gw-1"));
        REQUIRE(gateways.size() == 0);
        REQUIRE_FALSE(gateways.verify_api_key("key-1").has_value());
    }

    SECTION("list") {
        gateways.upsert(make_record("gw-2", "key-2"));
        REQUIRE(gateways.list().size() == 2);
    }
}

TEST_CASE("InMemoryGatewayStore - Concurrent access", "[store][concurrency]") {
    InMemoryGatewayStore gateways;
    for (int i = 0; i < 10; ++i) {
        gateways.upsert(make_record("gw-" + std::to_string(i), "key-" + std::to_string(i)));
    }

    std::atomic<int> misses{0};
    std::vector<std::thread> threads;
    for (int t = 0; t < 4; ++t) {
        threads.emplace_back([&gateways, &misses, t] {
            for (int i = 0; i < 500; ++i) {
                int n = (i + t) % 10;
                auto id = "gw-" + std::to_string(n);
                (void)gateways.update_active_status(id, i % 2 == 0);
                if (!gateways.verify_api_key("key-" + std::to_string(n))) {
                    misses++;
                }
            }
        });
    }
    for (auto& t : threads) {
        t.join();
    }
    REQUIRE(misses.load() == 0);
    REQUIRE(gateways.size() == 10);
}
