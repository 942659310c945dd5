// Switchyard Connection Tests

#include <catch2/catch_test_macros.hpp>

#include <chrono>
#include <string>
#include <thread>
#include <vector>

#include "../../src/core/errors.hpp"
#include "../../src/ws/connection.hpp"
#include "fake_transport.hpp"

using namespace switchyard;
using testing::make_fake_transport;

TEST_CASE("Connection - Send", "[ws][connection]") {
    auto [transport, state] = make_fake_transport();
    ws::Connection connection("gw-1", "conn-1", std::move(transport), "key");

    REQUIRE_FALSE(connection.send("one"));
    REQUIRE_FALSE(connection.send("two"));
    REQUIRE(state->sent_messages() == std::vector<std::string>{"one", "two"});

    // Delivery accounting belongs to the broadcaster
    REQUIRE(connection.stats().total_sent() == 0);
}

TEST_CASE("Connection - Close", "[ws][connection]") {
    auto [transport, state] = make_fake_transport();
    ws::Connection connection("gw-1", "conn-1", std::move(transport), "key");

    SECTION("closes the transport with the given code") {
        REQUIRE_FALSE(connection.close(1000, "normal closure"));
        REQUIRE(connection.is_closed());
        REQUIRE(state->close_code == 1000);
        REQUIRE(state->close_reason == "normal closure");
    }

    SECTION("is idempotent") {
        REQUIRE_FALSE(connection.close(1000, "normal closure"));
        REQUIRE_FALSE(connection.close(1001, "server shutdown"));
        REQUIRE(state->close_count() == 1);
        REQUIRE(state->close_code == 1000);
    }

    SECTION("send and ping after close fail without reaching the transport") {
        REQUIRE_FALSE(connection.close(1000, "normal closure"));
        REQUIRE(connection.send("late") == core::Errc::connection_closed);
        REQUIRE(connection.send_ping() == core::Errc::connection_closed);
        REQUIRE(state->sent_messages().empty());
        REQUIRE(state->ping_count() == 0);
    }

    SECTION("concurrent close calls close the transport once") {
        std::vector<std::thread> threads;
        for (int i = 0; i < 8; ++i) {
            threads.emplace_back([&connection] { connection.close(1001, "server shutdown"); });
        }
        for (auto& t : threads) {
            t.join();
        }
        REQUIRE(state->close_count() == 1);
    }
}

TEST_CASE("Connection - Closed flag while the transport close is in flight", "[ws][connection]") {
    using namespace std::chrono_literals;
    auto [transport, state] = make_fake_transport();
    state->hold_close = true;
    ws::Connection connection("gw-1", "conn-1", std::move(transport), "key");

    std::thread closer([&connection] { connection.close(1000, "normal closure"); });
    REQUIRE(state->wait_close_entered(2s));

    // close() still holds the connection lock inside the transport
    REQUIRE(connection.is_closed());
    REQUIRE(connection.to_string().find("closed=true") != std::string::npos);

    state->release_close();
    closer.join();
    REQUIRE(state->close_count() == 1);
    REQUIRE(connection.send("late") == core::Errc::connection_closed);
}

TEST_CASE("Connection - Heartbeat timestamp", "[ws][connection]") {
    auto [transport, state] = make_fake_transport();
    ws::Connection connection("gw-1", "conn-1", std::move(transport), "key");

    auto initial = connection.last_heartbeat();
    std::this_thread::sleep_for(std::chrono::milliseconds(5));
    connection.update_heartbeat();
    REQUIRE(connection.last_heartbeat() > initial);
}

TEST_CASE("Connection - Info snapshot", "[ws][connection]") {
    auto [transport, state] = make_fake_transport();
    ws::Connection connection("gw-1", "conn-1", std::move(transport), "key");
    connection.stats().record_success();
    connection.stats().record_failure("send error: broken pipe");

    auto info = connection.info();
    REQUIRE(info["gatewayId"] == "gw-1");
    REQUIRE(info["connectionId"] == "conn-1");
    REQUIRE(info["closed"] == false);
    REQUIRE(info["stats"]["totalEventsSent"] == 1);
    REQUIRE(info["stats"]["failedDeliveries"] == 1);
    REQUIRE(info["stats"]["lastFailureReason"] == "send error: broken pipe");
    REQUIRE(info.contains("connectedAt"));

    REQUIRE(connection.to_string() == "Connection{gateway=gw-1, id=conn-1, closed=false}");
}

TEST_CASE("DeliveryStats - Counters", "[ws][stats]") {
    ws::DeliveryStats stats;

    SECTION("starts empty") {
        REQUIRE(stats.total_sent() == 0);
        REQUIRE(stats.failed_deliveries() == 0);
        REQUIRE_FALSE(stats.last_failure_time().has_value());
        REQUIRE_FALSE(stats.to_json().contains("lastFailureTime"));
    }

    SECTION("failure keeps the latest reason") {
        stats.record_failure("first");
        stats.record_failure("second");
        REQUIRE(stats.failed_deliveries() == 2);
        REQUIRE(stats.last_failure_reason() == "second");
        REQUIRE(stats.last_failure_time().has_value());
    }

    SECTION("concurrent updates are not lost") {
        std::vector<std::thread> threads;
        for (int i = 0; i < 4; ++i) {
            threads.emplace_back([&stats] {
                for (int j = 0; j < 1000; ++j) {
                    stats.record_success();
                }
            });
        }
        for (auto& t : threads) {
            t.join();
        }
        REQUIRE(stats.total_sent() == 4000);
    }
}
