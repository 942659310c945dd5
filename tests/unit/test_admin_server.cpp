// Switchyard Admin Server Tests

#include <catch2/catch_test_macros.hpp>

#include <arpa/inet.h>
#include <netinet/in.h>
#include <sys/socket.h>

#include <chrono>
#include <nlohmann/json.hpp>
#include <span>
#include <string>
#include <thread>

#include "../../src/core/admin_server.hpp"
#include "../../src/core/logging.hpp"
#include "../../src/core/socket.hpp"
#include "../../src/events/event_broadcaster.hpp"
#include "../../src/events/event_types.hpp"
#include "../../src/ws/manager.hpp"
#include "fake_transport.hpp"

using namespace switchyard;
using http::StatusCode;
using testing::make_fake_transport;
using namespace std::chrono_literals;

namespace {

struct AdminFixture {
    ws::Manager manager{make_manager_config(), logging::get_logger()};
    events::EventBroadcaster broadcaster{manager, logging::get_logger()};
    core::AdminServer admin{control::AdminConfig{}, manager, broadcaster, logging::get_logger()};

    static ws::ManagerConfig make_manager_config() {
        ws::ManagerConfig config;
        config.heartbeat_interval = 10s;
        config.heartbeat_timeout = 30s;
        return config;
    }

    core::AdminResponse get(std::string_view path) {
        http::Request request;
        request.method = http::Method::GET;
        request.path = path;
        return admin.handle_request(request);
    }

    /// body must outlive the call
    core::AdminResponse post_event(const std::string& body) {
        http::Request request;
        request.method = http::Method::POST;
        request.path = "/_admin/events";
        request.body = std::span<const uint8_t>(reinterpret_cast<const uint8_t*>(body.data()),
                                                body.size());
        return admin.handle_request(request);
    }
};

}  // namespace

TEST_CASE("AdminServer - Health", "[admin]") {
    AdminFixture fixture;

    auto [transport, state] = make_fake_transport();
    std::error_code ec;
    REQUIRE(fixture.manager.register_connection("gw-1", transport, "k", ec));

    for (auto path : {"/health", "/_health"}) {
        auto response = fixture.get(path);
        REQUIRE(response.status == StatusCode::OK);
        auto body = nlohmann::json::parse(response.body);
        REQUIRE(body["status"] == "healthy");
        REQUIRE(body["connections"] == 1);
        REQUIRE(body.contains("timestamp"));
    }

    fixture.manager.shutdown();
    auto body = nlohmann::json::parse(fixture.get("/health").body);
    REQUIRE(body["status"] == "draining");
}

TEST_CASE("AdminServer - Stats", "[admin]") {
    AdminFixture fixture;
    std::error_code ec;

    auto [t1, s1] = make_fake_transport();
    auto [t2, s2] = make_fake_transport();
    REQUIRE(fixture.manager.register_connection("gw-1", t1, "k", ec));
    REQUIRE(fixture.manager.register_connection("gw-2", t2, "k", ec));

    auto response = fixture.get("/stats");
    REQUIRE(response.status == StatusCode::OK);
    auto stats = nlohmann::json::parse(response.body);
    REQUIRE(stats["totalConnections"] == 2);
    REQUIRE(stats["totalGateways"] == 2);
}

TEST_CASE("AdminServer - Unknown routes", "[admin]") {
    AdminFixture fixture;

    auto missing = fixture.get("/nope");
    REQUIRE(missing.status == StatusCode::NotFound);
    REQUIRE(nlohmann::json::parse(missing.body)["error"] == "not_found");

    auto wrong_method = fixture.get("/_admin/events");
    REQUIRE(wrong_method.status == StatusCode::MethodNotAllowed);
}

TEST_CASE("AdminServer - Publish event", "[admin][events]") {
    AdminFixture fixture;
    std::error_code ec;

    auto [transport, state] = make_fake_transport();
    REQUIRE(fixture.manager.register_connection("gw-1", transport, "k", ec));

    SECTION("targeted event is delivered") {
        std::string body =
            R"({"type":"agent.deployed","gatewayId":"gw-1","payload":{"agentId":"a-1"}})";
        auto response = fixture.post_event(body);
        REQUIRE(response.status == StatusCode::Accepted);

        auto accepted = nlohmann::json::parse(response.body);
        REQUIRE(accepted["status"] == "accepted");
        REQUIRE(accepted["gatewayId"] == "gw-1");

        auto sent = state->sent_messages();
        REQUIRE(sent.size() == 1);
        auto message = nlohmann::json::parse(sent[0]);
        REQUIRE(message["type"] == "agent.deployed");
        REQUIRE(message["payload"]["agentId"] == "a-1");
    }

    SECTION("event without gatewayId goes to every gateway") {
        auto [other, other_state] = make_fake_transport();
        REQUIRE(fixture.manager.register_connection("gw-2", other, "k", ec));

        std::string body = R"({"type":"config.updated","payload":{}})";
        auto response = fixture.post_event(body);
        REQUIRE(response.status == StatusCode::Accepted);
        REQUIRE_FALSE(nlohmann::json::parse(response.body).contains("gatewayId"));

        REQUIRE(state->sent_messages().size() == 1);
        REQUIRE(other_state->sent_messages().size() == 1);
    }

    SECTION("gateway without connections is still accepted") {
        std::string body = R"({"type":"config.updated","gatewayId":"gw-9","payload":{}})";
        REQUIRE(fixture.post_event(body).status == StatusCode::Accepted);
        REQUIRE(state->sent_messages().empty());
    }

    SECTION("body with invalid UTF-8") {
        std::string body = "{\"type\":\"\xff\",\"payload\":{}}";
        auto response = fixture.post_event(body);
        REQUIRE(response.status == StatusCode::BadRequest);

        auto parsed = nlohmann::json::parse(response.body);
        REQUIRE(parsed["error"] == "bad_request");
        REQUIRE(parsed["message"].get<std::string>().starts_with("Invalid JSON"));
        REQUIRE(state->sent_messages().empty());
    }

    SECTION("malformed requests") {
        std::string not_json = "{type:";
        std::string no_type = R"({"payload":{}})";
        std::string empty_type = R"({"type":"","payload":{}})";
        std::string no_payload = R"({"type":"x"})";
        std::string bad_gateway = R"({"type":"x","gatewayId":7,"payload":{}})";

        for (const auto* body : {&not_json, &no_type, &empty_type, &no_payload, &bad_gateway}) {
            auto response = fixture.post_event(*body);
            REQUIRE(response.status == StatusCode::BadRequest);
            REQUIRE(nlohmann::json::parse(response.body)["error"] == "bad_request");
        }
        REQUIRE(state->sent_messages().empty());
    }

    SECTION("oversized payload") {
        nlohmann::json request = {
            {"type", "config.updated"},
            {"gatewayId", "gw-1"},
            {"payload", {{"blob", std::string(events::MAX_EVENT_PAYLOAD_SIZE + 1, 'x')}}}};
        std::string body = request.dump();

        auto response = fixture.post_event(body);
        REQUIRE(response.status == StatusCode::PayloadTooLarge);
        REQUIRE(state->sent_messages().empty());
    }
}

TEST_CASE("AdminServer - Serves requests over loopback", "[admin]") {
    ws::Manager manager{AdminFixture::make_manager_config(), logging::get_logger()};
    events::EventBroadcaster broadcaster{manager, logging::get_logger()};
    control::AdminConfig config;
    config.port = 0;  // Ephemeral
    core::AdminServer admin{config, manager, broadcaster, logging::get_logger()};

    REQUIRE_FALSE(admin.start());
    REQUIRE(admin.port() != 0);
    std::thread server([&] { admin.run(); });

    auto exchange = [&](const std::string& request) {
        int fd = ::socket(AF_INET, SOCK_STREAM, 0);
        REQUIRE(fd >= 0);
        sockaddr_in addr{};
        addr.sin_family = AF_INET;
        addr.sin_port = htons(admin.port());
        addr.sin_addr.s_addr = htonl(INADDR_LOOPBACK);
        REQUIRE(::connect(fd, reinterpret_cast<sockaddr*>(&addr), sizeof(addr)) == 0);
        REQUIRE_FALSE(core::set_recv_timeout(fd, 2000ms));
        REQUIRE_FALSE(core::send_all(fd, request));

        std::string response;
        char chunk[1024];
        ssize_t n = 0;
        while ((n = ::recv(fd, chunk, sizeof(chunk), 0)) > 0) {
            response.append(chunk, static_cast<size_t>(n));
        }
        core::close_fd(fd);
        return response;
    };

    // A body the JSON parser rejects byte-wise is answered, not fatal
    std::string bad_body = "{\"type\":\"\xff\",\"payload\":{}}";
    auto rejected = exchange("POST /_admin/events HTTP/1.1\r\nContent-Length: " +
                             std::to_string(bad_body.size()) + "\r\n\r\n" + bad_body);
    REQUIRE(rejected.starts_with("HTTP/1.1 400"));

    // And the server keeps serving afterwards
    auto health = exchange("GET /health HTTP/1.1\r\nHost: localhost\r\n\r\n");
    REQUIRE(health.starts_with("HTTP/1.1 200"));
    REQUIRE(health.find("healthy") != std::string::npos);

    admin.stop();
    server.join();
}
