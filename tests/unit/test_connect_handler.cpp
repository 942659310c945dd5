// Switchyard Connect Handler Tests

#include <catch2/catch_test_macros.hpp>

#include <sys/socket.h>

#include <chrono>
#include <memory>
#include <nlohmann/json.hpp>
#include <string>
#include <thread>
#include <vector>

#include "../../src/core/errors.hpp"
#include "../../src/core/logging.hpp"
#include "../../src/core/socket.hpp"
#include "../../src/gateway/connect_handler.hpp"
#include "../../src/gateway/rate_limit.hpp"
#include "../../src/http/websocket.hpp"
#include "../../src/store/gateway_store.hpp"
#include "../../src/ws/manager.hpp"
#include "fake_transport.hpp"
#include "ws_test_helpers.hpp"

using namespace switchyard;
using http::StatusCode;
using testing::make_fake_transport;
using namespace std::chrono_literals;

namespace {

constexpr const char* WS_PATH = "/api/internal/v1/ws/gateways/connect";
constexpr const char* API_KEY = "gw-1-secret-key";

struct HandlerFixture {
    std::shared_ptr<store::InMemoryGatewayStore> gateways =
        std::make_shared<store::InMemoryGatewayStore>();
    ws::Manager manager;
    gateway::SlidingWindowRateLimiter limiter;
    gateway::ConnectHandler handler;

    explicit HandlerFixture(size_t max_connections = 10, uint64_t rate_limit = 10)
        : manager(make_manager_config(max_connections), logging::get_logger()),
          limiter(rate_limit),
          handler(gateway::ConnectHandlerConfig{}, manager, gateways, limiter,
                  logging::get_logger()) {
        store::GatewayRecord record;
        record.id = "gw-1";
        record.name = "Gateway One";
        record.adapter_type = "mock";
        record.api_key_hash = store::hash_api_key(API_KEY);
        gateways->upsert(std::move(record));
    }

    static ws::ManagerConfig make_manager_config(size_t max_connections) {
        ws::ManagerConfig config;
        config.max_connections = max_connections;
        config.heartbeat_interval = 10s;
        config.heartbeat_timeout = 30s;
        return config;
    }

    bool gateway_active() const { return gateways->find_by_id("gw-1")->is_active; }
};

http::Request connect_request() {
    http::Request req;
    req.method = http::Method::GET;
    req.path = WS_PATH;
    req.headers = {{"Upgrade", "websocket"},
                   {"Connection", "Upgrade"},
                   {"Sec-WebSocket-Key", "dGhlIHNhbXBsZSBub25jZQ=="},
                   {"Sec-WebSocket-Version", "13"},
                   {"api-key", API_KEY}};
    return req;
}

/// Poll until pred holds or the deadline passes
template <typename Pred>
bool eventually(Pred pred, std::chrono::milliseconds timeout = 2s) {
    auto deadline = std::chrono::steady_clock::now() + timeout;
    while (std::chrono::steady_clock::now() < deadline) {
        if (pred()) {
            return true;
        }
        std::this_thread::sleep_for(5ms);
    }
    return pred();
}

/// Read from fd until EOF, timeout or 'marker' shows up
std::string read_until(int fd, std::string_view marker) {
    std::string received;
    char chunk[1024];
    while (received.find(marker) == std::string::npos) {
        ssize_t n = ::recv(fd, chunk, sizeof(chunk), 0);
        if (n <= 0) {
            break;
        }
        received.append(chunk, static_cast<size_t>(n));
    }
    return received;
}

}  // namespace

// ========================================
// Admission
// ========================================

TEST_CASE("ConnectHandler - Admission checks", "[gateway][connect]") {
    HandlerFixture fixture;
    gateway::ConnectRejection rejection;

    SECTION("valid request") {
        auto gw = fixture.handler.authorize(connect_request(), "10.0.0.1", rejection);
        REQUIRE(gw.has_value());
        REQUIRE(gw->id == "gw-1");
    }

    SECTION("unknown path") {
        auto req = connect_request();
        req.path = "/api/internal/v1/ws/other";
        REQUIRE_FALSE(fixture.handler.authorize(req, "10.0.0.1", rejection));
        REQUIRE(rejection.status == StatusCode::NotFound);
    }

    SECTION("wrong method") {
        auto req = connect_request();
        req.method = http::Method::POST;
        REQUIRE_FALSE(fixture.handler.authorize(req, "10.0.0.1", rejection));
        REQUIRE(rejection.status == StatusCode::MethodNotAllowed);
    }

    SECTION("missing api-key") {
        auto req = connect_request();
        req.headers.pop_back();
        REQUIRE_FALSE(fixture.handler.authorize(req, "10.0.0.1", rejection));
        REQUIRE(rejection.status == StatusCode::Unauthorized);
        REQUIRE(rejection.message == "API key is required. Provide 'api-key' header.");
    }

    SECTION("unknown api-key") {
        auto req = connect_request();
        req.headers.back().value = "not-a-key";
        REQUIRE_FALSE(fixture.handler.authorize(req, "10.0.0.1", rejection));
        REQUIRE(rejection.status == StatusCode::Unauthorized);
        REQUIRE(rejection.message == "Invalid API key");
    }

    SECTION("authenticated but not an upgrade") {
        auto req = connect_request();
        req.headers.erase(req.headers.begin());  // Drop Upgrade
        REQUIRE_FALSE(fixture.handler.authorize(req, "10.0.0.1", rejection));
        REQUIRE(rejection.status == StatusCode::BadRequest);
    }
}

TEST_CASE("ConnectHandler - Rate limit precedes authentication", "[gateway][connect]") {
    HandlerFixture fixture(10, 2);
    gateway::ConnectRejection rejection;

    auto bad_key = connect_request();
    bad_key.headers.back().value = "not-a-key";

    // Failed attempts still count against the address
    REQUIRE_FALSE(fixture.handler.authorize(bad_key, "10.0.0.1", rejection));
    REQUIRE(rejection.status == StatusCode::Unauthorized);
    REQUIRE_FALSE(fixture.handler.authorize(bad_key, "10.0.0.1", rejection));
    REQUIRE(rejection.status == StatusCode::Unauthorized);

    REQUIRE_FALSE(fixture.handler.authorize(connect_request(), "10.0.0.1", rejection));
    REQUIRE(rejection.status == StatusCode::TooManyRequests);

    // Another address is unaffected
    REQUIRE(fixture.handler.authorize(connect_request(), "10.0.0.2", rejection));
}

TEST_CASE("ConnectHandler - Path and method checks do not consume rate limit",
          "[gateway][connect]") {
    HandlerFixture fixture(10, 1);
    gateway::ConnectRejection rejection;

    auto wrong_path = connect_request();
    wrong_path.path = "/elsewhere";
    for (int i = 0; i < 5; ++i) {
        REQUIRE_FALSE(fixture.handler.authorize(wrong_path, "10.0.0.1", rejection));
        REQUIRE(rejection.status == StatusCode::NotFound);
    }

    REQUIRE(fixture.handler.authorize(connect_request(), "10.0.0.1", rejection));
}

// ========================================
// Session lifecycle
// ========================================

TEST_CASE("ConnectHandler - Session lifecycle", "[gateway][connect]") {
    HandlerFixture fixture;
    auto [transport, state] = make_fake_transport();

    std::thread session([&, t = std::move(transport)]() mutable {
        fixture.handler.run_session("gw-1", std::move(t), API_KEY);
    });

    REQUIRE(eventually([&] { return !state->sent_messages().empty(); }));
    REQUIRE(eventually([&] { return fixture.gateway_active(); }));

    auto ack = nlohmann::json::parse(state->sent_messages().front());
    REQUIRE(ack["type"] == "connection.ack");
    REQUIRE(ack["gatewayId"] == "gw-1");
    REQUIRE(logging::is_valid_uuid(ack["connectionId"].get<std::string>()));
    REQUIRE(ack.contains("timestamp"));

    auto connections = fixture.manager.get_connections("gw-1");
    REQUIRE(connections.size() == 1);
    REQUIRE(connections.front()->connection_id() == ack["connectionId"]);

    // Inbound data is ignored; the session keeps running
    state->push_inbound("hello");
    std::this_thread::sleep_for(20ms);
    REQUIRE(fixture.manager.get_connection_count() == 1);

    state->peer_close(http::WebSocketCloseCode::NORMAL_CLOSURE);
    session.join();

    REQUIRE(fixture.manager.get_connection_count() == 0);
    REQUIRE_FALSE(fixture.gateway_active());
}

TEST_CASE("ConnectHandler - Abnormal closure still cleans up", "[gateway][connect]") {
    HandlerFixture fixture;
    auto [transport, state] = make_fake_transport();

    std::thread session([&, t = std::move(transport)]() mutable {
        fixture.handler.run_session("gw-1", std::move(t), API_KEY);
    });

    REQUIRE(eventually([&] { return fixture.gateway_active(); }));
    state->peer_close(http::WebSocketCloseCode::ABNORMAL_CLOSURE);
    session.join();

    REQUIRE(fixture.manager.get_connection_count() == 0);
    REQUIRE_FALSE(fixture.gateway_active());
}

TEST_CASE("ConnectHandler - Capacity exhausted", "[gateway][connect]") {
    HandlerFixture fixture(1);

    auto [held, held_state] = make_fake_transport();
    std::error_code ec;
    auto existing = fixture.manager.register_connection("gw-1", held, API_KEY, ec);
    REQUIRE(existing);

    auto [transport, state] = make_fake_transport();
    fixture.handler.run_session("gw-1", std::move(transport), API_KEY);  // Returns immediately

    auto sent = state->sent_messages();
    REQUIRE(sent.size() == 1);
    auto error = nlohmann::json::parse(sent.front());
    REQUIRE(error["type"] == "error");
    REQUIRE_FALSE(error["message"].get<std::string>().empty());

    REQUIRE(state->close_count() == 1);
    {
        std::lock_guard lock(state->mutex);
        REQUIRE(state->close_code == http::WebSocketCloseCode::TRY_AGAIN_LATER);
    }

    REQUIRE(fixture.manager.get_connection_count() == 1);
}

// ========================================
// Socket level
// ========================================

TEST_CASE("ConnectHandler - Upgrade over a socket", "[gateway][connect]") {
    HandlerFixture fixture;

    int fds[2];
    REQUIRE(::socketpair(AF_UNIX, SOCK_STREAM, 0, fds) == 0);
    int client = fds[0];
    REQUIRE_FALSE(core::set_recv_timeout(client, 2000ms));

    std::thread server([&] { fixture.handler.handle(fds[1], "10.0.0.1"); });

    std::string request = std::string("GET ") + WS_PATH +
                          " HTTP/1.1\r\n"
                          "Host: localhost\r\n"
                          "Upgrade: websocket\r\n"
                          "Connection: Upgrade\r\n"
                          "Sec-WebSocket-Key: dGhlIHNhbXBsZSBub25jZQ==\r\n"
                          "Sec-WebSocket-Version: 13\r\n"
                          "api-key: " +
                          API_KEY + "\r\n\r\n";
    REQUIRE_FALSE(core::send_all(client, request));

    auto received = read_until(client, "connection.ack");
    REQUIRE(received.starts_with("HTTP/1.1 101 Switching Protocols\r\n"));
    REQUIRE(received.find("Sec-WebSocket-Accept: s3pPLMBiTxaQ9kYGzzhZRbK+xOo=") !=
            std::string::npos);
    REQUIRE(received.find("connection.ack") != std::string::npos);
    REQUIRE(eventually([&] { return fixture.gateway_active(); }));

    REQUIRE_FALSE(core::send_all(client, testing::masked_close(1000, "bye")));
    server.join();

    REQUIRE(fixture.manager.get_connection_count() == 0);
    REQUIRE_FALSE(fixture.gateway_active());
    core::close_fd(client);
}

TEST_CASE("ConnectHandler - Rejection over a socket", "[gateway][connect]") {
    HandlerFixture fixture;

    int fds[2];
    REQUIRE(::socketpair(AF_UNIX, SOCK_STREAM, 0, fds) == 0);
    int client = fds[0];
    REQUIRE_FALSE(core::set_recv_timeout(client, 2000ms));

    std::thread server([&] { fixture.handler.handle(fds[1], "10.0.0.1"); });

    std::string request = std::string("GET ") + WS_PATH +
                          " HTTP/1.1\r\n"
                          "Host: localhost\r\n"
                          "Upgrade: websocket\r\n"
                          "Connection: Upgrade\r\n"
                          "Sec-WebSocket-Key: dGhlIHNhbXBsZSBub25jZQ==\r\n"
                          "Sec-WebSocket-Version: 13\r\n\r\n";
    REQUIRE_FALSE(core::send_all(client, request));

    auto received = read_until(client, "\x01");  // Read to EOF
    server.join();

    REQUIRE(received.starts_with("HTTP/1.1 401"));
    REQUIRE(received.find("API key is required") != std::string::npos);
    REQUIRE(fixture.manager.get_connection_count() == 0);
    core::close_fd(client);
}
