// Switchyard WebSocket Transport Tests
// Exercises the blocking transport over a connected socket pair

#include <catch2/catch_test_macros.hpp>

#include <sys/socket.h>
#include <unistd.h>

#include <algorithm>
#include <atomic>
#include <chrono>
#include <optional>
#include <string>
#include <thread>
#include <vector>

#include "../../src/core/errors.hpp"
#include "../../src/core/socket.hpp"
#include "../../src/http/websocket.hpp"
#include "../../src/ws/websocket_transport.hpp"
#include "ws_test_helpers.hpp"

using namespace switchyard;
using http::WebSocketOpcode;
using testing::masked_close;
using testing::masked_frame;
using testing::masked_text;

namespace {

/// Peer end of the socket pair, speaking as a gateway would
class TestClient {
public:
    explicit TestClient(int fd) : fd_(fd), parser_(1024 * 1024, false) {
        REQUIRE_FALSE(core::set_recv_timeout(fd_, std::chrono::milliseconds(2000)));
    }
    ~TestClient() { core::close_fd(fd_); }

    void write(const std::vector<uint8_t>& bytes) {
        REQUIRE_FALSE(core::send_all(fd_, bytes));
    }

    struct Frame {
        uint8_t opcode = 0;
        std::string payload;
    };

    /// Next frame from the server (nullopt on EOF or timeout)
    std::optional<Frame> read_frame() {
        parser_.reset();
        uint8_t byte = 0;
        while (true) {
            if (!pending_.empty()) {
                http::WebSocketFrame frame;
                size_t consumed = 0;
                auto result = parser_.parse(pending_, frame, consumed);
                pending_.erase(pending_.begin(),
                               pending_.begin() + static_cast<std::ptrdiff_t>(consumed));
                if (result == http::WebSocketFrameParser::ParseResult::Complete) {
                    return Frame{frame.opcode,
                                 std::string(frame.payload.begin(), frame.payload.end())};
                }
                if (result == http::WebSocketFrameParser::ParseResult::Error) {
                    return std::nullopt;
                }
            }
            ssize_t n = ::recv(fd_, &byte, 1, 0);
            if (n <= 0) {
                return std::nullopt;
            }
            pending_.push_back(byte);
        }
    }

    void shutdown_write() { ::shutdown(fd_, SHUT_WR); }

private:
    int fd_;
    http::WebSocketFrameParser parser_;
    std::vector<uint8_t> pending_;
};

struct SocketPair {
    int server_fd = -1;
    int client_fd = -1;

    SocketPair() {
        int fds[2];
        REQUIRE(::socketpair(AF_UNIX, SOCK_STREAM, 0, fds) == 0);
        server_fd = fds[0];
        client_fd = fds[1];
    }
};

uint16_t close_code_of(const std::string& payload) {
    REQUIRE(payload.size() >= 2);
    return static_cast<uint16_t>((static_cast<uint8_t>(payload[0]) << 8) |
                                 static_cast<uint8_t>(payload[1]));
}

}  // namespace

TEST_CASE("WebSocketTransport - Send text", "[ws][transport]") {
    SocketPair pair;
    ws::WebSocketTransport transport(pair.server_fd, 1024);
    TestClient client(pair.client_fd);

    REQUIRE_FALSE(transport.send(R"({"type":"connection.ack"})"));

    auto frame = client.read_frame();
    REQUIRE(frame.has_value());
    REQUIRE(frame->opcode == WebSocketOpcode::TEXT);
    REQUIRE(frame->payload == R"({"type":"connection.ack"})");
}

TEST_CASE("WebSocketTransport - Read messages", "[ws][transport]") {
    SocketPair pair;

    SECTION("single frame") {
        ws::WebSocketTransport transport(pair.server_fd, 1024);
        TestClient client(pair.client_fd);
        client.write(masked_text("hello"));

        ws::MessageType type;
        std::string payload;
        REQUIRE_FALSE(transport.read_message(type, payload));
        REQUIRE(type == ws::MessageType::Text);
        REQUIRE(payload == "hello");
    }

    SECTION("bytes buffered during the handshake come first") {
        auto buffered = masked_text("early");
        ws::WebSocketTransport transport(pair.server_fd, 1024, buffered);
        TestClient client(pair.client_fd);
        client.write(masked_text("late"));

        ws::MessageType type;
        std::string payload;
        REQUIRE_FALSE(transport.read_message(type, payload));
        REQUIRE(payload == "early");
        REQUIRE_FALSE(transport.read_message(type, payload));
        REQUIRE(payload == "late");
    }

    SECTION("fragmented message is reassembled") {
        ws::WebSocketTransport transport(pair.server_fd, 1024);
        TestClient client(pair.client_fd);

        std::string second = "world";
        client.write(masked_text("hello ", false));
        client.write(masked_frame(WebSocketOpcode::CONTINUATION,
                                  std::span<const uint8_t>(
                                      reinterpret_cast<const uint8_t*>(second.data()),
                                      second.size())));

        ws::MessageType type;
        std::string payload;
        REQUIRE_FALSE(transport.read_message(type, payload));
        REQUIRE(payload == "hello world");
    }
}

TEST_CASE("WebSocketTransport - Control frames", "[ws][transport]") {
    SocketPair pair;
    ws::WebSocketTransport transport(pair.server_fd, 1024);
    TestClient client(pair.client_fd);

    SECTION("ping is answered with a pong carrying the same payload") {
        std::vector<uint8_t> ping_payload{'h', 'b'};
        client.write(masked_frame(WebSocketOpcode::PING, ping_payload));
        client.write(masked_text("after"));

        ws::MessageType type;
        std::string payload;
        REQUIRE_FALSE(transport.read_message(type, payload));
        REQUIRE(payload == "after");

        auto pong = client.read_frame();
        REQUIRE(pong.has_value());
        REQUIRE(pong->opcode == WebSocketOpcode::PONG);
        REQUIRE(pong->payload == "hb");
    }

    SECTION("pong invokes the handler") {
        std::atomic<int> pongs{0};
        transport.set_pong_handler([&pongs] { pongs++; });

        client.write(masked_frame(WebSocketOpcode::PONG, {}));
        client.write(masked_frame(WebSocketOpcode::PONG, {}));
        client.write(masked_text("done"));

        ws::MessageType type;
        std::string payload;
        REQUIRE_FALSE(transport.read_message(type, payload));
        REQUIRE(pongs.load() == 2);
    }

    SECTION("send_ping writes a ping frame") {
        REQUIRE_FALSE(transport.send_ping());
        auto ping = client.read_frame();
        REQUIRE(ping.has_value());
        REQUIRE(ping->opcode == WebSocketOpcode::PING);
    }
}

TEST_CASE("WebSocketTransport - Closing", "[ws][transport]") {
    SocketPair pair;
    ws::WebSocketTransport transport(pair.server_fd, 1024);
    TestClient client(pair.client_fd);

    SECTION("peer close is echoed and reported with its code") {
        client.write(masked_close(1000, "bye"));

        ws::MessageType type;
        std::string payload;
        auto ec = transport.read_message(type, payload);
        REQUIRE(ec == core::make_close_error(1000));
        REQUIRE(core::is_normal_closure(ec));

        auto echo = client.read_frame();
        REQUIRE(echo.has_value());
        REQUIRE(echo->opcode == WebSocketOpcode::CLOSE);
        REQUIRE(close_code_of(echo->payload) == 1000);

        REQUIRE(transport.send("late") == core::Errc::connection_closed);
    }

    SECTION("local close sends a close frame and wakes the reader") {
        std::error_code read_ec;
        std::thread reader([&] {
            ws::MessageType type;
            std::string payload;
            read_ec = transport.read_message(type, payload);
        });

        // Give the reader time to block in recv
        std::this_thread::sleep_for(std::chrono::milliseconds(50));
        REQUIRE_FALSE(transport.close(1001, "server shutdown"));
        reader.join();

        REQUIRE(read_ec == core::make_close_error(1001));

        auto frame = client.read_frame();
        REQUIRE(frame.has_value());
        REQUIRE(frame->opcode == WebSocketOpcode::CLOSE);
        REQUIRE(close_code_of(frame->payload) == 1001);
        REQUIRE(frame->payload.substr(2) == "server shutdown");
    }

    SECTION("close is idempotent") {
        REQUIRE_FALSE(transport.close(1000, "normal closure"));
        REQUIRE_FALSE(transport.close(1001, "again"));

        auto frame = client.read_frame();
        REQUIRE(frame.has_value());
        REQUIRE(close_code_of(frame->payload) == 1000);
        REQUIRE_FALSE(client.read_frame().has_value());  // Only one close frame, then EOF
    }

    SECTION("EOF without a close frame is abnormal") {
        client.shutdown_write();

        ws::MessageType type;
        std::string payload;
        auto ec = transport.read_message(type, payload);
        REQUIRE(ec == core::make_close_error(1006));
        REQUIRE_FALSE(core::is_normal_closure(ec));
    }
}

TEST_CASE("WebSocketTransport - Nothing follows the close frame", "[ws][transport][concurrency]") {
    SocketPair pair;
    ws::WebSocketTransport transport(pair.server_fd, 1024);
    TestClient client(pair.client_fd);

    constexpr int SENDERS = 4;
    std::atomic<bool> go{false};
    std::vector<std::thread> senders;
    for (int i = 0; i < SENDERS; ++i) {
        senders.emplace_back([&] {
            while (!go.load()) {
                std::this_thread::yield();
            }
            while (!transport.send("event")) {
            }
        });
    }

    std::error_code read_ec;
    std::thread reader([&] {
        ws::MessageType type;
        std::string payload;
        read_ec = transport.read_message(type, payload);
    });

    go.store(true);
    std::this_thread::sleep_for(std::chrono::milliseconds(20));
    client.write(masked_close(1000, "bye"));

    // Drain everything the server wrote until it shuts the socket
    std::vector<uint8_t> opcodes;
    while (auto frame = client.read_frame()) {
        opcodes.push_back(frame->opcode);
    }

    reader.join();
    for (auto& t : senders) {
        t.join();
    }

    REQUIRE(read_ec == core::make_close_error(1000));
    REQUIRE_FALSE(opcodes.empty());
    REQUIRE(opcodes.back() == WebSocketOpcode::CLOSE);
    REQUIRE(std::count(opcodes.begin(), opcodes.end(), WebSocketOpcode::CLOSE) == 1);
    REQUIRE(transport.send("late") == core::Errc::connection_closed);
}

TEST_CASE("WebSocketTransport - Peer close without a reader", "[ws][transport]") {
    SocketPair pair;
    ws::WebSocketTransport transport(pair.server_fd, 1024);

    // Peer sends its close frame and vanishes before the echo
    REQUIRE_FALSE(core::send_all(pair.client_fd, masked_close(1001, "going away")));
    core::close_fd(pair.client_fd);

    ws::MessageType type;
    std::string payload;
    auto ec = transport.read_message(type, payload);
    REQUIRE(ec == core::make_close_error(1001));
    REQUIRE(transport.send("late") == core::Errc::connection_closed);
    REQUIRE_FALSE(transport.close(1000, "normal closure"));
}

TEST_CASE("WebSocketTransport - Protocol violations", "[ws][transport]") {
    SocketPair pair;
    ws::WebSocketTransport transport(pair.server_fd, 16);
    TestClient client(pair.client_fd);

    ws::MessageType type;
    std::string payload;

    SECTION("unmasked frame closes with 1002") {
        client.write(http::WebSocketUtils::create_text_frame("x"));
        REQUIRE(transport.read_message(type, payload) == core::Errc::protocol_error);

        auto frame = client.read_frame();
        REQUIRE(frame.has_value());
        REQUIRE(close_code_of(frame->payload) == 1002);
    }

    SECTION("oversized message closes with 1009") {
        client.write(masked_text(std::string(17, 'a')));
        REQUIRE(transport.read_message(type, payload) == core::Errc::payload_too_large);

        auto frame = client.read_frame();
        REQUIRE(frame.has_value());
        REQUIRE(close_code_of(frame->payload) == 1009);
    }

    SECTION("fragments past the limit close with 1009") {
        std::string rest(10, 'b');
        client.write(masked_text(std::string(10, 'a'), false));
        client.write(masked_frame(WebSocketOpcode::CONTINUATION,
                                  std::span<const uint8_t>(
                                      reinterpret_cast<const uint8_t*>(rest.data()), rest.size())));
        REQUIRE(transport.read_message(type, payload) == core::Errc::payload_too_large);
    }

    SECTION("continuation without a start closes with 1002") {
        client.write(masked_frame(WebSocketOpcode::CONTINUATION, {}));
        REQUIRE(transport.read_message(type, payload) == core::Errc::protocol_error);
    }
}
