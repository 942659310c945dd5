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

// Switchyard WebSocket Transport - Implementation

#include "websocket_transport.hpp"

#include <sys/socket.h>

#include <quill/LogMacros.h>

#include <cerrno>

#include "../core/errors.hpp"
#include "../core/logging.hpp"
#include "../core/socket.hpp"

namespace switchyard::ws {

using http::WebSocketCloseCode;
using http::WebSocketOpcode;
using http::WebSocketUtils;

WebSocketTransport::WebSocketTransport(int fd, size_t max_message_size,
                                       std::vector<uint8_t> buffered)
    : fd_(fd),
      max_message_size_(max_message_size),
      parser_(max_message_size, true),
      pending_(std::move(buffered)) {}

WebSocketTransport::~WebSocketTransport() {
    core::close_fd(fd_);
}

std::error_code WebSocketTransport::send(std::string_view message) {
    if (close_sent_.load(std::memory_order_acquire)) {
        return core::Errc::connection_closed;
    }
    return write_frame(WebSocketUtils::create_text_frame(message));
}

std::error_code WebSocketTransport::send_ping() {
    if (close_sent_.load(std::memory_order_acquire)) {
        return core::Errc::connection_closed;
    }
    return write_frame(WebSocketUtils::create_ping_frame());
}

std::error_code WebSocketTransport::close(uint16_t code, std::string_view reason) {
    if (close_sent_.exchange(true, std::memory_order_acq_rel)) {
        return {};
    }
    close_code_.store(code, std::memory_order_release);

    auto ec = write_close_frame(code, reason);

    // Wakes the reader; the fd itself is released by the destructor
    core::shutdown_fd(fd_);
    return ec;
}

std::error_code WebSocketTransport::set_read_timeout(std::chrono::milliseconds timeout) {
    return core::set_recv_timeout(fd_, timeout);
}

std::error_code WebSocketTransport::set_write_timeout(std::chrono::milliseconds timeout) {
    return core::set_send_timeout(fd_, timeout);
}

void WebSocketTransport::set_pong_handler(std::function<void()> handler) {
    std::lock_guard lock(handler_mutex_);
    pong_handler_ = std::move(handler);
}

std::error_code WebSocketTransport::write_frame(std::span<const uint8_t> frame) {
    std::lock_guard lock(write_mutex_);
    // A sender may have passed the close_sent_ check before close() won the lock
    if (close_written_) {
        return core::Errc::connection_closed;
    }
    return core::send_all(fd_, frame);
}

std::error_code WebSocketTransport::write_close_frame(uint16_t code, std::string_view reason) {
    auto frame = WebSocketUtils::create_close_frame(code, reason);
    std::lock_guard lock(write_mutex_);
    if (close_written_) {
        return {};
    }
    close_written_ = true;
    return core::send_all(fd_, frame);
}

std::error_code WebSocketTransport::closed_error() const noexcept {
    if (close_sent_.load(std::memory_order_acquire)) {
        return core::make_close_error(close_code_.load(std::memory_order_acquire));
    }
    return core::make_close_error(WebSocketCloseCode::ABNORMAL_CLOSURE);
}

std::error_code WebSocketTransport::read_frame(http::WebSocketFrame& frame) {
    parser_.reset();

    uint8_t buffer[8192];
    while (true) {
        if (!pending_.empty()) {
            size_t consumed = 0;
            auto result = parser_.parse(pending_, frame, consumed);
            pending_.erase(pending_.begin(), pending_.begin() + static_cast<std::ptrdiff_t>(consumed));

            if (result == http::WebSocketFrameParser::ParseResult::Complete) {
                return {};
            }
            if (result == http::WebSocketFrameParser::ParseResult::Error) {
                if (parser_.last_error() == http::WebSocketFrameParser::ParseError::FrameTooLarge) {
                    return core::Errc::payload_too_large;
                }
                return core::Errc::protocol_error;
            }
        }

        ssize_t n = ::recv(fd_, buffer, sizeof(buffer), 0);
        if (n > 0) {
            pending_.insert(pending_.end(), buffer, buffer + n);
            continue;
        }
        if (n == 0) {
            return closed_error();
        }
        if (errno == EINTR) {
            continue;
        }
        if (errno == EAGAIN || errno == EWOULDBLOCK) {
            // SO_RCVTIMEO expired
            return std::make_error_code(std::errc::timed_out);
        }
        if (close_sent_.load(std::memory_order_acquire)) {
            return closed_error();
        }
        return std::error_code(errno, std::system_category());
    }
}

std::error_code WebSocketTransport::read_message(MessageType& type, std::string& payload) {
    payload.clear();
    bool in_message = false;

    while (true) {
        http::WebSocketFrame frame;
        if (auto ec = read_frame(frame); ec) {
            if (ec == core::Errc::payload_too_large) {
                close(WebSocketCloseCode::MESSAGE_TOO_BIG, "message too big");
            } else if (ec == core::Errc::protocol_error) {
                close(WebSocketCloseCode::PROTOCOL_ERROR, "protocol error");
            }
            return ec;
        }

        switch (frame.opcode) {
            case WebSocketOpcode::PING: {
                if (close_sent_.load(std::memory_order_acquire)) {
                    continue;
                }
                if (auto ec = write_frame(WebSocketUtils::create_pong_frame(frame.payload)); ec) {
                    return ec;
                }
                continue;
            }

            case WebSocketOpcode::PONG: {
                std::function<void()> handler;
                {
                    std::lock_guard lock(handler_mutex_);
                    handler = pong_handler_;
                }
                if (handler) {
                    handler();
                }
                continue;
            }

            case WebSocketOpcode::CLOSE: {
                auto close_payload = WebSocketUtils::parse_close_payload(frame.payload);
                uint16_t code =
                    close_payload ? close_payload->code : WebSocketCloseCode::PROTOCOL_ERROR;

                // Echo the close (RFC 6455 §5.5.1) unless we initiated it
                if (!close_sent_.exchange(true, std::memory_order_acq_rel)) {
                    close_code_.store(code, std::memory_order_release);
                    uint16_t echo = code == WebSocketCloseCode::NO_STATUS_RECEIVED
                                        ? WebSocketCloseCode::NORMAL_CLOSURE
                                        : code;
                    // Peer may already be gone; the close is reported either way
                    if (auto ec = write_close_frame(echo, ""); ec) {
                        if (auto* logger = logging::get_logger()) {
                            LOG_DEBUG(logger, "Close echo not delivered: code={}, error={}", echo,
                                      ec.message());
                        }
                    }
                    core::shutdown_fd(fd_);
                }
                return core::make_close_error(code);
            }

            case WebSocketOpcode::TEXT:
            case WebSocketOpcode::BINARY: {
                if (in_message) {
                    close(WebSocketCloseCode::PROTOCOL_ERROR, "expected continuation frame");
                    return core::Errc::protocol_error;
                }
                type = frame.opcode == WebSocketOpcode::TEXT ? MessageType::Text
                                                              : MessageType::Binary;
                payload.assign(reinterpret_cast<const char*>(frame.payload.data()),
                               frame.payload.size());
                if (frame.fin) {
                    return {};
                }
                in_message = true;
                continue;
            }

            case WebSocketOpcode::CONTINUATION: {
                if (!in_message) {
                    close(WebSocketCloseCode::PROTOCOL_ERROR, "unexpected continuation frame");
                    return core::Errc::protocol_error;
                }
                if (payload.size() + frame.payload.size() > max_message_size_) {
                    close(WebSocketCloseCode::MESSAGE_TOO_BIG, "message too big");
                    return core::Errc::payload_too_large;
                }
                payload.append(reinterpret_cast<const char*>(frame.payload.data()),
                               frame.payload.size());
                if (frame.fin) {
                    return {};
                }
                continue;
            }

            default:
                close(WebSocketCloseCode::PROTOCOL_ERROR, "unsupported opcode");
                return core::Errc::protocol_error;
        }
    }
}

}  // namespace switchyard::ws
