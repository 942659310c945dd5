// In-memory Transport for registry, broadcaster and connect handler tests

#pragma once

#include <chrono>
#include <condition_variable>
#include <deque>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

#include "../../src/core/errors.hpp"
#include "../../src/ws/transport.hpp"

namespace switchyard::testing {

/// State shared between a FakeTransport and the test that created it.
/// Survives the transport so assertions can run after the manager drops it.
struct FakeTransportState {
    std::mutex mutex;
    std::condition_variable cv;

    std::vector<std::string> sent;
    size_t pings = 0;
    size_t close_calls = 0;
    uint16_t close_code = 0;
    std::string close_reason;
    bool closed = false;

    // Behaviour knobs
    bool fail_sends = false;
    bool answer_pings = true;  // Invoke the pong handler from send_ping
    bool hold_close = false;   // close() blocks until release_close()
    bool close_entered = false;

    std::deque<std::string> inbound;
    uint16_t peer_close_code = 0;  // Non-zero: read_message reports this close

    std::vector<std::string> sent_messages() {
        std::lock_guard lock(mutex);
        return sent;
    }

    size_t ping_count() {
        std::lock_guard lock(mutex);
        return pings;
    }

    size_t close_count() {
        std::lock_guard lock(mutex);
        return close_calls;
    }

    bool wait_closed(std::chrono::milliseconds timeout) {
        std::unique_lock lock(mutex);
        return cv.wait_for(lock, timeout, [this] { return closed; });
    }

    bool wait_close_entered(std::chrono::milliseconds timeout) {
        std::unique_lock lock(mutex);
        return cv.wait_for(lock, timeout, [this] { return close_entered; });
    }

    void release_close() {
        {
            std::lock_guard lock(mutex);
            hold_close = false;
        }
        cv.notify_all();
    }

    void push_inbound(std::string message) {
        {
            std::lock_guard lock(mutex);
            inbound.push_back(std::move(message));
        }
        cv.notify_all();
    }

    void peer_close(uint16_t code) {
        {
            std::lock_guard lock(mutex);
            peer_close_code = code;
        }
        cv.notify_all();
    }
};

class FakeTransport final : public ws::Transport {
public:
    explicit FakeTransport(std::shared_ptr<FakeTransportState> state) : state_(std::move(state)) {}

    std::error_code send(std::string_view message) override {
        std::lock_guard lock(state_->mutex);
        if (state_->closed) {
            return core::make_error_code(core::Errc::connection_closed);
        }
        if (state_->fail_sends) {
            return std::make_error_code(std::errc::broken_pipe);
        }
        state_->sent.emplace_back(message);
        return {};
    }

    std::error_code close(uint16_t code, std::string_view reason) override {
        {
            std::unique_lock lock(state_->mutex);
            ++state_->close_calls;
            state_->close_entered = true;
            state_->cv.notify_all();
            state_->cv.wait(lock, [this] { return !state_->hold_close; });
            if (!state_->closed) {
                state_->closed = true;
                state_->close_code = code;
                state_->close_reason = std::string(reason);
            }
        }
        state_->cv.notify_all();
        return {};
    }

    std::error_code set_read_timeout(std::chrono::milliseconds) override { return {}; }
    std::error_code set_write_timeout(std::chrono::milliseconds) override { return {}; }

    void set_pong_handler(std::function<void()> handler) override {
        std::lock_guard lock(handler_mutex_);
        pong_handler_ = std::move(handler);
    }

    std::error_code send_ping() override {
        bool answer = false;
        {
            std::lock_guard lock(state_->mutex);
            if (state_->closed) {
                return core::make_error_code(core::Errc::connection_closed);
            }
            ++state_->pings;
            answer = state_->answer_pings;
        }
        if (answer) {
            std::function<void()> handler;
            {
                std::lock_guard lock(handler_mutex_);
                handler = pong_handler_;
            }
            if (handler) {
                handler();
            }
        }
        return {};
    }

    std::error_code read_message(ws::MessageType& type, std::string& payload) override {
        std::unique_lock lock(state_->mutex);
        state_->cv.wait(lock, [this] {
            return state_->closed || state_->peer_close_code != 0 || !state_->inbound.empty();
        });
        if (!state_->inbound.empty()) {
            type = ws::MessageType::Text;
            payload = std::move(state_->inbound.front());
            state_->inbound.pop_front();
            return {};
        }
        if (state_->peer_close_code != 0) {
            return core::make_close_error(state_->peer_close_code);
        }
        return core::make_close_error(state_->close_code);
    }

private:
    std::shared_ptr<FakeTransportState> state_;
    std::mutex handler_mutex_;
    std::function<void()> pong_handler_;
};

/// Fresh transport plus the handle a test keeps for assertions
inline std::pair<std::unique_ptr<ws::Transport>, std::shared_ptr<FakeTransportState>>
make_fake_transport() {
    auto state = std::make_shared<FakeTransportState>();
    return {std::make_unique<FakeTransport>(state), state};
}

}  // namespace switchyard::testing
