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

// Switchyard Rate Limiting - Header
// Sliding-window limiter for WebSocket connect attempts

#pragma once

#include <chrono>
#include <cstdint>
#include <deque>
#include <mutex>
#include <string>
#include <string_view>

#include "../core/containers.hpp"

namespace switchyard::gateway {

/// Per-key sliding-window limiter (shared by all handler threads)
///
/// A key may make at most 'limit' attempts in any rolling window. Rejected
/// attempts are not recorded.
class SlidingWindowRateLimiter {
public:
    using Clock = std::chrono::steady_clock;

    /// @param limit Attempts allowed per window (0 disables limiting)
    /// @param window Rolling window length
    explicit SlidingWindowRateLimiter(uint64_t limit,
                                      std::chrono::milliseconds window = std::chrono::minutes(1));

    ~SlidingWindowRateLimiter() = default;

    // Non-copyable, non-movable
    SlidingWindowRateLimiter(const SlidingWindowRateLimiter&) = delete;
    SlidingWindowRateLimiter& operator=(const SlidingWindowRateLimiter&) = delete;

    /// Record an attempt for key if the window has room
    /// @return true if allowed, false if rate limited
    [[nodiscard]] bool allow(std::string_view key);

    /// Same as allow(key), at an explicit time
    [[nodiscard]] bool allow(std::string_view key, Clock::time_point now);

    /// Attempts left in the current window for key
    [[nodiscard]] uint64_t remaining(std::string_view key) const;

    /// Forget a key
    void reset(std::string_view key);

    /// Drop keys whose attempts have all left the window
    /// @return number of keys removed
    size_t prune();

    void clear();

    [[nodiscard]] size_t key_count() const;

    [[nodiscard]] uint64_t limit() const noexcept { return limit_; }
    [[nodiscard]] std::chrono::milliseconds window() const noexcept { return window_; }

private:
    /// Pop timestamps older than the window
    void expire(std::deque<Clock::time_point>& attempts, Clock::time_point now) const;

    size_t prune_locked(Clock::time_point now);

    const uint64_t limit_;
    const std::chrono::milliseconds window_;

    mutable std::mutex mutex_;
    core::fast_map<std::string, std::deque<Clock::time_point>> attempts_;
    uint64_t calls_since_prune_ = 0;
};

}  // namespace switchyard::gateway
