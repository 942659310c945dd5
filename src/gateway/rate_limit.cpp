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

// Switchyard Rate Limiting - Implementation

#include "rate_limit.hpp"

namespace switchyard::gateway {

namespace {
// Sweep idle keys every N attempts so the map stays bounded by active clients
constexpr uint64_t PRUNE_INTERVAL = 1024;
}  // namespace

SlidingWindowRateLimiter::SlidingWindowRateLimiter(uint64_t limit,
                                                   std::chrono::milliseconds window)
    : limit_(limit), window_(window) {}

void SlidingWindowRateLimiter::expire(std::deque<Clock::time_point>& attempts,
                                      Clock::time_point now) const {
    while (!attempts.empty() && now - attempts.front() >= window_) {
        attempts.pop_front();
    }
}

bool SlidingWindowRateLimiter::allow(std::string_view key) {
    return allow(key, Clock::now());
}

bool SlidingWindowRateLimiter::allow(std::string_view key, Clock::time_point now) {
    if (limit_ == 0) {
        return true;
    }

    std::lock_guard lock(mutex_);

    if (++calls_since_prune_ >= PRUNE_INTERVAL) {
        calls_since_prune_ = 0;
        prune_locked(now);
    }

    auto& attempts = attempts_[std::string(key)];
    expire(attempts, now);

    if (attempts.size() >= limit_) {
        return false;
    }
    attempts.push_back(now);
    return true;
}

uint64_t SlidingWindowRateLimiter::remaining(std::string_view key) const {
    if (limit_ == 0) {
        return UINT64_MAX;
    }

    std::lock_guard lock(mutex_);
    auto it = attempts_.find(std::string(key));
    if (it == attempts_.end()) {
        return limit_;
    }

    auto now = Clock::now();
    uint64_t live = 0;
    for (auto ts : it->second) {
        if (now - ts < window_) {
            ++live;
        }
    }
    return live >= limit_ ? 0 : limit_ - live;
}

void SlidingWindowRateLimiter::reset(std::string_view key) {
    std::lock_guard lock(mutex_);
    attempts_.erase(std::string(key));
}

size_t SlidingWindowRateLimiter::prune() {
    std::lock_guard lock(mutex_);
    return prune_locked(Clock::now());
}

size_t SlidingWindowRateLimiter::prune_locked(Clock::time_point now) {
    size_t removed = 0;
    for (auto it = attempts_.begin(); it != attempts_.end();) {
        expire(it->second, now);
        if (it->second.empty()) {
            it = attempts_.erase(it);
            ++removed;
        } else {
            ++it;
        }
    }
    return removed;
}

void SlidingWindowRateLimiter::clear() {
    std::lock_guard lock(mutex_);
    attempts_.clear();
}

size_t SlidingWindowRateLimiter::key_count() const {
    std::lock_guard lock(mutex_);
    return attempts_.size();
}

}  // namespace switchyard::gateway
