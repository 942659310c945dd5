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

// Switchyard Delivery Stats - Header
// Per-connection event delivery counters

#pragma once

#include <atomic>
#include <chrono>
#include <cstdint>
#include <mutex>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>

namespace switchyard::ws {

/// Counters only grow. The failure timestamp and reason are updated together.
class DeliveryStats {
public:
    DeliveryStats() = default;

    // Non-copyable, non-movable (atomics)
    DeliveryStats(const DeliveryStats&) = delete;
    DeliveryStats& operator=(const DeliveryStats&) = delete;

    void record_success() noexcept {
        total_sent_.fetch_add(1, std::memory_order_relaxed);
    }

    void record_failure(std::string reason);

    [[nodiscard]] uint64_t total_sent() const noexcept {
        return total_sent_.load(std::memory_order_relaxed);
    }

    [[nodiscard]] uint64_t failed_deliveries() const noexcept {
        return failed_deliveries_.load(std::memory_order_relaxed);
    }

    /// Time of the most recent failure (nullopt if none yet)
    [[nodiscard]] std::optional<std::chrono::system_clock::time_point> last_failure_time() const;

    [[nodiscard]] std::string last_failure_reason() const;

    [[nodiscard]] nlohmann::json to_json() const;

private:
    std::atomic<uint64_t> total_sent_{0};
    std::atomic<uint64_t> failed_deliveries_{0};

    mutable std::mutex failure_mutex_;
    std::optional<std::chrono::system_clock::time_point> last_failure_time_;
    std::string last_failure_reason_;
};

}  // namespace switchyard::ws
