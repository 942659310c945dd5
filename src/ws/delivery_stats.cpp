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

// Switchyard Delivery Stats - Implementation

#include "delivery_stats.hpp"

#include "../core/logging.hpp"

namespace switchyard::ws {

void DeliveryStats::record_failure(std::string reason) {
    failed_deliveries_.fetch_add(1, std::memory_order_relaxed);

    std::lock_guard lock(failure_mutex_);
    last_failure_time_ = std::chrono::system_clock::now();
    last_failure_reason_ = std::move(reason);
}

std::optional<std::chrono::system_clock::time_point> DeliveryStats::last_failure_time() const {
    std::lock_guard lock(failure_mutex_);
    return last_failure_time_;
}

std::string DeliveryStats::last_failure_reason() const {
    std::lock_guard lock(failure_mutex_);
    return last_failure_reason_;
}

nlohmann::json DeliveryStats::to_json() const {
    nlohmann::json j{{"totalEventsSent", total_sent()}, {"failedDeliveries", failed_deliveries()}};

    std::lock_guard lock(failure_mutex_);
    if (last_failure_time_) {
        j["lastFailureTime"] = logging::format_rfc3339(*last_failure_time_);
        j["lastFailureReason"] = last_failure_reason_;
    }
    return j;
}

}  // namespace switchyard::ws
