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

// Switchyard Wait Group - Header
// Counts detached tasks so an owner can block until all of them finished

#pragma once

#include <condition_variable>
#include <cstddef>
#include <mutex>

namespace switchyard::core {

class WaitGroup {
public:
    WaitGroup() = default;
    ~WaitGroup() = default;

    // Non-copyable, non-movable
    WaitGroup(const WaitGroup&) = delete;
    WaitGroup& operator=(const WaitGroup&) = delete;

    /// Register tasks (call before starting them)
    void add(size_t n = 1) {
        std::lock_guard lock(mutex_);
        count_ += n;
    }

    /// Mark one task finished. Must be the task's last access to shared state.
    void done() {
        std::lock_guard lock(mutex_);
        if (count_ > 0 && --count_ == 0) {
            cv_.notify_all();  // Under the lock so the owner cannot destroy us mid-notify
        }
    }

    /// Block until every registered task has called done()
    void wait() {
        std::unique_lock lock(mutex_);
        cv_.wait(lock, [this] { return count_ == 0; });
    }

    [[nodiscard]] size_t pending() const {
        std::lock_guard lock(mutex_);
        return count_;
    }

private:
    mutable std::mutex mutex_;
    std::condition_variable cv_;
    size_t count_ = 0;
};

}  // namespace switchyard::core
