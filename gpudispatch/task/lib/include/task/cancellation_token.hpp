/*
 * SPDX-FileCopyrightText: Copyright (c) 2025 NVIDIA CORPORATION & AFFILIATES. All rights reserved.
 * SPDX-License-Identifier: Apache-2.0
 *
 * Licensed under the Apache License, Version 2.0 (the "License");
 * you may not use this file except in compliance with the License.
 * You may obtain a copy of the License at
 *
 * http://www.apache.org/licenses/LICENSE-2.0
 *
 * Unless required by applicable law or agreed to in writing, software
 * distributed under the License is distributed on an "AS IS" BASIS,
 * WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
 * See the License for the specific language governing permissions and
 * limitations under the License.
 */

/**
 * @file cancellation_token.hpp
 * @brief Cooperative cancellation signal shared between an owner and a running unit
 */

#ifndef GPUDISPATCH_TASK_CANCELLATION_TOKEN_HPP
#define GPUDISPATCH_TASK_CANCELLATION_TOKEN_HPP

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <mutex>

namespace gpudispatch::task {

/**
 * Cancellation token for cooperative cancellation
 *
 * The running side polls is_cancelled() at its checkpoints or blocks in
 * wait_for(), which returns early once cancel() is called. The owning side
 * raises the signal and never waits on it.
 */
class CancellationToken final {
private:
    // NOLINTBEGIN(readability-redundant-member-init) - {} is required for std::atomic zero-init
    std::atomic<bool> cancelled_{}; //!< Atomic cancellation flag
    // NOLINTEND(readability-redundant-member-init)
    mutable std::mutex mutex_;              //!< Guards the wait condition
    mutable std::condition_variable cv_;    //!< Wakes sleepers on cancel()

public:
    CancellationToken() = default;
    ~CancellationToken() = default;

    /// Non-copyable and non-movable
    CancellationToken(const CancellationToken &) = delete;
    CancellationToken &operator=(const CancellationToken &) = delete;
    CancellationToken(CancellationToken &&) = delete;
    CancellationToken &operator=(CancellationToken &&) = delete;

    /**
     * Check if cancellation has been requested
     * @return true if the unit should stop at its next checkpoint
     */
    [[nodiscard]] bool is_cancelled() const noexcept {
        return cancelled_.load(std::memory_order_acquire);
    }

    /// Request cancellation and wake any waiter
    void cancel() noexcept {
        {
            const std::lock_guard<std::mutex> lock(mutex_);
            cancelled_.store(true, std::memory_order_release);
        }
        cv_.notify_all();
    }

    /// Clear the signal so the token can be reused
    void reset() noexcept { cancelled_.store(false, std::memory_order_release); }

    /**
     * Sleep for a duration unless cancelled first
     *
     * @param[in] duration Maximum time to sleep
     * @return true if the full duration elapsed, false if cancellation interrupted it
     */
    template <typename Rep, typename Period>
    bool wait_for(const std::chrono::duration<Rep, Period> duration) const {
        std::unique_lock<std::mutex> lock(mutex_);
        return !cv_.wait_for(lock, duration, [this] { return is_cancelled(); });
    }
};

} // namespace gpudispatch::task

#endif // GPUDISPATCH_TASK_CANCELLATION_TOKEN_HPP
