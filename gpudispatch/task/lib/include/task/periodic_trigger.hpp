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
 * @file periodic_trigger.hpp
 * @brief Background thread invoking a callback at a fixed interval
 *
 * Used for housekeeping loops that tolerate millisecond jitter, such as
 * worker availability sweeps. Missed intervals are skipped rather than
 * replayed.
 */

#ifndef GPUDISPATCH_TASK_PERIODIC_TRIGGER_HPP
#define GPUDISPATCH_TASK_PERIODIC_TRIGGER_HPP

#include <atomic>
#include <chrono>
#include <concepts>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <system_error>
#include <thread>
#include <type_traits>
#include <utility>

#include "task/cancellation_token.hpp"

namespace gpudispatch::task {

/// Requirements for a PeriodicTrigger callback
template <typename F>
concept PeriodicCallback = std::invocable<F> && std::same_as<std::invoke_result_t<F>, void> &&
                           std::copy_constructible<F>;

/**
 * Periodic callback runner
 *
 * The callback runs on a dedicated thread. An exception escaping the
 * callback is logged and the trigger keeps running. stop() interrupts the
 * wait between ticks but lets an in-flight callback finish.
 */
class PeriodicTrigger final {
public:
    using CallbackType = std::function<void()>;

    /**
     * Builder for PeriodicTrigger
     */
    class Builder final {
    public:
        /**
         * Create builder with the required parameters
         * @param[in] callback Function executed on every tick
         * @param[in] interval Time between tick starts
         */
        template <PeriodicCallback CallbackT, typename Rep, typename Period>
        Builder(CallbackT &&callback, std::chrono::duration<Rep, Period> interval)
                : callback_(std::forward<CallbackT>(callback)),
                  interval_(std::chrono::duration_cast<std::chrono::nanoseconds>(interval)) {}

        /**
         * Thread name shown in logs and debuggers
         * @param[in] name Name, truncated to 15 characters by the OS
         * @return Reference to builder for chaining
         */
        [[nodiscard]] Builder &name(std::string name);

        /**
         * Stop automatically after a number of ticks
         * @param[in] count Number of ticks
         * @return Reference to builder for chaining
         */
        [[nodiscard]] Builder &max_triggers(std::size_t count) noexcept;

        /**
         * Run the first tick immediately on start instead of after one interval
         * @param[in] enabled Whether to fire on start
         * @return Reference to builder for chaining
         */
        [[nodiscard]] Builder &fire_on_start(bool enabled = true) noexcept;

        /**
         * Build the trigger
         * @return Configured, not yet started trigger
         * @throws std::invalid_argument if the interval is not positive
         */
        [[nodiscard]] PeriodicTrigger build();

    private:
        CallbackType callback_;
        std::chrono::nanoseconds interval_;
        std::string name_{"periodic"};
        std::optional<std::size_t> max_triggers_;
        bool fire_on_start_{false};
    };

    /**
     * Start building a trigger
     * @param[in] callback Function executed on every tick
     * @param[in] interval Time between tick starts
     * @return Builder
     */
    template <PeriodicCallback CallbackT, typename Rep, typename Period>
    [[nodiscard]] static Builder
    create(CallbackT &&callback, std::chrono::duration<Rep, Period> interval) {
        return Builder{std::forward<CallbackT>(callback), interval};
    }

    ~PeriodicTrigger();

    PeriodicTrigger(const PeriodicTrigger &) = delete;
    PeriodicTrigger &operator=(const PeriodicTrigger &) = delete;
    /// Moves a trigger that has not been started yet
    PeriodicTrigger(PeriodicTrigger &&other) noexcept;
    PeriodicTrigger &operator=(PeriodicTrigger &&) = delete;

    /**
     * Start the background thread
     * @return TaskErrc::AlreadyRunning if started twice, success otherwise
     */
    [[nodiscard]] std::error_code start();

    /// Stop the background thread and join it. Safe to call repeatedly.
    void stop();

    /**
     * Wait until max_triggers ticks ran or stop() was called
     *
     * Returns immediately if the trigger was never started.
     */
    void wait_for_completion();

    [[nodiscard]] bool is_running() const noexcept;
    [[nodiscard]] std::uint64_t trigger_count() const noexcept;
    [[nodiscard]] std::uint64_t skipped_count() const noexcept;
    [[nodiscard]] std::chrono::nanoseconds get_interval() const noexcept { return interval_; }

private:
    PeriodicTrigger(
            CallbackType callback,
            std::chrono::nanoseconds interval,
            std::string name,
            std::optional<std::size_t> max_triggers,
            bool fire_on_start);

    void tick_loop();

    CallbackType callback_;
    std::chrono::nanoseconds interval_;
    std::string name_;
    std::optional<std::size_t> max_triggers_;
    bool fire_on_start_{false};
    std::unique_ptr<CancellationToken> stop_token_; //!< Heap allocated to keep the trigger movable
    std::thread thread_;
    std::atomic<bool> running_{false};
    std::atomic<std::uint64_t> trigger_count_{0};
    std::atomic<std::uint64_t> skipped_count_{0};
};

} // namespace gpudispatch::task

#endif // GPUDISPATCH_TASK_PERIODIC_TRIGGER_HPP
