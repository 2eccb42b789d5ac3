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

#include <pthread.h> // for pthread_setname_np, pthread_self

#include <chrono>    // for steady_clock, nanoseconds
#include <cstdint>   // for uint64_t
#include <exception> // for exception
#include <memory>    // for make_unique
#include <stdexcept> // for invalid_argument
#include <string>    // for string
#include <utility>   // for move

#include "log/dispatch_log_macros.hpp"
#include "task/periodic_trigger.hpp"
#include "task/task_errors.hpp"
#include "task/task_log.hpp"

namespace gpudispatch::task {

namespace {
constexpr std::size_t MAX_THREAD_NAME_LENGTH = 15;
} // namespace

PeriodicTrigger::Builder &PeriodicTrigger::Builder::name(std::string name) {
    name_ = std::move(name);
    return *this;
}

PeriodicTrigger::Builder &PeriodicTrigger::Builder::max_triggers(const std::size_t count) noexcept {
    max_triggers_ = count;
    return *this;
}

PeriodicTrigger::Builder &PeriodicTrigger::Builder::fire_on_start(const bool enabled) noexcept {
    fire_on_start_ = enabled;
    return *this;
}

PeriodicTrigger PeriodicTrigger::Builder::build() {
    if (interval_ <= std::chrono::nanoseconds::zero()) {
        throw std::invalid_argument("PeriodicTrigger interval must be positive");
    }
    return PeriodicTrigger{
            std::move(callback_), interval_, std::move(name_), max_triggers_, fire_on_start_};
}

PeriodicTrigger::PeriodicTrigger(
        CallbackType callback,
        const std::chrono::nanoseconds interval,
        std::string name,
        const std::optional<std::size_t> max_triggers,
        const bool fire_on_start)
        : callback_(std::move(callback)), interval_(interval), name_(std::move(name)),
          max_triggers_(max_triggers), fire_on_start_(fire_on_start),
          stop_token_(std::make_unique<CancellationToken>()) {}

PeriodicTrigger::PeriodicTrigger(PeriodicTrigger &&other) noexcept
        : callback_(std::move(other.callback_)), interval_(other.interval_),
          name_(std::move(other.name_)), max_triggers_(other.max_triggers_),
          fire_on_start_(other.fire_on_start_), stop_token_(std::move(other.stop_token_)),
          thread_(std::move(other.thread_)), running_(other.running_.load()),
          trigger_count_(other.trigger_count_.load()),
          skipped_count_(other.skipped_count_.load()) {}

PeriodicTrigger::~PeriodicTrigger() { stop(); }

std::error_code PeriodicTrigger::start() {
    if (running_.exchange(true)) {
        return make_error_code(TaskErrc::AlreadyRunning);
    }
    if (thread_.joinable()) {
        thread_.join();
    }
    stop_token_->reset();
    thread_ = std::thread([this] { tick_loop(); });
    GPUD_LOGC_DEBUG(
            TaskLog::PeriodicTrigger,
            "Started '{}' with interval {}ms",
            name_,
            std::chrono::duration_cast<std::chrono::milliseconds>(interval_).count());
    return make_error_code(TaskErrc::Success);
}

void PeriodicTrigger::stop() {
    if (stop_token_ == nullptr) {
        return; // moved-from
    }
    stop_token_->cancel();
    if (thread_.joinable() && thread_.get_id() != std::this_thread::get_id()) {
        thread_.join();
    }
    running_.store(false);
}

void PeriodicTrigger::wait_for_completion() {
    if (thread_.joinable() && thread_.get_id() != std::this_thread::get_id()) {
        thread_.join();
    }
}

bool PeriodicTrigger::is_running() const noexcept { return running_.load(); }

std::uint64_t PeriodicTrigger::trigger_count() const noexcept { return trigger_count_.load(); }

std::uint64_t PeriodicTrigger::skipped_count() const noexcept { return skipped_count_.load(); }

void PeriodicTrigger::tick_loop() {
    const std::string thread_name = name_.substr(0, MAX_THREAD_NAME_LENGTH);
    pthread_setname_np(pthread_self(), thread_name.c_str());

    auto next_tick = std::chrono::steady_clock::now();
    if (!fire_on_start_) {
        next_tick += interval_;
    }

    while (!stop_token_->is_cancelled()) {
        const auto wait = next_tick - std::chrono::steady_clock::now();
        if (wait > std::chrono::nanoseconds::zero() && !stop_token_->wait_for(wait)) {
            break; // stopped while waiting
        }

        try {
            callback_();
        } catch (const std::exception &e) {
            GPUD_LOGC_ERROR(
                    TaskLog::PeriodicTrigger, "Callback of '{}' threw: {}", name_, e.what());
        }

        const auto count = trigger_count_.fetch_add(1) + 1;
        if (max_triggers_.has_value() && count >= *max_triggers_) {
            break;
        }

        // Skip ahead over intervals consumed by a slow callback
        next_tick += interval_;
        const auto now = std::chrono::steady_clock::now();
        if (next_tick < now) {
            const auto behind = (now - next_tick) / interval_ + 1;
            skipped_count_.fetch_add(static_cast<std::uint64_t>(behind));
            next_tick += interval_ * behind;
        }
    }
    running_.store(false);
    GPUD_LOGC_DEBUG(
            TaskLog::PeriodicTrigger,
            "Stopped '{}' after {} ticks ({} skipped)",
            name_,
            trigger_count_.load(),
            skipped_count_.load());
}

} // namespace gpudispatch::task
