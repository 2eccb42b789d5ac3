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
 * @file periodic_trigger_tests.cpp
 * @brief Unit tests for PeriodicTrigger
 */

#include <atomic>
#include <chrono>
#include <stdexcept>
#include <system_error>
#include <thread>

#include <gtest/gtest.h>

#include "task/periodic_trigger.hpp"
#include "task/task_errors.hpp"

namespace {
namespace gt = gpudispatch::task;

// NOLINTBEGIN(cppcoreguidelines-avoid-magic-numbers,readability-magic-numbers)

using namespace std::chrono_literals;

TEST(PeriodicTrigger, RunsMaxTriggersThenStops) {
    std::atomic<int> ticks{0};
    auto trigger = gt::PeriodicTrigger::create([&ticks]() { ticks++; }, 5ms)
                           .name("test_trigger")
                           .max_triggers(4)
                           .build();

    ASSERT_FALSE(trigger.start());
    trigger.wait_for_completion();

    EXPECT_EQ(ticks.load(), 4);
    EXPECT_EQ(trigger.trigger_count(), 4U);
    EXPECT_FALSE(trigger.is_running());
}

TEST(PeriodicTrigger, StartTwiceReportsAlreadyRunning) {
    auto trigger = gt::PeriodicTrigger::create([]() {}, 50ms).build();
    ASSERT_FALSE(trigger.start());
    EXPECT_EQ(trigger.start(), gt::TaskErrc::AlreadyRunning);
    trigger.stop();
    EXPECT_FALSE(trigger.is_running());
}

TEST(PeriodicTrigger, StopInterruptsLongInterval) {
    std::atomic<int> ticks{0};
    auto trigger = gt::PeriodicTrigger::create([&ticks]() { ticks++; }, 1h).build();
    ASSERT_FALSE(trigger.start());

    const auto start = std::chrono::steady_clock::now();
    trigger.stop();
    EXPECT_LT(std::chrono::steady_clock::now() - start, 5s);
    EXPECT_EQ(ticks.load(), 0);
}

TEST(PeriodicTrigger, FireOnStartRunsImmediately) {
    std::atomic<int> ticks{0};
    auto trigger = gt::PeriodicTrigger::create([&ticks]() { ticks++; }, 1h)
                           .fire_on_start()
                           .max_triggers(1)
                           .build();
    ASSERT_FALSE(trigger.start());
    trigger.wait_for_completion();
    EXPECT_EQ(ticks.load(), 1);
}

TEST(PeriodicTrigger, CallbackExceptionDoesNotStopTrigger) {
    std::atomic<int> ticks{0};
    auto trigger = gt::PeriodicTrigger::create(
                           [&ticks]() {
                               ticks++;
                               throw std::runtime_error("tick failure");
                           },
                           2ms)
                           .max_triggers(3)
                           .build();
    ASSERT_FALSE(trigger.start());
    trigger.wait_for_completion();
    EXPECT_EQ(ticks.load(), 3);
}

TEST(PeriodicTrigger, SlowCallbackSkipsMissedIntervals) {
    auto trigger = gt::PeriodicTrigger::create([]() { std::this_thread::sleep_for(25ms); }, 5ms)
                           .max_triggers(3)
                           .build();
    ASSERT_FALSE(trigger.start());
    trigger.wait_for_completion();
    EXPECT_EQ(trigger.trigger_count(), 3U);
    EXPECT_GT(trigger.skipped_count(), 0U);
}

TEST(PeriodicTrigger, RejectsNonPositiveInterval) {
    EXPECT_THROW(
            { auto trigger = gt::PeriodicTrigger::create([]() {}, 0ms).build(); },
            std::invalid_argument);
}

// NOLINTEND(cppcoreguidelines-avoid-magic-numbers,readability-magic-numbers)

} // namespace
