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
 * @file cancellation_token_tests.cpp
 * @brief Unit tests for CancellationToken and TaskErrc
 */

#include <atomic>
#include <chrono>
#include <string>
#include <system_error>
#include <thread>

#include <gtest/gtest.h>

#include "task/cancellation_token.hpp"
#include "task/task_errors.hpp"

namespace {
namespace gt = gpudispatch::task;

// NOLINTBEGIN(cppcoreguidelines-avoid-magic-numbers,readability-magic-numbers)

using namespace std::chrono_literals;

TEST(CancellationToken, DefaultState) {
    const gt::CancellationToken token{};
    EXPECT_FALSE(token.is_cancelled());
}

TEST(CancellationToken, CancelAndReset) {
    gt::CancellationToken token{};
    token.cancel();
    EXPECT_TRUE(token.is_cancelled());

    token.reset();
    EXPECT_FALSE(token.is_cancelled());

    token.cancel();
    token.cancel();
    EXPECT_TRUE(token.is_cancelled());
}

TEST(CancellationToken, WaitForElapsesWithoutCancel) {
    const gt::CancellationToken token{};
    const auto start = std::chrono::steady_clock::now();
    EXPECT_TRUE(token.wait_for(20ms));
    EXPECT_GE(std::chrono::steady_clock::now() - start, 20ms);
}

TEST(CancellationToken, WaitForReturnsEarlyOnCancel) {
    gt::CancellationToken token{};
    std::atomic<bool> completed_full_wait{true};

    const auto start = std::chrono::steady_clock::now();
    std::thread sleeper([&token, &completed_full_wait]() {
        completed_full_wait.store(token.wait_for(10s));
    });

    std::this_thread::sleep_for(10ms);
    token.cancel();
    sleeper.join();

    EXPECT_FALSE(completed_full_wait.load());
    EXPECT_LT(std::chrono::steady_clock::now() - start, 5s);
}

TEST(CancellationToken, WaitForOnCancelledTokenIsImmediate) {
    gt::CancellationToken token{};
    token.cancel();
    EXPECT_FALSE(token.wait_for(10s));
}

TEST(TaskErrc, CategoryAndMessages) {
    const std::error_code ok = gt::TaskErrc::Success;
    EXPECT_FALSE(ok);

    const std::error_code running = gt::TaskErrc::AlreadyRunning;
    EXPECT_TRUE(running);
    EXPECT_STREQ(running.category().name(), "gpudispatch::task");
    EXPECT_NE(running.message().find("Already running"), std::string::npos);
    EXPECT_STREQ(gt::get_error_name(gt::TaskErrc::NotStarted), "NotStarted");

    const std::error_code invalid = gt::TaskErrc::InvalidParameter;
    EXPECT_EQ(invalid, std::errc::invalid_argument);
}

// NOLINTEND(cppcoreguidelines-avoid-magic-numbers,readability-magic-numbers)

} // namespace
