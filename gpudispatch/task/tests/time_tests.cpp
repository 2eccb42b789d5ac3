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
 * @file time_tests.cpp
 * @brief Unit tests for Time helpers
 */

#include <chrono>
#include <string>

#include <gtest/gtest.h>

#include "task/time.hpp"

namespace {
namespace gt = gpudispatch::task;

// NOLINTBEGIN(cppcoreguidelines-avoid-magic-numbers,readability-magic-numbers)

using namespace std::chrono_literals;

TEST(Time, NowNsIsMonotonicEnoughForTimestamps) {
    const auto first = gt::Time::now_ns();
    const auto second = gt::Time::now_ns();
    EXPECT_GT(first.count(), 0);
    EXPECT_GE(second, first);
}

TEST(Time, SteadyNowAdvances) {
    const auto start = gt::Time::steady_now();
    EXPECT_GE(gt::Time::steady_now(), start);
}

TEST(Time, Iso8601Formatting) {
    const gt::Time::TimePoint epoch{};
    EXPECT_EQ(gt::Time::to_iso8601(epoch), "1970-01-01T00:00:00.000Z");

    const gt::Time::TimePoint later = epoch + 86400s + 3723s + 45ms;
    EXPECT_EQ(gt::Time::to_iso8601(later), "1970-01-02T01:02:03.045Z");
}

// NOLINTEND(cppcoreguidelines-avoid-magic-numbers,readability-magic-numbers)

} // namespace
