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

#ifndef GPUDISPATCH_TASK_TIME_HPP
#define GPUDISPATCH_TASK_TIME_HPP

#include <chrono>
#include <string>

namespace gpudispatch::task {

/// Time type for nanosecond precision timing
using Nanos = std::chrono::nanoseconds;

/**
 * Wall-clock and steady-clock helpers
 *
 * Durable timestamps use the system clock. Intervals and deadlines inside
 * the process use the steady clock so wall-clock jumps cannot stretch them.
 */
class Time final {
public:
    /// Wall-clock time point stored in job and worker records
    using TimePoint = std::chrono::system_clock::time_point;

    /// Monotonic time point for intervals
    using SteadyPoint = std::chrono::steady_clock::time_point;

    /**
     * Current wall-clock time in nanoseconds since epoch
     * @return Nanoseconds since epoch
     */
    [[nodiscard]] static Nanos now_ns();

    /**
     * Current wall-clock time
     * @return Time point using system_clock
     */
    [[nodiscard]] static TimePoint now();

    /**
     * Current monotonic time
     * @return Time point using steady_clock
     */
    [[nodiscard]] static SteadyPoint steady_now();

    /**
     * Format a wall-clock time point as UTC ISO-8601 with millisecond precision
     *
     * @param[in] time_point Time point to format
     * @return Text such as 2025-01-31T12:00:00.123Z
     */
    [[nodiscard]] static std::string to_iso8601(TimePoint time_point);
};

} // namespace gpudispatch::task

#endif // GPUDISPATCH_TASK_TIME_HPP
