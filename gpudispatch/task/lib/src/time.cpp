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

#include <chrono>
#include <format>
#include <string>

#include "task/time.hpp"

namespace gpudispatch::task {

Nanos Time::now_ns() {
    return std::chrono::duration_cast<std::chrono::nanoseconds>(
            std::chrono::system_clock::now().time_since_epoch());
}

Time::TimePoint Time::now() { return std::chrono::system_clock::now(); }

Time::SteadyPoint Time::steady_now() { return std::chrono::steady_clock::now(); }

std::string Time::to_iso8601(const TimePoint time_point) {
    const auto millis = std::chrono::floor<std::chrono::milliseconds>(time_point);
    return std::format("{:%Y-%m-%dT%H:%M:%S}Z", millis);
}

} // namespace gpudispatch::task
