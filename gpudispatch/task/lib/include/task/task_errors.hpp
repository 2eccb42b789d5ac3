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
 * @file task_errors.hpp
 * @brief Error codes for task framework operations
 *
 * Provides type-safe error codes compatible with std::error_code for
 * starting and stopping background units such as PeriodicTrigger.
 */

#ifndef GPUDISPATCH_TASK_TASK_ERRORS_HPP
#define GPUDISPATCH_TASK_TASK_ERRORS_HPP

#include <array>
#include <cstddef>
#include <cstdint>
#include <format>
#include <iterator>
#include <string>
#include <string_view>
#include <system_error>
#include <type_traits>

#include <wise_enum.h>

namespace gpudispatch::task {

/**
 * Task framework error codes compatible with std::error_code
 */
enum class TaskErrc : std::uint8_t {
    Success,         //!< Operation succeeded
    AlreadyRunning,  //!< Operation failed: already running
    NotStarted,      //!< Operation failed: not started
    InvalidParameter //!< Invalid parameter provided
};

} // namespace gpudispatch::task

// WISE_ENUM_ADAPT must be called at global namespace scope for ADL to work
WISE_ENUM_ADAPT(gpudispatch::task::TaskErrc, Success, AlreadyRunning, NotStarted, InvalidParameter)

namespace std {
template <> struct is_error_code_enum<gpudispatch::task::TaskErrc> : true_type {};
} // namespace std

namespace gpudispatch::task {

/**
 * Custom error category for task framework errors
 */
class TaskErrorCategory final : public std::error_category {
private:
    static constexpr std::array<std::string_view, 4> KMESSAGES{
            "Success: Operation completed successfully",
            "Already running: Operation cannot be started because it is already running",
            "Not started: Operation cannot be performed because the unit is not started",
            "Invalid parameter: Parameter value is invalid or out of range"};

    static_assert(
            KMESSAGES.size() == ::wise_enum::size<TaskErrc>,
            "KMESSAGES array size must match the number of TaskErrc enum values");

public:
    [[nodiscard]] const char *name() const noexcept override { return "gpudispatch::task"; }

    [[nodiscard]] std::string message(const int condition) const override {
        const auto idx = static_cast<std::size_t>(condition);
        if (idx < KMESSAGES.size()) {
            return std::string{*std::next(KMESSAGES.begin(), static_cast<std::ptrdiff_t>(idx))};
        }
        return std::format("Unknown task error: {}", condition);
    }

    [[nodiscard]] std::error_condition
    default_error_condition(const int condition) const noexcept override {
        switch (static_cast<TaskErrc>(condition)) {
        case TaskErrc::Success:
            return {};
        case TaskErrc::InvalidParameter:
            return std::errc::invalid_argument;
        case TaskErrc::AlreadyRunning:
            return std::errc::operation_in_progress;
        default:
            return std::error_condition{condition, *this};
        }
    }
};

/**
 * Get the singleton instance of the task error category
 *
 * @return Reference to the task error category
 */
[[nodiscard]] inline const TaskErrorCategory &task_category() noexcept {
    static const TaskErrorCategory instance{};
    return instance;
}

/**
 * Create an error_code from a TaskErrc value
 *
 * @param[in] errc The task error code
 * @return A std::error_code representing the task error
 */
[[nodiscard]] inline std::error_code make_error_code(const TaskErrc errc) noexcept {
    return {static_cast<int>(errc), task_category()};
}

/**
 * Get the name of a TaskErrc enum value
 *
 * @param[in] errc The error code
 * @return The enum name as a string
 */
[[nodiscard]] inline const char *get_error_name(const TaskErrc errc) noexcept {
    return ::wise_enum::to_string(errc).data();
}

} // namespace gpudispatch::task

#endif // GPUDISPATCH_TASK_TASK_ERRORS_HPP
